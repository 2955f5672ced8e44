#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Split by any of the delimiter characters; empty tokens are kept unless skipEmpty
void split(std::vector<std::string>& tokens, const std::string& delims,
    const std::string& line, bool skipEmpty = false);

std::string trim(const std::string& s);

bool str2int32(const std::string& str, int32_t& value);
bool str2double(const std::string& str, double& value);

// Try to open the path for writing, removing the file if it did not exist
bool checkOutputWritable(const std::string& path);
