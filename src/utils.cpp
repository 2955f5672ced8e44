#include "utils.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sys/stat.h>

void split(std::vector<std::string>& tokens, const std::string& delims,
    const std::string& line, bool skipEmpty) {
    tokens.clear();
    size_t start = 0;
    while (true) {
        size_t pos = line.find_first_of(delims, start);
        std::string tok = line.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!(skipEmpty && tok.empty())) {
            tokens.push_back(tok);
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
}

std::string trim(const std::string& s) {
    size_t l = s.find_first_not_of(" \t\r\n\"");
    if (l == std::string::npos) return "";
    size_t r = s.find_last_not_of(" \t\r\n\"");
    return s.substr(l, r - l + 1);
}

bool str2int32(const std::string& str, int32_t& value) {
    if (str.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(str.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) return false;
    value = static_cast<int32_t>(v);
    return true;
}

bool str2double(const std::string& str, double& value) {
    if (str.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(str.c_str(), &end);
    if (errno != 0 || *end != '\0') return false;
    value = v;
    return true;
}

bool checkOutputWritable(const std::string& path) {
    struct stat buffer;
    bool existed = (stat(path.c_str(), &buffer) == 0);
    FILE* fp = fopen(path.c_str(), "a");
    if (!fp) return false;
    fclose(fp);
    if (!existed) {
        std::remove(path.c_str());
    }
    return true;
}
