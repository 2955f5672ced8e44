#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "error.hpp"
#include "params.hpp"
#include "utils.h"

int32_t cmdSegmentTissue(int32_t argc, char** argv);
int32_t cmdLabelRegions(int32_t argc, char** argv);
