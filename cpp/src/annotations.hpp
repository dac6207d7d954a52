#pragma once

#include "types.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Split "a;b;c" into trimmed, non-empty items.
std::vector<std::string> SplitList(const std::string& s, char sep);

// Exactly `expected` finite comma-separated numbers.
bool ParseNumbers(const std::string& s, size_t expected, std::vector<float>& out);

/**
 * "x1,y1,x2,y2;..." -> boxes. Returns false on any malformed row.
 */
bool ParseBoxes(const std::string& s, std::vector<BBox>& boxes);

/**
 * "x1,y1,x2,y2,cls,pid;..." -> ground-truth rows.
 *
 * `cls` and `pid` must be integral and fit in an int; a row such as
 * "0,0,10,10,1,3.7" or "0,0,10,10,1,1e20" makes the whole parse fail.
 * Identity range is not checked here.
 */
bool ParseGroundTruth(const std::string& s, std::vector<GroundTruthBox>& gt);
