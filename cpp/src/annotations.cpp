#include "annotations.hpp"

#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {
bool ToInt(float v, int& out) {
    const double d = static_cast<double>(v);
    if (std::floor(d) != d || d < static_cast<double>(INT_MIN) || d > static_cast<double>(INT_MAX)) {
        return false;
    }
    out = static_cast<int>(d);
    return true;
}
}  // namespace

std::vector<std::string> SplitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        size_t start = item.find_first_not_of(" \t\r\n");
        size_t end = item.find_last_not_of(" \t\r\n");
        if (start != std::string::npos && end != std::string::npos) {
            out.push_back(item.substr(start, end - start + 1));
        }
    }
    return out;
}

bool ParseNumbers(const std::string& s, size_t expected, std::vector<float>& out) {
    out.clear();
    for (const std::string& tok : SplitList(s, ',')) {
        char* end = nullptr;
        const float v = std::strtof(tok.c_str(), &end);
        if (end == tok.c_str() || *end != '\0' || !std::isfinite(v)) return false;
        out.push_back(v);
    }
    return out.size() == expected;
}

bool ParseBoxes(const std::string& s, std::vector<BBox>& boxes) {
    boxes.clear();
    std::vector<float> v;
    for (const std::string& item : SplitList(s, ';')) {
        if (!ParseNumbers(item, 4, v)) return false;
        boxes.push_back(BBox{v[0], v[1], v[2], v[3]});
    }
    return true;
}

bool ParseGroundTruth(const std::string& s, std::vector<GroundTruthBox>& gt) {
    gt.clear();
    std::vector<float> v;
    for (const std::string& item : SplitList(s, ';')) {
        GroundTruthBox g;
        if (!ParseNumbers(item, 6, v) || !ToInt(v[4], g.cls) || !ToInt(v[5], g.pid)) {
            gt.clear();
            return false;
        }
        g.box = BBox{v[0], v[1], v[2], v[3]};
        gt.push_back(g);
    }
    return true;
}
