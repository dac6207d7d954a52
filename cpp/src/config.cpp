#include "config.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "opencv2/core.hpp"

namespace {
const DatasetPreset kDatasets[] = {
    {"sysu", 5532, 5000, 256, 0.5f},
    {"prw", 483, 500, 256, 0.5f},
};

std::array<float, 4> ReadFour(const cv::FileStorage& fs, const char* key, const std::string& path) {
    const cv::FileNode node = fs[key];
    if (node.empty() || !node.isSeq() || node.size() != 4) {
        throw std::runtime_error(path + ": '" + key + "' must be a sequence of 4 numbers");
    }
    std::array<float, 4> out{};
    for (int i = 0; i < 4; ++i) {
        const cv::FileNode v = node[i];
        if (!v.isReal() && !v.isInt()) {
            throw std::runtime_error(path + ": '" + key + "' holds a non-numeric value");
        }
        out[static_cast<size_t>(i)] = static_cast<float>(v.real());
    }
    return out;
}
}  // namespace

DatasetPreset FindDatasetPreset(const std::string& name) {
    for (const DatasetPreset& preset : kDatasets) {
        if (preset.name == name) return preset;
    }
    throw std::invalid_argument("Unknown dataset: " + name);
}

BoxNormalization LoadBoxNormalization(const std::string& path) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            throw std::runtime_error("Cannot open box normalization config: " + path);
        }
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Cannot parse box normalization config " + path + ": " + e.what());
    }

    BoxNormalization norm;
    norm.means = ReadFour(fs, "train_bbox_normalize_means", path);
    norm.stds = ReadFour(fs, "train_bbox_normalize_stds", path);
    return norm;
}

float GetEnvFloat(const char* name, float fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    const float out = std::strtof(v, &end);
    if (end == v || !std::isfinite(out)) return fallback;
    return out;
}

int GetEnvInt(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    errno = 0;
    const long out = std::strtol(v, &end, 10);
    if (end == v || errno == ERANGE || out < INT_MIN || out > INT_MAX) return fallback;
    return static_cast<int>(out);
}
