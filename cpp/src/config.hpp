#pragma once

#include <array>
#include <string>

/**
 * Identity space of a training dataset.
 */
struct DatasetPreset {
    std::string name;
    int num_identities = 0;
    int queue_size = 0;
    int feature_dim = 256;
    float momentum = 0.5f;
};

/**
 * Look up a dataset by name ("sysu", "prw").
 * Throws std::invalid_argument for an unknown name.
 */
DatasetPreset FindDatasetPreset(const std::string& name);

/**
 * Per-coordinate de-normalization for box-head outputs:
 * delta = pred * std + mean, repeated for both classes.
 */
struct BoxNormalization {
    std::array<float, 4> means{{0.0f, 0.0f, 0.0f, 0.0f}};
    std::array<float, 4> stds{{0.1f, 0.1f, 0.2f, 0.2f}};
};

/**
 * Read `train_bbox_normalize_means` / `train_bbox_normalize_stds` from a
 * YAML (or JSON/XML) file with cv::FileStorage.
 *
 * Throws std::runtime_error if the file cannot be opened or either key is
 * missing or does not hold exactly 4 numbers.
 */
BoxNormalization LoadBoxNormalization(const std::string& path);

// Environment overrides; fall back on unset or unparsable values.
float GetEnvFloat(const char* name, float fallback);
int GetEnvInt(const char* name, int fallback);
