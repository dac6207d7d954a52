#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * Axis-aligned box in network-input pixel coordinates.
 */
struct BBox {
    float x1, y1, x2, y2;

    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
    float area() const { return width() * height(); }
};

/**
 * Ground-truth annotation row: box, class and identity.
 *
 * `cls == 0` marks background, any other class is a person.
 * `pid >= 0` is a labeled identity, `pid == -1` an unlabeled person.
 */
struct GroundTruthBox {
    BBox box;
    int cls = 1;
    int pid = -1;
};

/**
 * Height/width of the network input and the scale applied by the loader.
 */
struct ImageInfo {
    float height = 0.0f;
    float width = 0.0f;
    float scale = 1.0f;
};

struct RgbImage {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> rgb;  // interleaved RGB, size = w*h*3
};

/**
 * CHW float feature blob (one image or one region).
 */
struct FeatureMap {
    int c = 0;
    int h = 0;
    int w = 0;
    std::vector<float> data;

    FeatureMap() = default;
    FeatureMap(int channels, int height, int width)
        : c(channels), h(height), w(width),
          data(static_cast<size_t>(channels) * height * width, 0.0f) {}

    float& at(int ch, int y, int x) { return data[(static_cast<size_t>(ch) * h + y) * w + x]; }
    float at(int ch, int y, int x) const { return data[(static_cast<size_t>(ch) * h + y) * w + x]; }

    size_t size() const { return data.size(); }
};
