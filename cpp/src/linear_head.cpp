#include "linear_head.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

LinearHead::LinearHead(int in_features, int out_features)
    : weight_(out_features, in_features),
      bias_(static_cast<size_t>(out_features), 0.0f) {
    if (in_features <= 0 || out_features <= 0) {
        throw std::invalid_argument("LinearHead dimensions must be positive");
    }
}

void LinearHead::InitNormal(float mean, float stddev, bool truncated, std::mt19937& rng) {
    std::normal_distribution<float> normal(0.0f, 1.0f);
    for (float& w : weight_.data()) {
        float z = normal(rng);
        if (truncated) z = std::fmod(z, 2.0f);
        w = z * stddev + mean;
    }
    std::fill(bias_.begin(), bias_.end(), 0.0f);
}

Matrix LinearHead::Forward(const Matrix& x) const {
    if (x.cols() != inFeatures()) {
        throw std::invalid_argument("LinearHead expects " + std::to_string(inFeatures()) +
                                    " input features, got " + std::to_string(x.cols()));
    }
    Matrix y = x.mulTransposed(weight_);
    for (int r = 0; r < y.rows(); ++r) {
        float* out = y.row(r);
        for (int c = 0; c < y.cols(); ++c) out[c] += bias_[static_cast<size_t>(c)];
    }
    return y;
}

void LinearHead::Save(std::ostream& out) const {
    const int32_t dims[2] = {outFeatures(), inFeatures()};
    out.write(reinterpret_cast<const char*>(dims), sizeof(dims));
    out.write(reinterpret_cast<const char*>(weight_.data().data()),
              static_cast<std::streamsize>(weight_.data().size() * sizeof(float)));
    out.write(reinterpret_cast<const char*>(bias_.data()),
              static_cast<std::streamsize>(bias_.size() * sizeof(float)));
    if (!out) throw std::runtime_error("Failed to write linear head");
}

void LinearHead::Load(std::istream& in) {
    int32_t dims[2] = {0, 0};
    in.read(reinterpret_cast<char*>(dims), sizeof(dims));
    if (!in) throw std::runtime_error("Truncated linear head checkpoint");
    if (dims[0] != outFeatures() || dims[1] != inFeatures()) {
        throw std::runtime_error("Linear head checkpoint shape " + std::to_string(dims[0]) + "x" +
                                 std::to_string(dims[1]) + " does not match " +
                                 std::to_string(outFeatures()) + "x" +
                                 std::to_string(inFeatures()));
    }
    Matrix weight(outFeatures(), inFeatures());
    std::vector<float> bias(bias_.size());
    in.read(reinterpret_cast<char*>(weight.data().data()),
            static_cast<std::streamsize>(weight.data().size() * sizeof(float)));
    in.read(reinterpret_cast<char*>(bias.data()),
            static_cast<std::streamsize>(bias.size() * sizeof(float)));
    if (!in) throw std::runtime_error("Truncated linear head checkpoint");
    weight_ = std::move(weight);
    bias_ = std::move(bias);
}
