#pragma once

#include "matrix.hpp"

#include <iosfwd>
#include <random>
#include <vector>

/**
 * Fully connected task head: y = x W^T + b.
 */
class LinearHead {
public:
    LinearHead(int in_features, int out_features);

    int inFeatures() const { return weight_.cols(); }
    int outFeatures() const { return weight_.rows(); }

    Matrix& weight() { return weight_; }
    const Matrix& weight() const { return weight_; }
    std::vector<float>& bias() { return bias_; }
    const std::vector<float>& bias() const { return bias_; }

    /**
     * Weights ~ N(mean, stddev), bias = 0. With `truncated` the standard
     * normal sample is folded into (-2, 2) by fmod before scaling.
     */
    void InitNormal(float mean, float stddev, bool truncated, std::mt19937& rng);

    // x: N x inFeatures() -> N x outFeatures()
    Matrix Forward(const Matrix& x) const;

    void Save(std::ostream& out) const;
    void Load(std::istream& in);

private:
    Matrix weight_;
    std::vector<float> bias_;
};
