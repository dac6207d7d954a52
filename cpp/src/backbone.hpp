#pragma once

#include "types.hpp"

#include <array>
#include <memory>
#include <string>

/**
 * Convolutional feature extractor split in two stages.
 *
 * - Head: whole image -> conv feature map (shared by every region)
 * - Tail: one pooled region -> descriptor blob ("fc7")
 *
 * Families that flatten the pooled region before the tail (vgg16) return a
 * c x 1 x 1 descriptor; the others return a spatial blob that the caller
 * averages over h and w. Either way the descriptor has FeatureDim() values.
 */
class Backbone {
public:
    virtual ~Backbone() = default;

    virtual FeatureMap Head(const RgbImage& image) const = 0;
    virtual FeatureMap Tail(const FeatureMap& pooled) const = 0;

    virtual int FeatureDim() const = 0;
    virtual bool FlattensPooled() const = 0;
};

/**
 * Static description of a supported backbone family.
 */
struct BackboneSpec {
    const char* name;
    int feature_dim;       // width of fc7
    bool flattens_pooled;  // tail consumes flattened pooled features
    bool bgr_input;        // caffe-style models take BGR pixels
    std::array<float, 3> mean_vals;
    std::array<float, 3> norm_vals;
};

/**
 * Throws std::invalid_argument for names other than
 * vgg16, res34, res50, dense121, dense161.
 */
const BackboneSpec& FindBackboneSpec(const std::string& name);

/**
 * Create the ncnn-backed backbone `name` from `model_dir`, which must hold
 * head.param/head.bin and tail.param/tail.bin.
 *
 * Throws std::invalid_argument for an unknown name and std::runtime_error
 * when the model files cannot be loaded.
 */
std::unique_ptr<Backbone> CreateBackbone(const std::string& name, const std::string& model_dir);
