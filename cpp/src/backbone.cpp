#include "backbone.hpp"
#include "config.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

#include "net.h"

namespace {
// Caffe VGG16 pixel means (BGR), torchvision ImageNet statistics for the rest.
constexpr std::array<float, 3> kCaffeMeans = {{102.9801f, 115.9465f, 122.7717f}};
constexpr std::array<float, 3> kUnitNorm = {{1.0f, 1.0f, 1.0f}};
constexpr std::array<float, 3> kImageNetMeans = {{123.675f, 116.28f, 103.53f}};
constexpr std::array<float, 3> kImageNetNorms = {{1.0f / 58.395f, 1.0f / 57.12f, 1.0f / 57.375f}};

const BackboneSpec kBackbones[] = {
    {"vgg16", 4096, true, true, kCaffeMeans, kUnitNorm},
    {"res34", 512, false, false, kImageNetMeans, kImageNetNorms},
    {"res50", 2048, false, false, kImageNetMeans, kImageNetNorms},
    {"dense121", 1024, false, false, kImageNetMeans, kImageNetNorms},
    {"dense161", 2208, false, false, kImageNetMeans, kImageNetNorms},
};

FeatureMap ToFeatureMap(const ncnn::Mat& m) {
    FeatureMap out(m.c, m.h, m.w);
    const size_t plane = static_cast<size_t>(m.w) * static_cast<size_t>(m.h);
    for (int q = 0; q < m.c; ++q) {
        const float* src = m.channel(q);
        std::memcpy(out.data.data() + static_cast<size_t>(q) * plane, src, plane * sizeof(float));
    }
    return out;
}

ncnn::Mat ToNcnnMat(const FeatureMap& f) {
    ncnn::Mat m(f.w, f.h, f.c);
    const size_t plane = static_cast<size_t>(f.w) * static_cast<size_t>(f.h);
    for (int q = 0; q < f.c; ++q) {
        float* dst = m.channel(q);
        std::memcpy(dst, f.data.data() + static_cast<size_t>(q) * plane, plane * sizeof(float));
    }
    return m;
}

class NcnnBackbone : public Backbone {
public:
    NcnnBackbone(const BackboneSpec& spec, const std::string& model_dir)
        : spec_(spec) {
        const int default_threads =
            static_cast<int>(std::max(1u, std::min(4u, std::thread::hardware_concurrency())));
        const int threads = std::max(1, GetEnvInt("PERSON_SEARCH_NCNN_THREADS", default_threads));
        for (ncnn::Net* net : {&head_, &tail_}) {
            net->opt.use_vulkan_compute = false;
            net->opt.num_threads = threads;
        }
        Load(head_, model_dir + "/head");
        Load(tail_, model_dir + "/tail");
    }

    FeatureMap Head(const RgbImage& image) const override {
        if (image.w <= 0 || image.h <= 0 ||
            image.rgb.size() < static_cast<size_t>(image.w) * static_cast<size_t>(image.h) * 3u) {
            throw std::invalid_argument("Backbone head: empty or truncated image");
        }
        const int pixel_type = spec_.bgr_input ? ncnn::Mat::PIXEL_RGB2BGR : ncnn::Mat::PIXEL_RGB;
        ncnn::Mat in = ncnn::Mat::from_pixels(image.rgb.data(), pixel_type, image.w, image.h);
        in.substract_mean_normalize(spec_.mean_vals.data(), spec_.norm_vals.data());

        ncnn::Extractor ex = head_.create_extractor();
        ex.set_light_mode(true);
        if (ex.input("data", in) != 0) throw std::runtime_error("Backbone head: bad input blob");
        ncnn::Mat out;
        if (ex.extract("conv", out) != 0) throw std::runtime_error("Backbone head: extract failed");
        return ToFeatureMap(out);
    }

    FeatureMap Tail(const FeatureMap& pooled) const override {
        ncnn::Extractor ex = tail_.create_extractor();
        ex.set_light_mode(true);
        if (ex.input("pooled", ToNcnnMat(pooled)) != 0) {
            throw std::runtime_error("Backbone tail: bad input blob");
        }
        ncnn::Mat out;
        if (ex.extract("fc7", out) != 0) throw std::runtime_error("Backbone tail: extract failed");
        return ToFeatureMap(out);
    }

    int FeatureDim() const override { return spec_.feature_dim; }
    bool FlattensPooled() const override { return spec_.flattens_pooled; }

private:
    static void Load(ncnn::Net& net, const std::string& stem) {
        const std::string param_path = stem + ".param";
        const std::string bin_path = stem + ".bin";
        if (net.load_param(param_path.c_str()) != 0) {
            throw std::runtime_error("Failed to load " + param_path);
        }
        if (net.load_model(bin_path.c_str()) != 0) {
            throw std::runtime_error("Failed to load " + bin_path);
        }
    }

    BackboneSpec spec_;
    ncnn::Net head_;
    ncnn::Net tail_;
};
}  // namespace

const BackboneSpec& FindBackboneSpec(const std::string& name) {
    for (const BackboneSpec& spec : kBackbones) {
        if (name == spec.name) return spec;
    }
    throw std::invalid_argument("Unknown backbone: " + name);
}

std::unique_ptr<Backbone> CreateBackbone(const std::string& name, const std::string& model_dir) {
    return std::make_unique<NcnnBackbone>(FindBackboneSpec(name), model_dir);
}
