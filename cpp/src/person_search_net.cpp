#include "person_search_net.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace {
constexpr uint32_t kCheckpointMagic = 0x4E535350;  // "PSSN"
constexpr uint32_t kCheckpointVersion = 1;

constexpr uint32_t ByteSwap32(uint32_t v) {
    return (v >> 24) | ((v >> 8) & 0x0000FF00u) | ((v << 8) & 0x00FF0000u) | (v << 24);
}

// Dataset and backbone names are checked before any model file is touched.
std::unique_ptr<Backbone> CreateCheckedBackbone(const NetOptions& options) {
    (void)FindDatasetPreset(options.dataset);
    return CreateBackbone(options.backbone, options.model_dir);
}

FeatureMap Flatten(const FeatureMap& f) {
    FeatureMap flat;
    flat.c = static_cast<int>(f.size());
    flat.h = 1;
    flat.w = 1;
    flat.data = f.data;
    return flat;
}
}  // namespace

Mode ParseMode(const std::string& name) {
    if (name == "train") return Mode::Train;
    if (name == "gallery") return Mode::Gallery;
    if (name == "query") return Mode::Query;
    throw std::invalid_argument("Unknown mode: " + name);
}

const char* ModeName(Mode mode) {
    switch (mode) {
        case Mode::Train: return "train";
        case Mode::Gallery: return "gallery";
        case Mode::Query: return "query";
    }
    return "unknown";
}

Matrix DenormalizeBoxDeltas(const Matrix& pred, const BoxNormalization& norm) {
    if (pred.cols() % 4 != 0) {
        throw std::invalid_argument("Box predictions must have a multiple of 4 columns");
    }
    Matrix out(pred.rows(), pred.cols());
    for (int r = 0; r < pred.rows(); ++r) {
        for (int c = 0; c < pred.cols(); ++c) {
            const size_t k = static_cast<size_t>(c % 4);
            out(r, c) = pred(r, c) * norm.stds[k] + norm.means[k];
        }
    }
    return out;
}

PersonSearchNet::PersonSearchNet(const NetOptions& options)
    : PersonSearchNet(CreateCheckedBackbone(options),
                      std::make_unique<RoiAlignProposer>(options.pooled_size, options.spatial_scale),
                      FindDatasetPreset(options.dataset),
                      options.is_train,
                      options.seed,
                      options.truncated_init) {}

PersonSearchNet::PersonSearchNet(std::unique_ptr<Backbone> backbone,
                                 std::unique_ptr<ProposalNetwork> proposer,
                                 const DatasetPreset& dataset,
                                 bool is_train,
                                 unsigned seed,
                                 bool truncated_init)
    : backbone_(std::move(backbone)),
      proposer_(std::move(proposer)),
      is_train_(is_train),
      bank_(dataset.num_identities, dataset.queue_size, dataset.feature_dim, dataset.momentum),
      cls_score_net_(backbone_ ? backbone_->FeatureDim() : 1, 2),
      bbox_pred_net_(backbone_ ? backbone_->FeatureDim() : 1, 8),
      reid_feat_net_(backbone_ ? backbone_->FeatureDim() : 1, dataset.feature_dim) {
    if (!backbone_ || !proposer_) {
        throw std::invalid_argument("PersonSearchNet needs a backbone and a proposal network");
    }
    std::mt19937 rng(seed);
    cls_score_net_.InitNormal(0.0f, 0.01f, truncated_init, rng);
    bbox_pred_net_.InitNormal(0.0f, 0.001f, truncated_init, rng);
    reid_feat_net_.InitNormal(0.0f, 0.01f, truncated_init, rng);
}

Matrix PersonSearchNet::Describe(const std::vector<FeatureMap>& pooled) const {
    const int dim = backbone_->FeatureDim();
    Matrix fc7(static_cast<int>(pooled.size()), dim);
    for (int r = 0; r < fc7.rows(); ++r) {
        const FeatureMap& region = pooled[static_cast<size_t>(r)];
        float* out = fc7.row(r);
        if (backbone_->FlattensPooled()) {
            const FeatureMap desc = backbone_->Tail(Flatten(region));
            if (static_cast<int>(desc.size()) != dim) {
                throw std::invalid_argument("Backbone tail returned " + std::to_string(desc.size()) +
                                            " values, expected " + std::to_string(dim));
            }
            std::copy(desc.data.begin(), desc.data.end(), out);
        } else {
            const FeatureMap desc = backbone_->Tail(region);
            if (desc.c != dim || desc.h <= 0 || desc.w <= 0) {
                throw std::invalid_argument("Backbone tail returned " + std::to_string(desc.c) +
                                            " channels, expected " + std::to_string(dim));
            }
            // Spatial average over h and w.
            const size_t plane = static_cast<size_t>(desc.h) * static_cast<size_t>(desc.w);
            for (int ch = 0; ch < dim; ++ch) {
                const float* src = desc.data.data() + static_cast<size_t>(ch) * plane;
                double sum = 0.0;
                for (size_t i = 0; i < plane; ++i) sum += src[i];
                out[ch] = static_cast<float>(sum / static_cast<double>(plane));
            }
        }
    }
    return fc7;
}

TrainStep PersonSearchNet::Train(const RgbImage& image,
                                 const std::vector<GroundTruthBox>& gt_boxes,
                                 const ImageInfo& im_info) {
    if (!is_train_) {
        throw std::logic_error("Train() called on a network built for inference");
    }
    if (gt_boxes.empty()) {
        throw std::invalid_argument("Training requires at least one ground-truth box");
    }
    std::lock_guard<std::mutex> lock(train_mutex_);

    const FeatureMap conv = backbone_->Head(image);
    TrainProposals props = proposer_->ProposeTrain(conv, gt_boxes, im_info);
    const size_t regions = props.pooled.size();
    if (props.det_labels.size() != regions || props.pid_labels.size() != regions) {
        throw std::invalid_argument("Proposal labels do not match the number of pooled regions");
    }

    TrainStep step;
    step.fc7 = Describe(props.pooled);
    const Matrix cls_score = cls_score_net_.Forward(step.fc7);
    const Matrix bbox_pred = bbox_pred_net_.Forward(step.fc7);
    const Matrix reid_feat = reid_feat_net_.Forward(step.fc7);

    LossTerm det = DetectionLoss(cls_score, props.det_labels);
    LossTerm box = BoxLoss(bbox_pred, props.box_targets);
    LossTerm reid = IdentityLoss(reid_feat, props.pid_labels, bank_,
                                 static_cast<int>(gt_boxes.size()), bank_.momentum());

    step.losses.rpn_cls = props.rpn_cls_loss;
    step.losses.rpn_box = props.rpn_box_loss;
    step.losses.detection = det.value;
    step.losses.box = box.value;
    step.losses.identity = reid.value;
    step.grads.cls_score = std::move(det.grad);
    step.grads.bbox_pred = std::move(box.grad);
    step.grads.reid_feat = std::move(reid.grad);
    return step;
}

void PersonSearchNet::RequireInference(Mode mode) const {
    if (is_train_) {
        throw std::logic_error(std::string(ModeName(mode)) +
                               " inference called on a network built for training");
    }
}

GalleryOutput PersonSearchNet::InferGallery(const RgbImage& image,
                                            const std::vector<BBox>& boxes,
                                            const ImageInfo& im_info,
                                            const BoxNormalization& box_norm) const {
    RequireInference(Mode::Gallery);

    const FeatureMap conv = backbone_->Head(image);
    GalleryProposals props = proposer_->ProposeGallery(conv, boxes, im_info);
    const Matrix fc7 = Describe(props.pooled);

    GalleryOutput out;
    out.cls_prob = Softmax(cls_score_net_.Forward(fc7));
    out.bbox_pred = DenormalizeBoxDeltas(bbox_pred_net_.Forward(fc7), box_norm);
    out.rois = std::move(props.rois);
    out.embeddings = reid_feat_net_.Forward(fc7);
    out.embeddings.normalizeRows();
    return out;
}

QueryOutput PersonSearchNet::InferQuery(const RgbImage& image,
                                        const std::vector<BBox>& boxes,
                                        const ImageInfo& im_info) const {
    RequireInference(Mode::Query);

    const FeatureMap conv = backbone_->Head(image);
    const Matrix fc7 = Describe(proposer_->PoolQuery(conv, boxes, im_info));

    QueryOutput out;
    out.embeddings = reid_feat_net_.Forward(fc7);
    out.embeddings.normalizeRows();
    return out;
}

InferenceOutput PersonSearchNet::Infer(const std::string& mode,
                                       const InferenceRequest& request) const {
    const Mode m = ParseMode(mode);
    if (m == Mode::Train) {
        throw std::invalid_argument("'train' is not an inference mode");
    }
    RequireInference(m);
    if (!request.image) {
        throw std::invalid_argument("Inference request has no image");
    }
    switch (m) {
        case Mode::Gallery:
            return InferGallery(*request.image, request.boxes, request.im_info, request.box_norm);
        case Mode::Query:
            return InferQuery(*request.image, request.boxes, request.im_info);
        case Mode::Train:
            break;
    }
    throw std::logic_error("unreachable mode");
}

void PersonSearchNet::SaveState(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open checkpoint for writing: " + path);
    }
    out.write(reinterpret_cast<const char*>(&kCheckpointMagic), sizeof(kCheckpointMagic));
    out.write(reinterpret_cast<const char*>(&kCheckpointVersion), sizeof(kCheckpointVersion));
    cls_score_net_.Save(out);
    bbox_pred_net_.Save(out);
    reid_feat_net_.Save(out);
    bank_.Save(out);
    out.flush();
    if (!out) throw std::runtime_error("Failed to write checkpoint: " + path);
}

void PersonSearchNet::LoadState(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open checkpoint: " + path);
    }
    uint32_t magic = 0;
    uint32_t version = 0;
    in.read(reinterpret_cast<char*>(&magic), sizeof(magic));
    in.read(reinterpret_cast<char*>(&version), sizeof(version));
    if (in && magic == ByteSwap32(kCheckpointMagic)) {
        throw std::runtime_error("Checkpoint " + path + " was written with the opposite byte order");
    }
    if (!in || magic != kCheckpointMagic) {
        throw std::runtime_error("Not a person search checkpoint: " + path);
    }
    if (version != kCheckpointVersion) {
        throw std::runtime_error("Unsupported checkpoint version " + std::to_string(version));
    }

    // Stage everything so a bad file leaves the network unchanged.
    LinearHead cls(cls_score_net_.inFeatures(), cls_score_net_.outFeatures());
    LinearHead bbox(bbox_pred_net_.inFeatures(), bbox_pred_net_.outFeatures());
    LinearHead reid(reid_feat_net_.inFeatures(), reid_feat_net_.outFeatures());
    IdentityBank bank(bank_.numIdentities(), bank_.queueSize(), bank_.dim(), bank_.momentum());
    cls.Load(in);
    bbox.Load(in);
    reid.Load(in);
    bank.Load(in);

    cls_score_net_ = std::move(cls);
    bbox_pred_net_ = std::move(bbox);
    reid_feat_net_ = std::move(reid);
    bank_ = std::move(bank);
}
