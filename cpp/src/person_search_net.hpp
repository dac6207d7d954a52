#pragma once

#include "backbone.hpp"
#include "config.hpp"
#include "identity_bank.hpp"
#include "linear_head.hpp"
#include "losses.hpp"
#include "proposal.hpp"
#include "types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

/**
 * Execution mode. Train vs inference is fixed when the network is built;
 * the inference flavor is chosen per call.
 */
enum class Mode { Train, Gallery, Query };

/**
 * "train", "gallery" or "query". Anything else throws std::invalid_argument.
 */
Mode ParseMode(const std::string& name);
const char* ModeName(Mode mode);

/**
 * delta = pred * std + mean, with the 4 per-coordinate constants repeated
 * across every class block of `pred` (R x 4k).
 */
Matrix DenormalizeBoxDeltas(const Matrix& pred, const BoxNormalization& norm);

struct NetOptions {
    std::string backbone = "res50";
    std::string dataset = "sysu";
    std::string model_dir;  // holds head/tail .param/.bin
    bool is_train = false;
    int pooled_size = 7;
    float spatial_scale = 1.0f / 16.0f;
    unsigned seed = 0;
    bool truncated_init = false;
};

/**
 * Gradients of the three head losses w.r.t. the head outputs.
 */
struct HeadGradients {
    Matrix cls_score;  // R x 2
    Matrix bbox_pred;  // R x 8
    Matrix reid_feat;  // R x D, w.r.t. the un-normalized identity head output
};

struct TrainStep {
    TrainingLosses losses;
    HeadGradients grads;
    Matrix fc7;  // R x feature_dim, input of the three heads
};

struct GalleryOutput {
    Matrix cls_prob;    // R x 2, softmax
    Matrix bbox_pred;   // R x 8, de-normalized deltas
    std::vector<BBox> rois;
    Matrix embeddings;  // R x D, unit norm
};

struct QueryOutput {
    Matrix embeddings;  // one unit-norm row per query box
};

using InferenceOutput = std::variant<GalleryOutput, QueryOutput>;

struct InferenceRequest {
    const RgbImage* image = nullptr;
    std::vector<BBox> boxes;
    ImageInfo im_info;
    BoxNormalization box_norm;  // used by gallery mode only
};

/**
 * Joint detection + re-identification network.
 *
 * backbone head -> proposals -> backbone tail -> {cls, bbox, reid} heads.
 * In training the reid head output feeds the identity loss, which reads and
 * then updates the identity bank. Inference never touches the bank.
 *
 * Training steps are serialized by an internal mutex, so the bank always
 * sees whole batches in call order.
 */
class PersonSearchNet {
public:
    explicit PersonSearchNet(const NetOptions& options);

    PersonSearchNet(std::unique_ptr<Backbone> backbone,
                    std::unique_ptr<ProposalNetwork> proposer,
                    const DatasetPreset& dataset,
                    bool is_train,
                    unsigned seed = 0,
                    bool truncated_init = false);

    PersonSearchNet(const PersonSearchNet&) = delete;
    PersonSearchNet& operator=(const PersonSearchNet&) = delete;

    bool isTrain() const { return is_train_; }
    int featureDim() const { return backbone_->FeatureDim(); }
    int reidDim() const { return bank_.dim(); }

    IdentityBank& bank() { return bank_; }
    const IdentityBank& bank() const { return bank_; }
    LinearHead& clsScoreNet() { return cls_score_net_; }
    LinearHead& bboxPredNet() { return bbox_pred_net_; }
    LinearHead& reidFeatNet() { return reid_feat_net_; }

    /**
     * One forward pass with supervision.
     *
     * Returns the five losses separately plus the head gradients; the only
     * side effect is the identity bank update. Throws std::logic_error on an
     * inference network and std::invalid_argument without ground truth.
     */
    TrainStep Train(const RgbImage& image,
                    const std::vector<GroundTruthBox>& gt_boxes,
                    const ImageInfo& im_info);

    /**
     * Detect-and-identify over the given regions.
     */
    GalleryOutput InferGallery(const RgbImage& image,
                               const std::vector<BBox>& boxes,
                               const ImageInfo& im_info,
                               const BoxNormalization& box_norm) const;

    /**
     * Embeddings for already-known person boxes.
     */
    QueryOutput InferQuery(const RgbImage& image,
                           const std::vector<BBox>& boxes,
                           const ImageInfo& im_info) const;

    /**
     * Dispatch on a mode name. The name is validated before any computation.
     */
    InferenceOutput Infer(const std::string& mode, const InferenceRequest& request) const;

    // Head weights and identity bank, verbatim, in host byte order. Loading
    // a file from an opposite-endian host throws std::runtime_error.
    void SaveState(const std::string& path) const;
    void LoadState(const std::string& path);

private:
    Matrix Describe(const std::vector<FeatureMap>& pooled) const;
    void RequireInference(Mode mode) const;

    std::unique_ptr<Backbone> backbone_;
    std::unique_ptr<ProposalNetwork> proposer_;
    bool is_train_;

    IdentityBank bank_;
    LinearHead cls_score_net_;
    LinearHead bbox_pred_net_;
    LinearHead reid_feat_net_;

    std::mutex train_mutex_;
};
