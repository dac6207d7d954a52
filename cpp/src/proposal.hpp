#pragma once

#include "identity_bank.hpp"
#include "losses.hpp"
#include "types.hpp"

#include <vector>

/**
 * Output of the proposal subsystem during training.
 *
 * `transformed` is the spatially-transformed view of each region. The
 * identity head currently reads the shared fc7 descriptor instead, so the
 * controller carries it but does not consume it.
 */
struct TrainProposals {
    std::vector<FeatureMap> pooled;
    std::vector<FeatureMap> transformed;
    float rpn_cls_loss = 0.0f;
    float rpn_box_loss = 0.0f;
    std::vector<int> det_labels;          // 0 background, 1 person
    std::vector<SampleLabel> pid_labels;  // identity label per region
    BoxTargets box_targets;               // R x 8
};

struct GalleryProposals {
    std::vector<BBox> rois;
    std::vector<FeatureMap> pooled;
    std::vector<FeatureMap> transformed;
};

/**
 * Region proposal and pooling subsystem.
 *
 * Boxes are in network-input pixels; `conv` is the backbone head output for
 * that input.
 */
class ProposalNetwork {
public:
    virtual ~ProposalNetwork() = default;

    virtual TrainProposals ProposeTrain(const FeatureMap& conv,
                                        const std::vector<GroundTruthBox>& gt_boxes,
                                        const ImageInfo& im_info) const = 0;

    virtual GalleryProposals ProposeGallery(const FeatureMap& conv,
                                            const std::vector<BBox>& boxes,
                                            const ImageInfo& im_info) const = 0;

    // Pooling only: one pooled feature per box, no proposal generation.
    virtual std::vector<FeatureMap> PoolQuery(const FeatureMap& conv,
                                              const std::vector<BBox>& boxes,
                                              const ImageInfo& im_info) const = 0;
};

/**
 * Proposal subsystem driven entirely by the supplied boxes.
 *
 * Every box becomes a region. Pooling is crop-and-resize: bilinear sampling
 * of a (2 * pooled_size)^2 grid over the box on the conv map followed by a
 * 2x2 max pool. In training each ground-truth row is a region labeled from
 * its class/pid, box targets are zero and the RPN losses are reported as 0.
 * A person row with a pid below -1 throws std::out_of_range before any pooling.
 */
class RoiAlignProposer : public ProposalNetwork {
public:
    /**
     * @param pooled_size Output side length of each pooled region
     * @param spatial_scale Conv-map cells per input pixel (1 / stride)
     */
    explicit RoiAlignProposer(int pooled_size = 7, float spatial_scale = 1.0f / 16.0f);

    TrainProposals ProposeTrain(const FeatureMap& conv,
                                const std::vector<GroundTruthBox>& gt_boxes,
                                const ImageInfo& im_info) const override;

    GalleryProposals ProposeGallery(const FeatureMap& conv,
                                    const std::vector<BBox>& boxes,
                                    const ImageInfo& im_info) const override;

    std::vector<FeatureMap> PoolQuery(const FeatureMap& conv,
                                      const std::vector<BBox>& boxes,
                                      const ImageInfo& im_info) const override;

    FeatureMap Pool(const FeatureMap& conv, const BBox& box, const ImageInfo& im_info) const;

private:
    int pooled_size_;
    float spatial_scale_;
};
