#include "proposal.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {
inline float clampf(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

inline float SampleBilinear(const FeatureMap& f, int ch, float x, float y) {
    x = clampf(x, 0.0f, static_cast<float>(f.w - 1));
    y = clampf(y, 0.0f, static_cast<float>(f.h - 1));

    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const int x1 = std::min(x0 + 1, f.w - 1);
    const int y1 = std::min(y0 + 1, f.h - 1);
    const float dx = x - static_cast<float>(x0);
    const float dy = y - static_cast<float>(y0);

    const float v00 = f.at(ch, y0, x0);
    const float v10 = f.at(ch, y0, x1);
    const float v01 = f.at(ch, y1, x0);
    const float v11 = f.at(ch, y1, x1);
    const float v0 = v00 + (v10 - v00) * dx;
    const float v1 = v01 + (v11 - v01) * dx;
    return v0 + (v1 - v0) * dy;
}

BBox ClipToImage(const BBox& b, const ImageInfo& im_info) {
    BBox out{std::min(b.x1, b.x2), std::min(b.y1, b.y2),
             std::max(b.x1, b.x2), std::max(b.y1, b.y2)};
    if (im_info.width > 0.0f && im_info.height > 0.0f) {
        out.x1 = clampf(out.x1, 0.0f, im_info.width - 1.0f);
        out.x2 = clampf(out.x2, 0.0f, im_info.width - 1.0f);
        out.y1 = clampf(out.y1, 0.0f, im_info.height - 1.0f);
        out.y2 = clampf(out.y2, 0.0f, im_info.height - 1.0f);
    }
    return out;
}
}  // namespace

RoiAlignProposer::RoiAlignProposer(int pooled_size, float spatial_scale)
    : pooled_size_(pooled_size), spatial_scale_(spatial_scale) {
    if (pooled_size <= 0 || !(spatial_scale > 0.0f)) {
        throw std::invalid_argument("RoiAlignProposer: pooled size and spatial scale must be positive");
    }
}

FeatureMap RoiAlignProposer::Pool(const FeatureMap& conv,
                                  const BBox& box,
                                  const ImageInfo& im_info) const {
    if (conv.c <= 0 || conv.h <= 0 || conv.w <= 0) {
        throw std::invalid_argument("RoiAlignProposer: empty conv feature map");
    }
    const BBox b = ClipToImage(box, im_info);
    const float x1 = b.x1 * spatial_scale_;
    const float y1 = b.y1 * spatial_scale_;
    const float bin_w = (b.x2 - b.x1) * spatial_scale_;
    const float bin_h = (b.y2 - b.y1) * spatial_scale_;

    const int grid = 2 * pooled_size_;
    FeatureMap out(conv.c, pooled_size_, pooled_size_);
    std::vector<float> crop(static_cast<size_t>(grid) * grid);
    for (int ch = 0; ch < conv.c; ++ch) {
        for (int gy = 0; gy < grid; ++gy) {
            const float y = y1 + (static_cast<float>(gy) + 0.5f) * bin_h / static_cast<float>(grid);
            for (int gx = 0; gx < grid; ++gx) {
                const float x = x1 + (static_cast<float>(gx) + 0.5f) * bin_w / static_cast<float>(grid);
                crop[static_cast<size_t>(gy) * grid + gx] = SampleBilinear(conv, ch, x, y);
            }
        }
        // 2x2 max pool
        for (int py = 0; py < pooled_size_; ++py) {
            for (int px = 0; px < pooled_size_; ++px) {
                const size_t i = static_cast<size_t>(2 * py) * grid + 2 * px;
                out.at(ch, py, px) = std::max(std::max(crop[i], crop[i + 1]),
                                              std::max(crop[i + grid], crop[i + grid + 1]));
            }
        }
    }
    return out;
}

TrainProposals RoiAlignProposer::ProposeTrain(const FeatureMap& conv,
                                              const std::vector<GroundTruthBox>& gt_boxes,
                                              const ImageInfo& im_info) const {
    TrainProposals out;
    const int n = static_cast<int>(gt_boxes.size());
    out.pooled.reserve(gt_boxes.size());
    out.det_labels.reserve(gt_boxes.size());
    out.pid_labels.reserve(gt_boxes.size());
    out.box_targets.targets = Matrix(n, 8);
    out.box_targets.inside_weights = Matrix(n, 8);
    out.box_targets.outside_weights = Matrix(n, 8);

    // Only -1 means unlabeled; any other negative id is a corrupt annotation.
    for (const GroundTruthBox& gt : gt_boxes) {
        if (gt.cls != 0 && gt.pid < -1) {
            throw std::out_of_range("Ground-truth person has invalid identity id " +
                                    std::to_string(gt.pid));
        }
    }

    for (int i = 0; i < n; ++i) {
        const GroundTruthBox& gt = gt_boxes[static_cast<size_t>(i)];
        out.pooled.push_back(Pool(conv, gt.box, im_info));

        const bool person = gt.cls != 0;
        out.det_labels.push_back(person ? 1 : 0);
        if (!person) {
            out.pid_labels.push_back(SampleLabel::background());
        } else if (gt.pid == -1) {
            out.pid_labels.push_back(SampleLabel::unlabeled());
        } else {
            out.pid_labels.push_back(SampleLabel::known(gt.pid));
        }

        // The region is the ground-truth box itself, so its regression target is zero.
        if (person) {
            for (int c = 4; c < 8; ++c) {
                out.box_targets.inside_weights(i, c) = 1.0f;
                out.box_targets.outside_weights(i, c) = 1.0f;
            }
        }
    }
    out.transformed = out.pooled;
    return out;
}

GalleryProposals RoiAlignProposer::ProposeGallery(const FeatureMap& conv,
                                                  const std::vector<BBox>& boxes,
                                                  const ImageInfo& im_info) const {
    GalleryProposals out;
    out.rois.reserve(boxes.size());
    for (const BBox& b : boxes) out.rois.push_back(ClipToImage(b, im_info));
    out.pooled = PoolQuery(conv, boxes, im_info);
    out.transformed = out.pooled;
    return out;
}

std::vector<FeatureMap> RoiAlignProposer::PoolQuery(const FeatureMap& conv,
                                                    const std::vector<BBox>& boxes,
                                                    const ImageInfo& im_info) const {
    std::vector<FeatureMap> pooled;
    pooled.reserve(boxes.size());
    for (const BBox& b : boxes) pooled.push_back(Pool(conv, b, im_info));
    return pooled;
}
