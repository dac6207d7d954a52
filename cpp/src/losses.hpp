#pragma once

#include "identity_bank.hpp"
#include "matrix.hpp"

#include <vector>

// Temperature applied to the bank similarities before the softmax.
constexpr float kIdentityLogitScale = 10.0f;

/**
 * A scalar loss together with its gradient w.r.t. the loss input.
 */
struct LossTerm {
    float value = 0.0f;
    Matrix grad;
};

/**
 * Regression targets for the 8-column (4 coords x 2 classes) box head.
 *
 * Only the 4 columns of a region's class carry non-zero inside weights.
 */
struct BoxTargets {
    Matrix targets;
    Matrix inside_weights;
    Matrix outside_weights;
};

/**
 * The five training losses, kept separate so callers can log and weight
 * each one before summing.
 */
struct TrainingLosses {
    float rpn_cls = 0.0f;
    float rpn_box = 0.0f;
    float detection = 0.0f;
    float box = 0.0f;
    float identity = 0.0f;
};

/**
 * Row-wise softmax.
 */
Matrix Softmax(const Matrix& logits);

/**
 * Mean softmax cross-entropy over person/not-person logits (R x 2).
 *
 * @param labels One class index per row (0 background, 1 person)
 */
LossTerm DetectionLoss(const Matrix& logits, const std::vector<int>& labels);

/**
 * Smooth-L1 box loss: 0.5 * sigma^2 * x^2 when |x| < 1 / sigma^2,
 * |x| - 0.5 / sigma^2 otherwise, with x = inside_w * (pred - target),
 * scaled by outside_w, summed per region and averaged over regions.
 */
LossTerm BoxLoss(const Matrix& pred, const BoxTargets& targets, float sigma = 1.0f);

/**
 * Identity (online instance matching) loss.
 *
 * L2-normalizes `features`, scores them against `bank`, and takes the
 * softmax cross-entropy of each Known row against its LUT column (the queue
 * columns only act as negatives). The summed loss is divided by
 * `batch_scale`, the number of ground-truth instances in the image batch.
 *
 * The gradient is taken w.r.t. `features` using the bank as it was before
 * this call; afterwards the normalized features are folded into the bank
 * with `momentum`. This is the only function that mutates the bank.
 */
LossTerm IdentityLoss(const Matrix& features,
                      const std::vector<SampleLabel>& labels,
                      IdentityBank& bank,
                      int batch_scale,
                      float momentum);
