#include "losses.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {
// Stable log-softmax of one row; writes probabilities into `prob`.
double LogSoftmaxRow(const float* z, int n, float* prob, int target) {
    float zmax = z[0];
    for (int j = 1; j < n; ++j) zmax = std::max(zmax, z[j]);
    double sum = 0.0;
    for (int j = 0; j < n; ++j) sum += std::exp(static_cast<double>(z[j] - zmax));
    const double log_sum = std::log(sum);
    for (int j = 0; j < n; ++j) {
        prob[j] = static_cast<float>(std::exp(static_cast<double>(z[j] - zmax) - log_sum));
    }
    return static_cast<double>(z[target] - zmax) - log_sum;
}
}  // namespace

Matrix Softmax(const Matrix& logits) {
    Matrix prob(logits.rows(), logits.cols());
    if (logits.cols() == 0) return prob;
    for (int r = 0; r < logits.rows(); ++r) {
        (void)LogSoftmaxRow(logits.row(r), logits.cols(), prob.row(r), 0);
    }
    return prob;
}

LossTerm DetectionLoss(const Matrix& logits, const std::vector<int>& labels) {
    if (static_cast<int>(labels.size()) != logits.rows()) {
        throw std::invalid_argument("DetectionLoss: " + std::to_string(labels.size()) +
                                    " labels for " + std::to_string(logits.rows()) + " rows");
    }
    LossTerm term;
    term.grad = Matrix(logits.rows(), logits.cols());
    if (logits.rows() == 0) return term;

    const int n = logits.cols();
    const float inv_rows = 1.0f / static_cast<float>(logits.rows());
    double total = 0.0;
    for (int r = 0; r < logits.rows(); ++r) {
        const int y = labels[static_cast<size_t>(r)];
        if (y < 0 || y >= n) {
            throw std::out_of_range("DetectionLoss: class label " + std::to_string(y) +
                                    " outside [0, " + std::to_string(n) + ")");
        }
        float* g = term.grad.row(r);
        total -= LogSoftmaxRow(logits.row(r), n, g, y);
        g[y] -= 1.0f;
        for (int j = 0; j < n; ++j) g[j] *= inv_rows;
    }
    term.value = static_cast<float>(total / static_cast<double>(logits.rows()));
    return term;
}

LossTerm BoxLoss(const Matrix& pred, const BoxTargets& targets, float sigma) {
    const auto same_shape = [&pred](const Matrix& m) {
        return m.rows() == pred.rows() && m.cols() == pred.cols();
    };
    if (!same_shape(targets.targets) || !same_shape(targets.inside_weights) ||
        !same_shape(targets.outside_weights)) {
        throw std::invalid_argument("BoxLoss: prediction and target shapes differ");
    }

    LossTerm term;
    term.grad = Matrix(pred.rows(), pred.cols());
    if (pred.rows() == 0) return term;

    const float sigma2 = sigma * sigma;
    const float inv_rows = 1.0f / static_cast<float>(pred.rows());
    double total = 0.0;
    for (int r = 0; r < pred.rows(); ++r) {
        for (int c = 0; c < pred.cols(); ++c) {
            const float in_w = targets.inside_weights(r, c);
            const float out_w = targets.outside_weights(r, c);
            const float diff = in_w * (pred(r, c) - targets.targets(r, c));
            const float adiff = std::abs(diff);
            float loss;
            float dloss;
            if (adiff < 1.0f / sigma2) {
                loss = 0.5f * sigma2 * diff * diff;
                dloss = sigma2 * diff;
            } else {
                loss = adiff - 0.5f / sigma2;
                dloss = diff > 0.0f ? 1.0f : -1.0f;
            }
            total += static_cast<double>(out_w * loss);
            term.grad(r, c) = out_w * dloss * in_w * inv_rows;
        }
    }
    term.value = static_cast<float>(total / static_cast<double>(pred.rows()));
    return term;
}

LossTerm IdentityLoss(const Matrix& features,
                      const std::vector<SampleLabel>& labels,
                      IdentityBank& bank,
                      int batch_scale,
                      float momentum) {
    if (static_cast<int>(labels.size()) != features.rows()) {
        throw std::invalid_argument("IdentityLoss: " + std::to_string(labels.size()) +
                                    " labels for " + std::to_string(features.rows()) + " rows");
    }
    if (features.rows() > 0 && features.cols() != bank.dim()) {
        throw std::invalid_argument("IdentityLoss: feature dimension " +
                                    std::to_string(features.cols()) + " != bank dimension " +
                                    std::to_string(bank.dim()));
    }
    if (batch_scale <= 0) {
        throw std::invalid_argument("IdentityLoss: batch scale must be positive");
    }

    LossTerm term;
    term.grad = Matrix(features.rows(), bank.dim());
    if (features.rows() == 0) return term;

    // Unit-scale inputs are a hard requirement of both the logits and the bank update.
    Matrix normalized = features;
    std::vector<float> norms;
    normalized.normalizeRows(&norms);

    const Matrix logits = bank.SimilarityLogits(normalized);
    const int k = logits.cols();
    const float inv_scale = 1.0f / static_cast<float>(batch_scale);

    Matrix grad_logits(logits.rows(), k);
    std::vector<float> z(static_cast<size_t>(k));
    double total = 0.0;
    for (int b = 0; b < logits.rows(); ++b) {
        const SampleLabel& label = labels[static_cast<size_t>(b)];
        if (!label.isKnown()) continue;
        if (label.id < 0 || label.id >= bank.numIdentities()) {
            throw std::out_of_range("IdentityLoss: identity id " + std::to_string(label.id) +
                                    " outside [0, " + std::to_string(bank.numIdentities()) + ")");
        }
        const float* l = logits.row(b);
        for (int j = 0; j < k; ++j) z[static_cast<size_t>(j)] = kIdentityLogitScale * l[j];

        float* g = grad_logits.row(b);
        total -= LogSoftmaxRow(z.data(), k, g, label.id);
        g[label.id] -= 1.0f;
        for (int j = 0; j < k; ++j) g[j] *= kIdentityLogitScale * inv_scale;
    }
    term.value = static_cast<float>(total * static_cast<double>(inv_scale));

    // d/dn, then through the row normalization: (g - n (n . g)) / |x|.
    const Matrix grad_n = bank.BackProject(grad_logits);
    for (int b = 0; b < features.rows(); ++b) {
        const float norm = norms[static_cast<size_t>(b)];
        if (!(norm > 0.0f)) continue;
        const float* n = normalized.row(b);
        const float* g = grad_n.row(b);
        double dot = 0.0;
        for (int j = 0; j < bank.dim(); ++j) dot += static_cast<double>(n[j]) * g[j];
        float* out = term.grad.row(b);
        for (int j = 0; j < bank.dim(); ++j) {
            out[j] = static_cast<float>((g[j] - n[j] * dot) / norm);
        }
    }

    bank.Update(normalized, labels, momentum);
    return term;
}
