#pragma once

#include "matrix.hpp"

#include <iosfwd>
#include <vector>

/**
 * Per-region identity label used during training.
 */
struct SampleLabel {
    enum class Kind { Background, Known, Unlabeled };

    Kind kind = Kind::Background;
    int id = -1;  // valid only for Known

    static SampleLabel background() { return SampleLabel{Kind::Background, -1}; }
    static SampleLabel known(int identity) { return SampleLabel{Kind::Known, identity}; }
    static SampleLabel unlabeled() { return SampleLabel{Kind::Unlabeled, -1}; }

    bool isKnown() const { return kind == Kind::Known; }
};

/**
 * Non-parametric identity classifier state.
 *
 * - `lut`:   one running (momentum-averaged, unit-norm) embedding per labeled
 *            identity, num_identities x dim.
 * - `queue`: ring buffer of the most recent unlabeled-person embeddings,
 *            queue_size x dim, overwritten oldest first.
 *
 * Both tables start at zero and are never resized. The bank is not
 * synchronized: at most one thread may call `Update` at a time, and
 * `SimilarityLogits` must not run concurrently with it.
 */
class IdentityBank {
public:
    IdentityBank(int num_identities, int queue_size, int dim, float momentum);

    int numIdentities() const { return lut_.rows(); }
    int queueSize() const { return queue_.rows(); }
    int dim() const { return lut_.cols(); }
    float momentum() const { return momentum_; }
    int queueCursor() const { return cursor_; }

    const Matrix& lut() const { return lut_; }
    const Matrix& queue() const { return queue_; }

    /**
     * Inner products of each embedding against every LUT row followed by
     * every queue row.
     *
     * @param embeddings B x dim, expected to be L2-normalized
     * @return B x (numIdentities() + queueSize())
     */
    Matrix SimilarityLogits(const Matrix& embeddings) const;

    /**
     * coeffs * [lut; queue], i.e. maps a gradient over the logits returned by
     * `SimilarityLogits` back onto embedding space.
     */
    Matrix BackProject(const Matrix& coeffs) const;

    /**
     * Fold a batch into the bank, samples processed in index order.
     *
     * - Known(i):  lut[i] = normalize(m * lut[i] + (1 - m) * normalize(e))
     * - Unlabeled: queue[cursor] = normalize(e), cursor advances mod queue size
     * - Background: untouched
     *
     * A momentum of 1 freezes the bank: neither table changes.
     * Throws std::out_of_range for an identity outside [0, numIdentities()),
     * std::invalid_argument on a shape mismatch. Validation happens before
     * any row is written, so a failing call leaves the bank untouched.
     */
    void Update(const Matrix& embeddings, const std::vector<SampleLabel>& labels, float momentum);
    void Update(const Matrix& embeddings, const std::vector<SampleLabel>& labels) {
        Update(embeddings, labels, momentum_);
    }

    /**
     * Binary checkpoint section in host byte order: magic, shape, cursor,
     * momentum, then both tables as raw floats. Load requires matching
     * shapes, a valid cursor and a momentum in (0, 1], and throws
     * std::runtime_error otherwise (including for a section written with the
     * opposite byte order).
     */
    void Save(std::ostream& out) const;
    void Load(std::istream& in);

private:
    Matrix lut_;
    Matrix queue_;
    float momentum_;
    int cursor_ = 0;
};
