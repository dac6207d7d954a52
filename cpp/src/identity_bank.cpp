#include "identity_bank.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace {
constexpr uint32_t kBankMagic = 0x4B4E4249;  // "IBNK"

constexpr uint32_t ByteSwap32(uint32_t v) {
    return (v >> 24) | ((v >> 8) & 0x0000FF00u) | ((v << 8) & 0x00FF0000u) | (v << 24);
}

template <typename T>
void WritePod(std::ostream& out, const T& v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <typename T>
T ReadPod(std::istream& in) {
    T v{};
    in.read(reinterpret_cast<char*>(&v), sizeof(T));
    if (!in) throw std::runtime_error("Truncated identity bank checkpoint");
    return v;
}

void WriteTable(std::ostream& out, const Matrix& m) {
    out.write(reinterpret_cast<const char*>(m.data().data()),
              static_cast<std::streamsize>(m.data().size() * sizeof(float)));
}

void ReadTable(std::istream& in, Matrix& m) {
    in.read(reinterpret_cast<char*>(m.data().data()),
            static_cast<std::streamsize>(m.data().size() * sizeof(float)));
    if (!in) throw std::runtime_error("Truncated identity bank checkpoint");
}
}  // namespace

IdentityBank::IdentityBank(int num_identities, int queue_size, int dim, float momentum)
    : momentum_(momentum) {
    if (num_identities <= 0 || queue_size <= 0 || dim <= 0) {
        throw std::invalid_argument("IdentityBank sizes must be positive");
    }
    if (!(momentum > 0.0f && momentum <= 1.0f)) {
        throw std::invalid_argument("IdentityBank momentum must be in (0, 1]");
    }
    lut_ = Matrix(num_identities, dim);
    queue_ = Matrix(queue_size, dim);
}

Matrix IdentityBank::SimilarityLogits(const Matrix& embeddings) const {
    if (embeddings.cols() != dim()) {
        throw std::invalid_argument("Embedding dimension " + std::to_string(embeddings.cols()) +
                                    " does not match identity bank dimension " +
                                    std::to_string(dim()));
    }
    const int n = numIdentities();
    const int q = queueSize();
    Matrix logits(embeddings.rows(), n + q);
    const Matrix labeled = embeddings.mulTransposed(lut_);
    const Matrix unlabeled = embeddings.mulTransposed(queue_);
    for (int b = 0; b < embeddings.rows(); ++b) {
        float* out = logits.row(b);
        const float* l = labeled.row(b);
        const float* u = unlabeled.row(b);
        for (int j = 0; j < n; ++j) out[j] = l[j];
        for (int j = 0; j < q; ++j) out[n + j] = u[j];
    }
    return logits;
}

Matrix IdentityBank::BackProject(const Matrix& coeffs) const {
    const int n = numIdentities();
    const int q = queueSize();
    if (coeffs.cols() != n + q) {
        throw std::invalid_argument("BackProject expects " + std::to_string(n + q) + " columns");
    }
    Matrix out(coeffs.rows(), dim());
    for (int b = 0; b < coeffs.rows(); ++b) {
        const float* c = coeffs.row(b);
        float* o = out.row(b);
        for (int j = 0; j < n + q; ++j) {
            if (c[j] == 0.0f) continue;
            const float* src = j < n ? lut_.row(j) : queue_.row(j - n);
            for (int k = 0; k < dim(); ++k) o[k] += c[j] * src[k];
        }
    }
    return out;
}

void IdentityBank::Update(const Matrix& embeddings,
                          const std::vector<SampleLabel>& labels,
                          float momentum) {
    if (labels.empty() && embeddings.rows() == 0) return;
    if (static_cast<int>(labels.size()) != embeddings.rows()) {
        throw std::invalid_argument("IdentityBank::Update: " + std::to_string(labels.size()) +
                                    " labels for " + std::to_string(embeddings.rows()) +
                                    " embeddings");
    }
    if (embeddings.cols() != dim()) {
        throw std::invalid_argument("IdentityBank::Update: embedding dimension " +
                                    std::to_string(embeddings.cols()) + " != " +
                                    std::to_string(dim()));
    }
    if (!(momentum > 0.0f && momentum <= 1.0f)) {
        throw std::invalid_argument("IdentityBank::Update: momentum must be in (0, 1]");
    }
    for (const SampleLabel& label : labels) {
        if (label.isKnown() && (label.id < 0 || label.id >= numIdentities())) {
            throw std::out_of_range("Identity id " + std::to_string(label.id) +
                                    " outside [0, " + std::to_string(numIdentities()) + ")");
        }
    }
    if (momentum >= 1.0f) return;

    const int d = dim();
    std::vector<float> e(static_cast<size_t>(d));
    for (int b = 0; b < embeddings.rows(); ++b) {
        const SampleLabel& label = labels[static_cast<size_t>(b)];
        if (label.kind == SampleLabel::Kind::Background) continue;

        e.assign(embeddings.row(b), embeddings.row(b) + d);
        L2Normalize(e.data(), d);

        if (label.isKnown()) {
            float* r = lut_.row(label.id);
            for (int k = 0; k < d; ++k) {
                r[k] = momentum * r[k] + (1.0f - momentum) * e[static_cast<size_t>(k)];
            }
            L2Normalize(r, d);
        } else {
            queue_.setRow(cursor_, e);
            cursor_ = (cursor_ + 1) % queueSize();
        }
    }
}

void IdentityBank::Save(std::ostream& out) const {
    WritePod(out, kBankMagic);
    WritePod(out, static_cast<int32_t>(numIdentities()));
    WritePod(out, static_cast<int32_t>(queueSize()));
    WritePod(out, static_cast<int32_t>(dim()));
    WritePod(out, static_cast<int32_t>(cursor_));
    WritePod(out, momentum_);
    WriteTable(out, lut_);
    WriteTable(out, queue_);
    if (!out) throw std::runtime_error("Failed to write identity bank checkpoint");
}

void IdentityBank::Load(std::istream& in) {
    const uint32_t magic = ReadPod<uint32_t>(in);
    if (magic == ByteSwap32(kBankMagic)) {
        throw std::runtime_error("Identity bank checkpoint was written with the opposite byte order");
    }
    if (magic != kBankMagic) {
        throw std::runtime_error("Not an identity bank checkpoint section");
    }
    const int32_t n = ReadPod<int32_t>(in);
    const int32_t q = ReadPod<int32_t>(in);
    const int32_t d = ReadPod<int32_t>(in);
    const int32_t cursor = ReadPod<int32_t>(in);
    const float momentum = ReadPod<float>(in);
    if (n != numIdentities() || q != queueSize() || d != dim()) {
        throw std::runtime_error("Identity bank checkpoint shape " + std::to_string(n) + "/" +
                                 std::to_string(q) + "/" + std::to_string(d) +
                                 " does not match " + std::to_string(numIdentities()) + "/" +
                                 std::to_string(queueSize()) + "/" + std::to_string(dim()));
    }
    if (cursor < 0 || cursor >= q) {
        throw std::runtime_error("Identity bank checkpoint has invalid queue cursor");
    }
    if (!(momentum > 0.0f && momentum <= 1.0f)) {
        throw std::runtime_error("Identity bank checkpoint momentum " + std::to_string(momentum) +
                                 " outside (0, 1]");
    }

    Matrix lut(n, d);
    Matrix queue(q, d);
    ReadTable(in, lut);
    ReadTable(in, queue);

    lut_ = std::move(lut);
    queue_ = std::move(queue);
    cursor_ = cursor;
    momentum_ = momentum;
}
