#pragma once

#include <cstddef>
#include <vector>

/**
 * Dense row-major float matrix.
 *
 * Used for every per-batch numeric table in the network: region descriptors
 * (R x feature_dim), task head outputs, identity embeddings (B x D) and the
 * two identity bank tables.
 */
class Matrix {
public:
    Matrix() = default;
    Matrix(int rows, int cols);
    Matrix(int rows, int cols, const std::vector<float>& data);

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    bool empty() const { return rows_ == 0 || cols_ == 0; }

    float& operator()(int r, int c) { return data_[static_cast<size_t>(r) * cols_ + c]; }
    float operator()(int r, int c) const { return data_[static_cast<size_t>(r) * cols_ + c]; }

    float* row(int r) { return data_.data() + static_cast<size_t>(r) * cols_; }
    const float* row(int r) const { return data_.data() + static_cast<size_t>(r) * cols_; }

    const std::vector<float>& data() const { return data_; }
    std::vector<float>& data() { return data_; }

    Matrix operator*(float scalar) const;

    // this * other^T without materializing the transpose.
    Matrix mulTransposed(const Matrix& other) const;

    void setZero();

    std::vector<float> getRow(int r) const;
    void setRow(int r, const std::vector<float>& v);
    void setRow(int r, const float* v);

    /**
     * Scale every row to unit L2 norm.
     *
     * Rows with zero norm stay zero. If `norms_out` is given it receives the
     * pre-normalization norm of each row.
     */
    void normalizeRows(std::vector<float>* norms_out = nullptr);

    float rowNorm(int r) const;

    bool operator==(const Matrix& other) const;
    bool operator!=(const Matrix& other) const { return !(*this == other); }

private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<float> data_;
};

// Unit L2 norm in place (zero vectors stay zero). Returns the original norm.
float L2Normalize(float* v, int n);
