#include "matrix.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

float L2Normalize(float* v, int n) {
    double ss = 0.0;
    for (int i = 0; i < n; ++i) ss += static_cast<double>(v[i]) * static_cast<double>(v[i]);
    const double norm = std::sqrt(ss);
    const double inv = 1.0 / (norm + 1e-12);
    for (int i = 0; i < n; ++i) v[i] = static_cast<float>(static_cast<double>(v[i]) * inv);
    return static_cast<float>(norm);
}

Matrix::Matrix(int rows, int cols)
    : rows_(rows), cols_(cols) {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("Matrix dimensions must be non-negative");
    }
    data_.assign(static_cast<size_t>(rows) * static_cast<size_t>(cols), 0.0f);
}

Matrix::Matrix(int rows, int cols, const std::vector<float>& data)
    : rows_(rows), cols_(cols), data_(data) {
    if (rows < 0 || cols < 0 ||
        data.size() != static_cast<size_t>(rows) * static_cast<size_t>(cols)) {
        throw std::invalid_argument("Matrix data size mismatch");
    }
}

Matrix Matrix::operator*(float scalar) const {
    Matrix result(rows_, cols_);
    for (size_t i = 0; i < data_.size(); ++i) {
        result.data_[i] = data_[i] * scalar;
    }
    return result;
}

Matrix Matrix::mulTransposed(const Matrix& other) const {
    if (cols_ != other.cols_) {
        throw std::invalid_argument("Matrix dimensions mismatch for multiplication: " +
                                    std::to_string(cols_) + " vs " + std::to_string(other.cols_));
    }
    Matrix result(rows_, other.rows_);
    for (int i = 0; i < rows_; ++i) {
        const float* a = row(i);
        for (int j = 0; j < other.rows_; ++j) {
            const float* b = other.row(j);
            double dot = 0.0;
            for (int k = 0; k < cols_; ++k) {
                dot += static_cast<double>(a[k]) * static_cast<double>(b[k]);
            }
            result(i, j) = static_cast<float>(dot);
        }
    }
    return result;
}

void Matrix::setZero() {
    std::fill(data_.begin(), data_.end(), 0.0f);
}

std::vector<float> Matrix::getRow(int r) const {
    return std::vector<float>(row(r), row(r) + cols_);
}

void Matrix::setRow(int r, const std::vector<float>& v) {
    if (static_cast<int>(v.size()) != cols_) {
        throw std::invalid_argument("Matrix row size mismatch");
    }
    setRow(r, v.data());
}

void Matrix::setRow(int r, const float* v) {
    std::copy(v, v + cols_, row(r));
}

void Matrix::normalizeRows(std::vector<float>* norms_out) {
    if (norms_out) norms_out->assign(static_cast<size_t>(rows_), 0.0f);
    for (int i = 0; i < rows_; ++i) {
        const float n = L2Normalize(row(i), cols_);
        if (norms_out) (*norms_out)[static_cast<size_t>(i)] = n;
    }
}

float Matrix::rowNorm(int r) const {
    double ss = 0.0;
    const float* v = row(r);
    for (int k = 0; k < cols_; ++k) ss += static_cast<double>(v[k]) * static_cast<double>(v[k]);
    return static_cast<float>(std::sqrt(ss));
}

bool Matrix::operator==(const Matrix& other) const {
    return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
}
