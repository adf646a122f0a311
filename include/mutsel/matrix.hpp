#pragma once
// Row-major dense matrix with an OpenMP row-block matrix-vector product.

#include "mutsel/errors.hpp"
#include "mutsel/precision.hpp"

#include <cstddef>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mutsel {

// Half-open class interval [begin, end).
struct ClassRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }
    bool contains(size_t i) const { return i >= begin && i < end; }
    bool operator==(const ClassRange& other) const {
        return begin == other.begin && end == other.end;
    }
    bool operator!=(const ClassRange& other) const { return !(*this == other); }
};

// Products below this row count run on the calling thread.
constexpr size_t kParallelRowThreshold = 64;

template <typename Real>
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols, Real(0)) {}

    static Matrix identity(size_t n) {
        Matrix m(n, n);
        for (size_t i = 0; i < n; ++i) m(i, i) = Real(1);
        return m;
    }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return data_.empty(); }
    bool square() const { return rows_ == cols_; }

    Real& operator()(size_t i, size_t j) { return data_[i * cols_ + j]; }
    const Real& operator()(size_t i, size_t j) const { return data_[i * cols_ + j]; }

    const Real* row(size_t i) const { return data_.data() + i * cols_; }
    Real* row(size_t i) { return data_.data() + i * cols_; }

    std::vector<Real> column(size_t j) const {
        std::vector<Real> out(rows_);
        for (size_t i = 0; i < rows_; ++i) out[i] = (*this)(i, j);
        return out;
    }

    // out = A v. Rows are split across OpenMP threads; each row is owned by
    // exactly one thread and A, v are read-only for the duration.
    void multiply(const std::vector<Real>& v, std::vector<Real>& out, int num_threads = 0) const {
        if (v.size() != cols_) {
            throw InvalidArgument("Matrix::multiply: vector length " + std::to_string(v.size()) +
                                  " does not match " + std::to_string(cols_) + " columns");
        }
        out.resize(rows_);
        const long n = static_cast<long>(rows_);
        const size_t cols = cols_;
#ifdef _OPENMP
        const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
        #pragma omp parallel for schedule(static) num_threads(threads) if (rows_ >= kParallelRowThreshold)
#else
        (void)num_threads;
#endif
        for (long i = 0; i < n; ++i) {
            const Real* r = row(static_cast<size_t>(i));
            Real acc(0);
            for (size_t j = 0; j < cols; ++j) acc += r[j] * v[j];
            out[static_cast<size_t>(i)] = acc;
        }
    }

    std::vector<Real> operator*(const std::vector<Real>& v) const {
        std::vector<Real> out;
        multiply(v, out);
        return out;
    }

    // Principal sub-block over rows and columns [range.begin, range.end).
    Matrix block(const ClassRange& range) const {
        if (range.end > rows_ || range.end > cols_ || range.begin > range.end) {
            throw InvalidArgument("Matrix::block: range [" + std::to_string(range.begin) + ", " +
                                  std::to_string(range.end) + ") outside matrix");
        }
        Matrix out(range.size(), range.size());
        for (size_t i = 0; i < range.size(); ++i) {
            for (size_t j = 0; j < range.size(); ++j) {
                out(i, j) = (*this)(range.begin + i, range.begin + j);
            }
        }
        return out;
    }

    template <typename To>
    Matrix<To> convert() const {
        Matrix<To> out(rows_, cols_);
        for (size_t i = 0; i < rows_; ++i) {
            for (size_t j = 0; j < cols_; ++j) out(i, j) = type_convert<To>((*this)(i, j));
        }
        return out;
    }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<Real> data_;
};

}  // namespace mutsel
