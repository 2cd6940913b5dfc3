#ifndef CSVD_MATRIXMATH_HPP
#define CSVD_MATRIXMATH_HPP

#include <csvd/Matrix.hpp>
#include <csvd/meta/utils.hpp>

#include <algorithm>
#include <cmath>
#include <complex>
#include <span>
#include <stdexcept>

#include <fmt/format.h>

namespace csvd::math {

struct dimension_mismatch : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template<typename T>
[[nodiscard]] constexpr auto squaredMagnitude(const T& value) noexcept {
    if constexpr (meta::complex_like<T>) {
        return std::norm(value);
    } else {
        return value * value;
    }
}

template<typename T>
[[nodiscard]] constexpr T conj(const T& value) noexcept {
    if constexpr (meta::complex_like<T>) {
        return std::conj(value);
    } else {
        return value;
    }
}

/**
 * @brief dense matrix product C = A * B
 *
 * @param C output matrix [m x n], fully overwritten
 * @param A input matrix [m x k]
 * @param B input matrix [k x n]
 *
 * @throws dimension_mismatch if A.cols() != B.rows() or C is not [A.rows() x B.cols()]
 */
template<typename T>
void multiply(MatrixView<T> C, MatrixView<const T> A, MatrixView<const T> B) {
    if (A.cols() != B.rows()) {
        throw dimension_mismatch(fmt::format("multiply: A is {}x{} but B is {}x{}", A.rows(), A.cols(), B.rows(), B.cols()));
    }
    if (C.rows() != A.rows() || C.cols() != B.cols()) {
        throw dimension_mismatch(fmt::format("multiply: C is {}x{} but A*B is {}x{}", C.rows(), C.cols(), A.rows(), B.cols()));
    }

    C.fill(T{0});
    for (std::size_t i = 0UZ; i < A.rows(); ++i) {
        for (std::size_t p = 0UZ; p < A.cols(); ++p) { // i-p-j order: unit stride over B and C rows
            const T a = A[i, p];
            if (a == T{0}) {
                continue;
            }
            for (std::size_t j = 0UZ; j < B.cols(); ++j) {
                C[i, j] += a * B[p, j];
            }
        }
    }
}

template<typename T, typename Allocator>
[[nodiscard]] Matrix<T, Allocator> multiply(const Matrix<T, Allocator>& A, const Matrix<T, Allocator>& B) {
    Matrix<T, Allocator> C(A.rows(), B.cols());
    multiply<T>(C.view(), A.view(), B.view());
    return C;
}

/// A^H: transposed and, for complex T, element-wise conjugated
template<typename T>
[[nodiscard]] Matrix<std::remove_const_t<T>> conjTranspose(MatrixView<T> A) {
    Matrix<std::remove_const_t<T>> R(A.cols(), A.rows());
    for (std::size_t i = 0UZ; i < A.rows(); ++i) {
        for (std::size_t j = 0UZ; j < A.cols(); ++j) {
            R[j, i] = conj(A[i, j]);
        }
    }
    return R;
}

template<typename T, typename Allocator>
[[nodiscard]] Matrix<T> conjTranspose(const Matrix<T, Allocator>& A) {
    return conjTranspose(A.view());
}

template<typename T>
[[nodiscard]] auto frobeniusNorm(MatrixView<T> A) {
    using Real = meta::fundamental_base_value_type_t<std::remove_const_t<T>>;
    Real sum{0};
    for (std::size_t i = 0UZ; i < A.rows(); ++i) {
        for (const auto& value : A.row(i)) {
            sum += squaredMagnitude(value);
        }
    }
    return std::sqrt(sum);
}

template<typename T, typename Allocator>
[[nodiscard]] auto frobeniusNorm(const Matrix<T, Allocator>& A) {
    return frobeniusNorm(A.view());
}

/// rows x cols matrix with S on its main diagonal; entries of S beyond min(rows, cols) are ignored
template<meta::complex_like T>
[[nodiscard]] Matrix<T> diagonal(std::span<const meta::fundamental_base_value_type_t<T>> S, std::size_t rows, std::size_t cols) {
    Matrix<T>         D(rows, cols);
    const std::size_t count = std::min({rows, cols, S.size()});
    for (std::size_t i = 0UZ; i < count; ++i) {
        D[i, i] = T{S[i]};
    }
    return D;
}

} // namespace csvd::math

#endif // CSVD_MATRIXMATH_HPP
