#ifndef CSVD_PSEUDOINVERSE_HPP
#define CSVD_PSEUDOINVERSE_HPP

#include <csvd/Error.hpp>
#include <csvd/Matrix.hpp>
#include <csvd/MatrixMath.hpp>
#include <csvd/SVD.hpp>
#include <csvd/meta/utils.hpp>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <expected>
#include <source_location>
#include <span>
#include <vector>

#include <fmt/format.h>

namespace csvd::math {

namespace pinv {
template<std::floating_point Real>
struct Config {
    Real        cutoff = Real(1e-4); /// singular values <= cutoff are treated as zero (absolute, not scale-relative)
    svd::Config svd{};               /// forwarded to the decomposition by pseudoInverse(A, ..)
};
} // namespace pinv

/**
 * @brief Moore-Penrose pseudo-inverse INV = V * S^+ * U^H from an existing decomposition of an [m x n] matrix
 *
 * S^+ holds 1/S[k] for S[k] > cutoff and 0 otherwise, padded with zeros to length m.
 *
 * @param INV output [n x m], fully overwritten
 * @param S   singular values, first n valid, room for m entries; overwritten with the padded S^+
 * @param U   left singular vectors [m x >= n]
 * @param V   right singular vectors [n x >= n]
 * @param config cut-off configuration
 *
 * @throws dimension_mismatch if the buffer shapes are inconsistent
 */
template<meta::complex_like T>
void pseudoInverse(MatrixView<T> INV, std::span<meta::fundamental_base_value_type_t<T>> S, std::type_identity_t<MatrixView<const T>> U, std::type_identity_t<MatrixView<const T>> V, const pinv::Config<meta::fundamental_base_value_type_t<T>>& config = {}) {
    using Real          = meta::fundamental_base_value_type_t<T>;
    const std::size_t m = U.rows();
    const std::size_t n = V.rows();

    if (U.cols() < n || V.cols() < n) {
        throw dimension_mismatch(fmt::format("pseudoInverse: U [{}x{}] and V [{}x{}] must provide {} singular vectors", U.rows(), U.cols(), V.rows(), V.cols(), n));
    }
    if (INV.rows() != n || INV.cols() != m) {
        throw dimension_mismatch(fmt::format("pseudoInverse: INV is {}x{} but must be {}x{}", INV.rows(), INV.cols(), n, m));
    }
    if (S.size() < m || m < n) {
        throw dimension_mismatch(fmt::format("pseudoInverse: S holds {} entries, needs room for m = {} >= n = {}", S.size(), m, n));
    }

    for (std::size_t k = 0UZ; k < n; ++k) {
        S[k] = (S[k] > config.cutoff) ? Real{1} / S[k] : Real{0};
    }
    for (std::size_t k = n; k < m; ++k) {
        S[k] = Real{0};
    }

    for (std::size_t i = 0UZ; i < n; ++i) {
        for (std::size_t j = 0UZ; j < m; ++j) {
            T sum{0};
            for (std::size_t k = 0UZ; k < n; ++k) {
                if (S[k] != Real{0}) {
                    sum += V[i, k] * S[k] * std::conj(U[j, k]);
                }
            }
            INV[i, j] = sum;
        }
    }
}

/**
 * @brief pseudo-inverse of an [m x n] matrix, m >= n (allocating convenience interface, A is not modified)
 *
 * @return INV [n x m], or an Error carrying the decomposition status if the SVD fails
 */
template<meta::complex_like T, typename Allocator>
[[nodiscard]] std::expected<Matrix<T>, Error> pseudoInverse(const Matrix<T, Allocator>& A, const pinv::Config<meta::fundamental_base_value_type_t<T>>& config = {}, std::source_location location = std::source_location::current()) {
    using Real          = meta::fundamental_base_value_type_t<T>;
    const std::size_t m = A.rows();
    const std::size_t n = A.cols();

    Matrix<T>         work(A.view());
    Matrix<T>         U(m, m);
    Matrix<T>         V(n, n);
    std::vector<Real> S(std::max(m, n), Real{0});

    if (const svd::Status status = decompose<T>(work.view(), n, S, U.view(), V.view(), config.svd); status != svd::Status::Success) {
        return std::unexpected(Error{fmt::format("pseudo-inverse of {}x{} matrix failed: {} ({})", m, n, status, svd::message(status)), location});
    }

    Matrix<T> INV(n, m);
    pseudoInverse<T>(INV.view(), S, U.view(), V.view(), config);
    return INV;
}

} // namespace csvd::math

#endif // CSVD_PSEUDOINVERSE_HPP
