#ifndef CSVD_UNITTESTHELPER_HPP
#define CSVD_UNITTESTHELPER_HPP

#include <boost/ut.hpp>
#include <algorithm>
#include <cmath>
#include <complex>
#include <concepts>
#include <cstddef>
#include <fmt/format.h>
#include <ranges>
#include <source_location>
#include <string>

#include "formatter.hpp"
#include "utils.hpp"

namespace csvd::test {
using namespace boost::ut;

template<typename T>
concept HasSize = requires(const T c) {
    { c.size() } -> std::convertible_to<std::size_t>;
};

template<typename T>
concept Collection = std::ranges::range<T> && HasSize<T>;

template<typename M>
concept MatrixAccess = requires(const M& m, std::size_t i) {
    { m.rows() } -> std::convertible_to<std::size_t>;
    { m.cols() } -> std::convertible_to<std::size_t>;
    m[i, i];
};

struct eq_collection_result {
    bool                 success{};
    std::string          message{};
    std::source_location location = std::source_location::current();

    operator bool() const { return success; }
    friend std::ostream& operator<<(std::ostream& os, const eq_collection_result& r) { return os << r.message; }
};

template<Collection RangeLHS, Collection RangeRHS, typename T = std::ranges::range_value_t<RangeRHS>>
requires std::is_same_v<std::ranges::range_value_t<RangeLHS>, std::ranges::range_value_t<RangeRHS>>
auto approx_collections(const RangeLHS& LHS, const RangeRHS& RHS, T tolerance, std::size_t contextWindow = 3, std::source_location location = std::source_location::current()) -> eq_collection_result {
    const auto sizeLHS = LHS.size();
    const auto sizeRHS = RHS.size();
    if (sizeLHS != sizeRHS) {
        return {false, fmt::format("Collections size mismatch: LHS.size()={}, RHS.size()={}", sizeLHS, sizeRHS), location};
    }

    const auto pred = [tolerance](auto const& lhsValue, auto const& rhsValue) noexcept { return std::abs(lhsValue - rhsValue) <= tolerance; };

    auto firstMismatch = std::ranges::mismatch(LHS, RHS, pred);
    if (firstMismatch.in1 == LHS.end()) {
        return {true, fmt::format("Collections approx match ({} elements) within tolerance={}", sizeLHS, tolerance), location};
    }

    const std::ptrdiff_t idx         = std::distance(LHS.begin(), firstMismatch.in1);
    const std::ptrdiff_t ctxStartIdx = idx < static_cast<std::ptrdiff_t>(contextWindow) ? 0 : (idx - static_cast<std::ptrdiff_t>(contextWindow));
    const std::ptrdiff_t ctxStopIdx  = std::min<std::ptrdiff_t>(static_cast<std::ptrdiff_t>(sizeLHS), idx + static_cast<std::ptrdiff_t>(contextWindow) + 1);

    std::string ctxLHS;
    std::string ctxRHS;
    for (auto i = ctxStartIdx; i < ctxStopIdx; ++i) {
        ctxLHS += fmt::format("{} ", *std::next(LHS.begin(), i));
        ctxRHS += fmt::format("{} ", *std::next(RHS.begin(), i));
    }

    return {false,
        fmt::format("Collections differ (approx) at index={idx}; LHS[{idx}]={lhs} vs RHS[{idx}]={rhs} (tolerance={tol})\nContext window [{ctx_start}, {ctx_end}]:\n  left:  {lhs_context}\n  right: {rhs_context}", //
            fmt::arg("idx", idx), fmt::arg("lhs", *firstMismatch.in1), fmt::arg("rhs", *firstMismatch.in2), fmt::arg("tol", tolerance),                                                                             //
            fmt::arg("ctx_start", ctxStartIdx), fmt::arg("ctx_end", ctxStopIdx - 1), fmt::arg("lhs_context", ctxLHS), fmt::arg("rhs_context", ctxRHS)),
        location};
}

/// element-wise |LHS[i, j] - RHS[i, j]| <= tolerance, reporting the first offending element
template<MatrixAccess MatrixLHS, MatrixAccess MatrixRHS, std::floating_point Real>
auto approx_matrices(const MatrixLHS& LHS, const MatrixRHS& RHS, Real tolerance, std::source_location location = std::source_location::current()) -> eq_collection_result {
    if (LHS.rows() != RHS.rows() || LHS.cols() != RHS.cols()) {
        return {false, fmt::format("Matrix shape mismatch: LHS is {}x{}, RHS is {}x{}", LHS.rows(), LHS.cols(), RHS.rows(), RHS.cols()), location};
    }

    Real maxDiff{0};
    for (std::size_t i = 0UZ; i < LHS.rows(); ++i) {
        for (std::size_t j = 0UZ; j < LHS.cols(); ++j) {
            const auto diff = static_cast<Real>(std::abs(LHS[i, j] - RHS[i, j]));
            if (!(diff <= tolerance)) { // also catches NaN
                return {false, fmt::format("Matrices differ at [{}, {}]: LHS={} vs RHS={} (|diff|={}, tolerance={})", i, j, LHS[i, j], RHS[i, j], diff, tolerance), location};
            }
            maxDiff = std::max(maxDiff, diff);
        }
    }
    return {true, fmt::format("Matrices approx match ({}x{}) within tolerance={}, max |diff|={}", LHS.rows(), LHS.cols(), tolerance, maxDiff), location};
}

/// columns of Q are orthonormal: |Q^H Q - I| <= tolerance element-wise
template<MatrixAccess MatrixQ, std::floating_point Real>
auto isUnitary(const MatrixQ& Q, Real tolerance, std::source_location location = std::source_location::current()) -> eq_collection_result {
    for (std::size_t a = 0UZ; a < Q.cols(); ++a) {
        for (std::size_t b = a; b < Q.cols(); ++b) {
            std::complex<double> dot{0.0};
            for (std::size_t i = 0UZ; i < Q.rows(); ++i) {
                dot += std::conj(std::complex<double>(Q[i, a])) * std::complex<double>(Q[i, b]);
            }
            const double expected = (a == b) ? 1.0 : 0.0;
            const double diff     = std::abs(dot - expected);
            if (!(diff <= static_cast<double>(tolerance))) {
                return {false, fmt::format("columns {} and {} not orthonormal: <q_{}, q_{}> = {} (tolerance={})", a, b, a, b, dot, tolerance), location};
            }
        }
    }
    return {true, fmt::format("{}x{} matrix has orthonormal columns within tolerance={}", Q.rows(), Q.cols(), tolerance), location};
}

} // namespace csvd::test

#endif // CSVD_UNITTESTHELPER_HPP
