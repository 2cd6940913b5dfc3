#ifndef CSVD_SVD_HPP
#define CSVD_SVD_HPP

#include <csvd/Matrix.hpp>
#include <csvd/MatrixMath.hpp>
#include <csvd/meta/utils.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <concepts>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace csvd::math {

namespace config {
// largest supported column count N of the fixed-capacity workspace (can override with -DCSVD_MAX_COLUMNS=value)
#ifndef CSVD_MAX_COLUMNS
constexpr std::size_t MAX_COLUMNS = 150UZ;
#else
constexpr std::size_t MAX_COLUMNS = CSVD_MAX_COLUMNS;
#endif
static_assert(MAX_COLUMNS > 0UZ, "CSVD_MAX_COLUMNS must be positive");
} // namespace config

namespace svd {
enum class Status : std::uint8_t {
    Success,
    InvalidColumnCount,   /// N < 1
    CapacityExceeded,     /// N larger than the workspace capacity
    InvalidRowCount,      /// M < 1
    FewerRowsThanColumns, /// M < N
    ShapeMismatch,        /// S, U, V or the auxiliary columns are inconsistent with M, N, NU, NV
    NonFiniteInput,       /// NaN or Inf in A
    MaxIterations         /// QR iteration did not converge within the sweep budget
};

[[nodiscard]] constexpr std::string_view message(Status status) noexcept {
    switch (status) {
    case Status::Success: return "success";
    case Status::InvalidColumnCount: return "column count N must be at least 1";
    case Status::CapacityExceeded: return "column count N exceeds the workspace capacity";
    case Status::InvalidRowCount: return "row count M must be at least 1";
    case Status::FewerRowsThanColumns: return "row count M must not be smaller than column count N";
    case Status::ShapeMismatch: return "output buffers do not match the matrix dimensions";
    case Status::NonFiniteInput: return "input matrix contains NaN or Inf";
    case Status::MaxIterations: return "QR diagonalisation did not converge";
    }
    return "unknown status";
}

struct Config {
    std::size_t maxIterations = 0UZ;   /// 0 = auto (30 * N QR sweeps)
    bool        checkFinite   = true;  /// reject NaN/Inf before touching any buffer
    bool        fullMatrices  = false; /// gesvd(..) only: false = thin U [m x n], true = full U [m x m]
};

/// per-index state of the implicit-shift QR diagonalisation
enum class QrState : std::uint8_t {
    Splitting,  /// scan for a negligible super-diagonal or diagonal element
    Cancelling, /// zero the super-diagonal above a negligible diagonal element
    ShiftStep,  /// one implicit QR sweep with Wilkinson-type origin shift
    Converged   /// bottom 1x1 block is diagonal
};

/**
 * @brief fixed-capacity scratch storage of the SVD engine
 *
 * b and c receive the diagonal and super-diagonal of the bidiagonal form, t is the working copy of c.
 * uHat and vHat accumulate the real rotations of the QR phase (leading dimension nMax).
 * The content carries no meaning between calls; one workspace may be reused for any number of decompositions
 * with N <= nMax but must not be shared between concurrent calls.
 *
 * The footprint is (3 * nMax + 2 * nMax^2) reals, about 180 kB for float and 360 kB for double at the default
 * nMax = 150. Allocate it once on the heap (e.g. std::make_unique<Workspace<Real>>()) or give it static storage
 * rather than placing it on a thread stack.
 */
template<std::floating_point Real, std::size_t nMax = config::MAX_COLUMNS>
requires(nMax > 0UZ)
struct Workspace {
    static constexpr std::size_t capacity = nMax;

    std::array<Real, nMax>        b{};
    std::array<Real, nMax>        c{};
    std::array<Real, nMax>        t{};
    std::array<Real, nMax * nMax> uHat{};
    std::array<Real, nMax * nMax> vHat{};
};
} // namespace svd

namespace detail {

struct Split {
    svd::QrState state;
    std::size_t  l;
};

/// views of the buffers touched by the QR phase
template<typename T, typename Real>
struct QrContext {
    std::span<Real>  s;    /// diagonal [n]
    std::span<Real>  t;    /// super-diagonal [n], t[l] couples s[l-1] and s[l]
    MatrixView<Real> uHat; /// [n x n] or empty if U is not requested
    MatrixView<Real> vHat; /// [n x n] or empty if V is not requested
    MatrixView<T>    aux;  /// rows 0..n of the P auxiliary columns, or empty
    Real             eps;
};

// X[:, a], X[:, b] <- X[:, a] * cs + X[:, b] * sn, X[:, b] * cs - X[:, a] * sn
template<typename T, typename Real>
constexpr void rotateColumns(MatrixView<T> X, std::size_t a, std::size_t b, Real cs, Real sn) noexcept {
    for (std::size_t i = 0UZ; i < X.rows(); ++i) {
        const T x = X[i, a];
        const T y = X[i, b];
        X[i, a]   = x * cs + y * sn;
        X[i, b]   = y * cs - x * sn;
    }
}

template<typename T, typename Real>
constexpr void rotateRows(MatrixView<T> X, std::size_t a, std::size_t b, Real cs, Real sn) noexcept {
    for (std::size_t j = 0UZ; j < X.cols(); ++j) {
        const T x = X[a, j];
        const T y = X[b, j];
        X[a, j]   = x * cs + y * sn;
        X[b, j]   = y * cs - x * sn;
    }
}

template<typename T>
constexpr void swapColumns(MatrixView<T> X, std::size_t a, std::size_t b) noexcept {
    for (std::size_t i = 0UZ; i < X.rows(); ++i) {
        std::swap(X[i, a], X[i, b]);
    }
}

template<typename T>
constexpr void swapRows(MatrixView<T> X, std::size_t a, std::size_t b) noexcept {
    for (std::size_t j = 0UZ; j < X.cols(); ++j) {
        std::swap(X[a, j], X[b, j]);
    }
}

template<typename T>
[[nodiscard]] bool allFinite(MatrixView<const T> A) noexcept {
    for (std::size_t i = 0UZ; i < A.rows(); ++i) {
        for (const T& value : A.row(i)) {
            if (!std::isfinite(value.real()) || !std::isfinite(value.imag())) {
                return false;
            }
        }
    }
    return true;
}

template<typename T>
[[nodiscard]] svd::Status validate(MatrixView<const T> A, std::size_t n, std::size_t sizeS, MatrixView<const T> U, MatrixView<const T> V, std::size_t capacity) noexcept {
    const std::size_t m = A.rows();
    if (n < 1UZ) {
        return svd::Status::InvalidColumnCount;
    }
    if (n > capacity) {
        return svd::Status::CapacityExceeded;
    }
    if (m < 1UZ) {
        return svd::Status::InvalidRowCount;
    }
    if (m < n) {
        return svd::Status::FewerRowsThanColumns;
    }
    if (A.cols() < n || sizeS < n) {
        return svd::Status::ShapeMismatch;
    }
    if (U.cols() > m || (U.cols() > 0UZ && U.rows() != m)) {
        return svd::Status::ShapeMismatch;
    }
    if (V.cols() > n || (V.cols() > 0UZ && V.rows() != n)) {
        return svd::Status::ShapeMismatch;
    }
    return svd::Status::Success;
}

/**
 * Householder reduction of the leading n columns of A [m x (n + p)] to upper bidiagonal form.
 *
 * Column reflector k zeroes A[k+1.., k] and is applied to all n + p columns, followed by a phase correction of
 * row k. Row reflector k zeroes A[k, k+2..n) and acts on the n active columns only. b[k] and c[k+1] receive
 * the magnitudes of the diagonal and super-diagonal (c[0] = 0). The reflector vectors remain in A for the back
 * transformation: column k below (and including) the diagonal, row k right of the diagonal.
 */
template<meta::complex_like T, typename Real = meta::fundamental_base_value_type_t<T>>
void bidiagonalise(MatrixView<T> A, std::size_t n, std::span<Real> b, std::span<Real> c) noexcept {
    const std::size_t m   = A.rows();
    const std::size_t np  = A.cols();
    const Real        tol = std::numeric_limits<Real>::min() / std::numeric_limits<Real>::epsilon();

    c[0] = Real{0};
    for (std::size_t k = 0UZ; k < n; ++k) {
        const std::size_t k1 = k + 1UZ;

        Real z{0};
        for (std::size_t i = k; i < m; ++i) {
            z += squaredMagnitude(A[i, k]);
        }
        b[k] = Real{0};
        if (tol < z) {
            z         = std::sqrt(z);
            b[k]      = z;
            Real w    = std::abs(A[k, k]);
            T    q    = (w == Real{0}) ? T{1} : A[k, k] / w;
            A[k, k]   = q * (z + w);
            const Real scale = z * (z + w);
            for (std::size_t j = k1; j < np; ++j) {
                q = T{0};
                for (std::size_t i = k; i < m; ++i) {
                    q += std::conj(A[i, k]) * A[i, j];
                }
                q /= scale;
                for (std::size_t i = k; i < m; ++i) {
                    A[i, j] -= q * A[i, k];
                }
            }
            q = -std::conj(A[k, k]) / std::abs(A[k, k]); // phase: makes the new diagonal real and positive
            for (std::size_t j = k1; j < np; ++j) {
                A[k, j] = q * A[k, j];
            }
        }

        if (k1 == n) {
            break;
        }

        z = Real{0};
        for (std::size_t j = k1; j < n; ++j) {
            z += squaredMagnitude(A[k, j]);
        }
        c[k1] = Real{0};
        if (tol < z) {
            z         = std::sqrt(z);
            c[k1]     = z;
            Real w    = std::abs(A[k, k1]);
            T    q    = (w == Real{0}) ? T{1} : A[k, k1] / w;
            A[k, k1]  = q * (z + w);
            const Real scale = z * (z + w);
            for (std::size_t i = k1; i < m; ++i) {
                q = T{0};
                for (std::size_t j = k1; j < n; ++j) {
                    q += std::conj(A[k, j]) * A[i, j];
                }
                q /= scale;
                for (std::size_t j = k1; j < n; ++j) {
                    A[i, j] -= q * A[k, j];
                }
            }
            q = -std::conj(A[k, k1]) / std::abs(A[k, k1]);
            for (std::size_t i = k1; i < m; ++i) {
                A[i, k1] = A[i, k1] * q;
            }
        }
    }
}

/**
 * scans upward from index k for the lowest l <= k that starts an unreduced block.
 *
 * @return Converged (l == k) or ShiftStep if t[l] is negligible (t[0] is zero by construction),
 *         Cancelling if s[l-1] is negligible, which requires t[l] to be chased out of the block first
 */
template<std::floating_point Real>
[[nodiscard]] constexpr Split findSplit(std::span<const Real> s, std::span<const Real> t, std::size_t k, Real eps) noexcept {
    for (std::size_t l = k;; --l) {
        if (l == 0UZ || std::abs(t[l]) <= eps) {
            return {l == k ? svd::QrState::Converged : svd::QrState::ShiftStep, l};
        }
        if (std::abs(s[l - 1UZ]) <= eps) {
            return {svd::QrState::Cancelling, l};
        }
    }
}

// Givens sweep from l to k that annihilates t[l..k] against the negligible s[l-1]
template<typename T, typename Real>
void cancel(QrContext<T, Real>& ctx, std::size_t l, std::size_t k) noexcept {
    Real              cs{0};
    Real              sn{1};
    const std::size_t l1 = l - 1UZ;
    for (std::size_t i = l; i <= k; ++i) {
        const Real f = sn * ctx.t[i];
        ctx.t[i]     = cs * ctx.t[i];
        if (std::abs(f) <= ctx.eps) {
            break;
        }
        const Real h = ctx.s[i];
        const Real w = std::sqrt(f * f + h * h);
        ctx.s[i]     = w;
        cs           = h / w;
        sn           = -f / w;
        rotateColumns(ctx.uHat, l1, i, cs, sn);
        rotateRows(ctx.aux, l1, i, cs, sn);
    }
}

// one implicit QR sweep over the unreduced block [l, k], shifted by the eigenvalue estimate of its trailing 2x2 block
template<typename T, typename Real>
void shiftStep(QrContext<T, Real>& ctx, std::size_t l, std::size_t k) noexcept {
    auto& s = ctx.s;
    auto& t = ctx.t;

    Real       x = s[l];
    Real       y = s[k - 1UZ];
    Real       g = t[k - 1UZ];
    Real       h = t[k];
    const Real w = s[k];
    Real       f = ((y - w) * (y + w) + (g - h) * (g + h)) / (Real{2} * h * y);
    g            = std::sqrt(f * f + Real{1});
    if (f < Real{0}) {
        g = -g;
    }
    f = ((x - w) * (x + w) + (y / (f + g) - h) * h) / x;

    Real cs{1};
    Real sn{1};
    for (std::size_t i = l + 1UZ; i <= k; ++i) {
        g = t[i];
        y = s[i];
        h = sn * g;
        g = cs * g;

        Real r   = std::sqrt(h * h + f * f);
        t[i - 1] = r;
        cs       = f / r;
        sn       = h / r;
        f        = x * cs + g * sn;
        g        = g * cs - x * sn;
        h        = y * sn;
        y        = y * cs;
        rotateColumns(ctx.vHat, i - 1UZ, i, cs, sn);

        r        = std::sqrt(h * h + f * f);
        s[i - 1] = r;
        cs       = f / r;
        sn       = h / r;
        f        = cs * g + sn * y;
        x        = cs * y - sn * g;
        rotateColumns(ctx.uHat, i - 1UZ, i, cs, sn);
        rotateRows(ctx.aux, i - 1UZ, i, cs, sn);
    }
    t[l] = Real{0};
    t[k] = f;
    s[k] = x;
}

template<std::floating_point Real>
constexpr void normaliseSign(std::span<Real> s, MatrixView<Real> vHat, std::size_t k) noexcept {
    if (s[k] < Real{0}) {
        s[k] = -s[k];
        for (std::size_t i = 0UZ; i < vHat.rows(); ++i) {
            vHat[i, k] = -vHat[i, k];
        }
    }
}

// selection sort into non-increasing order, permuting the reduced factors and auxiliary rows alongside
template<typename T, typename Real>
void sortSingularValues(std::span<Real> s, MatrixView<Real> uHat, MatrixView<Real> vHat, MatrixView<T> aux) noexcept {
    const std::size_t n = s.size();
    for (std::size_t k = 0UZ; k < n; ++k) {
        Real        g{-1};
        std::size_t j = k;
        for (std::size_t i = k; i < n; ++i) {
            if (g < s[i]) {
                g = s[i];
                j = i;
            }
        }
        if (j != k) {
            s[j] = s[k];
            s[k] = g;
            swapColumns(vHat, j, k);
            swapColumns(uHat, j, k);
            swapRows(aux, j, k);
        }
    }
}

// U <- H_0 D_0^H ... H_{n-1} D_{n-1}^H [uHat 0; 0 I] restricted to the first U.cols() columns
template<meta::complex_like T>
void backTransformLeft(MatrixView<T> U, MatrixView<const T> A, std::size_t n, std::span<const meta::fundamental_base_value_type_t<T>> b, MatrixView<const meta::fundamental_base_value_type_t<T>> uHat) noexcept {
    using Real           = meta::fundamental_base_value_type_t<T>;
    const std::size_t m  = U.rows();
    const std::size_t nu = U.cols();
    for (std::size_t i = 0UZ; i < m; ++i) {
        for (std::size_t j = 0UZ; j < nu; ++j) {
            if (j < n) {
                U[i, j] = (i < n) ? T{uHat[i, j]} : T{0};
            } else {
                U[i, j] = (i == j) ? T{1} : T{0};
            }
        }
    }

    for (std::size_t k = n; k-- > 0UZ;) {
        if (b[k] == Real{0}) {
            continue;
        }
        const Real akk = std::abs(A[k, k]);
        T          q   = -A[k, k] / akk;
        for (std::size_t j = 0UZ; j < nu; ++j) {
            U[k, j] = q * U[k, j];
        }
        for (std::size_t j = 0UZ; j < nu; ++j) {
            q = T{0};
            for (std::size_t i = k; i < m; ++i) {
                q += std::conj(A[i, k]) * U[i, j];
            }
            q /= akk * b[k];
            for (std::size_t i = k; i < m; ++i) {
                U[i, j] -= q * A[i, k];
            }
        }
    }
}

// V <- G_0 ... G_{n-2} vHat restricted to the first V.cols() columns, G_k being the phase-corrected row reflector k
template<meta::complex_like T>
void backTransformRight(MatrixView<T> V, MatrixView<const T> A, std::size_t n, std::span<const meta::fundamental_base_value_type_t<T>> c, MatrixView<const meta::fundamental_base_value_type_t<T>> vHat) noexcept {
    using Real            = meta::fundamental_base_value_type_t<T>;
    const std::size_t nv = V.cols();
    for (std::size_t i = 0UZ; i < n; ++i) {
        for (std::size_t j = 0UZ; j < nv; ++j) {
            V[i, j] = T{vHat[i, j]};
        }
    }
    if (n < 2UZ) {
        return;
    }

    for (std::size_t k = n - 1UZ; k-- > 0UZ;) {
        const std::size_t k1 = k + 1UZ;
        if (c[k1] == Real{0}) {
            continue;
        }
        const Real akk1 = std::abs(A[k, k1]);
        T          q    = -std::conj(A[k, k1]) / akk1;
        for (std::size_t j = 0UZ; j < nv; ++j) {
            V[k1, j] = q * V[k1, j];
        }
        for (std::size_t j = 0UZ; j < nv; ++j) {
            q = T{0};
            for (std::size_t i = k1; i < n; ++i) {
                q += A[k, i] * V[i, j];
            }
            q /= akk1 * c[k1];
            for (std::size_t i = k1; i < n; ++i) {
                V[i, j] -= q * std::conj(A[k, i]);
            }
        }
    }
}

} // namespace detail

/**
 * @brief singular value decomposition A = U * diag(S) * V^H of a complex [m x n] matrix, m >= n
 *
 * Businger-Golub algorithm: Householder bidiagonalisation, implicit-shift QR diagonalisation of the real
 * bidiagonal form, selection sort and back transformation. No heap allocation takes place; all scratch
 * lives in the caller-provided workspace.
 *
 * A is [m x (n + p)]: the leading n columns are decomposed, the trailing p auxiliary columns B receive the
 * left transformation and hold U^H * B on return (rows 0..n-1 in the sorted singular vector order).
 * A is consumed: its content on return is the Householder representation, not the input matrix.
 *
 * @param A  input matrix [m x (n + p)], overwritten
 * @param n  number of columns to decompose, 1 <= n <= nMax and n <= m
 * @param S  output singular values [>= n], the first n non-negative and non-increasing
 * @param U  output leading NU = U.cols() columns of the m x m unitary U [m x NU], NU may be 0
 * @param V  output leading NV = V.cols() columns of the n x n unitary V [n x NV], NV may be 0
 * @param ws scratch storage, capacity nMax columns
 * @param config SVD configuration
 * @return Success, MaxIterations (outputs incomplete) or a validation status raised before any buffer is written
 */
template<meta::complex_like T, std::size_t nMax>
[[nodiscard]] svd::Status decompose(MatrixView<T> A, std::size_t n, std::span<meta::fundamental_base_value_type_t<T>> S, std::type_identity_t<MatrixView<T>> U, std::type_identity_t<MatrixView<T>> V, svd::Workspace<meta::fundamental_base_value_type_t<T>, nMax>& ws, const svd::Config& config = {}) {
    using Real = meta::fundamental_base_value_type_t<T>;
    if (const auto status = detail::validate<T>(A, n, S.size(), U, V, nMax); status != svd::Status::Success) {
        return status;
    }
    if (config.checkFinite && !detail::allFinite<T>(A)) {
        return svd::Status::NonFiniteInput;
    }

    const std::size_t m  = A.rows();
    const std::size_t p  = A.cols() - n;
    const std::size_t nu = U.cols();
    const std::size_t nv = V.cols();

    std::span<Real> b(ws.b.data(), n);
    std::span<Real> c(ws.c.data(), n);
    std::span<Real> t(ws.t.data(), n);
    std::span<Real> s = S.first(n);

    detail::bidiagonalise(A, n, b, c);

    // phase 2: QR diagonalisation of the real bidiagonal (s, t)
    const Real eta = std::numeric_limits<Real>::epsilon();
    Real       eps{0};
    for (std::size_t k = 0UZ; k < n; ++k) {
        s[k] = b[k];
        t[k] = c[k];
        eps  = std::max(eps, s[k] + t[k]);
    }
    eps *= eta;

    MatrixView<Real> uHat(ws.uHat.data(), n, n, nMax);
    MatrixView<Real> vHat(ws.vHat.data(), n, n, nMax);
    for (auto* hat : {&uHat, &vHat}) {
        hat->fill(Real{0});
        for (std::size_t i = 0UZ; i < n; ++i) {
            (*hat)[i, i] = Real{1};
        }
    }

    detail::QrContext<T, Real> ctx{
        .s    = s,
        .t    = t,
        .uHat = nu > 0UZ ? uHat : MatrixView<Real>{},
        .vHat = nv > 0UZ ? vHat : MatrixView<Real>{},
        .aux  = p > 0UZ ? MatrixView<T>(A.data() + n, n, p, A.stride()) : MatrixView<T>{},
        .eps  = eps,
    };

    const std::size_t maxIterations = config.maxIterations == 0UZ ? 30UZ * n : config.maxIterations;
    std::size_t       iterations    = 0UZ;
    for (std::size_t k = n; k-- > 0UZ;) {
        svd::QrState state = svd::QrState::Splitting;
        std::size_t  l     = k;
        while (state != svd::QrState::Converged) {
            switch (state) {
            case svd::QrState::Splitting: {
                const detail::Split split = detail::findSplit<Real>(s, t, k, eps);
                state                     = split.state;
                l                         = split.l;
            } break;
            case svd::QrState::Cancelling:
                detail::cancel(ctx, l, k);
                state = (l == k) ? svd::QrState::Converged : svd::QrState::ShiftStep;
                break;
            case svd::QrState::ShiftStep:
                if (++iterations > maxIterations) {
                    return svd::Status::MaxIterations;
                }
                detail::shiftStep(ctx, l, k);
                state = svd::QrState::Splitting;
                break;
            case svd::QrState::Converged: break;
            }
        }
        detail::normaliseSign(s, ctx.vHat, k);
    }

    // phase 3: sort and back transformation
    detail::sortSingularValues(s, ctx.uHat, ctx.vHat, ctx.aux);

    const MatrixView<const T> reflectors(A.data(), m, A.cols(), A.stride());
    if (nu > 0UZ) {
        detail::backTransformLeft<T>(U, reflectors, n, b, uHat);
    }
    if (nv > 0UZ) {
        detail::backTransformRight<T>(V, reflectors, n, c, vHat);
    }
    return svd::Status::Success;
}

/**
 * @brief as above, with a heap-allocated workspace of config::MAX_COLUMNS capacity (one allocation per call)
 */
template<meta::complex_like T>
[[nodiscard]] svd::Status decompose(MatrixView<T> A, std::size_t n, std::span<meta::fundamental_base_value_type_t<T>> S, std::type_identity_t<MatrixView<T>> U, std::type_identity_t<MatrixView<T>> V, const svd::Config& config = {}) {
    if (const auto status = detail::validate<T>(A, n, S.size(), U, V, config::MAX_COLUMNS); status != svd::Status::Success) {
        return status;
    }
    auto ws = std::make_unique<svd::Workspace<meta::fundamental_base_value_type_t<T>>>();
    return decompose(A, n, S, U, V, *ws, config);
}

/**
 * @brief singular value decomposition: A = U * diag(S) * V^H (allocating convenience interface)
 *
 * A is copied and remains unchanged. Outputs are resized as needed.
 *
 * @param U output left singular vectors [m x n], or [m x m] if config.fullMatrices
 * @param S output singular values [n], always real and non-negative, descending order
 * @param V output right singular vectors [n x n]
 * @param A input matrix [m x n], m >= n
 * @param config SVD configuration
 * @return status indicating success or type of failure
 */
template<meta::complex_like T, typename Allocator>
[[nodiscard]] svd::Status gesvd(Matrix<T, Allocator>& U, std::vector<meta::fundamental_base_value_type_t<T>>& S, Matrix<T, Allocator>& V, const Matrix<T, Allocator>& A, const svd::Config& config = {}) {
    const std::size_t m = A.rows();
    const std::size_t n = A.cols();

    Matrix<T, Allocator> work = A;
    U.resize(m, config.fullMatrices ? m : std::min(m, n));
    V.resize(n, n);
    S.assign(n, meta::fundamental_base_value_type_t<T>{0});
    return decompose<T>(work.view(), n, S, U.view(), V.view(), config);
}

} // namespace csvd::math

template<>
struct fmt::formatter<csvd::math::svd::Status> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(csvd::math::svd::Status status, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

#endif // CSVD_SVD_HPP
