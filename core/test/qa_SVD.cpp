#include <boost/ut.hpp>

#include <csvd/Matrix.hpp>
#include <csvd/MatrixMath.hpp>
#include <csvd/SVD.hpp>
#include <csvd/meta/UnitTestHelper.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <limits>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <tuple>
#include <vector>

#include <fmt/format.h>

using namespace csvd;
using namespace csvd::math;

using ComplexTypes = std::tuple<std::complex<float>, std::complex<double>>;

// ============================================================================
// Test Helpers
// ============================================================================

template<typename T>
[[nodiscard]] Matrix<T> randomMatrix(std::size_t m, std::size_t n, unsigned seed = 42U) {
    using Real = meta::fundamental_base_value_type_t<T>;
    std::mt19937                         gen(seed);
    std::uniform_real_distribution<Real> dis(Real{-1}, Real{1});
    Matrix<T>                            A(m, n);
    for (auto& x : A) {
        x = T{dis(gen), dis(gen)};
    }
    return A;
}

template<typename T>
[[nodiscard]] Matrix<T> referenceMatrix() {
    return Matrix<T>(3UZ, 3UZ,
        {
            T(0.4032, 0.0876), T(0.1678, 0.0390), T(0.5425, 0.5118),   //
            T(0.3174, 0.3352), T(0.9784, 0.4514), T(-0.4416, -1.3188), //
            T(0.4008, -0.0504), T(0.0979, -0.2558), T(0.2983, 0.7800), //
        });
}

template<typename T>
[[nodiscard]] constexpr meta::fundamental_base_value_type_t<T> defaultTolerance() {
    using Real = meta::fundamental_base_value_type_t<T>;
    return std::is_same_v<Real, float> ? static_cast<Real>(1e-4f) : static_cast<Real>(1e-10);
}

// U[:, :n] * diag(S) * V^H
template<typename T, typename Real = meta::fundamental_base_value_type_t<T>>
[[nodiscard]] Matrix<T> reconstruct(const Matrix<T>& U, const std::vector<Real>& S, const Matrix<T>& V) {
    const std::size_t m = U.rows();
    const std::size_t n = V.rows();
    Matrix<T>         R(m, n);
    for (std::size_t i = 0UZ; i < m; ++i) {
        for (std::size_t j = 0UZ; j < n; ++j) {
            T sum{0};
            for (std::size_t k = 0UZ; k < n; ++k) {
                sum += U[i, k] * S[k] * std::conj(V[j, k]);
            }
            R[i, j] = sum;
        }
    }
    return R;
}

template<typename T>
struct Decomposition {
    using Real = meta::fundamental_base_value_type_t<T>;

    svd::Status       status = svd::Status::Success;
    Matrix<T>         U;
    std::vector<Real> S;
    Matrix<T>         V;
};

template<typename T>
[[nodiscard]] Decomposition<T> runDecompose(const Matrix<T>& A, std::size_t nu, std::size_t nv, const svd::Config& config = {}) {
    const std::size_t m = A.rows();
    const std::size_t n = A.cols();
    Decomposition<T>  result{.status = svd::Status::Success, .U = Matrix<T>(m, nu), .S = std::vector<meta::fundamental_base_value_type_t<T>>(n), .V = Matrix<T>(n, nv)};
    Matrix<T>         work = A;
    result.status          = decompose<T>(work.view(), n, result.S, result.U.view(), result.V.view(), config);
    return result;
}

template<typename Real>
[[nodiscard]] bool sortedDescendingNonNegative(std::span<const Real> S) {
    for (std::size_t i = 0UZ; i < S.size(); ++i) {
        if (!(S[i] >= Real{0}) || (i + 1UZ < S.size() && S[i] < S[i + 1UZ])) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Tests
// ============================================================================

const boost::ut::suite<"SVD dimension validation"> _svd_validation = [] {
    using namespace boost::ut;
    using T    = std::complex<double>;
    using Real = double;

    constexpr Real kSentinel = 42.0;

    "N < 1"_test = [&] {
        Matrix<T>         A = randomMatrix<T>(3UZ, 3UZ);
        const Matrix<T>   original = A;
        std::vector<Real> S(3UZ, kSentinel);
        Matrix<T>         U(3UZ, 3UZ, T{kSentinel});
        Matrix<T>         V(3UZ, 3UZ, T{kSentinel});

        expect(decompose<T>(A.view(), 0UZ, S, U.view(), V.view()) == svd::Status::InvalidColumnCount);
        expect(A == original) << "A must not be touched";
        expect(std::ranges::all_of(S, [&](Real s) { return s == kSentinel; }));
        expect(std::ranges::all_of(U, [&](const T& u) { return u == T{kSentinel}; }));
        expect(std::ranges::all_of(V, [&](const T& v) { return v == T{kSentinel}; }));
    };

    "N above the workspace capacity"_test = [&] {
        Matrix<T>                     A = randomMatrix<T>(6UZ, 5UZ);
        const Matrix<T>               original = A;
        std::vector<Real>             S(5UZ, kSentinel);
        Matrix<T>                     U(6UZ, 5UZ, T{kSentinel});
        Matrix<T>                     V(5UZ, 5UZ, T{kSentinel});
        svd::Workspace<Real, 4UZ>     ws;

        expect(decompose<T>(A.view(), 5UZ, S, U.view(), V.view(), ws) == svd::Status::CapacityExceeded);
        expect(A == original);
        expect(std::ranges::all_of(S, [&](Real s) { return s == kSentinel; }));
        expect(std::ranges::all_of(U, [&](const T& u) { return u == T{kSentinel}; }));

        expect(decompose<T>(A.view().columns(0UZ, 4UZ), 4UZ, S, U.view().columns(0UZ, 4UZ), V.view().columns(0UZ, 4UZ), ws) == svd::Status::ShapeMismatch) << "V must have n rows";
        Matrix<T> V4(4UZ, 4UZ);
        expect(decompose<T>(A.view().columns(0UZ, 4UZ), 4UZ, S, U.view().columns(0UZ, 4UZ), V4.view(), ws) == svd::Status::Success) << "N == capacity is fine";
    };

    "N above config::MAX_COLUMNS (heap workspace)"_test = [&] {
        constexpr std::size_t n = csvd::math::config::MAX_COLUMNS + 1UZ;
        Matrix<T>             A(n, n);
        std::vector<Real>     S(n, kSentinel);
        Matrix<T>             U(n, 0UZ);
        Matrix<T>             V(n, 0UZ);
        expect(decompose<T>(A.view(), n, S, U.view(), V.view()) == svd::Status::CapacityExceeded);
        expect(std::ranges::all_of(S, [&](Real s) { return s == kSentinel; }));
    };

    "M < 1"_test = [&] {
        std::array<T, 1UZ> storage{};
        std::vector<Real>  S(1UZ, kSentinel);
        expect(decompose<T>(MatrixView<T>(storage.data(), 0UZ, 1UZ), 1UZ, S, MatrixView<T>{}, MatrixView<T>{}) == svd::Status::InvalidRowCount);
        expect(eq(S[0], kSentinel));
    };

    "M < N"_test = [&] {
        Matrix<T>         A = randomMatrix<T>(2UZ, 3UZ);
        const Matrix<T>   original = A;
        std::vector<Real> S(3UZ, kSentinel);
        Matrix<T>         U(2UZ, 2UZ, T{kSentinel});
        Matrix<T>         V(3UZ, 3UZ, T{kSentinel});

        expect(decompose<T>(A.view(), 3UZ, S, U.view(), V.view()) == svd::Status::FewerRowsThanColumns);
        expect(A == original);
        expect(std::ranges::all_of(S, [&](Real s) { return s == kSentinel; }));
        expect(std::ranges::all_of(V, [&](const T& v) { return v == T{kSentinel}; }));
    };

    "inconsistent output buffers"_test = [&] {
        Matrix<T> A = randomMatrix<T>(4UZ, 3UZ);
        Matrix<T> U(4UZ, 4UZ);
        Matrix<T> V(3UZ, 3UZ);

        std::vector<Real> shortS(2UZ);
        expect(decompose<T>(A.view(), 3UZ, shortS, U.view(), V.view()) == svd::Status::ShapeMismatch) << "S too short";

        std::vector<Real> S(3UZ);
        Matrix<T>         wrongRowsU(3UZ, 2UZ);
        expect(decompose<T>(A.view(), 3UZ, S, wrongRowsU.view(), V.view()) == svd::Status::ShapeMismatch) << "U rows != M";

        Matrix<T> wideV(3UZ, 4UZ);
        expect(decompose<T>(A.view(), 3UZ, S, U.view(), wideV.view()) == svd::Status::ShapeMismatch) << "NV > N";

        expect(decompose<T>(A.view().columns(0UZ, 2UZ), 3UZ, S, U.view(), V.view()) == svd::Status::ShapeMismatch) << "A narrower than N";
    };

    "non-finite input"_test = [&] {
        Matrix<T> A = randomMatrix<T>(4UZ, 3UZ);
        A[2, 1]     = T{std::numeric_limits<Real>::quiet_NaN(), 0.0};
        std::vector<Real> S(3UZ, kSentinel);
        Matrix<T>         U(4UZ, 3UZ, T{kSentinel});
        Matrix<T>         V(3UZ, 3UZ, T{kSentinel});

        expect(decompose<T>(A.view(), 3UZ, S, U.view(), V.view()) == svd::Status::NonFiniteInput);
        expect(std::ranges::all_of(S, [&](Real s) { return s == kSentinel; }));
        expect(std::ranges::all_of(U, [&](const T& u) { return u == T{kSentinel}; }));

        A[2, 1] = T{0.0, std::numeric_limits<Real>::infinity()};
        expect(decompose<T>(A.view(), 3UZ, S, U.view(), V.view()) == svd::Status::NonFiniteInput);
    };

    "status messages"_test = [] {
        expect(eq(fmt::format("{}", svd::Status::CapacityExceeded), std::string("CapacityExceeded")));
        expect(eq(fmt::format("{}", svd::Status::Success), std::string("Success")));
        expect(!svd::message(svd::Status::FewerRowsThanColumns).empty());
        expect(svd::message(svd::Status::InvalidColumnCount) != svd::message(svd::Status::InvalidRowCount));
    };
};

const boost::ut::suite<"SVD reference matrix"> _svd_reference = [] {
    using namespace boost::ut;

    "3x3 reference reconstruction"_test = []<typename T> {
        using Real       = meta::fundamental_base_value_type_t<T>;
        const Matrix<T> A = referenceMatrix<T>();
        const auto      r = runDecompose(A, 3UZ, 3UZ);

        expect(fatal(r.status == svd::Status::Success)) << fmt::format("{}", r.status);
        expect(sortedDescendingNonNegative<Real>(r.S)) << fmt::format("S = [{}]", fmt::join(r.S, ", "));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, Real(1e-4)));
        expect(test::isUnitary(r.U, Real(1e-4)));
        expect(test::isUnitary(r.V, Real(1e-4)));
    } | ComplexTypes{};

    "float and double agree"_test = [] {
        const auto rf = runDecompose(referenceMatrix<std::complex<float>>(), 0UZ, 0UZ);
        const auto rd = runDecompose(referenceMatrix<std::complex<double>>(), 0UZ, 0UZ);
        expect(fatal(rf.status == svd::Status::Success && rd.status == svd::Status::Success));
        for (std::size_t i = 0UZ; i < 3UZ; ++i) {
            expect(approx(static_cast<double>(rf.S[i]), rd.S[i], 1e-4)) << "S[" << i << "]";
        }
    };
};

const boost::ut::suite<"SVD properties"> _svd_properties = [] {
    using namespace boost::ut;

    "random shapes: reconstruction, ordering, unitarity"_test = []<typename T> {
        using Real = meta::fundamental_base_value_type_t<T>;
        constexpr std::array shapes{std::pair{1UZ, 1UZ}, std::pair{3UZ, 1UZ}, std::pair{2UZ, 2UZ}, std::pair{4UZ, 4UZ}, std::pair{7UZ, 3UZ}, std::pair{10UZ, 10UZ}, std::pair{12UZ, 5UZ}, std::pair{20UZ, 16UZ}};
        unsigned             seed = 1U;
        for (const auto& [m, n] : shapes) {
            const Matrix<T>   A     = randomMatrix<T>(m, n, seed++);
            const auto        r     = runDecompose(A, m, n);
            const std::string label = fmt::format("{}x{} {}", m, n, meta::type_name<T>());

            expect(fatal(r.status == svd::Status::Success)) << label;
            expect(sortedDescendingNonNegative<Real>(r.S)) << label;
            expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, defaultTolerance<T>())) << label;
            expect(test::isUnitary(r.U, defaultTolerance<T>())) << label << " U (full)";
            expect(test::isUnitary(r.V, defaultTolerance<T>())) << label << " V";
        }
    } | ComplexTypes{};

    "known singular values of a scaled diagonal matrix"_test = []<typename T> {
        using Real = meta::fundamental_base_value_type_t<T>;
        Matrix<T> D(5UZ, 4UZ);
        D[0, 0]    = T{3, 0};
        D[1, 1]    = T{0, 7};  // phase does not change the singular value
        D[2, 2]    = T{-1, 0};
        D[3, 3]    = T{3, 4};
        const auto r = runDecompose(D, 5UZ, 4UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(test::approx_collections(r.S, std::vector<Real>{7, 5, 3, 1}, defaultTolerance<T>()));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), D, defaultTolerance<T>()));
    } | ComplexTypes{};

    "gesvd convenience keeps A and honours fullMatrices"_test = []<typename T> {
        using Real        = meta::fundamental_base_value_type_t<T>;
        const Matrix<T> A = randomMatrix<T>(6UZ, 4UZ, 7U);
        const Matrix<T> copy = A;

        Matrix<T>         U;
        Matrix<T>         V;
        std::vector<Real> S;
        expect(fatal(gesvd(U, S, V, A) == svd::Status::Success));
        expect(A == copy);
        expect(eq(U.rows(), 6UZ));
        expect(eq(U.cols(), 4UZ));
        expect(eq(S.size(), 4UZ));
        expect(test::approx_matrices(reconstruct(U, S, V), A, defaultTolerance<T>()));

        expect(fatal(gesvd(U, S, V, A, svd::Config{.fullMatrices = true}) == svd::Status::Success));
        expect(eq(U.cols(), 6UZ));
        expect(test::isUnitary(U, defaultTolerance<T>()));
    } | ComplexTypes{};
};

const boost::ut::suite<"SVD truncated factors"> _svd_truncated = [] {
    using namespace boost::ut;

    "NU < N and NV < N give the leading columns"_test = []<typename T> {
        const Matrix<T> A    = randomMatrix<T>(8UZ, 6UZ, 3U);
        const auto      full = runDecompose(A, 8UZ, 6UZ);
        const auto      part = runDecompose(A, 2UZ, 3UZ);
        expect(fatal(full.status == svd::Status::Success && part.status == svd::Status::Success));

        expect(test::approx_collections(part.S, full.S, defaultTolerance<T>()));
        expect(test::approx_matrices(part.U.view(), full.U.view().columns(0UZ, 2UZ), defaultTolerance<T>()));
        expect(test::approx_matrices(part.V.view(), full.V.view().columns(0UZ, 3UZ), defaultTolerance<T>()));
    } | ComplexTypes{};

    "NU = 0 and NV = 0 compute singular values only"_test = []<typename T> {
        const Matrix<T> A    = randomMatrix<T>(5UZ, 5UZ, 4U);
        const auto      full = runDecompose(A, 5UZ, 5UZ);
        const auto      none = runDecompose(A, 0UZ, 0UZ);
        expect(fatal(none.status == svd::Status::Success));
        expect(test::approx_collections(none.S, full.S, defaultTolerance<T>()));
    } | ComplexTypes{};

    "thin U (NU = N) of a tall matrix"_test = []<typename T> {
        const Matrix<T> A = randomMatrix<T>(9UZ, 4UZ, 5U);
        const auto      r = runDecompose(A, 4UZ, 4UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(test::isUnitary(r.U, defaultTolerance<T>()));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, defaultTolerance<T>()));
    } | ComplexTypes{};
};

const boost::ut::suite<"SVD auxiliary columns"> _svd_auxiliary = [] {
    using namespace boost::ut;

    "P > 0: auxiliary columns receive U^H * B"_test = []<typename T> {
        using Real            = meta::fundamental_base_value_type_t<T>;
        constexpr std::size_t m = 7UZ;
        constexpr std::size_t n = 4UZ;
        constexpr std::size_t p = 2UZ;

        const Matrix<T> A = randomMatrix<T>(m, n, 11U);
        const Matrix<T> B = randomMatrix<T>(m, p, 12U);
        Matrix<T>       augmented(m, n + p);
        for (std::size_t i = 0UZ; i < m; ++i) {
            for (std::size_t j = 0UZ; j < n + p; ++j) {
                augmented[i, j] = j < n ? A[i, j] : B[i, j - n];
            }
        }

        Matrix<T>         U(m, m);
        Matrix<T>         V(n, n);
        std::vector<Real> S(n);
        expect(fatal(decompose<T>(augmented.view(), n, S, U.view(), V.view()) == svd::Status::Success));

        expect(test::approx_matrices(reconstruct(U, S, V), A, defaultTolerance<T>())) << "auxiliary columns do not disturb the decomposition";
        const Matrix<T> expected = multiply(conjTranspose(U), B);
        expect(test::approx_matrices(augmented.view().columns(n, p), expected, defaultTolerance<T>()));

        const auto plain = runDecompose(A, 0UZ, 0UZ);
        expect(test::approx_collections(S, plain.S, defaultTolerance<T>()));
    } | ComplexTypes{};

    "P > 0 without U"_test = [] {
        using T = std::complex<double>;
        constexpr std::size_t m = 5UZ;
        constexpr std::size_t n = 3UZ;

        const Matrix<T> A = randomMatrix<T>(m, n + 1UZ, 21U);
        Matrix<T>       work = A;
        Matrix<T>       U(m, m);
        Matrix<T>       V(n, 0UZ);
        std::vector<double> S(n);
        expect(fatal(decompose<T>(work.view(), n, S, U.view(), V.view()) == svd::Status::Success));

        Matrix<T>           workNoU = A;
        Matrix<T>           noU(m, 0UZ);
        std::vector<double> S2(n);
        expect(fatal(decompose<T>(workNoU.view(), n, S2, noU.view(), V.view()) == svd::Status::Success));
        expect(test::approx_matrices(workNoU.view().columns(n, 1UZ), work.view().columns(n, 1UZ), 1e-12)) << "rotations reach the auxiliary column without U";
    };
};

const boost::ut::suite<"SVD special matrices"> _svd_special = [] {
    using namespace boost::ut;

    "rank-deficient matrix with a zero row"_test = []<typename T> {
        using Real = meta::fundamental_base_value_type_t<T>;
        Matrix<T> A = referenceMatrix<T>();
        for (std::size_t j = 0UZ; j < 3UZ; ++j) {
            A[1, j] = T{0};
        }
        const auto r = runDecompose(A, 3UZ, 3UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(sortedDescendingNonNegative<Real>(r.S));
        expect(le(r.S[2], Real(1e-4))) << "smallest singular value must vanish";
        expect(gt(r.S[1], Real(1e-2)));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, Real(1e-4)));
        expect(test::isUnitary(r.U, Real(1e-4)));
    } | ComplexTypes{};

    "zero matrix"_test = []<typename T> {
        using Real          = meta::fundamental_base_value_type_t<T>;
        const Matrix<T> Z(4UZ, 3UZ);
        const auto      r = runDecompose(Z, 4UZ, 3UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(std::ranges::all_of(r.S, [](Real s) { return s == Real{0}; }));
        expect(test::approx_matrices(r.U, Matrix<T>::identity(4UZ), Real(0)));
        expect(test::approx_matrices(r.V, Matrix<T>::identity(3UZ), Real(0)));
    } | ComplexTypes{};

    "zero on the bidiagonal's diagonal (cancellation path)"_test = []<typename T> {
        using Real = meta::fundamental_base_value_type_t<T>;
        // column 1 has no component below row 0 after the first reflector: b[1] = 0
        const Matrix<T> A(4UZ, 3UZ, {T{1}, T{1}, T{0}, T{0}, T{0}, T{1}, T{0}, T{0}, T{2}, T{0}, T{0}, T{0, 1}});
        const auto      r = runDecompose(A, 4UZ, 3UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(sortedDescendingNonNegative<Real>(r.S));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, defaultTolerance<T>()));
        expect(test::isUnitary(r.U, defaultTolerance<T>()));
        expect(test::isUnitary(r.V, defaultTolerance<T>()));
    } | ComplexTypes{};

    "single column"_test = []<typename T> {
        using Real        = meta::fundamental_base_value_type_t<T>;
        const Matrix<T> A(3UZ, 1UZ, {T{1, 2}, T{0}, T{2, 0}});
        const auto      r = runDecompose(A, 3UZ, 1UZ);
        expect(fatal(r.status == svd::Status::Success));
        expect(approx(r.S[0], Real{3}, defaultTolerance<T>()));
        expect(test::approx_matrices(reconstruct(r.U, r.S, r.V), A, defaultTolerance<T>()));
        expect(approx(std::abs(r.V[0, 0]), Real{1}, defaultTolerance<T>()));
    } | ComplexTypes{};

    "scale invariance"_test = [](double scale) {
        using T                = std::complex<double>;
        const Matrix<T> A      = randomMatrix<T>(6UZ, 4UZ, 8U);
        Matrix<T>       scaled = A;
        for (auto& x : scaled) {
            x *= scale;
        }
        const auto r  = runDecompose(A, 6UZ, 4UZ);
        const auto rs = runDecompose(scaled, 6UZ, 4UZ);
        expect(fatal(rs.status == svd::Status::Success)) << "scale " << scale;
        for (std::size_t i = 0UZ; i < 4UZ; ++i) {
            expect(approx(rs.S[i] / scale, r.S[i], 1e-10 * r.S[0])) << "scale " << scale << " S[" << i << "]";
        }
        expect(test::approx_matrices(rs.U, r.U, 1e-8)) << "scale " << scale;
    } | std::vector{1e-30, 1e-8, 1e8, 1e30};
};

const boost::ut::suite<"SVD workspace and iteration budget"> _svd_workspace = [] {
    using namespace boost::ut;

    "fixed-capacity workspace is reusable"_test = [] {
        using T    = std::complex<float>;
        using Real = float;
        svd::Workspace<Real, 6UZ> ws;

        const Matrix<T>   A1 = randomMatrix<T>(8UZ, 6UZ, 30U);
        const Matrix<T>   A2 = randomMatrix<T>(5UZ, 2UZ, 31U);
        std::vector<Real> S1(6UZ);
        std::vector<Real> S1again(6UZ);
        std::vector<Real> S2(2UZ);
        Matrix<T>         U1(8UZ, 6UZ);
        Matrix<T>         V1(6UZ, 6UZ);
        Matrix<T>         U2(5UZ, 2UZ);
        Matrix<T>         V2(2UZ, 2UZ);

        Matrix<T> work = A1;
        expect(fatal(decompose<T>(work.view(), 6UZ, S1, U1.view(), V1.view(), ws) == svd::Status::Success));
        work = A2;
        expect(fatal(decompose<T>(work.view(), 2UZ, S2, U2.view(), V2.view(), ws) == svd::Status::Success));
        expect(test::approx_matrices(reconstruct(U2, S2, V2), A2, 1e-4f));
        work = A1;
        expect(fatal(decompose<T>(work.view(), 6UZ, S1again, U1.view(), V1.view(), ws) == svd::Status::Success));
        expect(S1 == S1again) << "no state carried over between calls";
    };

    "workspace footprint and off-stack storage"_test = [] {
        static_assert(sizeof(svd::Workspace<float, 4UZ>) == (3UZ * 4UZ + 2UZ * 16UZ) * sizeof(float));
        static_assert(sizeof(svd::Workspace<double, 4UZ>) == (3UZ * 4UZ + 2UZ * 16UZ) * sizeof(double));
        static_assert(sizeof(svd::Workspace<double>) >= 2UZ * csvd::math::config::MAX_COLUMNS * csvd::math::config::MAX_COLUMNS * sizeof(double));

        using T = std::complex<double>;
        static svd::Workspace<double> staticWs;
        auto                          heapWs = std::make_unique<svd::Workspace<double>>();

        const Matrix<T>     A = randomMatrix<T>(12UZ, 10UZ, 32U);
        std::vector<double> Sstatic(10UZ);
        std::vector<double> Sheap(10UZ);
        Matrix<T>           U(12UZ, 10UZ);
        Matrix<T>           V(10UZ, 10UZ);

        Matrix<T> work = A;
        expect(fatal(decompose<T>(work.view(), 10UZ, Sstatic, U.view(), V.view(), staticWs) == svd::Status::Success));
        expect(test::approx_matrices(reconstruct(U, Sstatic, V), A, 1e-10));
        work = A;
        expect(fatal(decompose<T>(work.view(), 10UZ, Sheap, U.view(), V.view(), *heapWs) == svd::Status::Success));
        expect(Sstatic == Sheap);
    };

    "iteration budget exhausted"_test = [] {
        using T = std::complex<double>;
        const auto r = runDecompose(randomMatrix<T>(6UZ, 6UZ, 40U), 6UZ, 6UZ, svd::Config{.maxIterations = 1UZ});
        expect(r.status == svd::Status::MaxIterations);
        const auto relaxed = runDecompose(randomMatrix<T>(6UZ, 6UZ, 40U), 6UZ, 6UZ, svd::Config{.maxIterations = 1000UZ});
        expect(relaxed.status == svd::Status::Success);
    };

    "finite check can be disabled"_test = [] {
        using T = std::complex<double>;
        const auto r = runDecompose(randomMatrix<T>(4UZ, 3UZ, 41U), 4UZ, 3UZ, svd::Config{.checkFinite = false});
        expect(r.status == svd::Status::Success);
    };
};

const boost::ut::suite<"SVD QR state machine"> _svd_qr = [] {
    using namespace boost::ut;
    using Real = double;
    using svd::QrState;

    constexpr Real eps = 1e-9;

    "findSplit"_test = [&] {
        const std::array<Real, 3UZ> s{3.0, 2.0, 1.0};

        const auto unreduced = csvd::math::detail::findSplit<Real>(s, std::array<Real, 3UZ>{0.0, 0.5, 0.5}, 2UZ, eps);
        expect(unreduced.state == QrState::ShiftStep);
        expect(eq(unreduced.l, 0UZ));

        const auto converged = csvd::math::detail::findSplit<Real>(s, std::array<Real, 3UZ>{0.0, 0.5, 1e-12}, 2UZ, eps);
        expect(converged.state == QrState::Converged);
        expect(eq(converged.l, 2UZ));

        const auto split = csvd::math::detail::findSplit<Real>(s, std::array<Real, 3UZ>{0.0, 0.0, 0.5}, 2UZ, eps);
        expect(split.state == QrState::ShiftStep);
        expect(eq(split.l, 1UZ));

        const auto cancel = csvd::math::detail::findSplit<Real>(std::array<Real, 3UZ>{3.0, 0.0, 1.0}, std::array<Real, 3UZ>{0.0, 0.5, 0.5}, 2UZ, eps);
        expect(cancel.state == QrState::Cancelling);
        expect(eq(cancel.l, 2UZ));

        const auto first = csvd::math::detail::findSplit<Real>(s, std::array<Real, 3UZ>{0.0, 0.5, 0.5}, 0UZ, eps);
        expect(first.state == QrState::Converged) << "index 0 always converges";
    };

    "cancel chases the super-diagonal out"_test = [&] {
        std::array<Real, 2UZ>                           s{0.0, 2.0};
        std::array<Real, 2UZ>                           t{0.0, 1.0};
        std::array<Real, 4UZ>                           uStorage{1.0, 0.0, 0.0, 1.0};
        csvd::math::detail::QrContext<std::complex<Real>, Real> ctx{.s = s, .t = t, .uHat = MatrixView<Real>(uStorage.data(), 2UZ, 2UZ), .vHat = {}, .aux = {}, .eps = eps};

        csvd::math::detail::cancel(ctx, 1UZ, 1UZ);
        expect(eq(t[1], 0.0));
        expect(approx(s[1], std::sqrt(5.0), 1e-12)) << "norm of (t, s) is preserved";
        expect(approx(uStorage[0] * uStorage[3] - uStorage[1] * uStorage[2], 1.0, 1e-12)) << "rotation has unit determinant";
    };

    "shiftStep preserves the Frobenius norm"_test = [&] {
        std::array<Real, 3UZ> s{3.0, 2.0, 1.0};
        std::array<Real, 3UZ> t{0.0, 0.5, 0.25};
        const Real            before = [&] {
            Real sum{0};
            for (std::size_t i = 0UZ; i < 3UZ; ++i) {
                sum += s[i] * s[i] + t[i] * t[i];
            }
            return sum;
        }();
        csvd::math::detail::QrContext<std::complex<Real>, Real> ctx{.s = s, .t = t, .uHat = {}, .vHat = {}, .aux = {}, .eps = eps};
        csvd::math::detail::shiftStep(ctx, 0UZ, 2UZ);

        Real after{0};
        for (std::size_t i = 0UZ; i < 3UZ; ++i) {
            after += s[i] * s[i] + t[i] * t[i];
        }
        expect(approx(after, before, 1e-12));
        expect(eq(t[0], 0.0));
        expect(lt(std::abs(t[2]), 0.25)) << "bottom super-diagonal shrinks";
    };

    "normaliseSign"_test = [] {
        std::array<Real, 2UZ> s{1.0, -2.0};
        std::array<Real, 4UZ> v{1.0, 0.5, 0.0, 0.25};
        csvd::math::detail::normaliseSign<Real>(s, MatrixView<Real>(v.data(), 2UZ, 2UZ), 1UZ);
        expect(eq(s[1], 2.0));
        expect(eq(v[1], -0.5));
        expect(eq(v[3], -0.25));
        expect(eq(v[0], 1.0)) << "other columns untouched";
    };
};

int main() { /* not needed for boost-ut */ return 0; }
