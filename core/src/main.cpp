#include <algorithm>
#include <charconv>
#include <complex>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string_view>

#include <fmt/core.h>

#include <csvd/Matrix.hpp>
#include <csvd/MatrixMath.hpp>
#include <csvd/MemoryAllocators.hpp>
#include <csvd/PseudoInverse.hpp>
#include <csvd/SVD.hpp>
#include <csvd/config.hpp> // contains the project and compiler flags definitions

namespace {

using T    = std::complex<float>;
using Real = float;

constexpr int kExitSvdFailure = 1;
constexpr int kExitUsage      = 2;

csvd::Matrix<T> referenceMatrix() {
    return csvd::Matrix<T>(3UZ, 3UZ,
        {
            {0.4032f, 0.0876f}, {0.1678f, 0.0390f}, {0.5425f, 0.5118f},   //
            {0.3174f, 0.3352f}, {0.9784f, 0.4514f}, {-0.4416f, -1.3188f}, //
            {0.4008f, -0.0504f}, {0.0979f, -0.2558f}, {0.2983f, 0.7800f}, //
        });
}

csvd::Matrix<T> randomMatrix(std::size_t m, std::size_t n, std::uint32_t seed) {
    std::mt19937                         gen(seed);
    std::uniform_real_distribution<Real> dist(-1.f, 1.f);
    csvd::Matrix<T>                      A(m, n);
    for (auto& value : A) {
        value = {dist(gen), dist(gen)};
    }
    return A;
}

// rejects shapes the engine cannot take before any buffer is allocated
std::optional<std::string_view> checkShape(std::size_t m, std::size_t n) {
    if (n > csvd::math::config::MAX_COLUMNS) {
        return "column count n exceeds the workspace capacity";
    }
    if (n > m) {
        return "row count m must not be smaller than column count n";
    }
    if (n != 0UZ && m > std::numeric_limits<std::size_t>::max() / (n * sizeof(T))) {
        return "m x n matrix exceeds the addressable size";
    }
    return std::nullopt;
}

template<typename Value>
std::optional<Value> parse(std::string_view arg) {
    Value value{};
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
    if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
        return std::nullopt;
    }
    return value;
}

Real distance(const csvd::Matrix<T>& lhs, const csvd::Matrix<T>& rhs) {
    csvd::Matrix<T> diff = lhs;
    for (std::size_t i = 0UZ; i < diff.rows(); ++i) {
        for (std::size_t j = 0UZ; j < diff.cols(); ++j) {
            diff[i, j] -= rhs[i, j];
        }
    }
    return csvd::math::frobeniusNorm(diff);
}

} // namespace

int main(int argc, char** argv) {
    using namespace csvd;

    fmt::print("csvd {} ({}), workspace capacity N <= {}\n", CSVD_VERSION, CSVD_BUILD_TYPE, CSVD_CONFIGURED_MAX_COLUMNS);
    fmt::print("Project compiler: '{}' - version '{}'\n", CXX_COMPILER_ID, CXX_COMPILER_VERSION);

    Matrix<T> A;
    if (argc == 1) {
        A = referenceMatrix();
    } else if (argc == 3 || argc == 4) {
        const auto m    = parse<std::size_t>(argv[1]);
        const auto n    = parse<std::size_t>(argv[2]);
        const auto seed = argc == 4 ? parse<std::uint32_t>(argv[3]) : std::optional<std::uint32_t>(42U);
        if (!m || !n || !seed) {
            fmt::print(stderr, "usage: {} [m n [seed]] - m, n and seed must be non-negative integers\n", argv[0]);
            return kExitUsage;
        }
        if (const auto reason = checkShape(*m, *n)) {
            fmt::print(stderr, "invalid shape {}x{}: {} (n <= {}, n <= m)\n", *m, *n, *reason, math::config::MAX_COLUMNS);
            return kExitUsage;
        }
        try {
            A = randomMatrix(*m, *n, *seed);
        } catch (const std::exception& e) {
            fmt::print(stderr, "cannot create the {}x{} input matrix: {}\n", *m, *n, e.what());
            return kExitSvdFailure;
        }
    } else {
        fmt::print(stderr, "usage: {} [m n [seed]]\n", argv[0]);
        return kExitUsage;
    }
    const std::size_t m = A.rows();
    const std::size_t n = A.cols();

    // allocation-free path: all buffers are allocated once up-front, the decomposition itself does not allocate
    // U is thin [m x n]: the trailing m - n columns are neither printed nor needed for the pseudo-inverse
    auto work = allocator::makeAlignedBuffer<T>(64UZ, m * n);
    auto S    = allocator::makeAlignedBuffer<Real>(64UZ, std::max(m, n));
    auto U    = allocator::makeAlignedBuffer<T>(64UZ, m * n);
    auto V    = allocator::makeAlignedBuffer<T>(64UZ, n * n);
    for (const auto* buffer : {&work, &U, &V}) {
        if (!buffer->has_value()) {
            fmt::print(stderr, "allocation failed: {}\n", buffer->error());
            return kExitSvdFailure;
        }
    }
    if (!S.has_value()) {
        fmt::print(stderr, "allocation failed: {}\n", S.error());
        return kExitSvdFailure;
    }
    std::ranges::copy(A, work->begin());

    MatrixView<T> Awork(work->data(), m, n);
    MatrixView<T> Uv(U->data(), m, n);
    MatrixView<T> Vv(V->data(), n, n);
    auto          ws = std::make_unique<math::svd::Workspace<Real>>();

    fmt::print("A [{}x{}] =\n{:f}\n", m, n, A);
    if (const auto status = math::decompose<T>(Awork, n, S->span(), Uv, Vv, *ws); status != math::svd::Status::Success) {
        fmt::print(stderr, "SVD failed: {} ({})\n", status, math::svd::message(status));
        return kExitSvdFailure;
    }

    const std::span<const Real> singularValues = S->span().first(n);
    fmt::print("S = [{}]\n", fmt::join(singularValues, ", "));
    fmt::print("U =\n{:f}\n", Uv);
    fmt::print("V =\n{:f}\n", Vv);

    const Matrix<T> Un{MatrixView<const T>{Uv}};
    const Matrix<T> Vm{MatrixView<const T>{Vv}};
    const Matrix<T> reconstructed = math::multiply(math::multiply(Un, math::diagonal<T>(singularValues, n, n)), math::conjTranspose(Vm));
    fmt::print("||U*S*V^H - A|| = {:e}\n", distance(reconstructed, A));

    Matrix<T> INV(n, m);
    math::pseudoInverse<T>(INV.view(), S->span(), Uv, Vv);
    fmt::print("INV [{}x{}] =\n{:f}\n", n, m, INV);
    fmt::print("||A*INV*A - A|| = {:e}\n", distance(math::multiply(math::multiply(A, INV), A), A));

    return 0;
}
