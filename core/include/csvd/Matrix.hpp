#ifndef CSVD_MATRIX_HPP
#define CSVD_MATRIX_HPP

#include <csvd/Error.hpp>
#include <csvd/MemoryAllocators.hpp>
#include <csvd/meta/formatter.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <source_location>
#include <span>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

namespace csvd {

/**
 * @class MatrixView
 * @brief non-owning, row-major 2D view with an explicit row stride (leading dimension).
 *
 * Element (i, j) lives at `data()[i * stride() + j]`. A stride larger than `cols()` addresses a column block
 * of a wider buffer, e.g. the leading N columns of an M x (N + P) matrix that carries P auxiliary columns.
 * Copying a view is shallow; constness of the view does not propagate to the elements.
 */
template<typename T>
struct MatrixView {
    using value_type = std::remove_const_t<T>;
    using element_type = T;

    T*          _data   = nullptr;
    std::size_t _rows   = 0UZ;
    std::size_t _cols   = 0UZ;
    std::size_t _stride = 0UZ;

    constexpr MatrixView() noexcept = default;
    constexpr MatrixView(T* data, std::size_t rows, std::size_t cols) noexcept : _data(data), _rows(rows), _cols(cols), _stride(cols) {}
    constexpr MatrixView(T* data, std::size_t rows, std::size_t cols, std::size_t stride) noexcept : _data(data), _rows(rows), _cols(cols), _stride(stride) {}

    template<typename U>
    requires(std::is_const_v<T> && std::same_as<std::remove_const_t<T>, U>)
    constexpr MatrixView(MatrixView<U> other) noexcept : _data(other.data()), _rows(other.rows()), _cols(other.cols()), _stride(other.stride()) {}

    [[nodiscard]] constexpr T*          data() const noexcept { return _data; }
    [[nodiscard]] constexpr std::size_t rows() const noexcept { return _rows; }
    [[nodiscard]] constexpr std::size_t cols() const noexcept { return _cols; }
    [[nodiscard]] constexpr std::size_t stride() const noexcept { return _stride; }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return _rows * _cols; }
    [[nodiscard]] constexpr bool        empty() const noexcept { return _rows == 0UZ || _cols == 0UZ; }
    [[nodiscard]] constexpr std::size_t extent(std::size_t dim) const noexcept { return dim == 0UZ ? _rows : _cols; }

    [[nodiscard]] constexpr T& operator[](std::size_t i, std::size_t j) const noexcept { return _data[i * _stride + j]; }

    [[nodiscard]] constexpr std::span<T> row(std::size_t i) const noexcept { return {_data + i * _stride, _cols}; }

    [[nodiscard]] constexpr MatrixView view() const noexcept { return *this; }

    /// columns [first, first + count) of all rows
    [[nodiscard]] MatrixView columns(std::size_t first, std::size_t count, std::source_location location = std::source_location::current()) const {
        if (first + count > _cols) {
            throw csvd::exception(fmt::format("column block [{}, {}) exceeds {} columns", first, first + count, _cols), location);
        }
        return {_data + first, _rows, count, _stride};
    }

    void fill(const value_type& value) const noexcept
    requires(!std::is_const_v<T>)
    {
        for (std::size_t i = 0UZ; i < _rows; ++i) {
            std::ranges::fill(row(i), value);
        }
    }
};

template<typename T>
MatrixView(T*, std::size_t, std::size_t) -> MatrixView<T>;
template<typename T>
MatrixView(T*, std::size_t, std::size_t, std::size_t) -> MatrixView<T>;

namespace detail {
[[nodiscard]] inline std::size_t checkedElementCount(std::size_t rows, std::size_t cols, std::source_location location) {
    if (cols != 0UZ && rows > std::numeric_limits<std::size_t>::max() / cols) {
        throw csvd::exception(fmt::format("{} x {} matrix exceeds the addressable element count", rows, cols), location);
    }
    return rows * cols;
}
} // namespace detail

/**
 * @class Matrix
 * @brief owning, contiguous row-major matrix backed by a cache-line aligned allocation.
 *
 * Usage:
 * @code
 * csvd::Matrix<std::complex<float>> A(3UZ, 2UZ, {1, 2, 3, 4, 5, 6}); // 3 rows, 2 columns, row-major data
 * A[2, 1] = {0.f, 1.f};
 * csvd::MatrixView<std::complex<float>> view = A;                      // shallow, no copy
 * @endcode
 */
template<typename T, typename Allocator = allocator::Default<T>>
struct Matrix {
    using value_type     = T;
    using allocator_type = Allocator;
    using container_type = std::vector<T, Allocator>;
    using iterator       = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    container_type _data;
    std::size_t    _rows = 0UZ;
    std::size_t    _cols = 0UZ;

    Matrix() = default;
    Matrix(std::size_t rows, std::size_t cols, const T& value = T{}, std::source_location location = std::source_location::current()) : _data(detail::checkedElementCount(rows, cols, location), value), _rows(rows), _cols(cols) {}

    Matrix(std::size_t rows, std::size_t cols, std::initializer_list<T> values, std::source_location location = std::source_location::current()) : _data(values.begin(), values.end()), _rows(rows), _cols(cols) {
        if (values.size() != detail::checkedElementCount(rows, cols, location)) {
            throw csvd::exception(fmt::format("{} x {} matrix cannot be initialised from {} values", rows, cols, values.size()), location);
        }
    }

    explicit Matrix(MatrixView<const T> other) : _data(other.size()), _rows(other.rows()), _cols(other.cols()) {
        for (std::size_t i = 0UZ; i < _rows; ++i) {
            std::ranges::copy(other.row(i), _data.begin() + static_cast<std::ptrdiff_t>(i * _cols));
        }
    }

    [[nodiscard]] static Matrix identity(std::size_t n) {
        Matrix I(n, n);
        for (std::size_t i = 0UZ; i < n; ++i) {
            I[i, i] = T{1};
        }
        return I;
    }

    [[nodiscard]] constexpr std::size_t rows() const noexcept { return _rows; }
    [[nodiscard]] constexpr std::size_t cols() const noexcept { return _cols; }
    [[nodiscard]] constexpr std::size_t stride() const noexcept { return _cols; }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return _data.size(); }
    [[nodiscard]] constexpr bool        empty() const noexcept { return _data.empty(); }
    [[nodiscard]] constexpr std::size_t extent(std::size_t dim) const noexcept { return dim == 0UZ ? _rows : _cols; }

    [[nodiscard]] T*       data() noexcept { return _data.data(); }
    [[nodiscard]] const T* data() const noexcept { return _data.data(); }

    [[nodiscard]] iterator       begin() noexcept { return _data.begin(); }
    [[nodiscard]] iterator       end() noexcept { return _data.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return _data.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return _data.end(); }

    [[nodiscard]] T&       operator[](std::size_t i, std::size_t j) noexcept { return _data[i * _cols + j]; }
    [[nodiscard]] const T& operator[](std::size_t i, std::size_t j) const noexcept { return _data[i * _cols + j]; }

    [[nodiscard]] MatrixView<T>       view() noexcept { return {_data.data(), _rows, _cols}; }
    [[nodiscard]] MatrixView<const T> view() const noexcept { return {_data.data(), _rows, _cols}; }

    operator MatrixView<T>() noexcept { return view(); }
    operator MatrixView<const T>() const noexcept { return view(); }

    /// reshapes to rows x cols; existing element values are not preserved
    void resize(std::size_t rows, std::size_t cols, const T& value = T{}, std::source_location location = std::source_location::current()) {
        _data.assign(detail::checkedElementCount(rows, cols, location), value);
        _rows = rows;
        _cols = cols;
    }

    void fill(const T& value) noexcept { std::ranges::fill(_data, value); }

    friend bool operator==(const Matrix& lhs, const Matrix& rhs) noexcept { return lhs._rows == rhs._rows && lhs._cols == rhs._cols && lhs._data == rhs._data; }
};

template<typename M>
concept MatrixLike = requires(const std::remove_cvref_t<M>& m) {
    typename std::remove_cvref_t<M>::value_type;
    { m.rows() } -> std::convertible_to<std::size_t>;
    { m.cols() } -> std::convertible_to<std::size_t>;
    { m.view() };
};

} // namespace csvd

// formatted row by row below rather than as a flat range
template<typename T, typename Allocator>
struct fmt::is_range<csvd::Matrix<T, Allocator>, char> : std::false_type {};

template<csvd::MatrixLike M>
struct fmt::formatter<M> {
    using value_type = typename M::value_type;
    fmt::formatter<value_type> elementFormatter;

    constexpr auto parse(fmt::format_parse_context& ctx) { return elementFormatter.parse(ctx); }

    template<typename FormatContext>
    auto format(const M& matrix, FormatContext& ctx) const {
        auto out = ctx.out();
        out      = fmt::format_to(out, "[");
        for (std::size_t i = 0UZ; i < matrix.rows(); ++i) {
            out = fmt::format_to(out, i == 0UZ ? "[" : ",\n [");
            for (std::size_t j = 0UZ; j < matrix.cols(); ++j) {
                if (j > 0UZ) {
                    out = fmt::format_to(out, ", ");
                }
                ctx.advance_to(out);
                out = elementFormatter.format(matrix[i, j], ctx);
            }
            out = fmt::format_to(out, "]");
        }
        return fmt::format_to(out, "]");
    }
};

#endif // CSVD_MATRIX_HPP
