#ifndef CSVD_MEMORYALLOCATORS_HPP
#define CSVD_MEMORYALLOCATORS_HPP

#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include <csvd/Error.hpp>
#include <csvd/meta/utils.hpp>

#include <fmt/format.h>

namespace csvd::allocator {

template<std::size_t Align, typename T>
[[nodiscard]] constexpr bool isAligned(const T* p) noexcept {
    return std::bit_cast<std::uintptr_t>(std::to_address(p)) % Align == 0UZ;
}

/** @brief STL allocator guaranteeing `alignment` byte alignment. */
template<typename T, std::size_t alignment = 64UZ>
requires(std::has_single_bit(alignment) && alignment >= alignof(T))
struct Aligned {
    using value_type = T;

    constexpr Aligned() noexcept = default;

    template<typename U>
    constexpr Aligned(const Aligned<U, alignment>&) noexcept {}

    [[nodiscard]] T* allocate(std::size_t n) {
        const std::size_t bytes = n * sizeof(T);
        if (bytes == 0) {
            return nullptr; // fine per standard
        }
        return static_cast<T*>(::operator new(bytes, std::align_val_t{alignment}));
    }

    void deallocate(T* p, std::size_t /*n*/) noexcept { ::operator delete(p, std::align_val_t{alignment}); }

    template<typename U>
    struct rebind {
        using other = Aligned<U, alignment>;
    };

    friend constexpr bool operator==(const Aligned&, const Aligned&) noexcept = default;
};

template<typename T>
using Default = Aligned<T, 64UZ>;

/// alignments accepted by makeAlignedBuffer(..): SSE, AVX and cache-line boundaries
inline constexpr std::size_t kSupportedAlignments[] = {16UZ, 32UZ, 64UZ};

[[nodiscard]] constexpr bool isSupportedAlignment(std::size_t alignment) noexcept {
    for (std::size_t supported : kSupportedAlignments) {
        if (alignment == supported) {
            return true;
        }
    }
    return false;
}

/**
 * @brief owning, zero-initialised buffer whose alignment is chosen at run-time.
 *
 * Move-only. The element type must be trivially destructible since no per-element destructor is run.
 */
template<typename T>
requires std::is_trivially_destructible_v<T>
class AlignedBuffer {
    T*          _data      = nullptr;
    std::size_t _size      = 0UZ;
    std::size_t _alignment = alignof(T);

public:
    using value_type = T;

    AlignedBuffer() noexcept = default;

    /// unchecked: `alignment` must be a power of two not smaller than alignof(T)
    AlignedBuffer(std::size_t alignment, std::size_t count) : _alignment(alignment) {
        if (count == 0UZ) {
            return;
        }
        _data = static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{alignment}));
        std::uninitialized_value_construct_n(_data, count);
        _size = count;
    }

    AlignedBuffer(const AlignedBuffer&)            = delete;
    AlignedBuffer& operator=(const AlignedBuffer&) = delete;

    AlignedBuffer(AlignedBuffer&& other) noexcept : _data(std::exchange(other._data, nullptr)), _size(std::exchange(other._size, 0UZ)), _alignment(other._alignment) {}

    AlignedBuffer& operator=(AlignedBuffer&& other) noexcept {
        if (this != &other) {
            release();
            _data      = std::exchange(other._data, nullptr);
            _size      = std::exchange(other._size, 0UZ);
            _alignment = other._alignment;
        }
        return *this;
    }

    ~AlignedBuffer() { release(); }

    [[nodiscard]] T*                   data() noexcept { return _data; }
    [[nodiscard]] const T*             data() const noexcept { return _data; }
    [[nodiscard]] std::size_t          size() const noexcept { return _size; }
    [[nodiscard]] bool                 empty() const noexcept { return _size == 0UZ; }
    [[nodiscard]] std::size_t          alignment() const noexcept { return _alignment; }
    [[nodiscard]] std::span<T>         span() noexcept { return {_data, _size}; }
    [[nodiscard]] std::span<const T>   span() const noexcept { return {_data, _size}; }
    [[nodiscard]] T&                   operator[](std::size_t i) noexcept { return _data[i]; }
    [[nodiscard]] const T&             operator[](std::size_t i) const noexcept { return _data[i]; }
    [[nodiscard]] T*                   begin() noexcept { return _data; }
    [[nodiscard]] T*                   end() noexcept { return _data + _size; }
    [[nodiscard]] const T*             begin() const noexcept { return _data; }
    [[nodiscard]] const T*             end() const noexcept { return _data + _size; }

private:
    void release() noexcept {
        if (_data != nullptr) {
            ::operator delete(_data, std::align_val_t{_alignment});
            _data = nullptr;
            _size = 0UZ;
        }
    }
};

/**
 * @brief allocates `count` zero-initialised elements on an `alignment`-byte boundary.
 *
 * @return the buffer, or an Error if `alignment` is not one of 16, 32 or 64 bytes, is smaller than alignof(T),
 *         or if `count` elements cannot be addressed or allocated
 */
template<typename T>
requires std::is_trivially_destructible_v<T>
[[nodiscard]] std::expected<AlignedBuffer<T>, Error> makeAlignedBuffer(std::size_t alignment, std::size_t count, std::source_location location = std::source_location::current()) {
    if (!isSupportedAlignment(alignment) || alignment < alignof(T)) {
        return std::unexpected(Error{fmt::format("unsupported alignment {} for {} (supported: {})", alignment, meta::type_name<T>(), fmt::join(kSupportedAlignments, ", ")), location});
    }
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
        return std::unexpected(Error{fmt::format("{} elements of {} exceed the addressable size", count, meta::type_name<T>()), location});
    }
    try {
        return AlignedBuffer<T>(alignment, count);
    } catch (const std::bad_alloc&) {
        return std::unexpected(Error{fmt::format("cannot allocate {} elements of {} ({} bytes)", count, meta::type_name<T>(), count * sizeof(T)), location});
    }
}

} // namespace csvd::allocator

#endif // CSVD_MEMORYALLOCATORS_HPP
