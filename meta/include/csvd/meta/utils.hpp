#ifndef CSVD_META_UTILS_HPP
#define CSVD_META_UTILS_HPP

#include <complex>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace csvd {

namespace meta {

template<typename T>
concept complex_like = std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>;

namespace detail {
template<typename T>
concept HasValueType = requires { typename T::value_type; };

template<typename T, typename = void>
struct fundamental_base_value_type {
    using type = T;
};

template<HasValueType T>
struct fundamental_base_value_type<T> {
    using type = typename fundamental_base_value_type<typename T::value_type>::type;
};

template<typename T>
[[nodiscard]] std::string local_type_name() noexcept {
    std::string type_name = typeid(T).name();
    int         status;
    char*       demangled_name = abi::__cxa_demangle(type_name.c_str(), nullptr, nullptr, &status);
    if (status == 0) {
        std::string ret(demangled_name);
        free(demangled_name);
        return ret;
    }
    free(demangled_name);
    return typeid(T).name();
}
} // namespace detail

template<typename T>
using fundamental_base_value_type_t = typename detail::fundamental_base_value_type<T>::type;

static_assert(std::is_same_v<fundamental_base_value_type_t<float>, float>);
static_assert(std::is_same_v<fundamental_base_value_type_t<std::complex<float>>, float>);
static_assert(std::is_same_v<fundamental_base_value_type_t<std::vector<std::complex<double>>>, double>);

/// demangled name of T, mainly used for test-case labels and allocation diagnostics
template<typename T>
[[nodiscard]] std::string type_name() noexcept {
    if constexpr (std::is_same_v<T, float>) {
        return "float32";
    } else if constexpr (std::is_same_v<T, double>) {
        return "float64";
    } else if constexpr (std::is_same_v<T, std::complex<float>>) {
        return "complex<float32>";
    } else if constexpr (std::is_same_v<T, std::complex<double>>) {
        return "complex<float64>";
    } else {
        return detail::local_type_name<T>();
    }
}

} // namespace meta
} // namespace csvd

#endif // CSVD_META_UTILS_HPP
