#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace EbmlFusion {

template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

/// Record member bound to an EBML element: the decoded value plus its schema options.
///
///   A<std::uint64_t, options::id<0x2AD7B1>, options::default_value<"1000000">> timecode_scale;
///
/// Reads convert to T, containers and nested records are reached through -> or get().
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template<class T, class... Opts>
using A = Annotated<T, Opts...>;

// Options never take part in comparisons: two members holding the same element value are equal
template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs, const Annotated<T, OptsR...>& rhs) {
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs, const U& rhs) {
    return lhs.value == rhs;
}

template<class U, class T, class... Opts>
    requires requires (const U& u, const T& t) { u == t; }
constexpr bool operator==(const U& lhs, const Annotated<T, Opts...>& rhs) {
    return lhs == rhs.value;
}

} // namespace EbmlFusion
