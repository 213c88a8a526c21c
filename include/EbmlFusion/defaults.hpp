#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"

namespace EbmlFusion {

namespace defaults {

namespace literal {

template<class V>
struct Parsed {
    bool ok = false;
    V value{};
};

constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

consteval Parsed<std::uint64_t> parse_unsigned(std::string_view s) {
    if (s.empty()) {
        return {};
    }
    std::uint64_t v = 0;
    for (char c : s) {
        if (!is_digit(c)) {
            return {};
        }
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10) {
            return {};
        }
        v = v * 10 + d;
    }
    return {true, v};
}

consteval Parsed<std::int64_t> parse_signed(std::string_view s) {
    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    auto u = parse_unsigned(s);
    if (!u.ok) {
        return {};
    }
    constexpr std::uint64_t maxPos = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (u.value > maxPos + 1) {
            return {};
        }
        if (u.value == maxPos + 1) {
            return {true, std::numeric_limits<std::int64_t>::min()};
        }
        return {true, -static_cast<std::int64_t>(u.value)};
    }
    if (u.value > maxPos) {
        return {};
    }
    return {true, static_cast<std::int64_t>(u.value)};
}

// [+-]digits[.digits][(e|E)[+-]digits], at least one mantissa digit
consteval Parsed<double> parse_float(std::string_view s) {
    std::size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        negative = s[i] == '-';
        ++i;
    }
    double mantissa = 0.0;
    int scale = 0;
    std::size_t digits = 0;
    while (i < s.size() && is_digit(s[i])) {
        mantissa = mantissa * 10.0 + (s[i] - '0');
        ++digits;
        ++i;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) {
            mantissa = mantissa * 10.0 + (s[i] - '0');
            --scale;
            ++digits;
            ++i;
        }
    }
    if (digits == 0) {
        return {};
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        auto e = parse_signed(s.substr(i));
        if (!e.ok || e.value > 400 || e.value < -400) {
            return {};
        }
        scale += static_cast<int>(e.value);
        i = s.size();
    }
    if (i != s.size()) {
        return {};
    }
    double v = mantissa;
    for (; scale > 0; --scale) v *= 10.0;
    for (; scale < 0; ++scale) v /= 10.0;
    if (v > std::numeric_limits<double>::max()) {
        return {};
    }
    return {true, negative ? -v : v};
}

} // namespace literal


namespace detail {

using static_schema::AnnotatedValue;
using static_schema::FieldKind;
using static_schema::field_kind_v;


template<class Field, ConstString Literal>
struct LiteralValue {
    using V = AnnotatedValue<Field>;
    static constexpr std::string_view text = Literal.toStringView();
    static constexpr FieldKind kind = field_kind_v<Field>;

    static_assert(kind == FieldKind::unsigned_integer || kind == FieldKind::signed_integer ||
                  kind == FieldKind::floating_point || kind == FieldKind::text,
                  "[[[ EbmlFusion ]]] default_value applies only to integer, floating point and text fields");

    static constexpr bool ok = [] {
        if constexpr (kind == FieldKind::unsigned_integer) {
            auto p = literal::parse_unsigned(text);
            return p.ok && p.value <= std::numeric_limits<V>::max();
        } else if constexpr (kind == FieldKind::signed_integer) {
            auto p = literal::parse_signed(text);
            return p.ok && p.value >= std::numeric_limits<V>::lowest() && p.value <= std::numeric_limits<V>::max();
        } else if constexpr (kind == FieldKind::floating_point) {
            auto p = literal::parse_float(text);
            return p.ok && p.value >= std::numeric_limits<V>::lowest() && p.value <= std::numeric_limits<V>::max();
        } else if constexpr (std::is_same_v<V, std::string>) {
            return true;
        } else {
            return text.size() <= static_schema::static_string_traits<V>::max_size();
        }
    }();
    static_assert(ok, "[[[ EbmlFusion ]]] default_value literal is malformed or does not fit the field type");

    static constexpr void assign(V & dst) {
        if constexpr (kind == FieldKind::unsigned_integer) {
            dst = static_cast<V>(literal::parse_unsigned(text).value);
        } else if constexpr (kind == FieldKind::signed_integer) {
            dst = static_cast<V>(literal::parse_signed(text).value);
        } else if constexpr (kind == FieldKind::floating_point) {
            dst = static_cast<V>(literal::parse_float(text).value);
        } else if constexpr (std::is_same_v<V, std::string>) {
            dst.assign(text.data(), text.size());
        } else {
            std::size_t i = 0;
            for (; i < text.size(); ++i) {
                dst[i] = text[i];
            }
            for (; i < dst.size(); ++i) {
                dst[i] = '\0';
            }
        }
    }
};


template<class T, std::size_t I>
constexpr void ResolveOne(T & obj) {
    using Field = introspection::MemberType<I, T>;
    using Opts  = options::detail::aggregate_field_opts_getter<T, I>;
    using Meta  = options::detail::annotation_meta_getter<Field>;

    if constexpr (Opts::template has_option<options::detail::default_value_tag>) {
        using Def = typename Opts::template get_option<options::detail::default_value_tag>;
        LiteralValue<Field, Def::literal>::assign(Meta::getRef(introspection::memberRef<I>(obj)));
    } else if constexpr (Opts::template has_option<options::detail::default_link_tag>) {
        using Link = typename Opts::template get_option<options::detail::default_link_tag>;
        using H = struct_fields_helper::FieldsHelper<T>;
        constexpr std::size_t J = H::indexByName(Link::name.toStringView());
        static_assert(J != H::NOT_FOUND, "[[[ EbmlFusion ]]] default_link names a field that does not exist");
        static_assert(J != I, "[[[ EbmlFusion ]]] default_link must name another field");

        using LinkedField = introspection::MemberType<J, T>;
        static_assert(std::is_same_v<AnnotatedValue<LinkedField>, AnnotatedValue<Field>>,
                      "[[[ EbmlFusion ]]] default_link source must have the same value type");
        using LinkedMeta = options::detail::annotation_meta_getter<LinkedField>;

        Meta::getRef(introspection::memberRef<I>(obj)) =
            LinkedMeta::getRef(introspection::memberRef<J>(obj));
    }
}

} // namespace detail


/// Applies literal and linked defaults to the scalar fields of `obj` not marked in `written`,
/// in declaration order. `written` is indexed by raw member index.
template<class T, std::size_t N>
constexpr void ResolveDefaults(T & obj, const std::array<bool, N> & written) {
    static_assert(N == introspection::memberCount<T>);
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        auto one = [&](auto ic) {
            constexpr std::size_t J = decltype(ic)::value;
            using Field = introspection::MemberType<J, T>;
            if constexpr (!struct_fields_helper::fieldIsExcluded<T, J>() && static_schema::EbmlScalar<Field>) {
                if (!written[J]) {
                    detail::ResolveOne<T, J>(obj);
                }
            } else if constexpr (!struct_fields_helper::fieldIsExcluded<T, J>()) {
                using Opts = options::detail::aggregate_field_opts_getter<T, J>;
                static_assert(!Opts::template has_option<options::detail::default_value_tag> &&
                              !Opts::template has_option<options::detail::default_link_tag>,
                              "[[[ EbmlFusion ]]] defaults apply only to integer, floating point and text fields");
            }
        };
        (one(std::integral_constant<std::size_t, I>{}), ...);
    }(std::make_index_sequence<N>{});
}

} // namespace defaults
} // namespace EbmlFusion
