#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"
#include "vint.hpp"

namespace EbmlFusion {


namespace options {



namespace detail {

struct id_tag{};
struct stop_tag{};
struct default_value_tag{};
struct default_link_tag{};
struct exclude_tag{};
}

/// Wire element ID, written with its length marker as in schema tables (0x1A45DFA3, 0x4286, ...).
template<std::uint64_t ID>
struct id {
    static_assert(vint::is_valid_id(ID), "[[[ EbmlFusion ]]] element id is not a well-formed EBML vint (marker bit must match its byte length)");
    using tag = detail::id_tag;
    static constexpr std::uint64_t value = ID;
};

/// Reaching this element ends schema decoding with DecodeOutcome::payload_reached.
struct stop {
    using tag = detail::stop_tag;
};

/// Textual default, parsed per field kind at compile time; applied when the element is absent.
template<ConstString Literal>
struct default_value {
    using tag = detail::default_value_tag;
    static constexpr auto literal = Literal;
};

/// Name of a sibling field copied into this one when the element is absent.
template<ConstString FieldName>
struct default_link {
    static_assert(FieldName.check(), "[[[ EbmlFusion ]]] default_link field name contains control characters");
    using tag = detail::default_link_tag;
    static constexpr auto name = FieldName;
};

/// Member is not part of the EBML schema; decoder and defaults pass ignore it.
struct exclude {
    using tag = detail::exclude_tag;
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    static_assert((requires { typename Opts::tag; } && ...),
                  "[[[ EbmlFusion ]]] Annotated<> options must come from EbmlFusion::options");

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

// Plain, non-annotated member
template<class T>
struct annotation_meta {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta fields: the member itself is a plain T, options come from the Field<> entry
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::MemberType<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using options = typename Meta::options;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;


} // namespace detail


} //namespace options


} // namespace EbmlFusion
