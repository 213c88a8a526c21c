#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>


#include "options.hpp"
#include "struct_introspection.hpp"

namespace EbmlFusion {

namespace static_schema {


template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};


namespace input_checks {

template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_null_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v =
    is_directly_forbidden<T>::value;

} // namespace input_checks



using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

template<class Field>
using AnnotatedOptions = typename annotation_meta_getter<Field>::options;


/* ######## Integers ######## */
template<class C>
concept EbmlUnsigned =
    std::unsigned_integral<AnnotatedValue<C>> && !std::same_as<AnnotatedValue<C>, bool>;

template<class C>
concept EbmlSigned = std::signed_integral<AnnotatedValue<C>>;

template<class C>
concept EbmlInteger = EbmlUnsigned<C> || EbmlSigned<C>;

/* ######## Floats ######## */
template<class C>
concept EbmlFloat = std::floating_point<AnnotatedValue<C>>;


/* ######## Text ######## */
template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;
    static constexpr std::size_t capacity = N;

    static constexpr char* data(std::array<char, N>& s)  { return s.data(); }

    // one byte stays reserved for the null terminator
    static constexpr std::size_t max_size() {
        return N ? N - 1 : 0;
    }
};

template<class C>
concept EbmlText =
    std::same_as<AnnotatedValue<C>, std::string> ||
    static_string_traits<AnnotatedValue<C>>::is_static;


/* ######## Binary ######## */
template<class C>
concept EbmlBinary =
    !EbmlText<C> &&
    DynamicContainerTypeConcept<AnnotatedValue<C>> &&
    (std::same_as<typename AnnotatedValue<C>::value_type, std::uint8_t> ||
     std::same_as<typename AnnotatedValue<C>::value_type, std::byte>);


template<class C>
concept EbmlScalar = EbmlInteger<C> || EbmlFloat<C> || EbmlText<C>;


/* ######## Records ######## */
template<typename T>
struct is_ebml_record {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (EbmlScalar<T> || EbmlBinary<T>) {
            return false;
        } else if constexpr (introspection::has_struct_meta<U>) {
            return true;
        } else if constexpr (std::ranges::range<U>) {
            return false;
        } else if constexpr (!std::is_class_v<U>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<U>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept EbmlRecord = is_ebml_record<C>::value;


/* ######## Record containers ######## */

// list of records: one element appended per matching child
template<class C>
concept EbmlRecordList =
    !EbmlText<C> && !EbmlBinary<C> &&
    requires(AnnotatedValue<C>& c) {
        typename AnnotatedValue<C>::value_type;
        { c.emplace_back() } -> std::same_as<typename AnnotatedValue<C>::value_type&>;
        c.clear();
    } &&
    EbmlRecord<typename AnnotatedValue<C>::value_type>;


template<class T>
struct record_array_traits {
    static constexpr bool is_record_array = false;
};

template<class T, std::size_t N>
struct record_array_traits<std::array<T, N>> {
    static constexpr bool is_record_array = EbmlRecord<T>;
    static constexpr std::size_t size = N;
    using element_type = T;
};

template<class C>
concept EbmlRecordArray = record_array_traits<AnnotatedValue<C>>::is_record_array;


enum class FieldKind {
    unsigned_integer,
    signed_integer,
    floating_point,
    text,
    binary,
    record,
    record_list,
    record_array,
    unsupported
};

template<class C>
constexpr FieldKind field_kind() {
    if constexpr (input_checks::is_directly_forbidden_v<AnnotatedValue<C>>) {
        return FieldKind::unsupported;
    } else if constexpr (EbmlUnsigned<C>) {
        return FieldKind::unsigned_integer;
    } else if constexpr (EbmlSigned<C>) {
        return FieldKind::signed_integer;
    } else if constexpr (EbmlFloat<C>) {
        return FieldKind::floating_point;
    } else if constexpr (EbmlText<C>) {
        return FieldKind::text;
    } else if constexpr (EbmlBinary<C>) {
        return FieldKind::binary;
    } else if constexpr (EbmlRecordList<C>) {
        return FieldKind::record_list;
    } else if constexpr (EbmlRecordArray<C>) {
        return FieldKind::record_array;
    } else if constexpr (EbmlRecord<C>) {
        return FieldKind::record;
    } else {
        return FieldKind::unsupported;
    }
}

template<class C>
inline constexpr FieldKind field_kind_v = field_kind<C>();

template<class C>
concept EbmlDecodableValue = field_kind_v<C> != FieldKind::unsupported;


namespace detail {
template<class T>
struct always_false : std::false_type {};
}

} //static_schema


namespace schema_analyzis {
using namespace static_schema;
constexpr std::size_t SCHEMA_UNBOUNDED = std::numeric_limits<std::size_t>::max();

// Nesting depth of element paths, root record included. List and array entries share
// the path slot of their element, so they add no extra level.
template <class Type, class ... SeenTypes>
consteval std::size_t calc_type_depth() {
    using T = AnnotatedValue<Type>;

    if constexpr ( (std::is_same_v<T, SeenTypes> || ...) ) {
        return SCHEMA_UNBOUNDED;
    } else if constexpr (EbmlRecordList<T>) {
        return calc_type_depth<typename T::value_type, SeenTypes...>();
    } else if constexpr (EbmlRecordArray<T>) {
        return calc_type_depth<typename record_array_traits<T>::element_type, SeenTypes...>();
    } else if constexpr (EbmlRecord<T>) {
        auto fieldDepthGetter = [](auto ic) -> std::size_t {
            constexpr std::size_t StructIndex = decltype(ic)::value;
            using Field   = introspection::MemberType<StructIndex, T>;
            using Opts    = AnnotatedOptions<Field>;
            if constexpr (Opts::template has_option<options::detail::exclude_tag>) {
                return 0;
            } else {
                return calc_type_depth<Field, T, SeenTypes...>();
            }
        };
        constexpr std::size_t struct_elements_count = introspection::memberCount<T>;
        if constexpr (struct_elements_count == 0) {
            return 1;
        } else {
            std::size_t r = [&]<std::size_t... I>(std::index_sequence<I...>) -> std::size_t {
                return std::max({fieldDepthGetter(std::integral_constant<std::size_t, I>{})...});
            }(std::make_index_sequence<struct_elements_count>{});
            if(r == SCHEMA_UNBOUNDED) {
                return r;
            } else {
                return 1 + r;
            }
        }
    } else {
        return 1;
    }
}

// Widest record of the schema, in raw members. Sizes the field-written mask a stop hands
// back, since the stop may happen in any nested record.
template <class Type, class ... SeenTypes>
consteval std::size_t calc_max_record_fields() {
    using T = AnnotatedValue<Type>;

    if constexpr ( (std::is_same_v<T, SeenTypes> || ...) ) {
        return 0;
    } else if constexpr (EbmlRecordList<T>) {
        return calc_max_record_fields<typename T::value_type, SeenTypes...>();
    } else if constexpr (EbmlRecordArray<T>) {
        return calc_max_record_fields<typename record_array_traits<T>::element_type, SeenTypes...>();
    } else if constexpr (EbmlRecord<T>) {
        auto fieldWidthGetter = [](auto ic) -> std::size_t {
            using Field = introspection::MemberType<decltype(ic)::value, T>;
            if constexpr (AnnotatedOptions<Field>::template has_option<options::detail::exclude_tag>) {
                return 0;
            } else {
                return calc_max_record_fields<Field, T, SeenTypes...>();
            }
        };
        constexpr std::size_t struct_elements_count = introspection::memberCount<T>;
        return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::size_t {
            return std::max({struct_elements_count, fieldWidthGetter(std::integral_constant<std::size_t, I>{})...});
        }(std::make_index_sequence<struct_elements_count>{});
    } else {
        return 0;
    }
}

} // namespace schema_analyzis
} // namespace EbmlFusion
