#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace EbmlFusion {

// External description of a record, for types PFR cannot reflect or that
// should not carry Annotated<> members:
//
//   template<> struct EbmlFusion::StructMeta<Seek> {
//       using Fields = StructFields<
//           Field<&Seek::seek_id,       "seek_id",       options::id<0x53AB>>,
//           Field<&Seek::seek_position, "seek_position", options::id<0x53AC>>
//       >;
//   };
template <class T>
struct StructMeta {};

template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...> {
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name = key;
    static constexpr T C::* MemberP = MPtr;
};

template <class ... F>
struct StructFields {
    using FieldsTuple = std::tuple<F...>;
};


/// Uniform member access for records, whichever way their schema is given.
/// Members are addressed by raw declaration index; excluded members keep their slot.
namespace introspection {

namespace detail {

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T, class = void>
struct meta_described : std::false_type {};

template<class T>
struct meta_described<T, std::void_t<typename StructMeta<T>::Fields>>
    : is_fields_pack<typename StructMeta<T>::Fields> {};


// Aggregates: PFR sees the members as declared, Annotated<> included
template<class T, bool = meta_described<T>::value>
struct RecordLayout {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template<std::size_t I>
    using member_type = pfr::tuple_element_t<I, T>;

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, T>();

    template<std::size_t I>
    static constexpr decltype(auto) ref(T & rec) {
        return (pfr::get<I>(rec));
    }
};

// StructMeta records: each member is seen as Annotated<ValueT, Opts...>, so options
// are looked up the same way as for inline annotations, while the member itself stays plain.
template<class T>
struct RecordLayout<T, true> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;

    template<std::size_t I>
    using entry = std::tuple_element_t<I, Fields>;

    template<class ValueT, class Pack> struct annotate;
    template<class ValueT, class... Opts> struct annotate<ValueT, OptionsPack<Opts...>> {
        using type = Annotated<ValueT, Opts...>;
    };

    static constexpr std::size_t count = std::tuple_size_v<Fields>;

    template<std::size_t I>
    using member_type = typename annotate<typename entry<I>::ValueT, typename entry<I>::OptionsP>::type;

    template<std::size_t I>
    static constexpr std::string_view name = entry<I>::Name.toStringView();

    template<std::size_t I>
    static constexpr decltype(auto) ref(T & rec) {
        return (rec.*(entry<I>::MemberP));
    }
};

} // namespace detail

template<class T>
inline constexpr bool has_struct_meta = detail::meta_described<std::remove_cv_t<T>>::value;

template<class RecordT>
inline constexpr std::size_t memberCount = detail::RecordLayout<std::remove_cv_t<RecordT>>::count;

template<std::size_t I, class RecordT>
using MemberType = typename detail::RecordLayout<std::remove_cv_t<RecordT>>::template member_type<I>;

template<std::size_t I, class RecordT>
inline constexpr std::string_view memberName = detail::RecordLayout<std::remove_cv_t<RecordT>>::template name<I>;

template<std::size_t I, class RecordT>
constexpr decltype(auto) memberRef(RecordT & rec) {
    return (detail::RecordLayout<std::remove_cv_t<RecordT>>::template ref<I>(rec));
}

} // namespace introspection
} // namespace EbmlFusion
