#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace EbmlFusion {

namespace struct_fields_helper {

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::exclude_tag>;
}

template<class T, std::size_t I>
static consteval bool fieldHasId() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return !fieldIsExcluded<T, I>() && Opts::template has_option<options::detail::id_tag>;
}

template<class T, std::size_t I>
static consteval std::uint64_t fieldId() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template get_option<options::detail::id_tag>::value;
}

template<class T, std::size_t I>
static consteval bool fieldIsStop() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::stop_tag>;
}


struct IdDescr {
    std::uint64_t id = 0;
    std::size_t index = 0;   // raw member index
    bool stop = false;
};


template<class T>
struct FieldsHelper {
    static constexpr std::size_t NOT_FOUND = std::size_t(-1);

    static constexpr std::size_t rawFieldsCount = introspection::memberCount<T>;

    static constexpr std::size_t idFieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (fieldHasId<T, I>() ? 1 : 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr std::array<IdDescr, idFieldsCount> idTable =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<IdDescr, idFieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (fieldHasId<T, J>()) {
                    arr[index++] = IdDescr{ fieldId<T, J>(), J, fieldIsStop<T, J>() };
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool idsAreUnique = [](std::array<IdDescr, idFieldsCount> inputArr) consteval {
        auto sortedArr = inputArr;
        std::ranges::sort(sortedArr, {}, &IdDescr::id);
        return std::ranges::adjacent_find(sortedArr, {}, &IdDescr::id) == sortedArr.end();
    }(idTable);

    static_assert(idsAreUnique, "[[[ EbmlFusion ]]] two fields of one record share the same element id");

    // Raw member index of the field bound to `id`, NOT_FOUND for unknown elements.
    static constexpr std::size_t indexForId(std::uint64_t id) {
        for (const auto & d : idTable) {
            if (d.id == id) {
                return d.index;
            }
        }
        return NOT_FOUND;
    }

    static constexpr bool isStop(std::uint64_t id) {
        for (const auto & d : idTable) {
            if (d.id == id) {
                return d.stop;
            }
        }
        return false;
    }

    static constexpr bool hasStopFields = []() consteval {
        for (const auto & d : idTable) {
            if (d.stop) return true;
        }
        return false;
    }();

    // Member lookup for default_link; excluded members are not linkable.
    static consteval std::size_t indexByName(std::string_view name) {
        std::size_t found = NOT_FOUND;
        [&]<std::size_t... I>(std::index_sequence<I...>) consteval {
            auto check_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsExcluded<T, J>()) {
                    if (found == NOT_FOUND && introspection::memberName<J, T> == name) {
                        found = J;
                    }
                }
            };
            (check_one(std::integral_constant<std::size_t, I>{}), ...);
        }(std::make_index_sequence<rawFieldsCount>{});
        return found;
    }
};

} // namespace struct_fields_helper
} // namespace EbmlFusion
