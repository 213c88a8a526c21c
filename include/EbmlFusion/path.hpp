#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

#include "static_schema.hpp"

namespace EbmlFusion {
namespace path {

constexpr bool allowed_dynamic_error_stack() {
#ifdef EBMLFUSION_ALLOW_DYNAMIC_ERROR_STACK
    return true;
#else
    return false;
#endif
}

struct PathElement {
    static constexpr std::size_t NO_INDEX = std::numeric_limits<std::size_t>::max();

    std::uint64_t id = 0;
    std::size_t   index = NO_INDEX;   // slot of list / array entries

    constexpr bool hasIndex() const {
        return index != NO_INDEX;
    }
};

template<std::size_t SchemaDepth> // schema depth INCLUDING root
struct ElementPath {
    static constexpr bool unbounded = SchemaDepth == schema_analyzis::SCHEMA_UNBOUNDED;

    static_assert(!unbounded || allowed_dynamic_error_stack(),
                  "[[[ EbmlFusion ]]] Recursive schema needs a growing error path: define EBMLFUSION_ALLOW_DYNAMIC_ERROR_STACK");

    using StorageT = std::conditional_t<!unbounded,
                                        std::array<PathElement, unbounded ? 0 : SchemaDepth - 1>,
                                        std::vector<PathElement>>;

    std::size_t currentLength = 0;
    StorageT storage{};

    constexpr void push_child(PathElement el) {
        if constexpr (!unbounded) {
            storage[currentLength] = el;
        } else {
            storage.push_back(el);
        }
        currentLength ++;
    }

    constexpr void pop() {
        if constexpr (unbounded) {
            storage.pop_back();
        }
        currentLength --;
    }

    constexpr std::size_t size() const {
        return currentLength;
    }

    constexpr const PathElement & operator[](std::size_t i) const {
        return storage[i];
    }

    constexpr bool empty() const {
        return currentLength == 0;
    }
};

} // namespace path
} // namespace EbmlFusion
