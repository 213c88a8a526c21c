#pragma once

#include <cstdint>
#include <iterator>

namespace EbmlFusion {

// 1) Iterator you can:
//    - read as *it   (convertible to std::uint8_t)
//    - advance as it++ / ++it
template <class It>
concept ByteInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, std::uint8_t>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class It, class Sent>
concept ByteSentinelFor =
    ByteInputIterator<It> &&
    std::sentinel_for<Sent, It>;

} // namespace EbmlFusion
