#pragma once

#include <cstdint>
#include <cstddef>

namespace EbmlFusion {

namespace vint {

constexpr std::size_t MAX_LENGTH = 8;

enum class VintStatus {
    ok,         // value decoded
    no_data,    // source could not supply the first byte
    truncated,  // source ended inside the vint
    illformed   // first byte has no marker bit
};

/// Total encoded length announced by the first byte: 1 + leading zero bits before the marker.
/// Returns 0 for 0x00, which cannot start a vint of at most 8 bytes.
constexpr std::size_t vint_length(std::uint8_t first) {
    for (std::size_t i = 0; i < MAX_LENGTH; ++i) {
        if (first & (0x80u >> i)) {
            return i + 1;
        }
    }
    return 0;
}

/// Clears the length marker from a raw vint value of the given encoded length.
constexpr std::uint64_t clear_marker(std::uint64_t raw, std::size_t length) {
    return raw & ~(std::uint64_t{1} << (8 * length - length));
}

// ByteSource: anything with `bool read_byte(std::uint8_t&)`.
template<class ByteSource>
constexpr VintStatus read_vint(ByteSource & src, std::uint64_t & value, std::size_t & length) {
    std::uint8_t b = 0;
    if (!src.read_byte(b)) {
        return VintStatus::no_data;
    }
    length = vint_length(b);
    if (length == 0) {
        return VintStatus::illformed;
    }
    std::uint64_t v = b;
    for (std::size_t i = 1; i < length; ++i) {
        if (!src.read_byte(b)) {
            return VintStatus::truncated;
        }
        v = (v << 8) | b;
    }
    value = v;
    return VintStatus::ok;
}

template<class ByteSource>
constexpr VintStatus read_size(ByteSource & src, std::uint64_t & value, std::size_t & length) {
    std::uint64_t raw = 0;
    VintStatus st = read_vint(src, raw, length);
    if (st == VintStatus::ok) {
        value = clear_marker(raw, length);
    }
    return st;
}

/// True when `id` is a raw vint (marker kept) whose byte count matches its marker position.
constexpr bool is_valid_id(std::uint64_t id) {
    if (id == 0) {
        return false;
    }
    std::size_t bytes = 1;
    while (bytes < MAX_LENGTH && (id >> (8 * bytes)) != 0) {
        ++bytes;
    }
    const std::uint8_t top = static_cast<std::uint8_t>(id >> (8 * (bytes - 1)));
    return vint_length(top) == bytes;
}

} // namespace vint

} // namespace EbmlFusion
