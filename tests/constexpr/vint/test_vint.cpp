#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace EbmlFusion;
#include <cstdint>

// ============================================================================
// Length from the first byte
// ============================================================================

static_assert(vint::vint_length(0x80) == 1);
static_assert(vint::vint_length(0xFF) == 1);
static_assert(vint::vint_length(0x40) == 2);
static_assert(vint::vint_length(0x7F) == 2);
static_assert(vint::vint_length(0x20) == 3);
static_assert(vint::vint_length(0x10) == 4);
static_assert(vint::vint_length(0x1A) == 4);
static_assert(vint::vint_length(0x08) == 5);
static_assert(vint::vint_length(0x04) == 6);
static_assert(vint::vint_length(0x02) == 7);
static_assert(vint::vint_length(0x01) == 8);
static_assert(vint::vint_length(0x00) == 0);

// Trailing bits never change the length
static_assert(vint::vint_length(0x5F) == vint::vint_length(0x40));
static_assert(vint::vint_length(0x3E) == vint::vint_length(0x21));

// ============================================================================
// Marker removal
// ============================================================================

static_assert(vint::clear_marker(0x81, 1) == 1);
static_assert(vint::clear_marker(0x4001, 2) == 1);
static_assert(vint::clear_marker(0x10000005, 4) == 5);
static_assert(vint::clear_marker(0xFF, 1) == 0x7F);
static_assert(vint::clear_marker(0x01FFFFFFFFFFFFFFULL, 8) == 0x00FFFFFFFFFFFFFFULL);

// ============================================================================
// Reading from a byte stream
// ============================================================================

struct VintRead {
    vint::VintStatus status = vint::VintStatus::ok;
    std::uint64_t value = 0;
    std::size_t length = 0;
    std::uint64_t consumed = 0;
};

template<std::size_t N>
constexpr VintRead ReadId(const std::array<std::uint8_t, N> & data) {
    IteratorByteReader reader(data.begin(), data.end());
    VintRead r{};
    r.status = vint::read_vint(reader, r.value, r.length);
    r.consumed = reader.position();
    return r;
}

template<std::size_t N>
constexpr VintRead ReadSize(const std::array<std::uint8_t, N> & data) {
    IteratorByteReader reader(data.begin(), data.end());
    VintRead r{};
    r.status = vint::read_size(reader, r.value, r.length);
    r.consumed = reader.position();
    return r;
}

// Identifiers keep the marker bit
static_assert(ReadId(bytes(0x81)).value == 0x81);
static_assert(ReadId(bytes(0x81)).length == 1);
static_assert(ReadId(bytes(0x42, 0x86)).value == 0x4286);
static_assert(ReadId(bytes(0x1A, 0x45, 0xDF, 0xA3)).value == 0x1A45DFA3);
static_assert(ReadId(bytes(0x1A, 0x45, 0xDF, 0xA3)).length == 4);

// Sizes drop it: one and two byte encodings of 1
static_assert(ReadSize(bytes(0x81)).value == 1);
static_assert(ReadSize(bytes(0x40, 0x01)).value == 1);
static_assert(ReadSize(bytes(0x40, 0x01)).length == 2);
static_assert(ReadSize(bytes(0x80)).value == 0);
static_assert(ReadSize(bytes(0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x05)).value == 5);
static_assert(ReadSize(bytes(0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x05)).length == 8);

// All-ones is not special: it is just the largest value of its length
static_assert(ReadSize(bytes(0xFF)).value == 0x7F);
static_assert(ReadSize(bytes(0x01, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF)).value == 0x00FFFFFFFFFFFFFFULL);

// Only the announced bytes are consumed
static_assert(ReadSize(bytes(0x82, 0x99, 0x99)).consumed == 1);
static_assert(ReadSize(bytes(0x40, 0x02, 0x99)).consumed == 2);

// Status results
static_assert(ReadSize(bytes()).status == vint::VintStatus::no_data);
static_assert(ReadSize(bytes(0x00)).status == vint::VintStatus::illformed);
static_assert(ReadSize(bytes(0x40)).status == vint::VintStatus::truncated);
static_assert(ReadId(bytes(0x1A, 0x45, 0xDF)).status == vint::VintStatus::truncated);
static_assert(ReadId(bytes(0x00, 0x81)).status == vint::VintStatus::illformed);

// ============================================================================
// Element id constants
// ============================================================================

static_assert(vint::is_valid_id(0x81));
static_assert(vint::is_valid_id(0xEC));
static_assert(vint::is_valid_id(0x4286));
static_assert(vint::is_valid_id(0x2AD7B1));
static_assert(vint::is_valid_id(0x1A45DFA3));

static_assert(!vint::is_valid_id(0));
static_assert(!vint::is_valid_id(0x7F));        // two byte marker, one byte value
static_assert(!vint::is_valid_id(0x2086));      // three byte marker, two byte value
static_assert(!vint::is_valid_id(0x1A45DF));    // four byte marker, three byte value
