#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace EbmlFusion;
#include <cstdint>
#include <string>
#include <vector>

struct Inner {
    A<std::uint8_t, options::id<0x81>> a;
    A<std::string,  options::id<0x82>> s;
};
struct Outer {
    A<Inner,        options::id<0xA0>> inner;
    A<std::uint8_t, options::id<0x83>> tail;
};

// ============================================================================
// Stream-level errors
// ============================================================================

// Empty input is not an error
static_assert(TestDecode(bytes(), Outer{}));

// Truncated payload
static_assert(TestDecodeError<Outer>(bytes(0x83, 0x84, 0x01), ReaderError::UNEXPECTED_END_OF_DATA));
// Truncated id
static_assert(TestDecodeError<Outer>(bytes(0x42), ReaderError::UNEXPECTED_END_OF_DATA));
// Id without size
static_assert(TestDecodeError<Outer>(bytes(0x83), ReaderError::UNEXPECTED_END_OF_DATA));
// Truncated size
static_assert(TestDecodeError<Outer>(bytes(0x83, 0x40), ReaderError::UNEXPECTED_END_OF_DATA));
// Invalid first byte of an id / of a size
static_assert(TestDecodeError<Outer>(bytes(0x00), ReaderError::ILLFORMED_VINT));
static_assert(TestDecodeError<Outer>(bytes(0x83, 0x00), ReaderError::ILLFORMED_VINT));

// Nested record shorter than its header claims
static_assert(TestDecodeError<Outer>(bytes(0xA0, 0x85, 0x81, 0x81), ReaderError::UNEXPECTED_END_OF_DATA));

// Child claiming more than its parent holds
static_assert(TestDecodeError<Outer>(bytes(0xA0, 0x82, 0x81, 0x85, 0x01, 0x02, 0x03, 0x04, 0x05),
                                     ReaderError::UNEXPECTED_END_OF_DATA));


// ============================================================================
// Positions
// ============================================================================

static_assert([] {
    Outer o{};
    return DecodeFailsAt(o, bytes(0x83, 0x84, 0x01), ReaderError::UNEXPECTED_END_OF_DATA, 3);
}());

static_assert([] {
    Outer o{};
    return DecodeFailsAt(o, bytes(0x83, 0x81, 0x01, 0x00), ReaderError::ILLFORMED_VINT, 4);
}());

// Parent boundary at offset 4
static_assert([] {
    Outer o{};
    return DecodeFailsAt(o, bytes(0xA0, 0x82, 0x81, 0x85, 0x01, 0x02, 0x03, 0x04, 0x05),
                         ReaderError::UNEXPECTED_END_OF_DATA, 4);
}());

// Success reports the number of bytes consumed
static_assert(TestDecodeResult<Outer>(bytes(0x83, 0x81, 0x01, 0xEC, 0x80), [](const auto & res, const Outer & o) {
    return res && res.outcome() == DecodeOutcome::decoded && res.pos() == 5 && o.tail == 1;
}));


// ============================================================================
// Element path
// ============================================================================

static_assert(TestDecodeResult<Outer>(bytes(0xA0, 0x83, 0x81, 0x82, 0x01), [](const auto & res, const Outer &) {
    return !res && PathIs(res.errorPath(), {{0xA0}, {0x81}});
}));

static_assert(TestDecodeResult<Outer>(bytes(0xA0, 0x84, 0x81, 0x82, 0x01, 0x00), [](const auto & res, const Outer &) {
    return res.error() == DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
        && PathIs(res.errorPath(), {{0xA0}, {0x81}});
}));

// Header error inside a nested record: the path stops at the record
static_assert(TestDecodeResult<Outer>(bytes(0xA0, 0x81, 0x00), [](const auto & res, const Outer &) {
    return res.readerError() == ReaderError::ILLFORMED_VINT
        && PathIs(res.errorPath(), {{0xA0}});
}));

// Failure in a root-level child, then a header error at root level
static_assert(TestDecodeResult<Outer>(bytes(0x83, 0x82, 0x01), [](const auto & res, const Outer &) {
    return !res && PathIs(res.errorPath(), {{0x83}});
}));
static_assert(TestDecodeResult<Outer>(bytes(0x00), [](const auto & res, const Outer &) {
    return !res && res.errorPath().empty();
}));

// Success leaves the path empty
static_assert(TestDecodeResult<Outer>(bytes(0xA0, 0x83, 0x81, 0x81, 0x01), [](const auto & res, const Outer &) {
    return res && res.errorPath().empty();
}));

// List entries carry their slot index
struct TrackEntry { A<std::uint8_t, options::id<0xD7>> number; };
struct Tracks { A<std::vector<TrackEntry>, options::id<0xAE>> entries; };

static_assert(TestDecodeResult<Tracks>(bytes(0xAE, 0x83, 0xD7, 0x81, 0x01,
                                             0xAE, 0x83, 0xD7, 0x82, 0x01),
                                       [](const auto & res, const Tracks &) {
    return res.readerError() == ReaderError::UNEXPECTED_END_OF_DATA
        && res.pos() == 10
        && PathIs(res.errorPath(), {{0xAE, 1}, {0xD7}});
}));
