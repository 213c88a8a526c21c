#include "test_helpers.hpp"
using namespace TestHelpers;
using EbmlFusion::A;
using EbmlFusion::ReaderError;
namespace options = EbmlFusion::options;
#include <cstdint>
#include <string>

struct Inner {
    A<std::uint32_t, options::id<0x81>> a;
    A<std::string,   options::id<0x82>> s;
};

struct Outer {
    A<Inner,        options::id<0xA0>> inner;
    A<std::uint8_t, options::id<0x83>> tail;
};

// Nested record followed by a sibling
static_assert(TestDecode(bytes(0xA0, 0x86,
                                   0x81, 0x81, 0x07,
                                   0x82, 0x81, 'x',
                               0x83, 0x81, 0x09),
                         Outer{Inner{7, "x"}, 9}));

// Child order inside a record does not matter
static_assert(TestDecode(bytes(0x83, 0x81, 0x09,
                               0xA0, 0x86,
                                   0x82, 0x81, 'x',
                                   0x81, 0x81, 0x07),
                         Outer{Inner{7, "x"}, 9}));

// Empty nested record
static_assert(TestDecode(bytes(0xA0, 0x80), Outer{}));

// Absent nested record stays value-initialized
static_assert(TestDecode(bytes(0x83, 0x81, 0x02), Outer{Inner{}, 2}));


// ===== unknown elements are skipped =====

// EBML Void at root
static_assert(TestDecode(bytes(0xEC, 0x82, 0xAA, 0xBB,
                               0x83, 0x81, 0x05),
                         Outer{Inner{}, 5}));

// Unknown master element: its children are never looked at, even when their ids are known elsewhere
static_assert(TestDecode(bytes(0xB0, 0x83, 0x83, 0x81, 0x63,
                               0x83, 0x81, 0x05),
                         Outer{Inner{}, 5}));

// Unknown element inside a nested record
static_assert(TestDecode(bytes(0xA0, 0x89,
                                   0xBF, 0x84, 0x01, 0x02, 0x03, 0x04,
                                   0x81, 0x81, 0x03),
                         Outer{Inner{3, ""}, 0}));

// Unknown element with a multi-byte id and size
static_assert(TestDecode(bytes(0x1F, 0x43, 0xB6, 0x75, 0x40, 0x02, 0x00, 0x00,
                               0x83, 0x81, 0x01),
                         Outer{Inner{}, 1}));

// Skipping an unknown element that runs past the stream end is a short read
static_assert(TestDecodeError<Outer>(bytes(0xEC, 0x85, 0x00, 0x00), ReaderError::UNEXPECTED_END_OF_DATA));


// ===== three levels =====
struct Level3 { A<std::uint8_t, options::id<0x81>> leaf; };
struct Level2 { A<Level3, options::id<0xA2>> l3; };
struct Level1 { A<Level2, options::id<0xA1>> l2; A<std::uint8_t, options::id<0x82>> after; };

static_assert(TestDecode(bytes(0xA1, 0x85,
                                   0xA2, 0x83,
                                       0x81, 0x81, 0x2A,
                               0x82, 0x81, 0x01),
                         Level1{Level2{Level3{42}}, 1}));
