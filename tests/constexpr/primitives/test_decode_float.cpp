#include "test_helpers.hpp"
using namespace TestHelpers;
using EbmlFusion::A;
using EbmlFusion::DecodeError;
using EbmlFusion::ReaderError;
namespace options = EbmlFusion::options;
#include <limits>

struct ConfigDouble { A<double, options::id<0x4489>> duration; };
struct ConfigFloat  { A<float,  options::id<0x4489>> duration; };

// 4 byte payload: binary32
static_assert(TestDecode(bytes(0x44, 0x89, 0x84, 0x3F, 0xC0, 0x00, 0x00), ConfigDouble{1.5}));
static_assert(TestDecode(bytes(0x44, 0x89, 0x84, 0xC0, 0x00, 0x00, 0x00), ConfigDouble{-2.0}));
static_assert(TestDecode(bytes(0x44, 0x89, 0x84, 0x3F, 0xC0, 0x00, 0x00), ConfigFloat{1.5f}));

// 8 byte payload: binary64
static_assert(TestDecode(bytes(0x44, 0x89, 0x88, 0x40, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00), ConfigDouble{2.5}));
static_assert(TestDecode(bytes(0x44, 0x89, 0x88, 0x40, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00), ConfigFloat{2.5f}));
static_assert(TestDecode(bytes(0x44, 0x89, 0x88, 0x40, 0xBF, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00), ConfigDouble{8000.0}));

// Empty payload reads as zero
static_assert(TestDecode(bytes(0x44, 0x89, 0x80), ConfigDouble{0.0}));

// binary64 value that does not fit float storage
static_assert(TestDecodeError<ConfigFloat>(bytes(0x44, 0x89, 0x88, 0x7F, 0xEF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF),
                                           DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestDecode(bytes(0x44, 0x89, 0x88, 0x7F, 0xEF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF),
                         ConfigDouble{std::numeric_limits<double>::max()}));

// Infinity is carried over, not a range error
static_assert(TestDecode<ConfigFloat>(bytes(0x44, 0x89, 0x88, 0x7F, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00),
                                      [](const ConfigFloat & c) {
                                          return c.duration.get() == std::numeric_limits<float>::infinity();
                                      }));

static_assert(TestDecodeError<ConfigDouble>(bytes(0x44, 0x89, 0x88, 0x40, 0x04), ReaderError::UNEXPECTED_END_OF_DATA));
static_assert(TestDecodeError<ConfigDouble>(bytes(0x44, 0x89, 0x89, 0x40, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00),
                                            ReaderError::OVERSIZED_NUMBER));
