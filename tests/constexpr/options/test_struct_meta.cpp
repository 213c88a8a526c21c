#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace EbmlFusion;
#include <cstdint>
#include <string>
#include <vector>

// Schema declared outside the type: members stay plain

struct Seek {
    std::uint64_t seek_id = 0;
    std::uint64_t seek_position = 0;
};

struct SeekHead {
    std::vector<Seek> seeks;
};

// Not an aggregate: PFR cannot see it, StructMeta can
class Info {
public:
    constexpr std::uint64_t scale() const { return timecode_scale; }
    constexpr const std::string & app() const { return writing_app; }
    constexpr const std::string & muxer() const { return muxing_app; }

    std::uint64_t timecode_scale = 0;
    std::string writing_app;
    std::string muxing_app;

    constexpr Info() {}
};

namespace EbmlFusion {

template<> struct StructMeta<Seek> {
    using Fields = StructFields<
        Field<&Seek::seek_id,       "seek_id",       options::id<0x53AB>>,
        Field<&Seek::seek_position, "seek_position", options::id<0x53AC>>
    >;
};

template<> struct StructMeta<SeekHead> {
    using Fields = StructFields<
        Field<&SeekHead::seeks, "seeks", options::id<0x4DBB>>
    >;
};

template<> struct StructMeta<Info> {
    using Fields = StructFields<
        Field<&Info::timecode_scale, "timecode_scale", options::id<0x2AD7B1>, options::default_value<"1000000">>,
        Field<&Info::writing_app,    "writing_app",    options::id<0x5741>>,
        Field<&Info::muxing_app,     "muxing_app",     options::id<0x4D80>, options::default_link<"writing_app">>
    >;
};

} // namespace EbmlFusion

static_assert(static_schema::EbmlRecord<Seek>);
static_assert(static_schema::EbmlRecord<Info>);
static_assert(static_schema::EbmlRecordList<std::vector<Seek>>);

static_assert(TestDecode(bytes(0x53, 0xAB, 0x84, 0x15, 0x49, 0xA9, 0x66,
                               0x53, 0xAC, 0x82, 0x10, 0x00),
                         Seek{0x1549A966, 0x1000}));

static_assert(TestDecode<SeekHead>(bytes(0x4D, 0xBB, 0x87, 0x53, 0xAB, 0x84, 0x16, 0x54, 0xAE, 0x6B,
                                         0x4D, 0xBB, 0x85, 0x53, 0xAC, 0x82, 0x01, 0x00),
                                   [](const SeekHead & h) {
    return h.seeks.size() == 2
        && h.seeks[0].seek_id == 0x1654AE6B && h.seeks[0].seek_position == 0
        && h.seeks[1].seek_id == 0 && h.seeks[1].seek_position == 0x100;
}));

// Defaults and links resolve through the names given in StructMeta
static_assert(TestDecode<Info>(bytes(0x57, 0x41, 0x83, 'a', 'p', 'p'), [](const Info & i) {
    return i.scale() == 1000000 && i.app() == "app" && i.muxer() == "app";
}));

static_assert(TestDecode<Info>(bytes(0x2A, 0xD7, 0xB1, 0x83, 0x0F, 0x42, 0x40,
                                     0x4D, 0x80, 0x81, 'm'), [](const Info & i) {
    return i.scale() == 1000000 && i.app().empty() && i.muxer() == "m";
}));

// Error paths use the ids from StructMeta
static_assert(TestDecodeResult<SeekHead>(bytes(0x4D, 0xBB, 0x84, 0x53, 0xAB, 0x84, 0x16),
                                         [](const auto & res, const SeekHead &) {
    return !res && PathIs(res.errorPath(), {{0x4DBB, 0}, {0x53AB}});
}));
