// Schema kept outside the types: plain structs, ids and defaults in StructMeta
// Compile: g++ -std=c++23 -I../include -I<pfr>/include external_meta.cpp -o external_meta

#include <EbmlFusion/decoder.hpp>
#include <EbmlFusion/error_formatting.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using std::cout;
using std::endl;

struct Seek {
    std::uint64_t seek_id = 0;
    std::uint64_t seek_position = 0;
};

struct SeekHead {
    std::vector<Seek> seeks;
};

struct Info {
    std::uint64_t timecode_scale = 0;
    std::string muxing_app;
    std::string writing_app;
};

struct SegmentMeta {
    SeekHead seek_head;
    Info info;
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
        Field<&Info::muxing_app,     "muxing_app",     options::id<0x4D80>>,
        Field<&Info::writing_app,    "writing_app",    options::id<0x5741>, options::default_link<"muxing_app">>
    >;
};

template<> struct StructMeta<SegmentMeta> {
    using Fields = StructFields<
        Field<&SegmentMeta::seek_head, "seek_head", options::id<0x114D9B74>>,
        Field<&SegmentMeta::info,      "info",      options::id<0x1549A966>>
    >;
};

} // namespace EbmlFusion


int main() {
    const std::vector<std::uint8_t> data = {
        0x11, 0x4D, 0x9B, 0x74, 0x8E,
            0x4D, 0xBB, 0x8B,
                0x53, 0xAB, 0x84, 0x15, 0x49, 0xA9, 0x66,
                0x53, 0xAC, 0x81, 0x40,
        0x15, 0x49, 0xA9, 0x66, 0x87,
            0x4D, 0x80, 0x84, 'l', 'a', 'v', 'f'
    };

    SegmentMeta meta;
    auto res = EbmlFusion::Decode(meta, data);
    cout << EbmlFusion::DecodeResultToString(res) << endl;
    if (!res) {
        return 1;
    }
    for (const Seek & s : meta.seek_head.seeks) {
        cout << std::hex << "seek 0x" << s.seek_id << std::dec << " -> " << s.seek_position << endl;
    }
    cout << "timecode scale " << meta.info.timecode_scale
         << ", muxing " << meta.info.muxing_app << ", writing " << meta.info.writing_app << endl;
    /* timecode scale 1000000, muxing lavf, writing lavf */
}
