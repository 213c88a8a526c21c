// Decode the metadata of a Matroska/WebM file, then walk the clusters by hand
// Compile: g++ -std=c++23 -I../include -I<pfr>/include payload_resume.cpp -o payload_resume
// Usage:   ./payload_resume file.webm

#include <EbmlFusion/decoder.hpp>
#include <EbmlFusion/error_formatting.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace EbmlFusion;
using options::id, options::default_value, options::default_link, options::stop;

struct EbmlHeader {
    A<std::uint8_t, id<0x4286>, default_value<"1">> version;
    A<std::string,  id<0x4282>, default_value<"matroska">> doc_type;
    A<std::uint8_t, id<0x4287>, default_value<"1">> doc_type_version;
};

struct Info {
    A<std::uint64_t, id<0x2AD7B1>, default_value<"1000000">> timecode_scale;
    A<double,        id<0x4489>> duration;
    A<std::string,   id<0x4D80>> muxing_app;
    A<std::string,   id<0x5741>> writing_app;
};

struct Video {
    A<std::uint64_t, id<0xB0>> pixel_width;
    A<std::uint64_t, id<0xBA>> pixel_height;
    A<std::uint64_t, id<0x54B0>, default_link<"pixel_width">>  display_width;
    A<std::uint64_t, id<0x54BA>, default_link<"pixel_height">> display_height;
};

struct Audio {
    A<double,        id<0xB5>, default_value<"8000.0">> sampling_frequency;
    A<std::uint64_t, id<0x9F>, default_value<"1">> channels;
};

struct TrackEntry {
    A<std::uint64_t, id<0xD7>> number;
    A<std::uint64_t, id<0x83>> type;
    A<std::string,   id<0x86>> codec_id;
    A<std::string,   id<0x22B59C>, default_value<"eng">> language;
    A<Video,         id<0xE0>> video;
    A<Audio,         id<0xE1>> audio;
};

struct Tracks {
    A<std::vector<TrackEntry>, id<0xAE>> entries;
};

// Decoding stops at the first Cluster: everything before it is metadata
struct Segment {
    A<Info,   id<0x1549A966>> info;
    A<Tracks, id<0x1654AE6B>> tracks;
    A<std::vector<std::uint8_t>, id<0x1F43B675>, stop> cluster;
};

struct WebmFile {
    A<EbmlHeader, id<0x1A45DFA3>> header;
    A<Segment,    id<0x18538067>> segment;
};

// Cluster children decoded on their own once the walk reaches them
struct Cluster {
    A<std::uint64_t, id<0xE7>> timecode;
    A<std::vector<std::uint8_t>, id<0xA3>, stop> simple_block;
};

constexpr std::uint64_t CLUSTER_ID = 0x1F43B675;

template <class ElementT>
bool walk_cluster(ElementT cluster, std::size_t & blocks, std::uint64_t & last_timecode) {
    Cluster c;
    auto res = DecodeElement(c, cluster);
    while (res.payloadReached()) {
        auto p = res.payload();
        blocks ++;
        if (!p->first.skip()) {
            return false;
        }
        res = DecodeElement(c, *p);
    }
    if (!res) {
        std::cerr << DecodeResultToString(res) << std::endl;
        return false;
    }
    last_timecode = c.timecode;
    return true;
}

int main(int argc, char ** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " file.webm" << std::endl;
        return 2;
    }
    std::ifstream in(argv[1], std::ios::binary);
    if (!in) {
        std::cerr << "cannot open " << argv[1] << std::endl;
        return 2;
    }

    std::istreambuf_iterator<char> begin(in), end;
    IteratorByteReader reader(begin, end);

    WebmFile file;
    auto res = DecodeElement(file, RootElement(reader));
    if (!res.payloadReached()) {
        std::cout << DecodeResultToString(res) << std::endl;
        return res ? 0 : 1;
    }

    const Segment & seg = file.segment.get();
    std::cout << "DocType: " << file.header->doc_type.get() << std::endl;
    std::cout << "Muxing app: " << seg.info->muxing_app.get()
              << ", timecode scale " << seg.info->timecode_scale << std::endl;
    for (const TrackEntry & t : seg.tracks->entries.get()) {
        std::cout << "Track " << t.number << ": " << t.codec_id.get() << " (" << t.language.get() << ")";
        if (t.video->pixel_width != 0) {
            std::cout << " " << t.video->display_width << "x" << t.video->display_height;
        }
        std::cout << std::endl;
    }

    // First cluster is the stop element; its siblings are the following clusters
    auto p = res.payload();
    std::size_t clusters = 0, blocks = 0;
    std::uint64_t last_timecode = 0;
    if (!walk_cluster(p->first, blocks, last_timecode)) {
        return 1;
    }
    clusters ++;

    Element<decltype(reader)> child;
    ElementStatus st;
    while ((st = p->rest.next(child)) == ElementStatus::element) {
        if (child.id() == CLUSTER_ID) {
            if (!walk_cluster(child, blocks, last_timecode)) {
                return 1;
            }
            clusters ++;
        } else if (!child.skip()) {
            break;
        }
    }
    if (st == ElementStatus::error || reader.getError() != ReaderError::NO_ERROR) {
        std::cerr << "reader error '" << reader_error_to_string(reader.getError())
                  << "' at byte " << reader.position() << std::endl;
        return 1;
    }

    std::cout << clusters << " clusters, " << blocks << " blocks, last cluster timecode "
              << last_timecode << std::endl;
    return 0;
}
