// Basic EbmlFusion usage example
// Compile: g++ -std=c++23 -I../include -I<pfr>/include basic_usage.cpp -o basic_usage

#include <EbmlFusion/decoder.hpp>
#include <EbmlFusion/error_formatting.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace EbmlFusion;
using options::id, options::default_value;

struct EbmlHeader {
    A<std::uint8_t, id<0x4286>, default_value<"1">> version;
    A<std::uint8_t, id<0x42F7>, default_value<"1">> read_version;
    A<std::uint8_t, id<0x42F2>, default_value<"4">> max_id_length;
    A<std::uint8_t, id<0x42F3>, default_value<"8">> max_size_length;
    A<std::string,  id<0x4282>, default_value<"matroska">> doc_type;
    A<std::uint8_t, id<0x4287>, default_value<"1">> doc_type_version;
    A<std::uint8_t, id<0x4285>, default_value<"1">> doc_type_read_version;
};

struct Document {
    A<EbmlHeader, id<0x1A45DFA3>> header;
};

int main() {
    // EBML header of a WebM file: only DocType and DocTypeVersion are written
    const std::vector<std::uint8_t> data = {
        0x1A, 0x45, 0xDF, 0xA3, 0x8B,
            0x42, 0x82, 0x84, 'w', 'e', 'b', 'm',
            0x42, 0x87, 0x81, 0x04
    };

    Document doc;
    auto result = Decode(doc, data);

    if (!result) {
        std::cout << DecodeResultToString(result) << std::endl;
        return 1;
    }

    const EbmlHeader & h = doc.header.get();
    std::cout << "Successfully decoded!" << std::endl;
    std::cout << "DocType: " << h.doc_type.get() << " v" << int(h.doc_type_version) << std::endl;
    std::cout << "EBML version: " << int(h.version) << ", max id length " << int(h.max_id_length)
              << ", max size length " << int(h.max_size_length) << std::endl;

    return 0;
}
