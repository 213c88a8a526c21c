#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "decode_result.hpp"
#include "errors.hpp"
#include "path.hpp"

namespace EbmlFusion {

namespace error_formatting_detail {

inline std::string hex_id(std::uint64_t id) {
    constexpr char digits[] = "0123456789ABCDEF";
    std::string out;
    do {
        out.insert(out.begin(), digits[id & 0xF]);
        id >>= 4;
    } while (id != 0);
    return "0x" + out;
}

}

/// "$/0x1A45DFA3/0x4282" style rendering; list and array entries get "[slot]".
template <std::size_t SchemaDepth>
std::string ElementPathToString(const path::ElementPath<SchemaDepth> & p) {
    std::string elementPath = "$";
    for(std::size_t i = 0; i < p.currentLength; i ++) {
        elementPath += "/" + error_formatting_detail::hex_id(p.storage[i].id);
        if(p.storage[i].hasIndex()) {
            elementPath += "[" + std::to_string(p.storage[i].index) + "]";
        }
    }
    return elementPath;
}

template <std::size_t SchemaDepth>
std::string DecodeResultToString(const DecodeResult<SchemaDepth> & res) {
    const std::string elementPath = ElementPathToString(res.errorPath());
    const std::string at = " at byte " + std::to_string(res.pos());

    switch(res.outcome()) {
    case DecodeOutcome::decoded:
        return "Decoded " + elementPath + ", stopped" + at;
    case DecodeOutcome::payload_reached:
        return "When decoding " + elementPath + ", reached payload element "
               + error_formatting_detail::hex_id(res.payloadId()) + at;
    case DecodeOutcome::failed:
        break;
    }
    if(res.error() == DecodeError::READER_ERROR) {
        return "When decoding " + elementPath + ", reader error '"
               + std::string(reader_error_to_string(res.readerError())) + "'" + at;
    }
    return "When decoding " + elementPath + ", decoding error '"
           + std::string(error_to_string(res.error())) + "'" + at;
}

} // namespace EbmlFusion
