#pragma once

#include <string_view>
namespace EbmlFusion {


enum class DecodeError {
    NO_ERROR,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
    FIXED_SIZE_CONTAINER_OVERFLOW,
    READER_ERROR
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR"; break;
    case DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    case DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case DecodeError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


enum class ReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    ILLFORMED_VINT,
    OVERSIZED_NUMBER
};

constexpr std::string_view reader_error_to_string(ReaderError e) {
    switch(e) {
    case ReaderError::NO_ERROR: return "NO_ERROR"; break;
    case ReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case ReaderError::ILLFORMED_VINT: return "ILLFORMED_VINT"; break;
    case ReaderError::OVERSIZED_NUMBER: return "OVERSIZED_NUMBER"; break;
    }
    return "N/A";
}


enum class DecodeOutcome {
    decoded,          // every level finished and got its defaults
    failed,           // see error() / readerError()
    payload_reached   // a stop field matched; decoding handed back to the caller
};

constexpr std::string_view outcome_to_string(DecodeOutcome o) {
    switch(o) {
    case DecodeOutcome::decoded: return "decoded"; break;
    case DecodeOutcome::failed: return "failed"; break;
    case DecodeOutcome::payload_reached: return "payload_reached"; break;
    }
    return "N/A";
}

} // namespace EbmlFusion
