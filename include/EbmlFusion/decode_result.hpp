#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "errors.hpp"
#include "path.hpp"
#include "static_schema.hpp"

namespace EbmlFusion {


/// Where decoding handed control back after a stop field matched.
/// `first` is the stop element, its header consumed and its payload untouched.
/// `rest` is the element that contained it; once `first` is consumed or skipped,
/// `rest.next()` yields the following sibling.
/// `written` marks the members of the record holding the stop field that were already
/// decoded, by raw member index. Resuming with it keeps the default pass off them.
template <class ElementT, std::size_t MaskSize>
struct PayloadReached {
    ElementT first;
    ElementT rest;
    std::array<bool, MaskSize> written{};
};


template <std::size_t SchemaDepth>
class DecodeResult {
    DecodeOutcome m_outcome = DecodeOutcome::decoded;
    DecodeError m_error = DecodeError::NO_ERROR;
    ReaderError m_readerError = ReaderError::NO_ERROR;
    std::uint64_t m_pos = 0;
    std::uint64_t m_payloadId = 0;

    path::ElementPath<SchemaDepth> currentPath;

public:
    constexpr DecodeResult(DecodeOutcome outcome, DecodeError err, ReaderError rerr, std::uint64_t pos,
                           std::uint64_t payloadId, path::ElementPath<SchemaDepth> elementP):
        m_outcome(outcome), m_error(err), m_readerError(rerr), m_pos(pos), m_payloadId(payloadId), currentPath(elementP)
    {}

    // true only when the whole tree was decoded; payload_reached is not an error but is not success either
    constexpr operator bool() const {
        return m_outcome == DecodeOutcome::decoded;
    }
    constexpr DecodeOutcome outcome() const {
        return m_outcome;
    }
    constexpr bool payloadReached() const {
        return m_outcome == DecodeOutcome::payload_reached;
    }
    constexpr DecodeError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
    /// Absolute byte offset where decoding stopped.
    constexpr std::uint64_t pos() const {
        return m_pos;
    }
    /// Id of the stop element, 0 unless payloadReached().
    constexpr std::uint64_t payloadId() const {
        return m_payloadId;
    }
    constexpr const path::ElementPath<SchemaDepth> & errorPath() const {
        return currentPath;
    }
};


template <std::size_t SchemaDepth, class ElementT, std::size_t MaskSize>
class ElementDecodeResult : public DecodeResult<SchemaDepth> {
    std::optional<PayloadReached<ElementT, MaskSize>> m_payload;

public:
    using element_type = ElementT;
    using payload_type = PayloadReached<ElementT, MaskSize>;

    constexpr ElementDecodeResult(DecodeResult<SchemaDepth> base, std::optional<payload_type> payload):
        DecodeResult<SchemaDepth>(base), m_payload(payload)
    {}

    /// Resumable cursors, set only when payloadReached(). They share the caller's reader.
    constexpr std::optional<payload_type> payload() const {
        return m_payload;
    }
};


template <class M>
struct ModelDecodingTraits {
    static constexpr std::size_t SchemaDepth = schema_analyzis::calc_type_depth<M>();
    static constexpr std::size_t MaxRecordFields = schema_analyzis::calc_max_record_fields<M>();
};

} // namespace EbmlFusion
