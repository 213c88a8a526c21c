#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>

#include "io.hpp"
#include "errors.hpp"

namespace EbmlFusion {

namespace reader {

/// ByteReaderLike is the shared, forward-only stream every Element of one decode reads through.
/// Elements only ever ask for single bytes and the absolute position, so alternative readers
/// (memory-mapped, socket-backed, ...) plug in by satisfying this concept.
template<typename R>
concept ByteReaderLike = requires(R reader,
                                  R& mutable_reader,
                                  std::uint8_t& byte_ref,
                                  ReaderError err) {
    typename R::error_type;

    { reader.position() } -> std::same_as<std::uint64_t>;
    { reader.at_end() } -> std::same_as<bool>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_byte(byte_ref) } -> std::same_as<bool>;
    mutable_reader.setError(err);
};

} // namespace reader


template <ByteInputIterator It, ByteSentinelFor<It> Sent = It>
class IteratorByteReader {
public:
    using iterator_type = It;
    using error_type = ReaderError;

    constexpr IteratorByteReader(It begin, Sent end)
        : cur_(begin)
        , end_(end)
    {}

    constexpr std::uint64_t position() const {
        return pos_;
    }

    constexpr bool at_end() const {
        return cur_ == end_;
    }

    constexpr ReaderError getError() const {
        return err_;
    }

    constexpr void setError(ReaderError e) {
        err_ = e;
    }

    constexpr bool read_byte(std::uint8_t & b) {
        if (cur_ == end_) {
            return false;
        }
        b = static_cast<std::uint8_t>(*cur_);
        ++cur_;
        ++pos_;
        return true;
    }

private:
    It cur_;
    Sent end_;
    std::uint64_t pos_ = 0;
    ReaderError err_ = ReaderError::NO_ERROR;
};

template <class It, class Sent>
IteratorByteReader(It, Sent) -> IteratorByteReader<It, Sent>;

static_assert(reader::ByteReaderLike<IteratorByteReader<const std::uint8_t*>>);

} // namespace EbmlFusion
