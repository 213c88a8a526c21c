#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <limits>

#include "byte_reader.hpp"
#include "errors.hpp"
#include "vint.hpp"

namespace EbmlFusion {

enum class ElementStatus {
    element,  // child header read, child cursor filled in
    end,      // cursor is exactly at its own boundary
    error     // reader error set
};

/// Size-bounded view of one EBML element over the shared reader.
///
/// An element never reads past the end its header declared, nor past any ancestor's end:
/// `limit_` is the declared end clamped to the parent's limit, so an oversized child length
/// shows up as UNEXPECTED_END_OF_DATA instead of eating a sibling's bytes.
/// Elements are cheap values; all stream state lives in the reader. A parent must not be
/// read until the child obtained from next() has been fully consumed or skipped.
template <reader::ByteReaderLike Reader>
class Element {
public:
    using reader_type = Reader;

    static constexpr std::uint64_t UNBOUNDED_SIZE =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    constexpr Element() = default;

    static constexpr Element root(Reader & r) {
        Element e;
        e.reader_ = &r;
        e.id_ = 0;
        e.end_ = r.position() + UNBOUNDED_SIZE;
        e.limit_ = e.end_;
        e.root_ = true;
        return e;
    }

    constexpr std::uint64_t id() const {
        return id_;
    }

    constexpr bool is_root() const {
        return root_;
    }

    /// Absolute offset of the next byte in the underlying stream.
    constexpr std::uint64_t position() const {
        return reader_->position();
    }

    constexpr std::uint64_t remaining_size() const {
        const std::uint64_t pos = reader_->position();
        return pos < end_ ? end_ - pos : 0;
    }

    constexpr ReaderError getError() const {
        return reader_->getError();
    }

    constexpr ElementStatus next(Element & child) {
        if (remaining_size() == 0) {
            return ElementStatus::end;
        }
        if (root_ && reader_->at_end()) {
            return ElementStatus::end;
        }

        std::uint64_t childId = 0;
        std::uint64_t childSize = 0;
        std::size_t length = 0;
        if (!check(vint::read_vint(*this, childId, length))) {
            return ElementStatus::error;
        }
        if (!check(vint::read_size(*this, childSize, length))) {
            return ElementStatus::error;
        }

        child.reader_ = reader_;
        child.id_ = childId;
        child.end_ = reader_->position() + childSize;
        child.limit_ = child.end_ < limit_ ? child.end_ : limit_;
        child.root_ = false;
        return ElementStatus::element;
    }

    constexpr bool read_byte(std::uint8_t & b) {
        if (reader_->position() >= limit_ || !reader_->read_byte(b)) {
            return fail(ReaderError::UNEXPECTED_END_OF_DATA);
        }
        return true;
    }

    template<class ByteT>
    constexpr bool read_bytes(ByteT * dst, std::size_t n) {
        std::uint8_t b = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (!read_byte(b)) {
                return false;
            }
            dst[i] = static_cast<ByteT>(b);
        }
        return true;
    }

    /// Appends exactly remaining_size() bytes to `out`. On a short stream returns false
    /// with UNEXPECTED_END_OF_DATA; whatever was appended must not be used.
    template<class Cont>
    constexpr bool read_all_bytes(Cont & out) {
        using V = typename Cont::value_type;
        std::uint8_t b = 0;
        for (std::uint64_t left = remaining_size(); left > 0; --left) {
            if (!read_byte(b)) {
                return false;
            }
            out.push_back(static_cast<V>(b));
        }
        return true;
    }

    constexpr bool skip() {
        std::uint8_t b = 0;
        for (std::uint64_t left = remaining_size(); left > 0; --left) {
            if (!read_byte(b)) {
                return false;
            }
        }
        return true;
    }

    // Vint codec on this element's bounded stream, for manual decoding of payloads.
    constexpr bool read_vint(std::uint64_t & value, std::size_t & length) {
        return check(vint::read_vint(*this, value, length));
    }

    constexpr bool read_size(std::uint64_t & value, std::size_t & length) {
        return check(vint::read_size(*this, value, length));
    }

    /// Big-endian unsigned value spanning the rest of the element (0 bytes reads as 0).
    constexpr bool read_unsigned(std::uint64_t & value) {
        const std::uint64_t size = remaining_size();
        if (size > 8) {
            return fail(ReaderError::OVERSIZED_NUMBER);
        }
        std::uint64_t v = 0;
        std::uint8_t b = 0;
        for (std::uint64_t i = 0; i < size; ++i) {
            if (!read_byte(b)) {
                return false;
            }
            v = (v << 8) | b;
        }
        value = v;
        return true;
    }

    /// Two's complement value sign-extended from the element width.
    constexpr bool read_signed(std::int64_t & value) {
        const std::uint64_t size = remaining_size();
        std::uint64_t u = 0;
        if (!read_unsigned(u)) {
            return false;
        }
        if (size > 0 && size < 8 && ((u >> (8 * size - 1)) & 1u)) {
            u |= ~std::uint64_t{0} << (8 * size);
        }
        value = static_cast<std::int64_t>(u);
        return true;
    }

    /// 8 bytes: binary64. Any other width: binary32 (low 32 bits) widened to double.
    constexpr bool read_float(double & value) {
        const std::uint64_t size = remaining_size();
        std::uint64_t u = 0;
        if (!read_unsigned(u)) {
            return false;
        }
        if (size == 8) {
            value = std::bit_cast<double>(u);
        } else {
            value = static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(u)));
        }
        return true;
    }

private:
    constexpr bool fail(ReaderError e) {
        reader_->setError(e);
        return false;
    }

    constexpr bool check(vint::VintStatus st) {
        switch (st) {
        case vint::VintStatus::ok:
            return true;
        case vint::VintStatus::illformed:
            return fail(ReaderError::ILLFORMED_VINT);
        case vint::VintStatus::no_data:
        case vint::VintStatus::truncated:
            return fail(ReaderError::UNEXPECTED_END_OF_DATA);
        }
        return false;
    }

    Reader * reader_ = nullptr;
    std::uint64_t id_ = 0;
    std::uint64_t end_ = 0;
    std::uint64_t limit_ = 0;
    bool root_ = false;
};

template <reader::ByteReaderLike Reader>
constexpr Element<Reader> RootElement(Reader & r) {
    return Element<Reader>::root(r);
}

} // namespace EbmlFusion
