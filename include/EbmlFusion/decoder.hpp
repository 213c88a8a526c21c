#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#include "byte_reader.hpp"
#include "decode_result.hpp"
#include "defaults.hpp"
#include "element.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "options.hpp"
#include "path.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"

namespace EbmlFusion {

namespace decoder_details {


template <std::size_t SchemaDepth, class ElementT, std::size_t MaskSize>
class DecodeContext {
    using PayloadT = PayloadReached<ElementT, MaskSize>;

    DecodeOutcome outcome = DecodeOutcome::decoded;
    DecodeError error = DecodeError::NO_ERROR;
    ReaderError reader_error = ReaderError::NO_ERROR;
    std::uint64_t m_pos = 0;
    std::optional<PayloadT> m_payload;

    using PathT = path::ElementPath<SchemaDepth>;
    PathT currentPath;

public:
    // Keeps the path of a failed or stopped decode intact for the result.
    struct PathGuard {
        DecodeContext & ctx;

        constexpr ~PathGuard() {
            if(ctx.running())
                ctx.currentPath.pop();
        }
    };

    constexpr bool running() const {
        return outcome == DecodeOutcome::decoded;
    }

    constexpr bool withDecodeError(DecodeError err, const ElementT & el) {
        outcome = DecodeOutcome::failed;
        error = err;
        reader_error = el.getError();
        m_pos = el.position();
        return false;
    }

    constexpr bool withReaderError(const ElementT & el) {
        return withDecodeError(DecodeError::READER_ERROR, el);
    }

    template<std::size_t N>
    constexpr bool withPayload(const ElementT & first, const ElementT & rest, const std::array<bool, N> & written) {
        static_assert(N <= MaskSize);
        outcome = DecodeOutcome::payload_reached;
        m_pos = first.position();
        PayloadT p{first, rest};
        for (std::size_t i = 0; i < N; ++i) {
            p.written[i] = written[i];
        }
        m_payload = p;
        return false;
    }

    constexpr void finish(const ElementT & el) {
        if (running()) {
            m_pos = el.position();
        }
    }

    constexpr ElementDecodeResult<SchemaDepth, ElementT, MaskSize> result() const {
        const std::uint64_t payloadId = m_payload ? m_payload->first.id() : 0;
        return ElementDecodeResult<SchemaDepth, ElementT, MaskSize>(
            DecodeResult<SchemaDepth>(outcome, error, reader_error, m_pos, payloadId, currentPath),
            m_payload);
    }

    constexpr PathGuard getElementGuard(std::uint64_t id) {
        currentPath.push_child({id});
        return PathGuard{*this};
    }
    constexpr PathGuard getSlotGuard(std::uint64_t id, std::size_t index) {
        currentPath.push_child({id, index});
        return PathGuard{*this};
    }
};


template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlUnsigned<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    std::uint64_t v = 0;
    if (!el.read_unsigned(v)) {
        return ctx.withReaderError(el);
    }
    if (v > std::numeric_limits<ObjT>::max()) {
        return ctx.withDecodeError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, el);
    }
    obj = static_cast<ObjT>(v);
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlSigned<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    std::int64_t v = 0;
    if (!el.read_signed(v)) {
        return ctx.withReaderError(el);
    }
    if (v < std::numeric_limits<ObjT>::lowest() || v > std::numeric_limits<ObjT>::max()) {
        return ctx.withDecodeError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, el);
    }
    obj = static_cast<ObjT>(v);
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlFloat<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    double v = 0;
    if (!el.read_float(v)) {
        return ctx.withReaderError(el);
    }
    if constexpr (sizeof(ObjT) < sizeof(double)) {
        constexpr double inf = std::numeric_limits<double>::infinity();
        constexpr double maxV = static_cast<double>(std::numeric_limits<ObjT>::max());
        if (v != inf && v != -inf && (v > maxV || v < -maxV)) {
            return ctx.withDecodeError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, el);
        }
    }
    obj = static_cast<ObjT>(v);
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlText<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    using Traits = static_schema::static_string_traits<ObjT>;
    if constexpr (Traits::is_static) {
        const std::uint64_t size = el.remaining_size();
        if (size > Traits::max_size()) {
            return ctx.withDecodeError(DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW, el);
        }
        const std::size_t n = static_cast<std::size_t>(size);
        if (!el.read_bytes(Traits::data(obj), n)) {
            return ctx.withReaderError(el);
        }
        for (std::size_t i = n; i < Traits::capacity; ++i) {
            obj[i] = '\0';
        }
    } else {
        obj.clear();
        if (!el.read_all_bytes(obj)) {
            return ctx.withReaderError(el);
        }
    }
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlBinary<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    obj.clear();
    if (!el.read_all_bytes(obj)) {
        return ctx.withReaderError(el);
    }
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecordList<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx);

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecordArray<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx);

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecord<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx);

template <class Opts, class ObjT, class ElementT, class CTX>
    requires (!static_schema::EbmlDecodableValue<ObjT>)
constexpr bool DecodeValue(ObjT &, ElementT &, CTX &) {
    static_assert(static_schema::detail::always_false<ObjT>::value,
                  "[[[ EbmlFusion ]]] Field type is not decodable from EBML. Supported kinds: unsigned and signed integers, "
                  "float/double, std::string or std::array<char, N>, byte containers, records, "
                  "lists (emplace_back containers) of records and std::array of records. "
                  "Mark other members with options::exclude");
    return false;
}


template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::MemberType<StructIndex, StructT>
>;

template<std::size_t I, class ObjT, class ElementT, class CTX>
constexpr bool decode_struct_field_one(ObjT & structObj, ElementT & child, CTX & ctx) {
    using Field = introspection::MemberType<I, ObjT>;
    using Opts = options::detail::aggregate_field_opts_getter<ObjT, I>;

    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>() || struct_fields_helper::fieldIsStop<ObjT, I>()) {
        return false; // never dispatched: excluded fields have no id, stop fields end decoding first
    } else {
        auto & field = StructFieldMeta<ObjT, I>::getRef(introspection::memberRef<I>(structObj));
        if constexpr (static_schema::EbmlRecordList<Field> || static_schema::EbmlRecordArray<Field>) {
            return DecodeValue<Opts>(field, child, ctx);
        } else {
            typename CTX::PathGuard guard = ctx.getElementGuard(child.id());
            return DecodeValue<Opts>(field, child, ctx);
        }
    }
}

template <class ObjT, class ElementT, class CTX, std::size_t... StructIndex>
constexpr bool DecodeStructField(ObjT & structObj, ElementT & child, CTX & ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (ok = decode_struct_field_one<StructIndex>(structObj, child, ctx), 0)
             : 0),
        ...
        );
    return ok;
}


// Child loop of one record level. `writtenFields` comes in prefilled when resuming after a stop.
template <class ObjT, class ElementT, class CTX, std::size_t N>
constexpr bool DecodeRecordChildren(ObjT & obj, ElementT & el, CTX & ctx, std::array<bool, N> & writtenFields) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(N == FH::rawFieldsCount);

    ElementT child;

    while (true) {
        const ElementStatus st = el.next(child);
        if (st == ElementStatus::end) {
            break;
        }
        if (st == ElementStatus::error) {
            return ctx.withReaderError(el);
        }

        const std::size_t structIndex = FH::indexForId(child.id());
        if (structIndex == FH::NOT_FOUND) {
            if (!child.skip()) {
                return ctx.withReaderError(child);
            }
            continue;
        }
        if constexpr (FH::hasStopFields) {
            if (FH::isStop(child.id())) {
                return ctx.withPayload(child, el, writtenFields);
            }
        }

        if (!DecodeStructField(obj, child, ctx, std::make_index_sequence<FH::rawFieldsCount>{}, structIndex)) {
            return false;
        }
        writtenFields[structIndex] = true;
    }

    defaults::ResolveDefaults(obj, writtenFields);
    return true;
}

template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecord<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    std::array<bool, struct_fields_helper::FieldsHelper<ObjT>::rawFieldsCount> writtenFields{};
    return DecodeRecordChildren(obj, el, ctx, writtenFields);
}


template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecordList<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    using Meta = options::detail::annotation_meta_getter<typename ObjT::value_type>;

    const std::size_t slot = obj.size();
    auto & item = obj.emplace_back();

    typename CTX::PathGuard guard = ctx.getSlotGuard(el.id(), slot);
    return DecodeValue<typename Meta::options>(Meta::getRef(item), el, ctx);
}

// Every slot reads from the same element: the first slot consumes its children,
// later slots find it exhausted and only receive their defaults.
template <class Opts, class ObjT, class ElementT, class CTX>
    requires static_schema::EbmlRecordArray<ObjT>
constexpr bool DecodeValue(ObjT & obj, ElementT & el, CTX & ctx) {
    using Meta = options::detail::annotation_meta_getter<typename static_schema::record_array_traits<ObjT>::element_type>;

    for (std::size_t i = 0; i < obj.size(); ++i) {
        typename CTX::PathGuard guard = ctx.getSlotGuard(el.id(), i);
        if (!DecodeValue<typename Meta::options>(Meta::getRef(obj[i]), el, ctx)) {
            return false;
        }
    }
    // no-op once a slot consumed the children; std::array<Record, 0> never read them
    if (!el.skip()) {
        return ctx.withReaderError(el);
    }
    return true;
}


} // namespace decoder_details


/// Decodes the children of `element` into `obj`. On payload_reached the result carries
/// resumable cursors over the caller's reader.
template <static_schema::EbmlRecord InputObjectT, reader::ByteReaderLike Reader>
constexpr auto DecodeElement(InputObjectT & obj, Element<Reader> element) {
    using Tr = ModelDecodingTraits<InputObjectT>;
    using CtxT = decoder_details::DecodeContext<Tr::SchemaDepth, Element<Reader>, Tr::MaxRecordFields>;

    CtxT ctx;

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    decoder_details::DecodeValue<typename Meta::options>(Meta::getRef(obj), element, ctx);
    ctx.finish(element);

    return ctx.result();
}

/// Continues the record that held the stop field, from `from.rest`. `obj` must be that record,
/// and `from.first` must have been consumed or skipped. Members decoded before the stop count
/// as written, so the default pass leaves them alone.
template <static_schema::EbmlRecord InputObjectT, reader::ByteReaderLike Reader, std::size_t N>
constexpr auto DecodeElement(InputObjectT & obj, const PayloadReached<Element<Reader>, N> & from) {
    using Tr = ModelDecodingTraits<InputObjectT>;
    using CtxT = decoder_details::DecodeContext<Tr::SchemaDepth, Element<Reader>, Tr::MaxRecordFields>;
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;
    using FH = struct_fields_helper::FieldsHelper<typename Meta::value_t>;

    static_assert(FH::rawFieldsCount <= N,
                  "[[[ EbmlFusion ]]] resumed record is wider than any record of the schema that stopped");

    std::array<bool, FH::rawFieldsCount> writtenFields{};
    for (std::size_t i = 0; i < FH::rawFieldsCount; ++i) {
        writtenFields[i] = from.written[i];
    }

    CtxT ctx;
    Element<Reader> rest = from.rest;
    decoder_details::DecodeRecordChildren(Meta::getRef(obj), rest, ctx, writtenFields);
    ctx.finish(rest);

    return ctx.result();
}

template <static_schema::EbmlRecord InputObjectT, ByteInputIterator It, ByteSentinelFor<It> Sent>
constexpr auto Decode(InputObjectT & obj, It begin, const Sent & end) {
    using Tr = ModelDecodingTraits<InputObjectT>;

    IteratorByteReader<It, Sent> reader(begin, end);
    auto r = DecodeElement(obj, RootElement(reader));
    return DecodeResult<Tr::SchemaDepth>(r);
}

template<class InputObjectT, class ContainterT>
    requires (!std::is_pointer_v<ContainterT>) && requires(const ContainterT& c) { c.begin(); c.end(); }
constexpr auto Decode(InputObjectT & obj, const ContainterT & c) {
    return Decode(obj, c.begin(), c.end());
}


template <class T>
    requires (!static_schema::EbmlRecord<T>)
constexpr auto Decode(T & obj, auto, auto) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ EbmlFusion ]]] T is not a supported EbmlFusion record type.\n"
                  "see EbmlRecord concept for full rules");
}

template <class T>
    requires (!static_schema::EbmlRecord<T>)
constexpr auto Decode(T & obj, auto) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ EbmlFusion ]]] T is not a supported EbmlFusion record type.\n"
                  "see EbmlRecord concept for full rules");
}


} // namespace EbmlFusion
