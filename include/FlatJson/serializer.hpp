#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "flat_path.hpp"
#include "io.hpp"
#include "json.hpp"
#include "options.hpp"
#include "serialize_result.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"
#include "writer_concept.hpp"

namespace FlatJson {

namespace serializer_details {


template <CharOutputIterator OutIter, class WriterError>
class SerializationContext {

    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};
    OutIter m_pos;

public:
    constexpr SerializationContext(OutIter it): m_pos(it){}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = SerializeError::WRITER_ERROR;
        writerError = writer.getError();
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr bool withError(SerializeError err, Writer & writer) {
        error = err;
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr void finish(Writer & writer) {
        m_pos = writer.current();
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(error, writerError, m_pos);
    }
};


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const ObjT & obj, Writer & writer, CTX &ctx);


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonBool<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bool(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonNumber<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if constexpr (std::is_floating_point_v<ObjT> && Opts::template has_option<options::detail::float_decimals_tag>) {
        using decimals = typename Opts::template get_option<options::detail::float_decimals_tag>;
        if(!writer.write_number(obj, decimals::value)) {
            return ctx.withWriterError(writer);
        }
    } else {
        if(!writer.write_number(obj)) {
            return ctx.withWriterError(writer);
        }
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonString<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_string(obj.data(), obj.size())) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class ItemT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeItem(const ItemT& item, Writer & writer, CTX &ctx) {
    using Meta = options::detail::annotation_meta_getter<ItemT>;
    return SerializeValue<typename Meta::options>(Meta::getRef(item), writer, ctx);
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonArray<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(fr)) {
        return ctx.withWriterError(writer);
    }

    using FH = static_schema::array_read_cursor<ObjT>;
    FH cursor{ obj };
    bool first = true;
    while(cursor.read_more()) {
        if(!first) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        first = false;
        if(!SerializeItem(cursor.get(), writer, ctx)) {
            return false;
        }
    }

    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonMap<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(fr)) {
        return ctx.withWriterError(writer);
    }

    bool first = true;
    for(const auto & [key, value] : obj) {
        if(!first) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        first = false;
        if(!writer.write_string(key.data(), key.size())) {
            return ctx.withWriterError(writer);
        }
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeItem(value, writer, ctx)) {
            return false;
        }
    }

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

// skip_if_default of a deeper flat_path field belongs to the innermost link, which applies it itself
template<class Plan, class Opts, std::size_t I>
constexpr bool record_applies_skip_if_default() {
    if constexpr (!Opts::template has_option<options::detail::skip_if_default_tag>) {
        return false;
    } else if constexpr (Plan::template is_flattened<I>) {
        return Plan::template adapter<I>::depth == 1;
    } else {
        return true;
    }
}

template<class T>
constexpr bool is_default_value(const T& v) {
    static_assert(std::equality_comparable<T>,
                  "[[[ FlatJson ]]] skip_if_default requires an equality comparable field type");
    return v == T{};
}


template<bool Positional, class Scope, class RecordOpts, std::size_t I, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeOneStructField(std::size_t & count, Frame & fr, const ObjT& structObj, Writer & writer, CTX &ctx) {
    using Opts = options::detail::aggregate_field_opts_getter<ObjT, I>;
    using Plan = flat_path::RecordPlan<Scope, ObjT>;
    using Meta = StructFieldMeta<ObjT, I>;

    if constexpr (Opts::template has_option<options::detail::not_json_tag>) {
        return true;
    } else {
        const auto & value = Meta::getRef(introspection::getStructElementByIndex<I>(structObj));

        if constexpr (!Positional && record_applies_skip_if_default<Plan, Opts, I>()) {
            if(is_default_value(value)) {
                return true;
            }
        }

        if(count > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        count ++;

        if constexpr (!Positional) {
            constexpr std::string_view name = flat_path::FieldAnnotation<ObjT, I>::json_name;
            if(!writer.write_string(name.data(), name.size())) {
                return ctx.withWriterError(writer);
            }
            if(!writer.move_to_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }

        if constexpr (Plan::template is_flattened<I>) {
            using Adapter = typename Plan::template adapter<I>;
            return Adapter::template serialize<flat_path::chain_link_options<RecordOpts>>(
                value,
                [&](auto& head) {
                    using HeadMeta = options::detail::annotation_meta_getter<std::remove_cvref_t<decltype(head)>>;
                    return SerializeValue<typename HeadMeta::options>(HeadMeta::getRef(head), writer, ctx);
                });
        } else {
            return SerializeValue<Opts>(value, writer, ctx);
        }
    }
}

template<bool Positional, class Scope, class RecordOpts, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    std::size_t count = 0;
    return (
        SerializeOneStructField<Positional, Scope, RecordOpts, StructIndex>(count, fr, structObj, writer, ctx)
        && ...
        );
}


template <class Scope, class Opts, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeRecord(const ObjT& obj, Writer & writer, CTX &ctx) {
    constexpr auto indexes = std::make_index_sequence<introspection::structureElementsCount<ObjT>>{};
    if constexpr (static_schema::is_positional<Opts>()) {
        typename Writer::ArrayFrame fr;
        if(!writer.write_array_begin(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeStructFields<true, Scope, Opts>(fr, obj, writer, ctx, indexes)) {
            return false;
        }
        if(!writer.write_array_end(fr)) {
            return ctx.withWriterError(writer);
        }
    } else {
        // chains sharing a first segment are written one after another, each under its own key
        static_assert(struct_fields_helper::FieldsHelper<ObjT>::repeatedKeysAreChains,
                      "[[[ FlatJson ]]] Field keys are not unique (only flat_path chains may share a first segment)");
        typename Writer::MapFrame fr;
        if(!writer.write_map_begin(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeStructFields<false, Scope, Opts>(fr, obj, writer, ctx, indexes)) {
            return false;
        }
        if(!writer.write_map_end(fr)) {
            return ctx.withWriterError(writer);
        }
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonObject<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    return SerializeRecord<flat_path::record_scope<ObjT>, Opts>(obj, writer, ctx);
}


/// Externally tagged: {"<tag>": {alternative fields}}
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonTaggedUnion<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    static_assert(flat_path::detail::all_alternatives_are_records<ObjT>::value,
                  "[[[ FlatJson ]]] std::variant alternatives must be records");
    using Tags = flat_path::variant_tag_names<ObjT, Opts>;
    using Plan = flat_path::UnionPlan<ObjT>;

    if(obj.valueless_by_exception()) {
        if(!writer.write_null()) {
            return ctx.withWriterError(writer);
        }
        return true;
    }

    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(fr)) {
        return ctx.withWriterError(writer);
    }
    const std::string_view tag = Tags::names[obj.index()];
    if(!writer.write_string(tag.data(), tag.size())) {
        return ctx.withWriterError(writer);
    }
    if(!writer.move_to_value(fr)) {
        return ctx.withWriterError(writer);
    }

    bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
        bool res = false;
        auto one = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
            if (obj.index() != J) return;
            using Meta = typename Plan::template alternative_meta<J>;
            res = SerializeRecord<flat_path::variant_scope<ObjT, J>, typename Plan::template alternative_options<J>>(
                Meta::getRef(std::get<J>(obj)), writer, ctx);
        };
        (one(std::integral_constant<std::size_t, I>{}), ...);
        return res;
    }(std::make_index_sequence<Tags::Count>{});
    if(!ok) {
        return false;
    }

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonNullable<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    using Traits = static_schema::nullable_traits<ObjT>;
    [[maybe_unused]] constexpr bool valid = flat_path::validate<typename Traits::value_type, Opts>();
    return SerializeNonNullValue<Opts>(Traits::get(obj), writer, ctx);
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    static_assert(static_schema::JsonValue<ObjT>,
                  "[[[ FlatJson ]]] Type is not a supported FlatJson model type");
    [[maybe_unused]] constexpr bool valid = flat_path::validate<ObjT, Opts>();

    if constexpr (static_schema::JsonTransformer<ObjT>) {
        using WireT = typename static_schema::transform_traits<ObjT>::wire_type;
        WireT wire{};
        if(!obj.transform_to(wire)) {
            return ctx.withError(SerializeError::TRANSFORMER_ERROR, writer);
        }
        using Meta = options::detail::annotation_meta_getter<WireT>;
        return SerializeValue<typename Meta::options>(Meta::getRef(wire), writer, ctx);
    } else {
        if constexpr(static_schema::JsonNullable<ObjT>) {
            if(static_schema::nullable_traits<ObjT>::isNull(obj)) {
                if(!writer.write_null()) {
                    return ctx.withWriterError(writer);
                }
                return true;
            }
        }
        return SerializeNonNullValue<Opts>(obj, writer, ctx);
    }
}

} // namespace serializer_details



template <static_schema::JsonValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    if(serializer_details::SerializeValue<typename Meta::options>(Meta::getRef(obj), writer, ctx)) {
        if(!writer.finish()) {
            ctx.withWriterError(writer);
        } else {
            ctx.finish(writer);
        }
    }
    return ctx.result();
}

template <static_schema::JsonValue InputObjectT, CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr auto Serialize(const InputObjectT & obj, It &begin, const Sent & end) {
    JsonIteratorWriter<It, Sent> writer(begin, end);
    auto res = SerializeWithWriter(obj, writer);
    begin = writer.current();
    return res;
}

/// Appends the JSON text of obj to out
template<static_schema::JsonValue InputObjectT>
constexpr auto Serialize(const InputObjectT& obj, std::string& out) {
    auto it  = std::back_inserter(out);
    io_details::limitless_sentinel end{};
    return Serialize(obj, it, end);
}


template <class T>
    requires (!static_schema::JsonValue<T>)
constexpr auto Serialize(const T&, auto&...) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ FlatJson ]]] T is not a supported FlatJson model type.\n"
                  "see JsonValue concept for full rules");
}

} // namespace FlatJson
