#pragma once

#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "flat_path.hpp"
#include "io.hpp"
#include "json.hpp"
#include "options.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "reader_concept.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"

namespace FlatJson {

namespace parser_details {


template <class InpIter, class ReaderError>
class DeserializationContext {
    ReaderError reader_error = {};
    ParseError error = ParseError::NO_ERROR;
    InpIter m_pos{};
    path::Path currentPath;

public:
    // Leaves the failing element on the path, so the result points at it
    struct PathGuard {
        DeserializationContext & ctx;

        constexpr ~PathGuard() {
            if(ctx.error == ParseError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    constexpr bool withParseError(ParseError err, const reader::ReaderLike auto & reader) {
        error = err;
        if(err == ParseError::NO_ERROR) {
            error = ParseError::READER_ERROR;
        }
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    constexpr bool withReaderError(const reader::ReaderLike auto & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    constexpr ParseError currentError() const { return error; }

    constexpr ParseResult<InpIter, ReaderError> result() const {
        return ParseResult<InpIter, ReaderError>(error, reader_error, m_pos, currentPath);
    }

    constexpr PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    constexpr PathGuard getMapItemGuard(std::string_view key, bool is_static = true) {
        currentPath.push_field(key, is_static);
        return PathGuard{*this};
    }
};


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(ObjT & obj, Tokenizer & reader, CTX &ctx);


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonBool<ObjT>
constexpr bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_bool(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonNumber<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.template read_number<ObjT>(obj);
                st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
    }
    return true;
}


constexpr std::size_t STRING_CHUNK_SIZE = 64;

// Appends the whole current JSON string to out
template<class Reader>
constexpr bool read_json_string_into(Reader& reader, std::string& out, ParseError& err) {
    for (;;) {
        char buf[STRING_CHUNK_SIZE];
        reader::StringChunkResult res = reader.read_string_chunk(buf, STRING_CHUNK_SIZE);
        switch (res.status) {
        case reader::StringChunkStatus::no_match:
            err = ParseError::NON_STRING_IN_STRING_STORAGE;
            return false;
        case reader::StringChunkStatus::error:
            err = ParseError::READER_ERROR;
            return false;
        case reader::StringChunkStatus::ok:
            break;
        }
        out.append(buf, res.bytes_written);
        if (res.done) {
            return true;
        }
    }
}

/// Reads an object key into buf[0, Capacity). A key that does not fit is consumed to its end
/// and reported with len == Capacity, which no known key of at most Capacity - 1 chars matches.
template<std::size_t Capacity, class Reader>
constexpr bool read_key_into(Reader& reader, char (&buf)[Capacity], std::size_t& len, ParseError& err) {
    len = 0;
    for (;;) {
        reader::StringChunkResult res;
        if (len < Capacity) {
            res = reader.read_string_chunk(buf + len, Capacity - len);
        } else {
            char scratch[STRING_CHUNK_SIZE];
            res = reader.read_string_chunk(scratch, STRING_CHUNK_SIZE);
        }
        switch (res.status) {
        case reader::StringChunkStatus::no_match:
            err = ParseError::NON_STRING_IN_STRING_STORAGE;
            return false;
        case reader::StringChunkStatus::error:
            err = ParseError::READER_ERROR;
            return false;
        case reader::StringChunkStatus::ok:
            break;
        }
        if (len < Capacity) {
            len += res.bytes_written;
        }
        if (res.done) {
            return true;
        }
    }
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonString<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    obj.clear();
    ParseError err{ParseError::NO_ERROR};
    if(!read_json_string_into(reader, obj, err)) {
        return ctx.withParseError(err, reader);
    }
    return true;
}


template <class ItemT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseItem(ItemT& item, Tokenizer & reader, CTX &ctx) {
    using Meta = options::detail::annotation_meta_getter<ItemT>;
    return ParseValue<typename Meta::options>(Meta::getRef(item), reader, ctx);
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonArray<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::array_write_cursor<ObjT>;
    FH cursor{ obj };
    cursor.reset();

    std::size_t parsed_items_count = 0;
    while(iterStatus.has_value) {
        if(cursor.allocate_slot() != stream_write_result::slot_allocated) {
            return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
        }
        cursor.emplace();
        typename FH::element_type & newItem = cursor.get_slot();

        typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);
        if(!ParseItem(newItem, reader, ctx)) {
            return false;
        }
        parsed_items_count ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonMap<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    obj.clear();
    while(iterStatus.has_value) {
        std::string key;
        ParseError err{ParseError::NO_ERROR};
        if(!read_json_string_into(reader, key, err)) {
            return ctx.withParseError(err, reader);
        }
        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        auto [it, inserted] = obj.try_emplace(std::move(key));
        if(!inserted) {
            return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
        }

        typename CTX::PathGuard guard = ctx.getMapItemGuard(it->first, false);
        if(!ParseItem(it->second, reader, ctx)) {
            return false;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

template<class Scope, class RecordOpts, std::size_t I, class ObjT, class Tokenizer, class CTX>
constexpr bool parse_struct_field_one(ObjT& structObj, Tokenizer& reader, CTX& ctx) {
    using Opts = options::detail::aggregate_field_opts_getter<ObjT, I>;
    using Plan = flat_path::RecordPlan<Scope, ObjT>;
    auto& field = introspection::getStructElementByIndex<I>(structObj);

    if constexpr (Opts::template has_option<options::detail::not_json_tag>) {
        return false;
    } else if constexpr (Plan::template is_flattened<I>) {
        using Adapter = typename Plan::template adapter<I>;
        return Adapter::template deserialize<flat_path::chain_link_options<RecordOpts>>(
            StructFieldMeta<ObjT, I>::getRef(field),
            [&](auto& head) {
                using HeadMeta = options::detail::annotation_meta_getter<std::remove_cvref_t<decltype(head)>>;
                return ParseValue<typename HeadMeta::options>(HeadMeta::getRef(head), reader, ctx);
            });
    } else {
        return ParseValue<Opts>(StructFieldMeta<ObjT, I>::getRef(field), reader, ctx);
    }
}

template <class Scope, class RecordOpts, class ObjT, reader::ReaderLike Tokenizer, class CTX, std::size_t... StructIndex>
constexpr bool ParseStructField(ObjT& structObj, Tokenizer & reader, CTX &ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (ok = parse_struct_field_one<Scope, RecordOpts, StructIndex>(structObj, reader, ctx), 0)
             : 0),
        ...
        );
    return ok;
}


template <class Scope, class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseKeyedRecord(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::repeatedKeysAreChains, "[[[ FlatJson ]]] Field keys are not unique (only flat_path chains may share a first segment)");

    std::bitset<FH::fieldsCount> parsedFieldsByIndex{};

    while(iterStatus.has_value) {
        char keyBuf[FH::maxFieldNameLength + 1];
        std::size_t keyLen = 0;
        ParseError err{ParseError::NO_ERROR};
        if(!read_key_into(reader, keyBuf, keyLen, err)) {
            return ctx.withParseError(err, reader);
        }
        std::size_t arrayIndex = FH::find(std::string_view(keyBuf, keyLen));
        // a repeated chain head fills the next field declared under that key
        while(arrayIndex != FH::fieldsCount && parsedFieldsByIndex[arrayIndex]) {
            const std::size_t next = FH::find(std::string_view(keyBuf, keyLen), arrayIndex + 1);
            if(next == FH::fieldsCount) {
                break;
            }
            arrayIndex = next;
        }

        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        if(arrayIndex == FH::fieldsCount) {
            if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                if(!reader.skip_value()) {
                    return ctx.withReaderError(reader);
                }
            } else {
                return ctx.withParseError(ParseError::EXCESS_FIELD, reader);
            }
        } else {
            if(parsedFieldsByIndex[arrayIndex]) {
                return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
            }

            const auto& descr = FH::fieldIndexesToFieldNames[arrayIndex];
            typename CTX::PathGuard guard = ctx.getMapItemGuard(descr.name);

            if(!ParseStructField<Scope, Opts>(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{}, descr.originalIndex)) {
                return false;
            }
            parsedFieldsByIndex[arrayIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


template <class Scope, class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParsePositionalRecord(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_DESTRUCTURED_STRUCT, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    std::size_t parsed_items_count = 0;

    while(iterStatus.has_value) {
        if(parsed_items_count >= FH::fieldsCount) {
            return ctx.withParseError(ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR, reader);
        }
        typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);
        if(!ParseStructField<Scope, Opts>(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{},
                                          FH::fieldIndexesToFieldNames[parsed_items_count].originalIndex)) {
            return false;
        }
        parsed_items_count ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    if(parsed_items_count != FH::fieldsCount) {
        return ctx.withParseError(ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR, reader);
    }
    return true;
}


template <class Scope, class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseRecord(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if constexpr (static_schema::is_positional<Opts>()) {
        return ParsePositionalRecord<Scope, Opts>(obj, reader, ctx);
    } else {
        return ParseKeyedRecord<Scope, Opts>(obj, reader, ctx);
    }
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonObject<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    return ParseRecord<flat_path::record_scope<ObjT>, Opts>(obj, reader, ctx);
}


template <class ObjT, reader::ReaderLike Tokenizer, class CTX, std::size_t... I>
constexpr bool ParseAlternative(ObjT& obj, Tokenizer & reader, CTX &ctx, std::size_t requiredIndex, std::index_sequence<I...>) {
    using Plan = flat_path::UnionPlan<ObjT>;
    bool ok = false;
    auto one = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
        if (requiredIndex != J) return;
        auto& alt = obj.template emplace<J>();
        using Meta = typename Plan::template alternative_meta<J>;
        if (reader::TryParseStatus st = reader.start_value_and_try_read_null(); st == reader::TryParseStatus::ok) {
            ok = ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        } else if (st == reader::TryParseStatus::error) {
            ok = ctx.withReaderError(reader);
        } else {
            ok = ParseRecord<flat_path::variant_scope<ObjT, J>, typename Plan::template alternative_options<J>>(
                Meta::getRef(alt), reader, ctx);
        }
    };
    (one(std::integral_constant<std::size_t, I>{}), ...);
    return ok;
}

/// Externally tagged: {"<tag>": {alternative fields}}
template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonTaggedUnion<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    static_assert(flat_path::detail::all_alternatives_are_records<ObjT>::value,
                  "[[[ FlatJson ]]] std::variant alternatives must be records");
    using Tags = flat_path::variant_tag_names<ObjT, Opts>;

    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_TAGGED_UNION, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if(!iterStatus.has_value) {
        return ctx.withParseError(ParseError::VARIANT_TAG_COUNT_MISMATCH, reader);
    }

    char tagBuf[Tags::maxLength + 1];
    std::size_t tagLen = 0;
    ParseError err{ParseError::NO_ERROR};
    if(!read_key_into(reader, tagBuf, tagLen, err)) {
        return ctx.withParseError(err, reader);
    }
    const std::size_t index = Tags::find(std::string_view(tagBuf, tagLen));
    if(index == Tags::Count) {
        return ctx.withParseError(ParseError::UNKNOWN_VARIANT_TAG, reader);
    }
    if (!reader.move_to_value(fr)) {
        return ctx.withReaderError(reader);
    }

    {
        typename CTX::PathGuard guard = ctx.getMapItemGuard(Tags::names[index]);
        if(!ParseAlternative(obj, reader, ctx, index, std::make_index_sequence<Tags::Count>{})) {
            return false;
        }
    }

    iterStatus = reader.advance_after_value(fr);
    if (iterStatus.status != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }
    if (iterStatus.has_value) {
        return ctx.withParseError(ParseError::VARIANT_TAG_COUNT_MISMATCH, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonNullable<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    using Traits = static_schema::nullable_traits<ObjT>;
    [[maybe_unused]] constexpr bool valid = flat_path::validate<typename Traits::value_type, Opts>();
    return ParseNonNullValue<Opts>(Traits::materialize(obj), reader, ctx);
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    static_assert(static_schema::JsonValue<ObjT>,
                  "[[[ FlatJson ]]] Type is not a supported FlatJson model type");
    [[maybe_unused]] constexpr bool valid = flat_path::validate<ObjT, Opts>();

    if constexpr (static_schema::JsonTransformer<ObjT>) {
        // the wire value is parsed with its own options, then handed to the stored value
        using WireT = typename static_schema::transform_traits<ObjT>::wire_type;
        WireT wire{};
        using Meta = options::detail::annotation_meta_getter<WireT>;
        if(!ParseValue<typename Meta::options>(Meta::getRef(wire), reader, ctx)) {
            return false;
        }
        if(!obj.transform_from(wire)) {
            return ctx.withParseError(ParseError::TRANSFORMER_ERROR, reader);
        }
        return true;
    } else if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
        if constexpr(static_schema::JsonNullable<ObjT>) {
            static_schema::nullable_traits<ObjT>::setNull(obj);
            return true;
        } else {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        }
    } else if(r == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else {
        return ParseNonNullValue<Opts>(obj, reader, ctx);
    }
}

} // namespace parser_details


template <static_schema::JsonValue InputObjectT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(InputObjectT & obj, Reader & reader) {
    using CtxT = parser_details::DeserializationContext<typename Reader::iterator_type, typename Reader::error_type>;
    CtxT ctx;

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;
    parser_details::ParseValue<typename Meta::options>(Meta::getRef(obj), reader, ctx);

    if(ctx.currentError() == ParseError::NO_ERROR) {
        if(!reader.finish()) {
            ctx.withReaderError(reader);
        }
    }
    return ctx.result();
}

template <static_schema::JsonValue InputObjectT, CharInputIterator It, CharSentinelFor<It> Sent>
constexpr auto Parse(InputObjectT & obj, It begin, const Sent & end) {
    JsonIteratorReader<It, Sent> reader(begin, end);
    return ParseWithReader(obj, reader);
}

template<static_schema::JsonValue InputObjectT>
constexpr auto Parse(InputObjectT& obj, std::string_view sv) {
    return Parse(obj, sv.data(), sv.data() + sv.size());
}

template <class T>
    requires (!static_schema::JsonValue<T>)
constexpr auto Parse(T&, auto...) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ FlatJson ]]] T is not a supported FlatJson model type.\n"
                  "see JsonValue concept for full rules");
}

} // namespace FlatJson
