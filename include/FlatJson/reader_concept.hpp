#pragma once

#include <concepts>
#include <cstddef>

namespace FlatJson {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, nothing consumed that matters to the caller
    ok,         // parsed and consumed
    error       // malformed, reader error is set
};

enum class StringChunkStatus {
    ok,       // wrote some bytes (maybe zero), no error
    no_match, // not at a string
    error     // malformed, reader error is set
};

struct StringChunkResult {
    StringChunkStatus status;
    std::size_t       bytes_written;
    bool              done;          // true if the closing quote was consumed
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};


/// Interface the parser needs from a wire format tokenizer.
template<typename R>
concept ReaderLike = requires(R reader,
                               R& mutable_reader,
                               bool& bool_ref,
                               int& int_ref,
                               double& double_ref,
                               char* char_ptr,
                               std::size_t size,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;

    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<int>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<double>(double_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string_chunk(char_ptr, size) } -> std::same_as<StringChunkResult>;

    { mutable_reader.skip_value() } -> std::same_as<bool>;
    { mutable_reader.finish() } -> std::same_as<bool>;
};

} // namespace reader

} // namespace FlatJson
