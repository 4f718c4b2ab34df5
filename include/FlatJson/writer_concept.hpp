#pragma once

#include <concepts>
#include <cstddef>

namespace FlatJson {

namespace writer {

/// Interface the serializer needs from a wire format emitter.
template<typename W>
concept WriterLike = requires(W writer,
                               W& mutable_writer,
                               const bool& bool_ref,
                               const int& int_ref,
                               const double& double_ref,
                               const char* char_ptr,
                               std::size_t size,
                               typename W::ArrayFrame & arrFrameRef,
                               typename W::MapFrame & mapFrameRef
                              ) {
    typename W::iterator_type;
    typename W::ArrayFrame;
    typename W::MapFrame;
    typename W::error_type;

    { writer.current() } -> std::same_as<typename W::iterator_type>;
    { writer.getError() } -> std::same_as<typename W::error_type>;

    { mutable_writer.write_array_begin(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<int>(int_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<double>(double_ref, size) } -> std::same_as<bool>;
    { mutable_writer.write_string(char_ptr, size) } -> std::same_as<bool>;

    { mutable_writer.finish() } -> std::same_as<bool>;
};

} // namespace writer

} // namespace FlatJson
