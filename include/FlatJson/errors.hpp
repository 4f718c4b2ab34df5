#pragma once

#include <string_view>
namespace FlatJson {


enum class ParseError {
    NO_ERROR,

    FIXED_SIZE_CONTAINER_OVERFLOW,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    NON_ARRAY_IN_DESTRUCTURED_STRUCT,
    NULL_IN_NON_OPTIONAL,

    EXCESS_FIELD,
    ARRAY_DESTRUCTURING_SCHEMA_ERROR,

    DUPLICATE_KEY_IN_MAP,

    NON_MAP_IN_TAGGED_UNION,
    UNKNOWN_VARIANT_TAG,
    VARIANT_TAG_COUNT_MISMATCH,

    TRANSFORMER_ERROR,

    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE"; break;
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE"; break;
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case ParseError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE"; break;
    case ParseError::NON_ARRAY_IN_DESTRUCTURED_STRUCT: return "NON_ARRAY_IN_DESTRUCTURED_STRUCT"; break;
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case ParseError::EXCESS_FIELD: return "EXCESS_FIELD"; break;
    case ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR: return "ARRAY_DESTRUCTURING_SCHEMA_ERROR"; break;
    case ParseError::DUPLICATE_KEY_IN_MAP: return "DUPLICATE_KEY_IN_MAP"; break;
    case ParseError::NON_MAP_IN_TAGGED_UNION: return "NON_MAP_IN_TAGGED_UNION"; break;
    case ParseError::UNKNOWN_VARIANT_TAG: return "UNKNOWN_VARIANT_TAG"; break;
    case ParseError::VARIANT_TAG_COUNT_MISMATCH: return "VARIANT_TAG_COUNT_MISMATCH"; break;
    case ParseError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR,
    TRANSFORMER_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    case SerializeError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    }
    return "N/A";
}


// ============================================================================
// flat_path misuse, detected while the model types are instantiated
// ============================================================================

enum class FlatPathError {
    none,
    duplicate_annotation,
    empty_path,
    unnamed_field_not_supported,
    unsupported_shape,
    conflicting_key
};

constexpr std::string_view flat_path_error_to_string(FlatPathError e) {
    switch(e) {
    case FlatPathError::none                        : return "none"; break;
    case FlatPathError::duplicate_annotation        : return "duplicate_annotation"; break;
    case FlatPathError::empty_path                  : return "empty_path"; break;
    case FlatPathError::unnamed_field_not_supported : return "unnamed_field_not_supported"; break;
    case FlatPathError::unsupported_shape           : return "unsupported_shape"; break;
    case FlatPathError::conflicting_key             : return "conflicting_key"; break;
    }
    return "N/A";
}

} // namespace FlatJson
