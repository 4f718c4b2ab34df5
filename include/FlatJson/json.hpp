#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

#include "fp_to_str.hpp"
#include "reader_concept.hpp"
#include "writer_concept.hpp"

namespace FlatJson {

#ifndef FLATJSON_MAX_SKIP_NESTING
constexpr std::size_t DefaultMaxSkipNesting = 64;
#else
constexpr std::size_t DefaultMaxSkipNesting = FLATJSON_MAX_SKIP_NESTING;
#endif

enum class JsonIteratorReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    ILLFORMED_ARRAY,
    SKIPPING_STACK_OVERFLOW,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
};

constexpr std::string_view error_to_string(JsonIteratorReaderError e) {
    switch(e) {
    case JsonIteratorReaderError::NO_ERROR: return "NO_ERROR";
    case JsonIteratorReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA";
    case JsonIteratorReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS";
    case JsonIteratorReaderError::ILLFORMED_NULL: return "ILLFORMED_NULL";
    case JsonIteratorReaderError::ILLFORMED_BOOL: return "ILLFORMED_BOOL";
    case JsonIteratorReaderError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT";
    case JsonIteratorReaderError::ILLFORMED_STRING: return "ILLFORMED_STRING";
    case JsonIteratorReaderError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER";
    case JsonIteratorReaderError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY";
    case JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW: return "SKIPPING_STACK_OVERFLOW";
    case JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE";
    }
    return "N/A";
}

/// RFC 8259 tokenizer over any char iterator range.
/// Values are consumed in place; the parser drives it token by token.
template<class It, class Sent, std::size_t MaxSkipNesting = DefaultMaxSkipNesting>
class JsonIteratorReader {
public:
    using iterator_type = It;
    struct ArrayFrame {};
    struct MapFrame {};

    using error_type = JsonIteratorReaderError;

    constexpr JsonIteratorReader(It first, Sent last)
        : m_error(JsonIteratorReaderError::NO_ERROR), current_(first), end_(last) {}

    constexpr reader::TryParseStatus start_value_and_try_read_null() {
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if (*current_ != 'n') {
            return reader::TryParseStatus::no_match;
        }
        ++current_;
        if (!match_literal("ull") || !atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NULL);
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    constexpr reader::TryParseStatus read_bool(bool & b) {
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        std::string_view rest;
        bool value = false;
        switch(*current_) {
        case 't': rest = "rue"; value = true; break;
        case 'f': rest = "alse"; value = false; break;
        default:
            return reader::TryParseStatus::no_match;
        }
        ++current_;
        if (!match_literal(rest) || !atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        }
        b = value;
        return reader::TryParseStatus::ok;
    }

    constexpr bool finish() {
        skip_whitespace();
        if (!atEnd()) {
            setError(JsonIteratorReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    constexpr reader::IterationStatus read_array_begin(ArrayFrame&) {
        return read_container_begin('[', ']', JsonIteratorReaderError::ILLFORMED_ARRAY);
    }

    constexpr reader::IterationStatus read_map_begin(MapFrame&) {
        reader::IterationStatus ret = read_container_begin('{', '}', JsonIteratorReaderError::ILLFORMED_OBJECT);
        if(ret.status == reader::TryParseStatus::ok && ret.has_value && *current_ != '"') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            ret.status = reader::TryParseStatus::error;
        }
        return ret;
    }

    constexpr reader::IterationStatus advance_after_value(ArrayFrame&) {
        return advance_in_container(']', JsonIteratorReaderError::ILLFORMED_ARRAY);
    }

    constexpr reader::IterationStatus advance_after_value(MapFrame&) {
        reader::IterationStatus ret = advance_in_container('}', JsonIteratorReaderError::ILLFORMED_OBJECT);
        // next member must start with a key
        if(ret.status == reader::TryParseStatus::ok && ret.has_value && *current_ != '"') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            ret.status = reader::TryParseStatus::error;
        }
        return ret;
    }

    constexpr bool move_to_value(MapFrame&) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(*current_ != ':') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        ++current_;
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        return true;
    }

    constexpr It current() const { return current_; }

    template<class NumberT>
    constexpr reader::TryParseStatus read_number(NumberT & storage) {
        static_assert(std::is_integral_v<NumberT> || std::is_floating_point_v<NumberT>,
                      "[[[ FlatJson ]]] read_number storage must be integral or floating");
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(*current_ != '-' && !isDigit(*current_)) {
            return reader::TryParseStatus::no_match;
        }

        char buf[fp_to_str_detail::NumberBufSize];
        bool seenDot = false;
        bool seenExp = false;
        if (!read_number_token(buf, seenDot, seenExp)) {
            return reader::TryParseStatus::error;
        }

        if constexpr (std::is_integral_v<NumberT>) {
            // 1.5 is a number, but not one this storage can hold
            if (seenDot || seenExp) {
                return reader::TryParseStatus::no_match;
            }
            NumberT value{};
            if(!parse_decimal_integer<NumberT>(buf, value)) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            storage = value;
            return reader::TryParseStatus::ok;
        } else {
            double x = 0;
            if(!fp_to_str_detail::parse_number_to_double(buf, x)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return reader::TryParseStatus::error;
            }
            if(static_cast<double>(std::numeric_limits<NumberT>::lowest()) > x
                || static_cast<double>(std::numeric_limits<NumberT>::max()) < x) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            storage = static_cast<NumberT>(x);
            return reader::TryParseStatus::ok;
        }
    }

    /// Reads up to capacity decoded bytes of the current string.
    /// The first call consumes the opening quote; done is set once the closing quote is consumed.
    constexpr reader::StringChunkResult read_string_chunk(char* out, std::size_t capacity) {
        std::size_t written = 0;

        auto fail = [&](JsonIteratorReaderError e) {
            setError(e);
            in_string_ = false;
            pending_len_ = 0;
            pending_pos_ = 0;
            return reader::StringChunkResult{reader::StringChunkStatus::error, written, false};
        };

        if (!in_string_) {
            if (atEnd()) {
                return fail(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            }
            if (*current_ != '"') {
                return {reader::StringChunkStatus::no_match, 0, false};
            }
            in_string_ = true;
            ++current_;
        }

        // A full buffer still finishes the string when the closing quote is next
        auto capacity_full = [&]() {
            if (pending_pos_ == pending_len_ && !atEnd() && *current_ == '"') {
                ++current_;
                in_string_ = false;
                pending_len_ = 0;
                pending_pos_ = 0;
                return reader::StringChunkResult{reader::StringChunkStatus::ok, written, true};
            }
            return reader::StringChunkResult{reader::StringChunkStatus::ok, written, false};
        };

        while (pending_pos_ < pending_len_ && written < capacity) {
            out[written++] = pending_[pending_pos_++];
        }
        if (pending_pos_ < pending_len_) {
            return capacity_full();
        }
        pending_len_ = 0;
        pending_pos_ = 0;

        while (written < capacity) {
            if (atEnd()) {
                return fail(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            }
            const char c = *current_;
            const auto uc = static_cast<unsigned char>(c);

            if (c == '"') {
                ++current_;
                in_string_ = false;
                return {reader::StringChunkStatus::ok, written, true};
            }
            if (uc <= 0x1F) {
                return fail(JsonIteratorReaderError::ILLFORMED_STRING);
            }
            if (c != '\\') {
                out[written++] = c;
                ++current_;
                continue;
            }

            ++current_;
            if (atEnd()) {
                return fail(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            }
            const char esc = *current_;
            ++current_;

            char decoded[4];
            std::size_t decoded_len = 0;
            switch (esc) {
            case '"':  decoded[decoded_len++] = '"';  break;
            case '/':  decoded[decoded_len++] = '/';  break;
            case '\\': decoded[decoded_len++] = '\\'; break;
            case 'b':  decoded[decoded_len++] = '\b'; break;
            case 'f':  decoded[decoded_len++] = '\f'; break;
            case 'r':  decoded[decoded_len++] = '\r'; break;
            case 'n':  decoded[decoded_len++] = '\n'; break;
            case 't':  decoded[decoded_len++] = '\t'; break;
            case 'u': {
                std::uint32_t codepoint = 0;
                if (!read_escaped_codepoint(codepoint)) {
                    return fail(m_error);
                }
                decoded_len = encode_utf8(codepoint, decoded);
                break;
            }
            default:
                return fail(JsonIteratorReaderError::ILLFORMED_STRING);
            }

            std::size_t i = 0;
            while (i < decoded_len && written < capacity) {
                out[written++] = decoded[i++];
            }
            if (i < decoded_len) {
                // keep the rest of the multibyte sequence for the next call
                pending_pos_ = 0;
                pending_len_ = decoded_len - i;
                for (std::size_t j = 0; j < pending_len_; ++j) {
                    pending_[j] = decoded[i + j];
                }
                return capacity_full();
            }
        }
        return capacity_full();
    }

    /// Skips one complete JSON value of any kind, validating only its bracket structure.
    constexpr bool skip_value() {
        skip_whitespace();
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }

        char closers[MaxSkipNesting];
        std::size_t depth = 0;

        do {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char ch = *current_;
            switch (ch) {
            case ' ': case '\n': case '\r': case '\t': case ',': case ':':
                ++current_;
                break;
            case '"':
                if (!skip_string()) return false;
                break;
            case '{':
            case '[':
                if (depth >= MaxSkipNesting) {
                    setError(JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW);
                    return false;
                }
                closers[depth++] = (ch == '{') ? '}' : ']';
                ++current_;
                break;
            case '}':
            case ']':
                if (depth == 0 || closers[depth - 1] != ch) {
                    setError(ch == '}' ? JsonIteratorReaderError::ILLFORMED_OBJECT
                                       : JsonIteratorReaderError::ILLFORMED_ARRAY);
                    return false;
                }
                --depth;
                ++current_;
                break;
            case 't':
                if (!skip_literal("true", JsonIteratorReaderError::ILLFORMED_BOOL)) return false;
                break;
            case 'f':
                if (!skip_literal("false", JsonIteratorReaderError::ILLFORMED_BOOL)) return false;
                break;
            case 'n':
                if (!skip_literal("null", JsonIteratorReaderError::ILLFORMED_NULL)) return false;
                break;
            default:
                if (ch != '-' && !isDigit(ch)) {
                    setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                    return false;
                }
                while (!atEnd() && !atPlainEnd()) {
                    ++current_;
                }
                break;
            }
        } while (depth > 0);

        return true;
    }

    constexpr JsonIteratorReaderError getError() const {
        return m_error;
    }

private:
    JsonIteratorReaderError m_error;
    It current_;
    Sent end_;

    char        pending_[4]  = {};
    std::size_t pending_len_ = 0;
    std::size_t pending_pos_ = 0;
    bool        in_string_   = false;

    constexpr void setError(JsonIteratorReaderError e) {
        m_error = e;
    }

    constexpr bool atEnd() const {
        return current_ == end_;
    }

    static constexpr bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    static constexpr bool isSpace(char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    // end of input also terminates a scalar
    constexpr bool atPlainEnd() const {
        if (atEnd()) return true;
        const char c = *current_;
        return c == ']' || c == '}' || c == ',' || c == ':' || isSpace(c);
    }

    constexpr void skip_whitespace() {
        while (!atEnd() && isSpace(*current_)) {
            ++current_;
        }
    }

    constexpr bool match_literal(std::string_view lit) {
        for (char c : lit) {
            if (atEnd() || *current_ != c)  {
                return false;
            }
            ++current_;
        }
        return true;
    }

    constexpr bool skip_literal(std::string_view lit, JsonIteratorReaderError err) {
        if (!match_literal(lit) || !atPlainEnd()) {
            setError(atEnd() ? JsonIteratorReaderError::UNEXPECTED_END_OF_DATA : err);
            return false;
        }
        return true;
    }

    constexpr bool skip_string() {
        ++current_;
        while (true) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = *current_;
            ++current_;
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) <= 0x1F) {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            if (c == '\\') {
                if (atEnd()) {
                    setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                ++current_;
            }
        }
    }

    constexpr bool read_number_token(char (&buf)[fp_to_str_detail::NumberBufSize],
                                     bool& seenDot,
                                     bool& seenExp)
    {
        std::size_t index = 0;
        bool digitsBeforeExp = false;
        bool digitsAfterExp = false;

        auto push_char = [&](char c) -> bool {
            if (index >= fp_to_str_detail::NumberBufSize - 1) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            buf[index++] = c;
            ++current_;
            return true;
        };

        if (*current_ == '-' && !push_char('-')) {
            return false;
        }
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        // no leading zeros except a lone 0
        if (*current_ == '0') {
            if (!push_char('0')) return false;
            digitsBeforeExp = true;
            if (!atEnd() && isDigit(*current_)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
        }

        while (!atPlainEnd()) {
            const char c = *current_;
            if (isDigit(c)) {
                (seenExp ? digitsAfterExp : digitsBeforeExp) = true;
                if (!push_char(c)) return false;
            } else if (c == '.' && !seenDot && !seenExp && digitsBeforeExp) {
                seenDot = true;
                if (!push_char(c)) return false;
                if (atEnd() || !isDigit(*current_)) {
                    setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                    return false;
                }
            } else if ((c == 'e' || c == 'E') && !seenExp && digitsBeforeExp) {
                seenExp = true;
                if (!push_char(c)) return false;
                if (!atEnd() && (*current_ == '+' || *current_ == '-')) {
                    if (!push_char(*current_)) return false;
                }
            } else {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
        }
        buf[index] = '\0';

        if (!digitsBeforeExp || (seenExp && !digitsAfterExp)) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    // buf holds an optional '-' followed by digits only.
    // Returns false when the value does not fit Int.
    template <class Int>
    static constexpr bool parse_decimal_integer(const char* buf, Int& out) {
        using Unsigned = std::make_unsigned_t<Int>;

        const char *p = buf;
        bool negative = false;
        if (*p == '-') {
            if constexpr (std::is_unsigned_v<Int>) {
                // -0 is still zero
                for (const char* q = p + 1; *q != 0; ++q) {
                    if (*q != '0') return false;
                }
                out = 0;
                return true;
            }
            negative = true;
            ++p;
        }

        Unsigned limit = static_cast<Unsigned>(std::numeric_limits<Int>::max());
        if constexpr (std::is_signed_v<Int>) {
            if (negative) limit = limit + 1u;
        }

        Unsigned value = 0;
        for (; *p != 0; ++p) {
            const unsigned digit = static_cast<unsigned>(*p - '0');
            if (value > static_cast<Unsigned>((limit - digit) / 10u))  {
                return false;
            }
            value = static_cast<Unsigned>(value * 10u + digit);
        }

        if constexpr (std::is_signed_v<Int>) {
            if (negative) {
                out = (value == static_cast<Unsigned>(std::numeric_limits<Int>::max()) + 1u)
                          ? std::numeric_limits<Int>::min()
                          : static_cast<Int>(-static_cast<Int>(value));
                return true;
            }
        }
        out = static_cast<Int>(value);
        return true;
    }

    constexpr bool read_hex4(std::uint16_t &out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = *current_;
            std::uint8_t v;
            if (c >= '0' && c <= '9') {
                v = static_cast<std::uint8_t>(c - '0');
            } else if (c >= 'A' && c <= 'F') {
                v = static_cast<std::uint8_t>(c - 'A' + 10);
            } else if (c >= 'a' && c <= 'f') {
                v = static_cast<std::uint8_t>(c - 'a' + 10);
            } else  {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            out = static_cast<std::uint16_t>((out << 4) | v);
            ++current_;
        }
        return true;
    }

    // after "\u": one code unit, or a surrogate pair written as two escapes
    constexpr bool read_escaped_codepoint(std::uint32_t& codepoint) {
        std::uint16_t u1 = 0;
        if (!read_hex4(u1)) {
            return false;
        }
        if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
            setError(JsonIteratorReaderError::ILLFORMED_STRING);
            return false;
        }
        if (u1 < 0xD800u || u1 > 0xDBFFu) {
            codepoint = u1;
            return true;
        }
        if (!match_literal("\\u")) {
            setError(atEnd() ? JsonIteratorReaderError::UNEXPECTED_END_OF_DATA
                             : JsonIteratorReaderError::ILLFORMED_STRING);
            return false;
        }
        std::uint16_t u2 = 0;
        if (!read_hex4(u2)) {
            return false;
        }
        if (u2 < 0xDC00u || u2 > 0xDFFFu) {
            setError(JsonIteratorReaderError::ILLFORMED_STRING);
            return false;
        }
        codepoint = 0x10000u
                    + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                    + (static_cast<std::uint32_t>(u2) - 0xDC00u);
        return true;
    }

    static constexpr std::size_t encode_utf8(std::uint32_t codepoint, char (&utf8)[4]) {
        if (codepoint <= 0x7Fu) {
            utf8[0] = static_cast<char>(codepoint);
            return 1;
        }
        if (codepoint <= 0x7FFu) {
            utf8[0] = static_cast<char>(0xC0 | (codepoint >> 6));
            utf8[1] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 2;
        }
        if (codepoint <= 0xFFFFu) {
            utf8[0] = static_cast<char>(0xE0 | (codepoint >> 12));
            utf8[1] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            utf8[2] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 3;
        }
        utf8[0] = static_cast<char>(0xF0 | (codepoint >> 18));
        utf8[1] = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        utf8[2] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        utf8[3] = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 4;
    }

    constexpr reader::IterationStatus read_container_begin(char open, char close, JsonIteratorReaderError err) {
        reader::IterationStatus ret;
        if(*current_ != open)  {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        ++current_;
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if(*current_ == ',') {
            setError(err);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if(*current_ == close) {
            ++current_;
        } else {
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    constexpr reader::IterationStatus advance_in_container(char close, JsonIteratorReaderError err) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if(*current_ == close)  {
            ++current_;
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
        if(*current_ != ',')  {
            setError(err);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        ++current_;
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if(*current_ == ',' || *current_ == close) {
            setError(err);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        ret.has_value = true;
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }
};

static_assert(FlatJson::reader::ReaderLike<JsonIteratorReader<const char*, const char*>>);


enum class JsonIteratorWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW
};

constexpr std::string_view error_to_string(JsonIteratorWriterError e) {
    switch(e) {
    case JsonIteratorWriterError::NO_ERROR: return "NO_ERROR";
    case JsonIteratorWriterError::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW";
    }
    return "N/A";
}

/// Compact JSON emitter into [first, last).
/// Writing past last fails with OUTPUT_OVERFLOW.
template<class It, class Sent>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    struct ArrayFrame {};
    struct MapFrame {};

    using error_type = JsonIteratorWriterError;

    static constexpr std::size_t DefaultFloatDecimals = 8;

    constexpr JsonIteratorWriter(It first, Sent last, std::size_t float_decimals = DefaultFloatDecimals)
        : m_error(JsonIteratorWriterError::NO_ERROR), m_current(first), end_(last), m_float_decimals(float_decimals) {}

    constexpr JsonIteratorWriterError getError() const {
        return m_error;
    }

    constexpr It current() const {
        return m_current;
    }

    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }

    constexpr bool write_array_begin(ArrayFrame&) { return put('['); }
    constexpr bool write_map_begin(MapFrame&) { return put('{'); }
    constexpr bool advance_after_value(ArrayFrame&) { return put(','); }
    constexpr bool advance_after_value(MapFrame&) { return put(','); }
    constexpr bool move_to_value(MapFrame&) { return put(':'); }
    constexpr bool write_array_end(ArrayFrame&) { return put(']'); }
    constexpr bool write_map_end(MapFrame&) { return put('}'); }

    constexpr bool write_null() {
        return write_literal("null");
    }

    constexpr bool write_bool(const bool & obj) {
        return write_literal(obj ? "true" : "false");
    }

    template<class NumberT>
    constexpr bool write_number(const NumberT & v) {
        return write_number(v, m_float_decimals);
    }

    /// float_decimals is the count of significant digits for floating point values
    template<class NumberT>
    constexpr bool write_number(const NumberT & v, std::size_t float_decimals) {
        char buf[fp_to_str_detail::NumberBufSize];
        char* end = buf;
        if constexpr (std::is_integral_v<NumberT>) {
            end = format_decimal_integer<NumberT>(v, buf, buf + sizeof(buf));
        } else {
            const double content = static_cast<double>(v);
            // JSON has no representation for these
            if(std::isnan(content) || std::isinf(content)) {
                return write_literal("0");
            }
            end = fp_to_str_detail::format_double_to_chars(buf, buf + sizeof(buf), content, float_decimals);
        }
        for (char* it = buf; it != end; ++it) {
            if (!put(*it)) return false;
        }
        return true;
    }

    constexpr bool write_string(const char* data, std::size_t size) {
        constexpr char hex[] = "0123456789abcdef";
        if (!put('"')) return false;
        for (std::size_t i = 0; i < size; ++i) {
            const auto uc = static_cast<unsigned char>(data[i]);
            bool ok = true;
            switch (uc) {
            case '"':  ok = put('\\') && put('"');  break;
            case '\\': ok = put('\\') && put('\\'); break;
            case '\b': ok = put('\\') && put('b');  break;
            case '\f': ok = put('\\') && put('f');  break;
            case '\n': ok = put('\\') && put('n');  break;
            case '\r': ok = put('\\') && put('r');  break;
            case '\t': ok = put('\\') && put('t');  break;
            default:
                if (uc < 0x20) {
                    ok = put('\\') && put('u') && put('0') && put('0')
                         && put(hex[(uc >> 4) & 0xF]) && put(hex[uc & 0xF]);
                } else {
                    ok = put(data[i]);
                }
                break;
            }
            if (!ok) return false;
        }
        return put('"');
    }

    constexpr bool finish() {
        return m_error == JsonIteratorWriterError::NO_ERROR;
    }

private:
    JsonIteratorWriterError m_error;
    It m_current;
    Sent end_;
    std::size_t m_float_decimals;
    std::size_t m_bytesWritten = 0;

    constexpr void setError(JsonIteratorWriterError e) {
        m_error = e;
    }

    constexpr bool put(char c) {
        if (m_current == end_) {
            setError(JsonIteratorWriterError::OUTPUT_OVERFLOW);
            return false;
        }
        *m_current = c;
        ++m_current;
        ++m_bytesWritten;
        return true;
    }

    constexpr bool write_literal(std::string_view lit) {
        for (char c : lit) {
            if (!put(c)) return false;
        }
        return true;
    }

    // Writes base-10 value into [first, last), returns one past the last char.
    template <class Int>
    static constexpr char* format_decimal_integer(Int value, char* first, char* last) {
        using Unsigned = std::make_unsigned_t<Int>;
        char* p = last;

        Unsigned u;
        bool negative = false;
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                negative = true;
                // min() has no positive counterpart in Int
                u = Unsigned(-(value + 1)) + 1u;
            } else {
                u = static_cast<Unsigned>(value);
            }
        } else {
            u = value;
        }

        do {
            *--p = static_cast<char>('0' + static_cast<unsigned>(u % 10u));
            u /= 10u;
        } while (u != 0 && p != first);

        if (negative && p != first) {
            *--p = '-';
        }

        const std::size_t len = static_cast<std::size_t>(last - p);
        for (std::size_t i = 0; i < len; ++i) {
            first[i] = p[i];
        }
        return first + len;
    }
};

static_assert(FlatJson::writer::WriterLike<JsonIteratorWriter<char*, char*>>);

} // namespace FlatJson
