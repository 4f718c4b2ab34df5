#include "../test_helpers.hpp"
#include <cstdint>
#include <limits>
#include <string>

using namespace FlatJson;
using namespace TestHelpers;

// ============================================================================
// Test: bool
// ============================================================================

struct Flags {
    bool a;
    bool b;
};

static_assert(TestParse<Flags>(R"({"a": true, "b": false})", Flags{true, false}));
static_assert(TestParseError<Flags>(R"({"a": 1, "b": false})", ParseError::NON_BOOL_IN_BOOL_VALUE));
static_assert(TestParseError<Flags>(R"({"a": tru, "b": false})", JsonIteratorReaderError::ILLFORMED_BOOL));
static_assert(TestParseError<Flags>(R"({"a": truex, "b": false})", JsonIteratorReaderError::ILLFORMED_BOOL));


// ============================================================================
// Test: integers
// ============================================================================

struct Ints {
    std::int8_t i8;
    std::uint8_t u8;
    std::int32_t i32;
    std::int64_t i64;
    std::uint64_t u64;
};

static_assert(TestParse<Ints>(R"({"i8": -128, "u8": 255, "i32": -2147483648, "i64": 9223372036854775807, "u64": 18446744073709551615})",
    [](const Ints& v) {
        return v.i8 == std::numeric_limits<std::int8_t>::min()
            && v.u8 == 255
            && v.i32 == std::numeric_limits<std::int32_t>::min()
            && v.i64 == std::numeric_limits<std::int64_t>::max()
            && v.u64 == std::numeric_limits<std::uint64_t>::max();
    }), "Integer limits");

static_assert(TestParseError<Ints>(R"({"i8": 128})", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<Ints>(R"({"u8": -1})", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<Ints>(R"({"u64": 18446744073709551616})", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParse<Ints>(R"({"u8": -0})", [](const Ints& v) { return v.u8 == 0; }), "-0 fits unsigned");

static_assert(TestParseError<Ints>(R"({"i32": 1.5})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE),
              "Fractions do not fit integer storage");
static_assert(TestParseError<Ints>(R"({"i32": 1e3})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<Ints>(R"({"i32": "1"})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<Ints>(R"({"i32": 01})", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(TestParseError<Ints>(R"({"i32": -})", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(TestParseError<Ints>(R"({"i32": 12a})", JsonIteratorReaderError::ILLFORMED_NUMBER));


// ============================================================================
// Test: strings
// ============================================================================

struct Text {
    std::string s;
};

static_assert(TestParse<Text>(R"({"s": "plain"})", Text{"plain"}));
static_assert(TestParse<Text>(R"({"s": ""})", Text{""}));
static_assert(TestParse<Text>(R"({"s": "q\"b\\s\/n\nt\tr\rb\bf\f"})", Text{"q\"b\\s/n\nt\tr\rb\bf\f"}));
static_assert(TestParse<Text>(R"({"s": "\u0041\u00e9\u20ac"})", Text{"A\xC3\xA9\xE2\x82\xAC"}), "BMP escapes");
static_assert(TestParse<Text>(R"({"s": "\ud83d\ude00"})", Text{"\xF0\x9F\x98\x80"}), "Surrogate pair");
static_assert(TestParseError<Text>(R"({"s": "\ude00"})", JsonIteratorReaderError::ILLFORMED_STRING), "Lone low surrogate");
static_assert(TestParseError<Text>(R"({"s": "\x"})", JsonIteratorReaderError::ILLFORMED_STRING));
static_assert(TestParseError<Text>("{\"s\": \"a\nb\"}", JsonIteratorReaderError::ILLFORMED_STRING), "Raw control character");
static_assert(TestParseError<Text>(R"({"s": 5})", ParseError::NON_STRING_IN_STRING_STORAGE));
static_assert(TestParseError<Text>(R"({"s": "abc)", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));

// Longer than one read chunk, with a multibyte escape across the boundary
static_assert([]() constexpr {
    std::string json = R"({"s": ")";
    std::string expected;
    for (int i = 0; i < 63; ++i) {
        json += 'x';
        expected += 'x';
    }
    json += R"(\u20ac")";
    json += "}";
    expected += "\xE2\x82\xAC";
    Text t{};
    return Parse(t, json) && t.s == expected;
}(), "Escape split across chunks");


// ============================================================================
// Test: null in non-nullable storage
// ============================================================================

static_assert(TestParseError<Text>(R"({"s": null})", ParseError::NULL_IN_NON_OPTIONAL));
static_assert(TestParseError<Flags>(R"({"a": nul})", JsonIteratorReaderError::ILLFORMED_NULL));
