#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <string>

using namespace FlatJson;
using namespace TestHelpers;

struct Ints {
    std::int8_t i8;
    std::uint16_t u16;
    std::int64_t i64;
    std::uint64_t u64;
};

static_assert(TestSerialize(Ints{-128, 65535, std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::uint64_t>::max()},
                            R"({"i8":-128,"u16":65535,"i64":-9223372036854775808,"u64":18446744073709551615})"));
static_assert(TestSerialize(Ints{0, 0, 0, 0}, R"({"i8":0,"u16":0,"i64":0,"u64":0})"));

struct Flags {
    bool a;
    bool b;
};
static_assert(TestSerialize(Flags{true, false}, R"({"a":true,"b":false})"));

struct Text {
    std::string s;
};
static_assert(TestSerialize(Text{"q\"b\\n\nt\t"}, R"({"s":"q\"b\\n\nt\t"})"));
static_assert(TestSerialize(Text{std::string("\x01\x1f", 2)}, R"({"s":"\u0001\u001f"})"), "Control characters escaped");
static_assert(TestSerialize(Text{"\xE2\x82\xAC"}, "{\"s\":\"\xE2\x82\xAC\"}"), "UTF-8 passed through");

// Top-level scalars
static_assert(TestSerialize(42, "42"));
static_assert(TestSerialize(std::string("x"), R"("x")"));


// ============================================================================
// Test: fixed output range
// ============================================================================

static_assert([]() constexpr {
    std::array<char, 32> buf{};
    char* it = buf.data();
    auto res = Serialize(Flags{true, true}, it, buf.data() + buf.size());
    return res && std::string_view(buf.data(), static_cast<std::size_t>(it - buf.data())) == R"({"a":true,"b":true})";
}(), "Serialize into a char range");

static_assert([]() constexpr {
    std::array<char, 8> buf{};
    char* it = buf.data();
    auto res = Serialize(Flags{true, true}, it, buf.data() + buf.size());
    return !res
        && res.error() == SerializeError::WRITER_ERROR
        && res.writerError() == JsonIteratorWriterError::OUTPUT_OVERFLOW;
}(), "Output overflow reported");

static_assert([]() constexpr {
    std::string out = "prefix:";
    return Serialize(Flags{false, true}, out) && out == R"(prefix:{"a":false,"b":true})";
}(), "Serialize appends to a std::string");
