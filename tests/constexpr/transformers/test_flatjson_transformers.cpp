#include "../test_helpers.hpp"
#include <FlatJson/generic_transformers.hpp>
#include <FlatJson/options.hpp>
#include <string>
#include <vector>

using namespace FlatJson;
using namespace FlatJson::options;
using namespace FlatJson::transformers;
using namespace TestHelpers;

// ============================================================================
// Helpers: constexpr int <-> decimal string
// ============================================================================

constexpr bool parse_int(int& result, std::string_view sv) {
    if (sv.empty()) return false;
    bool negative = false;
    std::size_t i = 0;
    if (sv[0] == '-') {
        if (sv.size() == 1) return false;
        negative = true;
        i = 1;
    }
    int v = 0;
    for (; i < sv.size(); ++i) {
        if (sv[i] < '0' || sv[i] > '9') return false;
        v = v * 10 + (sv[i] - '0');
    }
    result = negative ? -v : v;
    return true;
}

constexpr bool format_int(int value, std::string& out) {
    out.clear();
    if (value == 0) {
        out = "0";
        return true;
    }
    const bool negative = value < 0;
    std::string digits;
    for (int v = negative ? -value : value; v > 0; v /= 10) {
        digits.push_back(static_cast<char>('0' + v % 10));
    }
    if (negative) out.push_back('-');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(*it);
    }
    return true;
}

constexpr auto string_to_int = [](int& stored, const std::string& wire) -> bool {
    return parse_int(stored, wire);
};
constexpr auto int_to_string = [](const int& stored, std::string& wire) -> bool {
    return format_int(stored, wire);
};

using IntAsString = Transformed<int, std::string, string_to_int, int_to_string>;

static_assert(static_schema::JsonTransformer<IntAsString>);
static_assert(static_schema::JsonValue<IntAsString>);
static_assert(!static_schema::JsonObject<IntAsString>);
static_assert(std::is_same_v<static_schema::transform_traits<IntAsString>::wire_type, std::string>);


// ============================================================================
// Test: plain field
// ============================================================================

struct Plain {
    IntAsString n;
    int raw;
};

static_assert(TestSerialize(Plain{{42}, 7}, R"({"n":"42","raw":7})"));
static_assert(TestSerialize(Plain{{-120}, 0}, R"({"n":"-120","raw":0})"));
static_assert(TestParse<Plain>(R"({"n":"-5","raw":3})", [](const Plain& p) {
    return p.n.get() == -5 && p.raw == 3;
}));
static_assert(TestRoundTrip<Plain>(R"({"n":"0","raw":1})"));

static_assert(TestParseError<Plain>(R"({"n":"twelve","raw":1})", ParseError::TRANSFORMER_ERROR));
static_assert(TestParseError<Plain>(R"({"n":12,"raw":1})", ParseError::NON_STRING_IN_STRING_STORAGE),
              "The wire type decides what JSON is accepted");


// ============================================================================
// Test: transformer at the end of a flat_path chain
// ============================================================================

struct Chained {
    A<IntAsString, flat_path<"a", "b">> x;
};

static_assert(flat_path::Driver<Chained>::error == FlatPathError::none);
static_assert(flat_path::Driver<Chained>::flattened_count == 1);

static_assert(TestSerialize(Chained{{42}}, R"({"a":{"b":"42"}})"));
static_assert(TestParse<Chained>(R"({"a":{"b":"17"}})", [](const Chained& c) {
    return c.x.get().get() == 17;
}));
static_assert(TestRoundTrip<Chained>(R"({"a":{"b":"-3"}})"));

static_assert(TestParseErrorWithJsonPath<Chained>(R"({"a":{"b":"x1"}})", ParseError::TRANSFORMER_ERROR, "a", "b"));

struct ChainedSkip {
    A<IntAsString, flat_path<"a", "b">, skip_if_default> x;
    int y;
};
static_assert(TestSerialize(ChainedSkip{{0}, 1}, R"({"a":{},"y":1})"));
static_assert(TestSerialize(ChainedSkip{{9}, 1}, R"({"a":{"b":"9"},"y":1})"));


// ============================================================================
// Test: failing encoder
// ============================================================================

constexpr auto reject_negative = [](const int& stored, std::string& wire) -> bool {
    return stored >= 0 && format_int(stored, wire);
};
using NonNegative = Transformed<int, std::string, string_to_int, reject_negative>;

struct Guarded {
    A<NonNegative, flat_path<"limits", "max">> max;
};

constexpr bool test_serialize_failure() {
    Guarded g;
    g.max = -1;
    std::string out;
    auto res = Serialize(g, out);
    return !res && res.error() == SerializeError::TRANSFORMER_ERROR;
}
static_assert(test_serialize_failure());


// ============================================================================
// Test: wire type is itself a record, nested inside an array
// ============================================================================

struct Range {
    int lo;
    int hi;
};

constexpr auto from_range = [](int& width, const Range& r) -> bool {
    if (r.hi < r.lo) return false;
    width = r.hi - r.lo;
    return true;
};
constexpr auto to_range = [](const int& width, Range& r) -> bool {
    r = Range{0, width};
    return true;
};
using Width = Transformed<int, Range, from_range, to_range>;

struct Spans {
    std::vector<Width> widths;
};

static_assert(TestParse<Spans>(R"({"widths":[{"lo":1,"hi":4},{"lo":0,"hi":0}]})", [](const Spans& s) {
    return s.widths.size() == 2 && s.widths[0].get() == 3 && s.widths[1].get() == 0;
}));
static_assert(TestParseErrorWithJsonPath<Spans>(R"({"widths":[{"lo":5,"hi":4}]})", ParseError::TRANSFORMER_ERROR, "widths", 0));
static_assert(TestSerialize(Spans{{Width{2}}}, R"({"widths":[{"lo":0,"hi":2}]})"));


// ============================================================================
// Test: value access
// ============================================================================

constexpr bool test_value_access() {
    IntAsString a;
    a = 10;
    IntAsString b{10};
    if (!(a == b) || a != b) return false;
    if (!(a == 10) || !(10 == a)) return false;
    int raw = a;
    return raw == 10 && a.get() == 10;
}
static_assert(test_value_access());
