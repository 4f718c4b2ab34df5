#include "../test_helpers.hpp"
#include <FlatJson/options.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace FlatJson;
using namespace FlatJson::options;
using namespace TestHelpers;

// ============================================================================
// key<>
// ============================================================================

struct Renamed {
    A<int, key<"user-id">> id;
    A<std::string, key<"display name">> name;
};

static_assert(TestParse<Renamed>(R"({"user-id": 5, "display name": "Ann"})",
    [](const Renamed& r) { return r.id == 5 && r.name.get() == "Ann"; }));
static_assert(TestParseError<Renamed>(R"({"id": 5})", ParseError::EXCESS_FIELD),
              "The member name is not accepted once renamed");
static_assert(TestRoundTrip<Renamed>(R"({"user-id":1,"display name":"x"})"));


// ============================================================================
// not_json
// ============================================================================

struct Hidden {
    int shown;
    A<int, not_json> internal;
};

static_assert(TestSerialize(Hidden{1, {99}}, R"({"shown":1})"));
static_assert(TestParseError<Hidden>(R"({"shown": 1, "internal": 2})", ParseError::EXCESS_FIELD));
static_assert([]() constexpr {
    Hidden h{0, {7}};
    return Parse(h, std::string_view(R"({"shown": 3})")) && h.shown == 3 && h.internal == 7;
}(), "not_json fields keep their values");


// ============================================================================
// allow_excess_fields
// ============================================================================

struct Strict {
    int a;
};

struct Lenient {
    int a;
    A<Strict, allow_excess_fields<>> inner;
};

static_assert(TestParseError<Strict>(R"({"a": 1, "b": 2})", ParseError::EXCESS_FIELD));
static_assert(TestParse<A<Strict, allow_excess_fields<>>>(
    R"({"x": [1, {"y": [true, null]}], "a": 4, "z": "s"})",
    [](const A<Strict, allow_excess_fields<>>& s) { return s->a == 4; }));
static_assert(TestParse<Lenient>(R"({"a": 1, "inner": {"a": 2, "extra": {}}})",
    [](const Lenient& l) { return l.a == 1 && l.inner->a == 2; }));
static_assert(TestParseError<Lenient>(R"({"a": 1, "extra": 0})", ParseError::EXCESS_FIELD),
              "The option does not leak to the enclosing record");

static_assert(TestParseError<A<Strict, allow_excess_fields<>>>(R"({"x": [1}, "a": 1})",
                                                              JsonIteratorReaderError::ILLFORMED_OBJECT),
              "Skipped values must still be well-formed");


// ============================================================================
// skip_if_default
// ============================================================================

struct Sparse {
    A<int, skip_if_default> count;
    A<std::string, skip_if_default> label;
    A<std::vector<int>, skip_if_default> items;
    A<std::optional<int>, skip_if_default> maybe;
    int always;
};

static_assert(TestSerialize(Sparse{}, R"({"always":0})"));
static_assert([]() constexpr {
    Sparse s{};
    s.count = 2;
    s.items.get().push_back(1);
    s.maybe = 0;
    return TestSerialize(s, R"({"count":2,"items":[1],"maybe":0,"always":0})");
}(), "Engaged optional holding a default value is still written");
static_assert(TestParse<Sparse>(R"({"always": 1})", [](const Sparse& s) { return s.always == 1 && s.count == 0; }),
              "Skipped fields parse back from absence");


// ============================================================================
// Options on container items
// ============================================================================

struct Point {
    int x;
    int y;
};

struct Polyline {
    std::vector<A<Point, as_array>> pts;
    A<std::vector<std::string>, key<"names">> n;
};

static_assert(TestRoundTrip<Polyline>(R"({"pts":[[0,0],[1,2]],"names":["a"]})"));


// ============================================================================
// External per-field annotations
// ============================================================================

struct ExtAnnotated {
    int id;
    std::string secret;
};

template<>
struct FlatJson::AnnotatedField<ExtAnnotated, 0> {
    using Options = OptionsPack<key<"ID">>;
};
template<>
struct FlatJson::AnnotatedField<ExtAnnotated, 1> {
    using Options = OptionsPack<not_json>;
};

static_assert(TestSerialize(ExtAnnotated{3, "pw"}, R"({"ID":3})"));
static_assert(TestParse<ExtAnnotated>(R"({"ID": 9})", [](const ExtAnnotated& e) { return e.id == 9 && e.secret.empty(); }));


// ============================================================================
// Type-level annotations
// ============================================================================

struct Pair {
    int first;
    int second;
};

template<>
struct FlatJson::Annotated<Pair> {
    using Options = OptionsPack<as_array>;
};

struct HoldsPair {
    Pair p;
};

static_assert(TestRoundTrip<HoldsPair>(R"({"p":[1,2]})"));
