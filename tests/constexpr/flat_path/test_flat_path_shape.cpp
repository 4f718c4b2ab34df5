#include "../test_helpers.hpp"
#include <FlatJson/options.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace FlatJson;
using namespace FlatJson::options;
using namespace TestHelpers;

// ============================================================================
// Test: flat_path - field written at the end of a chain of nested objects
// ============================================================================

struct Shape {
    A<int, flat_path<"a", "b", "c">> x;
};

static_assert(TestSerialize(Shape{{7}}, R"({"a":{"b":{"c":7}}})"),
              "Three segments produce three nested objects");

static_assert(TestParse<Shape>(R"({"a":{"b":{"c":7}}})", Shape{{7}}),
              "Value decoded from the innermost key");

static_assert(TestParse<Shape>(R"( { "a" : { "b" : { "c" : -12 } } } )", Shape{{-12}}),
              "Whitespace at every chain level");

static_assert(TestRoundTrip<Shape>(R"({"a":{"b":{"c":42}}})"),
              "Compact round-trip is byte exact");


// Single segment: plain rename, no extra nesting
struct Renamed {
    A<int, flat_path<"renamed">> x;
    int y;
};

static_assert(TestSerialize(Renamed{{1}, 2}, R"({"renamed":1,"y":2})"),
              "One segment is a rename");
static_assert(TestParse<Renamed>(R"({"y":2,"renamed":1})", Renamed{{1}, 2}),
              "One segment parses under the renamed key");


// Flattened and ordinary fields mixed, declaration order kept
struct Mixed {
    int id;
    A<std::string, flat_path<"meta", "owner", "name">> owner;
    bool active;
    A<int, flat_path<"stats", "count">> count;
};

static_assert(TestSerialize(Mixed{1, {"bob"}, true, {3}},
                            R"({"id":1,"meta":{"owner":{"name":"bob"}},"active":true,"stats":{"count":3}})"),
              "Mixed record keeps field order");

static_assert(TestParse<Mixed>(R"({"stats":{"count":3},"active":true,"meta":{"owner":{"name":"bob"}},"id":1})",
                               Mixed{1, {"bob"}, true, {3}}),
              "Mixed record parses in any key order");


// ============================================================================
// Leaf types
// ============================================================================

struct Point {
    int x;
    int y;
};

struct Leaves {
    A<std::string, flat_path<"s", "v">> str;
    A<bool, flat_path<"b", "v">> flag;
    A<std::vector<int>, flat_path<"arr", "items">> items;
    A<std::optional<int>, flat_path<"opt", "v">> maybe;
    A<Point, flat_path<"geo", "pos">> pos;
};

static_assert(TestSerialize(Leaves{{"q\"uote"}, {true}, {std::vector<int>{1, 2, 3}}, {std::nullopt}, {Point{4, 5}}},
                            R"({"s":{"v":"q\"uote"},"b":{"v":true},"arr":{"items":[1,2,3]},"opt":{"v":null},"geo":{"pos":{"x":4,"y":5}}})"),
              "Every leaf kind under a chain");

static_assert(TestParse<Leaves>(R"({"s":{"v":"tab\t"},"b":{"v":false},"arr":{"items":[]},"opt":{"v":9},"geo":{"pos":{"y":1,"x":2}}})",
    [](const Leaves& l) {
        return l.str.get() == "tab\t"
            && l.flag.get() == false
            && l.items.get().empty()
            && l.maybe.get() == 9
            && l.pos.get().x == 2 && l.pos.get().y == 1;
    }),
    "Every leaf kind decoded through its chain");

static_assert(TestRoundTripSemantic(Leaves{{"x"}, {true}, {std::vector<int>{7}}, {5}, {Point{-1, 1}}}),
              "Leaves round-trip");


// Leaf record with its own flattened field
struct Inner {
    A<int, flat_path<"deep", "er">> v;
};

struct Outer {
    A<Inner, flat_path<"wrap", "inner">> inner;
};

static_assert(TestSerialize(Outer{{Inner{{3}}}}, R"({"wrap":{"inner":{"deep":{"er":3}}}})"),
              "Chains compose through a leaf record");
static_assert(TestParse<Outer>(R"({"wrap":{"inner":{"deep":{"er":3}}}})", Outer{{Inner{{3}}}}),
              "Composed chains parse");


// Long path
struct Long {
    A<int, flat_path<"l1", "l2", "l3", "l4", "l5", "l6">> v;
};

static_assert(TestRoundTrip<Long>(R"({"l1":{"l2":{"l3":{"l4":{"l5":{"l6":6}}}}}})"),
              "Six segments");


// Flattened fields in arrays of records
struct Item {
    A<int, flat_path<"data", "id">> id;
};

struct Catalog {
    std::vector<Item> items;
};

static_assert(TestRoundTrip<Catalog>(R"({"items":[{"data":{"id":1}},{"data":{"id":2}}]})"),
              "Records with chains inside arrays");


// Segment text is escaped like any key
struct Quoted {
    A<int, flat_path<"a b", "c\"d">> v;
};

static_assert(TestSerialize(Quoted{{1}}, R"({"a b":{"c\"d":1}})"),
              "Segments are escaped on output");
static_assert(TestParse<Quoted>(R"({"a b":{"c\"d":1}})", Quoted{{1}}),
              "Escaped segments match on input");
