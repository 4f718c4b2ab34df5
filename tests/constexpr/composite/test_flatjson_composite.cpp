#include "../test_helpers.hpp"
#include <FlatJson/options.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace FlatJson;
using namespace FlatJson::options;
using namespace TestHelpers;

// ============================================================================
// Test: nested records
// ============================================================================

struct Level2 {
    int data;
};

struct Level1 {
    int id;
    Level2 nested;
};

static_assert(TestParse<Level1>(R"({"id": 1, "nested": {"data": 42}})", Level1{1, {42}}));
static_assert(TestSerialize(Level1{1, {42}}, R"({"id":1,"nested":{"data":42}})"));


// ============================================================================
// Test: vectors and fixed arrays
// ============================================================================

struct Lists {
    std::vector<int> v;
    std::array<int, 3> a;
    std::vector<std::vector<std::string>> nested;
};

static_assert(TestParse<Lists>(R"({"v": [1, 2, 3], "a": [4, 5, 6], "nested": [["x"], [], ["y", "z"]]})",
    [](const Lists& l) {
        return l.v.size() == 3 && l.v[2] == 3
            && l.a[0] == 4 && l.a[2] == 6
            && l.nested.size() == 3 && l.nested[1].empty() && l.nested[2][1] == "z";
    }));

static_assert(TestRoundTrip<Lists>(R"({"v":[],"a":[1,2,3],"nested":[["a","b"]]})"));

static_assert(TestParseError<Lists>(R"({"a": [1, 2, 3, 4]})", ParseError::FIXED_SIZE_CONTAINER_OVERFLOW));
static_assert(TestParse<Lists>(R"({"a": [9]})", [](const Lists& l) { return l.a[0] == 9 && l.a[1] == 0; }),
              "Short input leaves the remaining array items");
static_assert(TestParseError<Lists>(R"({"v": {}})", ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE));
static_assert(TestParseError<Lists>(R"({"v": [1,]})", JsonIteratorReaderError::ILLFORMED_ARRAY));
static_assert(TestParseError<Lists>(R"({"v": [,1]})", JsonIteratorReaderError::ILLFORMED_ARRAY));
static_assert(TestParseError<Lists>(R"({"v": [1 2]})", JsonIteratorReaderError::ILLFORMED_ARRAY));

static_assert([]() constexpr {
    Lists l{};
    l.v = {7, 8, 9};
    return Parse(l, std::string_view(R"({"v": [1]})")) && l.v.size() == 1 && l.v[0] == 1;
}(), "Vectors are replaced, not appended to");


// ============================================================================
// Test: optionals and unique_ptr
// ============================================================================

struct Maybe {
    std::optional<int> i;
    std::optional<Level2> rec;
    std::unique_ptr<int> p;
};

static_assert(TestParse<Maybe>(R"({"i": null, "rec": {"data": 3}, "p": 5})",
    [](const Maybe& m) { return !m.i && m.rec && m.rec->data == 3 && m.p && *m.p == 5; }));

static_assert(TestParse<Maybe>(R"({"i": 1, "rec": null, "p": null})",
    [](const Maybe& m) { return m.i == 1 && !m.rec && !m.p; }));

static_assert([]() constexpr {
    Maybe m{};
    m.i = 4;
    m.p = std::make_unique<int>(6);
    return TestSerialize(m, R"({"i":4,"rec":null,"p":6})");
}());

static_assert(TestSerialize(Maybe{}, R"({"i":null,"rec":null,"p":null})"));

static_assert(TestParseErrorWithJsonPath<Maybe>(R"({"rec": {"data": "x"}})",
                                                ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, "rec", "data"));


// ============================================================================
// Test: as_array records
// ============================================================================

struct Vec3 {
    int x;
    int y;
    int z;
};

struct Mesh {
    std::vector<A<Vec3, as_array>> points;
};

static_assert(TestRoundTrip<Mesh>(R"({"points":[[1,2,3],[4,5,6]]})"));
static_assert(TestParseError<Mesh>(R"({"points":[[1,2]]})", ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR));
static_assert(TestParseError<Mesh>(R"({"points":[[1,2,3,4]]})", ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR));
static_assert(TestParseError<Mesh>(R"({"points":[{"x":1}]})", ParseError::NON_ARRAY_IN_DESTRUCTURED_STRUCT));

struct WithHiddenPositional {
    int a;
    A<int, not_json> skip;
    int b;
};
static_assert(TestSerialize(A<WithHiddenPositional, as_array>{WithHiddenPositional{1, {2}, 3}}, "[1,3]"),
              "not_json fields are not positions");


// ============================================================================
// Test: StructMeta explicit field lists
// ============================================================================

class Account {
public:
    constexpr int id() const { return m_id; }
    constexpr const std::string& owner() const { return m_owner; }
    constexpr void set(int id, std::string owner) { m_id = id; m_owner = std::move(owner); }

    int m_id = 0;
    std::string m_owner;
    int m_cache = 0;
};

template<>
struct FlatJson::StructMeta<Account> {
    using Fields = StructFields<
        Field<&Account::m_id, "id">,
        Field<&Account::m_owner, "owner", flat_path<"profile", "name">>
    >;
};

static_assert([]() constexpr {
    Account acc;
    acc.set(3, "ann");
    return TestSerialize(acc, R"({"id":3,"profile":{"name":"ann"}})");
}(), "StructMeta fields can be flattened");

static_assert(TestParse<Account>(R"({"profile":{"name":"bo"},"id":8})",
    [](const Account& a) { return a.id() == 8 && a.owner() == "bo" && a.m_cache == 0; }));
