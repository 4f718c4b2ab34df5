#include "../test_helpers.hpp"
#include <FlatJson/options.hpp>
#include <string>
#include <string_view>

using namespace FlatJson;
using namespace FlatJson::options;
using namespace TestHelpers;

// ============================================================================
// Test: chains deeper than the error path storage
// ============================================================================

struct Deep {
    A<int, flat_path<"k0", "k1", "k2", "k3", "k4", "k5", "k6", "k7", "k8", "k9", "k10", "k11", "k12", "k13", "k14", "k15", "k16", "k17", "k18", "k19", "k20", "k21", "k22", "k23", "k24", "k25", "k26", "k27", "k28", "k29", "k30", "k31", "k32", "k33", "k34", "k35", "k36", "k37", "k38", "k39">> v;
};

inline constexpr std::string_view DeepOk = R"({"k0":{"k1":{"k2":{"k3":{"k4":{"k5":{"k6":{"k7":{"k8":{"k9":{"k10":{"k11":{"k12":{"k13":{"k14":{"k15":{"k16":{"k17":{"k18":{"k19":{"k20":{"k21":{"k22":{"k23":{"k24":{"k25":{"k26":{"k27":{"k28":{"k29":{"k30":{"k31":{"k32":{"k33":{"k34":{"k35":{"k36":{"k37":{"k38":{"k39":7}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}})";
inline constexpr std::string_view DeepBad = R"({"k0":{"k1":{"k2":{"k3":{"k4":{"k5":{"k6":{"k7":{"k8":{"k9":{"k10":{"k11":{"k12":{"k13":{"k14":{"k15":{"k16":{"k17":{"k18":{"k19":{"k20":{"k21":{"k22":{"k23":{"k24":{"k25":{"k26":{"k27":{"k28":{"k29":{"k30":{"k31":{"k32":{"k33":{"k34":{"k35":{"k36":{"k37":{"k38":{"k39":"x"}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}}})";

static_assert([]() constexpr {
    Deep d{};
    return Parse(d, DeepOk) && d.v == 7;
}(), "Forty nested objects decode into one field");

static_assert([]() constexpr {
    Deep d{};
    d.v = 7;
    std::string out;
    return Serialize(d, out) && out == DeepOk;
}(), "Forty nested objects encoded back");

static_assert([]() constexpr {
    Deep d{};
    auto res = Parse(d, DeepBad);
    return !res
        && res.error() == ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE
        && res.errorPath().size() == path::MaxPathDepth
        && res.errorPath().truncated == 40 - path::MaxPathDepth
        && res.errorPath()[0].field_name == "k0"
        && res.errorPath()[path::MaxPathDepth - 1].field_name == "k31";
}(), "Levels past the path capacity are counted, not stored");


// ============================================================================
// Test: nested records with a chain at the bottom
// ============================================================================

struct Inner {
    A<int, flat_path<"x", "y">> v;
};
struct Middle {
    Inner inner;
};
struct Outer {
    Middle middle;
};

static_assert(TestParseErrorWithJsonPath<Outer>(R"({"middle":{"inner":{"x":{"y":true}}}})",
                                                ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE,
                                                "middle", "inner", "x", "y"));
static_assert(TestRoundTrip<Outer>(R"({"middle":{"inner":{"x":{"y":3}}}})"));
