#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "flat_path.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"

namespace FlatJson {

namespace struct_fields_helper {

template<class T, std::size_t I>
static consteval bool fieldIsNotJSON() {
    using Opts = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::not_json_tag>;
}

struct FieldDescr {
    std::string_view name;
    std::size_t originalIndex = 0;
    bool chained = false;   // written as the head of a flat_path chain
};

/// JSON names of the fields of T, in declaration order, not_json fields left out.
/// A flat_path field is listed under its first path segment.
template<class T>
struct FieldsHelper {
    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (!fieldIsNotJSON<T, I>() ? 1 : 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        return flat_path::FieldAnnotation<T, I>::json_name;
    }

    static constexpr std::array<FieldDescr, fieldsCount> fieldIndexesToFieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<FieldDescr, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsNotJSON<T, J>()) {
                    using FA = flat_path::FieldAnnotation<T, J>;
                    arr[index++] = FieldDescr{ fieldName<J>(), J, FA::flattened && FA::depth >= 2 };
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    // sibling flat_path fields sharing a first segment would repeat a key
    static constexpr bool fieldsAreUnique = [](std::array<FieldDescr, fieldsCount> sortedArr) consteval {
        std::ranges::sort(sortedArr, {}, &FieldDescr::name);
        return std::ranges::adjacent_find(sortedArr, {}, &FieldDescr::name) == sortedArr.end();
    }(fieldIndexesToFieldNames);

    // a key may repeat only when every field claiming it opens its own chain
    static constexpr bool repeatedKeysAreChains = []() consteval {
        for (std::size_t i = 0; i < fieldsCount; i++) {
            for (std::size_t j = i + 1; j < fieldsCount; j++) {
                const auto& a = fieldIndexesToFieldNames[i];
                const auto& b = fieldIndexesToFieldNames[j];
                if (a.name == b.name && !(a.chained && b.chained)) {
                    return false;
                }
            }
        }
        return true;
    }();

    static constexpr std::size_t maxFieldNameLength = []() consteval {
        std::size_t maxLen = 0;
        for (const auto& field : fieldIndexesToFieldNames) {
            if (field.name.size() > maxLen) {
                maxLen = field.name.size();
            }
        }
        return maxLen;
    }();

    /// Position of name in fieldIndexesToFieldNames at or after from, or fieldsCount
    static constexpr std::size_t find(std::string_view name, std::size_t from = 0) {
        for (std::size_t i = from; i < fieldsCount; i++) {
            if (fieldIndexesToFieldNames[i].name == name) {
                return i;
            }
        }
        return fieldsCount;
    }
};

} // namespace struct_fields_helper
} // namespace FlatJson
