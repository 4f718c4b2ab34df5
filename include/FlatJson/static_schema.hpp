#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace FlatJson {

enum class stream_write_result : std::uint8_t {
    slot_allocated,
    overflow,
    error,
    value_processed,
};

namespace static_schema {

namespace detail {
template<class T>
struct always_false : std::false_type {};
}

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


/* ######## Nullable values: JSON null <-> empty state ######## */
template<class T>
struct nullable_traits {
    static constexpr bool is_nullable = false;
};

template<class T>
struct nullable_traits<std::optional<T>> {
    static constexpr bool is_nullable = true;
    using value_type = T;

    static constexpr bool isNull(const std::optional<T>& o) { return !o.has_value(); }
    static constexpr void setNull(std::optional<T>& o) { o.reset(); }
    static constexpr T& materialize(std::optional<T>& o) {
        if(!o.has_value()) {
            o.emplace();
        }
        return *o;
    }
    static constexpr const T& get(const std::optional<T>& o) { return *o; }
};

template<class T>
struct nullable_traits<std::unique_ptr<T>> {
    static constexpr bool is_nullable = true;
    using value_type = T;

    static constexpr bool isNull(const std::unique_ptr<T>& p) { return p == nullptr; }
    static constexpr void setNull(std::unique_ptr<T>& p) { p.reset(); }
    static constexpr T& materialize(std::unique_ptr<T>& p) {
        if(!p) {
            p = std::make_unique<T>();
        }
        return *p;
    }
    static constexpr const T& get(const std::unique_ptr<T>& p) { return *p; }
};

template<class C>
concept JsonNullable = nullable_traits<std::remove_cvref_t<AnnotatedValue<C>>>::is_nullable;


/* ######## Bool type detection ######## */
template<class C>
concept JsonBool = std::same_as<AnnotatedValue<C>, bool>;

/* ######## Number type detection ######## */
template<class C>
concept JsonNumber =
    !JsonBool<C> &&
    (std::is_integral_v<AnnotatedValue<C>> || std::is_floating_point_v<AnnotatedValue<C>>);

/* ######## String type detection ######## */
template<class C>
concept JsonString = std::same_as<AnnotatedValue<C>, std::string>;


/* ######## Arrays ######## */
template<class C>
struct array_read_cursor {};

template<class C>
    requires std::ranges::range<C>
struct array_read_cursor<C> {
    using element_type = typename C::value_type;
    const C& c;
    decltype(c.begin()) it = c.begin();
    bool first = true;

    constexpr const element_type& get() const {
        return *it;
    }
    constexpr bool read_more() {
        if(first) {
            first = false;
        } else {
            ++it;
        }
        return it != c.end();
    }
};

template<class C>
struct array_write_cursor;

template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type & >;
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;

    constexpr stream_write_result allocate_slot() {
        return stream_write_result::slot_allocated;
    }
    constexpr element_type & get_slot() {
        return c.back();
    }
    constexpr void emplace() {
        c.emplace_back();
    }
    constexpr void reset(){
        c.clear();
    }
};

// fixed-size std::array: extra items overflow, missing items keep their values
template<class T, std::size_t N>
struct array_write_cursor<std::array<T, N>> {
    using element_type = T;
    std::array<T, N>& c;
    std::size_t index = 0;
    bool first = true;
    constexpr stream_write_result allocate_slot() {
        if(first) {
            index = 0;
            first = false;
        } else {
            index ++;
        }
        if(index < N)
            return stream_write_result::slot_allocated;
        else {
            return stream_write_result::overflow;
        }
    }
    constexpr element_type & get_slot() {
        return c[index];
    }
    constexpr void emplace() {}
    constexpr void reset(){
        index = 0;
        first = true;
    }
};

template<class C>
concept JsonArray =
    !JsonString<C> &&
    requires { typename array_write_cursor<AnnotatedValue<C>>::element_type; } &&
    requires { typename array_read_cursor<AnnotatedValue<C>>::element_type; };


/* ######## Maps: string keys only ######## */
template<class M>
struct map_traits {
    static constexpr bool is_map = false;
};

template<class V, class Cmp, class Alloc>
struct map_traits<std::map<std::string, V, Cmp, Alloc>> {
    static constexpr bool is_map = true;
    using mapped_type = V;
};

template<class C>
concept JsonMap = map_traits<std::remove_cvref_t<AnnotatedValue<C>>>::is_map;


/* ######## Tagged unions ######## */
template<class C>
concept JsonTaggedUnion = is_specialization_of_v<AnnotatedValue<C>, std::variant>;


/* ######## Transformers: stored value <-> wire value ######## */
template<class C>
concept ParseTransformer = requires(AnnotatedValue<C>& t, const typename AnnotatedValue<C>::wire_type& w) {
    { t.transform_from(w) } -> std::convertible_to<bool>;
};

template<class C>
concept SerializeTransformer = requires(const AnnotatedValue<C>& t, typename AnnotatedValue<C>::wire_type& w) {
    { t.transform_to(w) } -> std::convertible_to<bool>;
};

template<class C>
concept JsonTransformer = ParseTransformer<C> && SerializeTransformer<C>;

template<class C>
struct transform_traits {
    using wire_type = typename AnnotatedValue<C>::wire_type;
};


/* ######## Object type detection ######## */
template<class C>
concept JsonObject =
    std::is_class_v<AnnotatedValue<C>> &&
    !JsonString<C> && !JsonArray<C> && !JsonMap<C> &&
    !JsonNullable<C> && !JsonTaggedUnion<C> && !JsonTransformer<C> &&
    (introspection::has_struct_meta_specialization<AnnotatedValue<C>> || std::is_aggregate_v<AnnotatedValue<C>>);

template<class C>
concept JsonValue =
    JsonBool<C> || JsonNumber<C> || JsonString<C> || JsonArray<C> ||
    JsonMap<C> || JsonTaggedUnion<C> || JsonObject<C> || JsonNullable<C> ||
    JsonTransformer<C>;

// Records written as JSON arrays, one item per field, in declaration order
template<class Opts>
constexpr bool is_positional() {
    return Opts::template has_option<options::detail::as_array_tag>;
}

} // namespace static_schema
} // namespace FlatJson
