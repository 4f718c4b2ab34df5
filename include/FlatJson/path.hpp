#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <string_view>
#include <type_traits>

namespace FlatJson {
namespace path {

#ifndef FLATJSON_MAX_PATH_DEPTH
constexpr std::size_t MaxPathDepth = 32;
#else
constexpr std::size_t MaxPathDepth = FLATJSON_MAX_PATH_DEPTH;
#endif

#ifndef FLATJSON_PATH_KEY_CAPACITY
constexpr std::size_t InlineKeyCapacity = 64;
#else
constexpr std::size_t InlineKeyCapacity = FLATJSON_PATH_KEY_CAPACITY;
#endif

constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

struct PathElement {
    std::size_t     array_index = NotAnIndex;   // all array-like
    std::string_view field_name;  // static name for records and chain links, buffer content for map keys
    bool is_static = true;
    char        buf[InlineKeyCapacity > 0 ? InlineKeyCapacity : 1] = {};

    constexpr PathElement() = default;

    constexpr PathElement(const PathElement& other)
        : array_index(other.array_index),
        is_static(other.is_static)
    {
        assign_name(other.is_static ? other.field_name : std::string_view(other.buf, other.field_name.size()));
    }

    constexpr PathElement& operator=(const PathElement& other) {
        if (this == &other) return *this;
        array_index = other.array_index;
        is_static   = other.is_static;
        assign_name(other.is_static ? other.field_name : std::string_view(other.buf, other.field_name.size()));
        return *this;
    }

    constexpr bool is_index() const {
        return array_index != NotAnIndex;
    }

    constexpr void assign_name(std::string_view key) {
        if (is_static) {
            field_name = key;
        } else {
            // map keys live in the input buffer only while they are parsed
            const std::size_t len = key.size() < InlineKeyCapacity ? key.size() : InlineKeyCapacity;
            for(std::size_t l = 0; l < len; l ++) buf[l] = key[l];
            field_name = std::string_view(buf, len);
        }
    }
};

/// Keys and indexes from the root to the value being parsed.
/// Levels deeper than MaxPathDepth are counted but not stored.
struct Path {
    std::array<PathElement, MaxPathDepth> storage{};
    std::size_t currentLength = 0;
    std::size_t truncated = 0;

    constexpr void push_field(std::string_view key, bool is_static) {
        if(currentLength == MaxPathDepth) {
            truncated ++;
            return;
        }
        auto& elem = storage[currentLength];
        elem.array_index = NotAnIndex;
        elem.is_static = is_static;
        elem.assign_name(key);
        currentLength++;
    }

    constexpr void push_index(std::size_t index) {
        if(currentLength == MaxPathDepth) {
            truncated ++;
            return;
        }
        auto& elem = storage[currentLength];
        elem.array_index = index;
        elem.field_name = {};
        elem.is_static = true;
        currentLength++;
    }

    constexpr void pop() {
        if(truncated > 0) {
            truncated --;
        } else {
            currentLength --;
        }
    }

    constexpr std::size_t size() const {
        return currentLength;
    }

    constexpr const PathElement& operator[](std::size_t i) const {
        return storage[i];
    }

    // Compares against a list of keys (string-like) and indexes (integers)
    template <class ... PathElems>
    constexpr bool equals(PathElems ... elems) const {
        if(sizeof...(elems) != currentLength || truncated != 0) {
            return false;
        }
        std::size_t i = 0;
        bool eq = true;
        auto one = [&]<class ArgT>(ArgT arg) {
            const PathElement& el = storage[i++];
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                eq = eq && !el.is_index() && el.field_name == std::string_view(arg);
            } else if constexpr (std::is_convertible_v<ArgT, std::size_t>){
                eq = eq && el.array_index == static_cast<std::size_t>(arg);
            } else {
                static_assert(!sizeof(arg), "[[[ FlatJson ]]] Use integers or str-compatible segments in Path comparison");
            }
        };
        (one(elems), ...);
        return eq;
    }
};

} // namespace path
} // namespace FlatJson
