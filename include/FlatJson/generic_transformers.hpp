#pragma once

#include <concepts>
#include <memory>
#include <utility>

namespace FlatJson {
namespace transformers {

/// Stores a StoredT and reads/writes it as a WireT.
/// FromFn: bool(StoredT&, const WireT&), called after the wire value is parsed.
/// ToFn:   bool(const StoredT&, WireT&), called before the wire value is written.
/// Either returning false fails the call with TRANSFORMER_ERROR.
template<
    class StoredT,
    class WireT,
    auto FromFn,
    auto ToFn
>
struct Transformed {
    using stored_type = StoredT;
    using wire_type   = WireT;

    StoredT value{};

    constexpr bool transform_from(const WireT& wire) {
        return FromFn(value, wire);
    }

    constexpr bool transform_to(WireT& wire) const {
        return ToFn(value, wire);
    }

    constexpr Transformed() = default;
    constexpr Transformed(const Transformed&) = default;
    constexpr Transformed(Transformed&&) = default;
    constexpr Transformed& operator=(const Transformed&) = default;
    constexpr Transformed& operator=(Transformed&&) = default;

    template<class U>
        requires std::convertible_to<U, StoredT>
    constexpr Transformed(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, StoredT>
    constexpr Transformed& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator StoredT&()             { return value; }
    constexpr operator const StoredT&() const { return value; }

    constexpr StoredT*       operator->()       { return std::addressof(value); }
    constexpr const StoredT* operator->() const { return std::addressof(value); }

    constexpr StoredT&       get()       { return value; }
    constexpr const StoredT& get() const { return value; }
};


// also covers Transformed == Transformed and, reversed, U == Transformed
template<class T, class W, auto F, auto To, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Transformed<T, W, F, To>& lhs, const U& rhs) {
    return lhs.value == rhs;
}

} // namespace transformers
} // namespace FlatJson
