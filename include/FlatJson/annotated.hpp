#pragma once

#include <cstddef>
#include <concepts>
#include <memory>
#include <utility>

namespace FlatJson {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

/// Attaches options to a value without changing its layout:
/// Annotated<T, Opts...> holds exactly one T.
/// Specialize Annotated<T> with `using Options = OptionsPack<...>` to annotate a type externally.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }

    template<class U = T>
        requires requires (const U& u) { u.size(); }
    constexpr auto size() const {
        return value.size();
    }

    template<class U = T>
        requires requires (U& u) { u[std::size_t{0}]; }
    constexpr decltype(auto) operator[](std::size_t i) {
        return value[i];
    }

    template<class U = T>
        requires requires (const U& u) { u[std::size_t{0}]; }
    constexpr decltype(auto) operator[](std::size_t i) const {
        return value[i];
    }
};

template <class T, typename... Options>
using A = Annotated<T, Options...>;

/// External per-field options: specialize with `using Options = OptionsPack<...>`
/// for field #I of aggregate T. Merged with the field's inline options.
template <class T, std::size_t I>
struct AnnotatedField {};

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs,
                const Annotated<T, OptsR...>& rhs)
{
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs,
                const U& rhs)
{
    return lhs.value == rhs;
}

} // namespace FlatJson
