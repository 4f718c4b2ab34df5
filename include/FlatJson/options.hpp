#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace FlatJson {

namespace options {

namespace detail {

struct not_json_tag{};
struct key_tag{};
struct allow_excess_fields_tag{};
struct float_decimals_tag {};
struct as_array_tag {};
struct skip_if_default_tag {};
struct flat_path_tag {};
struct variant_tags_tag {};
}

struct not_json {
    using tag = detail::not_json_tag;
    static constexpr std::string_view to_string() {
        return "not_json";
    }
};

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ FlatJson ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

template<std::size_t N>
struct float_decimals {
    using tag = detail::float_decimals_tag;
    static constexpr std::size_t value = N;
    static constexpr std::string_view to_string() {
        return "float_decimals";
    }
};

struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

template<std::size_t MaxSkipDepth=64>
struct allow_excess_fields{
    static constexpr std::size_t SkipDepthLimit = MaxSkipDepth;
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

// Serializer omits the field (key included) when it compares equal to a value-initialized T.
struct skip_if_default {
    using tag = detail::skip_if_default_tag;
    static constexpr std::string_view to_string() {
        return "skip_if_default";
    }
};

/// Places the field's value at the end of a chain of nested objects:
/// a field annotated flat_path<"a", "b", "c"> is written as {"a":{"b":{"c": value}}}.
/// The first segment becomes the field's key; every other option of the field
/// applies to the innermost value only.
template<ConstString... Keys>
struct flat_path {
    using tag = detail::flat_path_tag;
    using segments = OptionsPack<key<Keys>...>;
    static constexpr std::size_t Length = sizeof...(Keys);
    static constexpr std::string_view to_string() {
        return "flat_path";
    }
};

// JSON tags of std::variant alternatives, in alternative order.
template<ConstString... Tags>
struct variant_tags {
    static_assert((Tags.check() && ...), "[[[ FlatJson ]]] variant tag contains control characters");
    using tag = detail::variant_tags_tag;
    static constexpr std::size_t Count = sizeof...(Tags);
    static constexpr std::array<std::string_view, Count> names{Tags.toStringView()...};
    static constexpr std::string_view to_string() {
        return "variant_tags";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    static constexpr std::size_t option_count = 0;

    template<class Tag>
    using get_option = void;

    using pack = OptionsPack<>;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    // Number of options carrying Tag, repeated ones included.
    template<class Tag>
    static constexpr std::size_t option_count = (std::size_t{0} + ... + (option_matches_tag<Opts, Tag>::value ? 1 : 0));

    template<class Tag>
    using get_option = option_type<Tag>;

    using pack = OptionsPack<Opts...>;
};


template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class Field>
struct annotation_meta{};

// Base: non-annotated
template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ FlatJson ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ FlatJson ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

// Drops every option carrying Tag
template <class Tag, class P> struct remove_options_by_tag;
template <class Tag> struct remove_options_by_tag<Tag, OptionsPack<>> {
    using type = OptionsPack<>;
};
template <class Tag, class First, class... Rest> struct remove_options_by_tag<Tag, OptionsPack<First, Rest...>> {
    using rest = typename remove_options_by_tag<Tag, OptionsPack<Rest...>>::type;
    using type = std::conditional_t<option_matches_tag<First, Tag>::value,
                                    rest,
                                    typename merge_options<OptionsPack<First>, rest>::type>;
};


// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<
        OptionsPack<Opts...>
        >;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta members are reached through member pointers as plain T, still described by this meta
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};


// Externally Annotated<T>
template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t = T;
    using options      = field_options<typename Annotated<T>::Options>;

    using OptionsP = typename Annotated<T>::Options;

    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }

};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template<class T, std::size_t I, class = void>
struct has_field_annotation_specialization_impl : std::false_type {
    using Options = OptionsPack<>;
};

template<class T, std::size_t I>
struct has_field_annotation_specialization_impl<T, I,
                                          std::void_t<typename AnnotatedField<T, I>::Options>
                                          > : std::bool_constant<
                                                  is_options_pack_v<typename AnnotatedField<T, I>::Options>
                                                  && (AnnotatedField<T, I>::Options::Count > 0)
                                                  > {
    using Options = typename AnnotatedField<T, I>::Options;
};

template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using ExternalOpts = typename has_field_annotation_specialization_impl<AggregateT, Index>::Options;
    using OptionsP = typename merge_options<ExternalOpts, typename Meta::OptionsP>::type;
    using options      = field_options<OptionsP>;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;

} // namespace detail

} //namespace options

} // namespace FlatJson
