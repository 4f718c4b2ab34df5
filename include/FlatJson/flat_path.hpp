#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "annotated.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace FlatJson {

namespace flat_path {

/// Borrowed leaf of a chain. Decoding writes through it, encoding reads through it.
template<class Leaf>
struct LeafRef {
    Leaf* ptr = nullptr;
};

// Scope tags. Every chain is instantiated under the field_scope of the field it serves,
// so equal paths in different fields, records or variant alternatives never share types.
template<class Record>
struct record_scope {};

template<class Variant, std::size_t I>
struct variant_scope {};

template<class Scope, std::size_t FieldIndex>
struct field_scope {};

} // namespace flat_path


namespace options::detail {

// The innermost chain link is described by the leaf it points to
template<class Leaf, class... Opts>
struct annotation_meta<Annotated<flat_path::LeafRef<Leaf>, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = std::remove_const_t<Leaf>;
    using options = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<flat_path::LeafRef<Leaf>, Opts...> & f) {
        return (*f.value.ptr);
    }
    static constexpr decltype(auto) getRef(const Annotated<flat_path::LeafRef<Leaf>, Opts...> & f) {
        return (*f.value.ptr);
    }
};

} // namespace options::detail


namespace flat_path {

using options::detail::flat_path_tag;
using options::detail::key_tag;
using options::detail::not_json_tag;

namespace detail {

template<class Pack>
struct split_path {
    static constexpr std::string_view head{};
    using tail = OptionsPack<>;
};

template<class First, class... Rest>
struct split_path<OptionsPack<First, Rest...>> {
    static constexpr std::string_view head = First::desc.toStringView();
    using tail = OptionsPack<Rest...>;
};

template<class Opts>
struct path_of {
    using segments = OptionsPack<>;
    static constexpr std::size_t Length = 0;
};

template<class Opts>
    requires (Opts::template has_option<flat_path_tag>)
struct path_of<Opts> {
    using option = typename Opts::template get_option<flat_path_tag>;
    using segments = typename option::segments;
    static constexpr std::size_t Length = option::Length;
};

template<class T>
constexpr bool type_level_flat_path() {
    if constexpr (options::detail::has_annotation_specialization<T>) {
        return options::detail::field_options<typename Annotated<T>::Options>::template has_option<flat_path_tag>;
    } else {
        return false;
    }
}

} // namespace detail


/// Flat-path annotation of field #I of Record, with inline and external options merged.
template<class Record, std::size_t I>
struct FieldAnnotation {
    using Source   = options::detail::aggregate_field_opts<std::remove_cv_t<Record>, I>;
    using Field    = typename Source::Field;
    using FieldMeta = typename Source::Meta;
    using Opts     = typename Source::options;
    using value_type = typename FieldMeta::value_t;

    static constexpr std::size_t count = Opts::template option_count<flat_path_tag>;
    static constexpr bool present = count > 0;
    static constexpr bool excluded = Opts::template has_option<not_json_tag>;

    // a flat_path on the type's own annotation, whether or not the member adds inline options
    static constexpr bool from_type_level = detail::type_level_flat_path<value_type>();

    using Path = detail::path_of<Opts>;
    static constexpr std::size_t depth = Path::Length;

    static constexpr FlatPathError error = []() consteval {
        if constexpr (from_type_level) {
            return FlatPathError::unsupported_shape;
        } else if constexpr (!present) {
            return FlatPathError::none;
        } else if constexpr (count > 1) {
            return FlatPathError::duplicate_annotation;
        } else if constexpr (Path::Length == 0) {
            return FlatPathError::empty_path;
        } else if constexpr (Opts::template has_option<key_tag>) {
            return FlatPathError::conflicting_key;
        } else {
            return FlatPathError::none;
        }
    }();

    static constexpr bool flattened = present && error == FlatPathError::none;

    static constexpr std::string_view first_key = detail::split_path<typename Path::segments>::head;
    using tail_segments = typename detail::split_path<typename Path::segments>::tail;

    using leaf_options = typename options::detail::remove_options_by_tag<flat_path_tag, typename Source::OptionsP>::type;

    /// Key the owning record reads and writes this field under
    static constexpr std::string_view json_name = []() consteval {
        if constexpr (flattened) {
            return first_key;
        } else if constexpr (Opts::template has_option<key_tag>) {
            return Opts::template get_option<key_tag>::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, std::remove_cv_t<Record>>;
        }
    }();
};


template<class Scope, class Leaf, class LeafOpts, class LinkOpts, class... Segments>
struct Chain;

// last segment: the link holding the leaf, customized with the field's remaining options
template<class Scope, class Leaf, class... LeafOpts, class... LinkOpts, class Last>
struct Chain<Scope, Leaf, OptionsPack<LeafOpts...>, OptionsPack<LinkOpts...>, Last> {
    using Item = Annotated<LeafRef<Leaf>, Last, LeafOpts...>;

    struct Link {
        Item field;
    };

    static_assert(sizeof(Link) == sizeof(LeafRef<Leaf>) && alignof(Link) == alignof(LeafRef<Leaf>),
                  "[[[ FlatJson ]]] flat_path link must have the layout of the reference it wraps");
    static_assert(std::is_standard_layout_v<Link>,
                  "[[[ FlatJson ]]] flat_path link must be standard layout");

    static constexpr Link wrap(Leaf& v) {
        return Link{ Item(LeafRef<Leaf>{&v}) };
    }
};

template<class Scope, class Leaf, class LeafOpts, class... LinkOpts, class Seg, class Next, class... Rest>
struct Chain<Scope, Leaf, LeafOpts, OptionsPack<LinkOpts...>, Seg, Next, Rest...> {
    using Inner = Chain<Scope, Leaf, LeafOpts, OptionsPack<LinkOpts...>, Next, Rest...>;
    using Item = Annotated<typename Inner::Link, Seg, LinkOpts...>;

    struct Link {
        Item field;
    };

    static_assert(sizeof(Link) == sizeof(LeafRef<Leaf>) && alignof(Link) == alignof(LeafRef<Leaf>),
                  "[[[ FlatJson ]]] flat_path link must have the layout of the reference it wraps");
    static_assert(std::is_standard_layout_v<Link>,
                  "[[[ FlatJson ]]] flat_path link must be standard layout");

    static constexpr Link wrap(Leaf& v) {
        return Link{ Item(Inner::wrap(v)) };
    }
};


/// What the owning record hands to its value decoder/encoder in place of the field:
/// a single-segment path is the leaf itself, a longer one is the first link.
template<class Scope, class Leaf, class LeafOpts, class LinkOpts, class Tail>
struct ChainHead;

template<class Scope, class Leaf, class... LeafOpts, class LinkOpts>
struct ChainHead<Scope, Leaf, OptionsPack<LeafOpts...>, LinkOpts, OptionsPack<>> {
    using type = Annotated<LeafRef<Leaf>, LeafOpts...>;
    static constexpr type wrap(Leaf& v) {
        return type(LeafRef<Leaf>{&v});
    }
};

template<class Scope, class Leaf, class LeafOpts, class... LinkOpts, class... Segments>
    requires (sizeof...(Segments) > 0)
struct ChainHead<Scope, Leaf, LeafOpts, OptionsPack<LinkOpts...>, OptionsPack<Segments...>> {
    using chain = Chain<Scope, Leaf, LeafOpts, OptionsPack<LinkOpts...>, Segments...>;
    using type = Annotated<typename chain::Link, LinkOpts...>;
    static constexpr type wrap(Leaf& v) {
        return type(chain::wrap(v));
    }
};


// Record-level options repeated on each nested object of a chain
template<class RecordOpts>
using chain_link_options = std::conditional_t<
    RecordOpts::template has_option<options::detail::allow_excess_fields_tag>,
    OptionsPack<typename RecordOpts::template get_option<options::detail::allow_excess_fields_tag>>,
    OptionsPack<>>;


/// Serialize/deserialize adapter of flattened field #I of Record.
/// LinkOpts are record-level options repeated on every intermediate object (allow_excess_fields).
template<class Scope, class Record, std::size_t I>
struct FieldAdapter {
    using Annotation = FieldAnnotation<Record, I>;
    using value_type = typename Annotation::value_type;

    static_assert(Annotation::flattened);

    static constexpr std::string_view key = Annotation::first_key;
    static constexpr std::size_t depth = Annotation::depth;

    template<class LinkOpts>
    using decode_head = ChainHead<field_scope<Scope, I>, value_type,
                                  typename Annotation::leaf_options, LinkOpts, typename Annotation::tail_segments>;
    template<class LinkOpts>
    using encode_head = ChainHead<field_scope<Scope, I>, const value_type,
                                  typename Annotation::leaf_options, LinkOpts, typename Annotation::tail_segments>;

    template<class LinkOpts = OptionsPack<>, class Decode>
    static constexpr bool deserialize(value_type& v, Decode&& decode) {
        auto head = decode_head<LinkOpts>::wrap(v);
        return decode(head);
    }

    template<class LinkOpts = OptionsPack<>, class Encode>
    static constexpr bool serialize(const value_type& v, Encode&& encode) {
        auto head = encode_head<LinkOpts>::wrap(v);
        return encode(head);
    }
};


/// Classification of every field of an object-like record.
template<class Scope, class T, bool Positional = false>
struct RecordPlan {
    using scope = Scope;
    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    template<std::size_t I>
    static consteval bool counts() {
        using FA = FieldAnnotation<T, I>;
        return (FA::present || FA::from_type_level) && !FA::excluded;
    }

    static constexpr std::size_t flattened_count = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (counts<I>() ? 1 : 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr std::size_t error_field = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        std::size_t found = rawFieldsCount;
        auto one = [&](std::size_t idx, bool failed) {
            if (failed && found == rawFieldsCount) found = idx;
        };
        (one(I, counts<I>() && FieldAnnotation<T, I>::error != FlatPathError::none), ...);
        return found;
    }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr FlatPathError error = []() consteval {
        if constexpr (Positional && flattened_count > 0) {
            return FlatPathError::unnamed_field_not_supported;
        } else if constexpr (error_field < rawFieldsCount) {
            return FieldAnnotation<T, error_field>::error;
        } else {
            return FlatPathError::none;
        }
    }();

    template<std::size_t I>
    static constexpr bool is_flattened = counts<I>() && FieldAnnotation<T, I>::flattened;

    template<std::size_t I>
    using adapter = FieldAdapter<Scope, T, I>;
};


/// Per-alternative plans of a std::variant tagged union, each under its own scope.
template<class V>
struct UnionPlan;

template<class... Alts>
struct UnionPlan<std::variant<Alts...>> {
    using variant_type = std::variant<Alts...>;
    static constexpr std::size_t Count = sizeof...(Alts);

    template<std::size_t I>
    using alternative_meta = options::detail::annotation_meta_getter<std::variant_alternative_t<I, variant_type>>;

    template<std::size_t I>
    using alternative_type = typename alternative_meta<I>::value_t;

    template<std::size_t I>
    using alternative_options = typename alternative_meta<I>::options;

    template<std::size_t I>
    using plan = RecordPlan<variant_scope<variant_type, I>, alternative_type<I>,
                            static_schema::is_positional<alternative_options<I>>()>;

    template<std::size_t I>
    static consteval FlatPathError alternative_error() {
        if constexpr (alternative_options<I>::template has_option<flat_path_tag>) {
            return FlatPathError::unsupported_shape;
        } else {
            return plan<I>::error;
        }
    }

    static constexpr std::size_t error_alternative = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        std::size_t found = Count;
        auto one = [&](std::size_t idx, FlatPathError e) {
            if (e != FlatPathError::none && found == Count) found = idx;
        };
        (one(I, alternative_error<I>()), ...);
        return found;
    }(std::make_index_sequence<Count>{});

    static constexpr FlatPathError error = []() consteval {
        if constexpr (error_alternative < Count) {
            return alternative_error<error_alternative>();
        } else {
            return FlatPathError::none;
        }
    }();

    static constexpr std::size_t flattened_count = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + plan<I>::flattened_count);
    }(std::make_index_sequence<Count>{});

    // alternatives without fields produce no chains
    static constexpr std::size_t skipped_alternatives = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (plan<I>::rawFieldsCount == 0 ? 1 : 0));
    }(std::make_index_sequence<Count>{});
};


enum class Kind {
    none,
    record,
    tagged_union
};

namespace detail {

template<class V>
struct all_alternatives_are_records : std::false_type {};

template<class... Alts>
struct all_alternatives_are_records<std::variant<Alts...>>
    : std::bool_constant<(static_schema::JsonObject<Alts> && ...)> {};

template<class Item>
constexpr bool item_has_flat_path() {
    return options::detail::annotation_meta_getter<Item>::options::template has_option<flat_path_tag>;
}

} // namespace detail

/// Dispatches a value type to its record or union plan.
/// Opts are the options the value is used with: its own type-level annotation,
/// plus the field options when the value is a field.
template<class T, class Opts = typename options::detail::annotation_meta_getter<T>::options>
struct Driver {
    using value_type = static_schema::AnnotatedValue<T>;

    static constexpr Kind kind = []() consteval {
        if constexpr (static_schema::JsonObject<value_type>) {
            return Kind::record;
        } else if constexpr (static_schema::JsonTaggedUnion<value_type>) {
            if constexpr (detail::all_alternatives_are_records<value_type>::value) {
                return Kind::tagged_union;
            } else {
                return Kind::none;
            }
        } else {
            return Kind::none;
        }
    }();

    static constexpr FlatPathError error = []() consteval {
        if constexpr (Opts::template has_option<flat_path_tag>) {
            return FlatPathError::unsupported_shape;
        } else if constexpr (static_schema::JsonArray<value_type>) {
            using Elem = typename static_schema::array_read_cursor<value_type>::element_type;
            return detail::item_has_flat_path<Elem>() ? FlatPathError::unsupported_shape : FlatPathError::none;
        } else if constexpr (static_schema::JsonMap<value_type>) {
            using Mapped = typename static_schema::map_traits<value_type>::mapped_type;
            return detail::item_has_flat_path<Mapped>() ? FlatPathError::unsupported_shape : FlatPathError::none;
        } else if constexpr (kind == Kind::record) {
            return RecordPlan<record_scope<value_type>, value_type, static_schema::is_positional<Opts>()>::error;
        } else if constexpr (kind == Kind::tagged_union) {
            return UnionPlan<value_type>::error;
        } else {
            return FlatPathError::none;
        }
    }();

    static constexpr std::size_t flattened_count = []() consteval {
        if constexpr (kind == Kind::record) {
            return RecordPlan<record_scope<value_type>, value_type, static_schema::is_positional<Opts>()>::flattened_count;
        } else if constexpr (kind == Kind::tagged_union) {
            return UnionPlan<value_type>::flattened_count;
        } else {
            return std::size_t{0};
        }
    }();
};

/// Turns a misuse found by the Driver into a compile error. Always returns true otherwise.
template<class T, class Opts = typename options::detail::annotation_meta_getter<T>::options>
consteval bool validate() {
    constexpr FlatPathError e = Driver<T, Opts>::error;
    static_assert(e != FlatPathError::duplicate_annotation,
                  "[[[ FlatJson ]]] flat_path: a field carries more than one flat_path annotation");
    static_assert(e != FlatPathError::empty_path,
                  "[[[ FlatJson ]]] flat_path: path must have at least one segment");
    static_assert(e != FlatPathError::unnamed_field_not_supported,
                  "[[[ FlatJson ]]] flat_path: fields of as_array records have no keys to flatten under");
    static_assert(e != FlatPathError::unsupported_shape,
                  "[[[ FlatJson ]]] flat_path: annotation is allowed on record fields only");
    static_assert(e != FlatPathError::conflicting_key,
                  "[[[ FlatJson ]]] flat_path: key<> conflicts with the first path segment");
    return e == FlatPathError::none;
}


/// JSON tags of the alternatives of V: variant_tags<...> from Opts, else decimal indexes.
template<std::size_t Count>
struct index_tags {
    static constexpr std::size_t Width = 20;

    static constexpr std::size_t digits_of(std::size_t v) {
        std::size_t n = 1;
        while (v >= 10) {
            v /= 10;
            ++n;
        }
        return n;
    }

    static constexpr std::array<std::array<char, Width>, Count> storage = []() consteval {
        std::array<std::array<char, Width>, Count> res{};
        for (std::size_t i = 0; i < Count; ++i) {
            std::size_t v = i;
            std::size_t n = digits_of(i);
            for (std::size_t d = n; d > 0; --d) {
                res[i][d - 1] = static_cast<char>('0' + v % 10);
                v /= 10;
            }
        }
        return res;
    }();

    static constexpr std::array<std::string_view, Count> names = []() consteval {
        std::array<std::string_view, Count> res{};
        for (std::size_t i = 0; i < Count; ++i) {
            res[i] = std::string_view(storage[i].data(), digits_of(i));
        }
        return res;
    }();
};

template<class V, class Opts>
struct variant_tag_names {
    static constexpr std::size_t Count = std::variant_size_v<V>;
    static constexpr std::array<std::string_view, Count> names = []() consteval {
        if constexpr (Opts::template has_option<options::detail::variant_tags_tag>) {
            using Tags = typename Opts::template get_option<options::detail::variant_tags_tag>;
            static_assert(Tags::Count == Count, "[[[ FlatJson ]]] variant_tags must name every alternative");
            return Tags::names;
        } else {
            return index_tags<Count>::names;
        }
    }();

    static constexpr bool unique = []() consteval {
        for (std::size_t i = 0; i < Count; ++i) {
            for (std::size_t j = i + 1; j < Count; ++j) {
                if (names[i] == names[j]) return false;
            }
        }
        return true;
    }();
    static_assert(unique, "[[[ FlatJson ]]] variant tags must be unique");

    static constexpr std::size_t find(std::string_view tag) {
        for (std::size_t i = 0; i < Count; ++i) {
            if (names[i] == tag) return i;
        }
        return Count;
    }

    static constexpr std::size_t maxLength = []() consteval {
        std::size_t m = 0;
        for (auto n : names) {
            if (n.size() > m) m = n.size();
        }
        return m;
    }();
};

} // namespace flat_path

} // namespace FlatJson
