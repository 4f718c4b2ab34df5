#pragma once

#include <iterator>
#include <string>

namespace FlatJson {

template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

template <class It, class Sent>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;

template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;


namespace io_details {
// End marker for growing outputs: never reached
struct limitless_sentinel {};

constexpr bool operator==(const std::back_insert_iterator<std::string>&,
                                 const limitless_sentinel&) noexcept {
    return false;
}
}

} // namespace FlatJson
