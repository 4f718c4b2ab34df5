#pragma once

#ifndef FLATJSON_USE_FAST_FLOAT
#define FLATJSON_USE_FAST_FLOAT 1  // desktop default
#endif

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

#if FLATJSON_USE_FAST_FLOAT
#include <fast_double_parser.h>
#endif

namespace FlatJson::fp_to_str_detail {

#ifndef FLATJSON_NUMBER_BUF_SIZE
constexpr std::size_t NumberBufSize = 64;
#else
constexpr std::size_t NumberBufSize = FLATJSON_NUMBER_BUF_SIZE;
#endif

// buf is a validated, null-terminated JSON number token
inline bool parse_number_to_double(const char * buf, double& out) {
#if FLATJSON_USE_FAST_FLOAT
    const char* endp = fast_double_parser::parse_number(buf, &out);
    return endp != nullptr;
#else
    char* endp = nullptr;
    errno = 0;
    double x = std::strtod(buf, &endp);
    if (endp == buf) {
        return false;
    }
    out = x;
    return true;
#endif
}

// Format double into [first, last), return pointer past last char.
// decimals is the number of significant digits, clamped to what a double carries.
inline char* format_double_to_chars(char* first, char* last, double value, std::size_t decimals) {
    if (first == last) {
        return first;
    }

    int prec;
    if (decimals == 0) {
        prec = 1;
    } else if (decimals > 17) {
        prec = 17;
    } else {
        prec = static_cast<int>(decimals);
    }

    std::size_t bufSize = static_cast<std::size_t>(last - first);

    int n = std::snprintf(first,
                          bufSize,
                          "%.*g",
                          prec,
                          value);

    if (n <= 0) {
        *first++ = '0';
        return first;
    }

    // snprintf reports the untruncated length
    std::size_t written = static_cast<std::size_t>(n);
    if (written >= bufSize) {
        written = bufSize - 1;
    }

    return first + written;
}

} // namespace FlatJson::fp_to_str_detail
