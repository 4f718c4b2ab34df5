#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "serialize_result.hpp"

namespace FlatJson {

namespace error_formatting_detail {

inline constexpr const char* ws = " \t\n\r\f\v";

inline std::string& rtrim(std::string& s, const char* t = ws)
{
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string& ltrim(std::string& s, const char* t = ws)
{
    s.erase(0, s.find_first_not_of(t));
    return s;
}

inline std::string& trim(std::string& s, const char* t = ws)
{
    return ltrim(rtrim(s, t), t);
}

/// "$.a.b[3].c"
inline std::string json_path_string(const path::Path & p) {
    std::string jsonPath = "$";
    for(std::size_t i = 0; i < p.size(); i ++) {
        if(p[i].is_index()) {
            jsonPath += "[" + std::to_string(p[i].array_index) + "]";
        } else {
            jsonPath += "." + std::string(p[i].field_name);
        }
    }
    if(p.truncated > 0) {
        jsonPath += std::format("...(+{})", p.truncated);
    }
    return jsonPath;
}

} // namespace error_formatting_detail


/// Renders a failed parse as "When parsing $.a.b, parsing error 'X': '...before|after...'".
/// The input window is shown for contiguous char inputs only.
template <class C, class InpIter, class ReaderError, class DataIter>
std::string ParseResultToString(const ParseResult<InpIter, ReaderError> & res, DataIter inp, const DataIter end, std::size_t window = 40) {
    if(res) {
        return "OK";
    }
    const std::string jsonPath = error_formatting_detail::json_path_string(res.errorPath());

    std::string fragment;
    if constexpr(std::is_convertible_v<InpIter, const char*> && std::is_convertible_v<DataIter, const char*>) {
        const char* begin = inp;
        const std::size_t tot = static_cast<std::size_t>(end - inp);
        std::size_t pos = static_cast<std::size_t>(static_cast<const char*>(res.pos()) - begin);
        if(pos > tot) {
            pos = tot;
        }
        const std::size_t from = pos > window ? pos - window : 0;
        const std::size_t to = pos + window < tot ? pos + window : tot;
        std::string before(begin + from, begin + pos);
        std::string after(begin + pos, begin + to);
        error_formatting_detail::trim(before);
        error_formatting_detail::trim(after);
        fragment = std::format(": '...{}|{}...'", before, after);
    }

    if(res.error() == ParseError::READER_ERROR) {
        return std::format("When parsing {}, reader error '{}'{}", jsonPath, error_to_string(res.readerError()), fragment);
    }
    return std::format("When parsing {}, parsing error '{}'{}", jsonPath, error_to_string(res.error()), fragment);
}

template <class C, class InpIter, class ReaderError>
std::string ParseResultToString(const ParseResult<InpIter, ReaderError> & res, std::string_view input, std::size_t window = 40) {
    return ParseResultToString<C>(res, input.data(), input.data() + input.size(), window);
}

template <class OutIter, class WriterError>
std::string SerializeResultToString(const SerializeResult<OutIter, WriterError> & res) {
    if(res) {
        return "OK";
    }
    return std::format("Serialization error '{}', writer error '{}'", error_to_string(res.error()), error_to_string(res.writerError()));
}

} // namespace FlatJson
