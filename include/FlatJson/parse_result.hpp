#pragma once

#include <string_view>

#include "io.hpp"
#include "path.hpp"
#include "errors.hpp"

namespace FlatJson {


template <class InpIter, class ReaderError>
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    ReaderError m_readerError{};
    InpIter m_pos;
    path::Path currentPath;

public:
    using iterator_type = InpIter;
    constexpr ParseResult(ParseError err, ReaderError rerr, InpIter pos, const path::Path & errorP):
        m_error(err), m_readerError(rerr), m_pos(pos), currentPath(errorP)
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    constexpr InpIter pos() const {
        return m_pos;
    }

    constexpr ParseError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
    // Path of the value that failed; keys of flat_path chains included
    constexpr const path::Path & errorPath() const {
        return currentPath;
    }
};

} // namespace FlatJson
