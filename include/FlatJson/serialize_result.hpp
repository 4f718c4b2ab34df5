#pragma once

#include "errors.hpp"
#include "io.hpp"

namespace FlatJson {

template <CharOutputIterator OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
public:
    using iterator_type = OutIter;
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos):
        m_error(err), m_writerError(werr), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
};

} // namespace FlatJson
