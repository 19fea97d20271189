#pragma once

#include <stdexcept>
#include <string>

namespace CitySeq {

enum class ErrorKind {
    MalformedJson,
    UnsupportedDocument,
    MissingObject,
    InvalidValue,
    UnsupportedOperation,
    Io
};

const char* toString(ErrorKind kind);

/**
 * Error raised by the document model and the split/merge/filter engines.
 *
 * The kind tells the caller whether the offending input can be skipped
 * (a single bad line in a stream) or whether the whole run must stop.
 */
class SeqError : public std::runtime_error {
public:
    SeqError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

    // Message without the kind prefix.
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

}
