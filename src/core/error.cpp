#include "error.h"

namespace CitySeq {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedJson: return "malformed JSON";
        case ErrorKind::UnsupportedDocument: return "unsupported document";
        case ErrorKind::MissingObject: return "missing CityObject";
        case ErrorKind::InvalidValue: return "invalid value";
        case ErrorKind::UnsupportedOperation: return "unsupported operation";
        case ErrorKind::Io: return "I/O error";
    }
    return "unknown error";
}

SeqError::SeqError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind), detail_(message) {
}

}
