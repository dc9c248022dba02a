#include "errors.hpp"
#include <sstream>

namespace weft {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::malformed_encoding:
        return "MalformedEncoding";
    case ErrorKind::structural:
        return "StructuralError";
    case ErrorKind::type_mismatch:
        return "TypeMismatch";
    case ErrorKind::predecessor_count:
        return "PredecessorCountError";
    case ErrorKind::unresolved_signature:
        return "UnresolvedSignature";
    }
    return "UnknownError";
}

std::string ValidationError::to_string() const {
    std::ostringstream out;
    out << error_kind_name(kind);
    if (offset != unknown_offset)
        out << " at offset " << offset;
    if (funclet)
        out << " in funclet " << *funclet;
    out << ": " << message;
    if (expected && actual)
        out << " (expected " << weft::to_string(*expected) << ", got "
            << weft::to_string(*actual) << ")";
    return out.str();
}

validation_error::validation_error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), info{kind, message} {}

validation_error::validation_error(ErrorKind kind, const std::string &message,
                                   valtype_vector expected,
                                   valtype_vector actual)
    : std::runtime_error(message),
      info{kind, message, ValidationError::unknown_offset, std::nullopt,
           std::move(expected), std::move(actual)} {}

validation_error &validation_error::in_funclet(uint32_t funclet) {
    info.funclet = funclet;
    return *this;
}

} // namespace weft
