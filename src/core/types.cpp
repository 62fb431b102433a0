#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "ok";
        case ErrorKind::InvalidInput: return "invalid input";
        case ErrorKind::ConfigError:  return "config error";
        case ErrorKind::IoError:      return "io error";
    }
    return "unknown";
}

std::string ValidationReport::error_text() const {
    std::string out;
    for (size_t i = 0; i < errors.size(); i++) {
        if (i > 0) out += "\n";
        out += errors[i];
    }
    return out;
}
