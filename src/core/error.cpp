#include <easel/core/error.h>

namespace easel::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidGeometry:        return "invalid-geometry";
        case ErrorKind::InvalidSize:            return "invalid-size";
        case ErrorKind::OutOfBounds:            return "out-of-bounds";
        case ErrorKind::InvalidGradient:        return "invalid-gradient";
        case ErrorKind::BuilderFinished:        return "builder-finished";
        case ErrorKind::NonInvertibleTransform: return "non-invertible-transform";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
      kind_(kind) {}

} // namespace easel::core
