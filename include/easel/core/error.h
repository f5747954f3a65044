#pragma once
#include <stdexcept>
#include <string>

namespace easel::core {

enum class ErrorKind {
    InvalidGeometry,        // non-finite or negative rect / path coordinates
    InvalidSize,            // pixmap or target dimensions out of range
    OutOfBounds,            // pixel buffer shorter than its declared size
    InvalidGradient,        // empty stop list or non-finite gradient input
    BuilderFinished,        // path builder used after finish()
    NonInvertibleTransform,
};

const char* error_kind_name(ErrorKind kind);

// Typed failure raised by fallible constructors. The message names the
// offending rect, size or buffer.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace easel::core
