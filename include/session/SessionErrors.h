#ifndef SESSIONERRORS_H
#define SESSIONERRORS_H

#include <stdexcept>
#include <string>

namespace SnapOverlay {

// Thrown by mutating CaptureSession calls made after dispose()
class SessionDisposedError : public std::logic_error
{
public:
    explicit SessionDisposedError(const std::string &operation)
        : std::logic_error("CaptureSession used after dispose: " + operation)
    {
    }
};

// Thrown by WindowBuilder::build() when required configuration is missing
class WindowBuilderError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace SnapOverlay

#endif // SESSIONERRORS_H
