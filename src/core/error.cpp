#include "fine2d/core/error.hpp"

namespace fine2d {

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceResourceError:            return "DeviceResourceError";
        case ErrorKind::CapacityExceededButUnflushable: return "CapacityExceededButUnflushable";
        case ErrorKind::CallbackError:                  return "CallbackError";
        case ErrorKind::PlatformError:                  return "PlatformError";
        case ErrorKind::InvalidConfiguration:           return "InvalidConfiguration";
    }
    return "Unknown";
}

std::string Error::describe() const {
    return std::string(errorKindToString(kind)) + ": " + message;
}

} // namespace fine2d
