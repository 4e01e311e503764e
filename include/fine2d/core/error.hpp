#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace fine2d {

/// Failure categories surfaced by core operations
enum class ErrorKind {
    DeviceResourceError,            // GPU allocation, compile or submit failure
    CapacityExceededButUnflushable, // A single command larger than the ceiling
    CallbackError,                  // Propagated from a game callback
    PlatformError,                  // Window or surface failure
    InvalidConfiguration            // Rejected config value or malformed argument
};

const char* errorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// "Kind: message"
    std::string describe() const;
};

/**
 * @brief Value-or-error return type for fallible core calls
 *
 * Holds either a T or an Error. Core code returns Result/Status instead of
 * throwing; exceptions stay inside the Vulkan wrapper layer.
 */
template<typename T>
class [[nodiscard]] Result {
public:
    using ValueType = T;

    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool isOk() const noexcept { return std::holds_alternative<T>(data_); }
    bool isError() const noexcept { return !isOk(); }
    explicit operator bool() const noexcept { return isOk(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const Error& error() const& { return std::get<Error>(data_); }
    Error&& error() && { return std::get<Error>(std::move(data_)); }

    T valueOr(T fallback) const& {
        return isOk() ? std::get<T>(data_) : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>> {
        if (isOk()) {
            return f(std::get<T>(data_));
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool isOk() const noexcept { return !error_.has_value(); }
    bool isError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return isOk(); }

    const Error& error() const& { return *error_; }
    Error&& error() && { return std::move(*error_); }

private:
    std::optional<Error> error_;
};

using Status = Result<void>;

inline Status ok() { return Status{}; }

inline Error makeError(ErrorKind kind, std::string message) {
    return Error(kind, std::move(message));
}

/**
 * @brief Thrown by the Vulkan wrapper layer when a vk* call fails
 *
 * The renderer converts it into ErrorKind::DeviceResourceError at the
 * flush boundary so it never reaches game code as an exception.
 */
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what, int32_t code = 0)
        : std::runtime_error(what), code_(code) {}

    /// Raw VkResult value, 0 when not applicable
    int32_t code() const { return code_; }

private:
    int32_t code_;
};

} // namespace fine2d
