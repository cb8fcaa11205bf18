#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace scout::listeners {

/// @brief Base class for every failure raised by the discovery layer.
class ListenerError : public std::runtime_error {
public:
    explicit ListenerError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief Raised by a Service accessor when the backend cannot provide the
/// requested attribute.
///
/// This is the only standardized accessor failure. Backends may add context
/// to the message; callers must test for the type, never for the text.
class NotSupportedError : public ListenerError {
public:
    static constexpr const char* DEFAULT_MESSAGE =
        "AD: variable not supported by listener";

    NotSupportedError() : ListenerError(DEFAULT_MESSAGE) {}
    explicit NotSupportedError(const std::string& context)
        : ListenerError(std::string(DEFAULT_MESSAGE) + ": " + context) {}
};

/// @brief Raised when a listener is driven through an invalid lifecycle
/// transition, such as a second call to listen().
class ListenerStateError : public ListenerError {
public:
    explicit ListenerStateError(const std::string& what)
        : ListenerError(what) {}
};

/// @brief True if @p error holds a NotSupportedError (or a subclass).
bool is_not_supported(const std::exception_ptr& error) noexcept;

}  // namespace scout::listeners
