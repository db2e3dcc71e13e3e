// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace uniui
{

/// @brief Error codes for categorizing failures across the compiler and its renderers.
enum class ErrorCode
{
    Unknown,
    InvalidAction,
    PayloadTooLarge,
    PayloadTooDeep,
    StringTooLong,
    InvalidPayload,
    InvalidHook,
    InvalidTypeFormat,
    UnknownSignal,
    MissingElementId,
    InvalidPlatform,
    InvalidTarget,
    DispatchFailed,
    Timeout,
    RenderError,
    StyleNotFound,
    MissingLabel,
    MissingContent,
    UnknownType,
    InvalidEvent,
    NoHandler,
    NotFound,
    ParseError,
    ConfigError,
    IoError,
};

/// @brief Returns the snake_case name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidAction: return "invalid_action";
        case ErrorCode::PayloadTooLarge: return "payload_too_large";
        case ErrorCode::PayloadTooDeep: return "payload_too_deep";
        case ErrorCode::StringTooLong: return "string_too_long";
        case ErrorCode::InvalidPayload: return "invalid_payload";
        case ErrorCode::InvalidHook: return "invalid_hook";
        case ErrorCode::InvalidTypeFormat: return "invalid_type_format";
        case ErrorCode::UnknownSignal: return "unknown_signal";
        case ErrorCode::MissingElementId: return "missing_element_id";
        case ErrorCode::InvalidPlatform: return "invalid_platform";
        case ErrorCode::InvalidTarget: return "invalid_target";
        case ErrorCode::DispatchFailed: return "dispatch_failed";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::RenderError: return "render_error";
        case ErrorCode::StyleNotFound: return "style_not_found";
        case ErrorCode::MissingLabel: return "missing_label";
        case ErrorCode::MissingContent: return "missing_content";
        case ErrorCode::UnknownType: return "unknown_type";
        case ErrorCode::InvalidEvent: return "invalid_event";
        case ErrorCode::NoHandler: return "no_handler";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::ParseError: return "parse_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::IoError: return "io_error";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// Aggregate failures (for example a broadcast that failed on some targets) carry the
/// individual failures in @c causes.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::vector<Error> causes;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), {} });
}

/// @brief Fatal error raised for a broken UI definition.
///
/// Circular style inheritance, duplicate element ids and dangling label references cannot
/// be rendered safely, so they abort the build instead of being returned as a Result.
class ConfigurationError: public std::runtime_error
{
  public:
    ConfigurationError(std::string message, std::vector<std::string> chain):
        std::runtime_error(std::move(message)), _chain(std::move(chain))
    {
    }

    /// @brief The names or ids involved in the failure, in the order they were visited.
    [[nodiscard]] auto chain() const noexcept -> std::vector<std::string> const& { return _chain; }

  private:
    std::vector<std::string> _chain;
};

} // namespace uniui

template <>
struct std::formatter<uniui::Error>: std::formatter<std::string>
{
    auto format(const uniui::Error& error, auto& ctx) const
    {
        auto text = std::format("[{}] {}", uniui::errorCodeName(error.code), error.message);
        for (auto const& cause: error.causes)
            text += std::format("; [{}] {}", uniui::errorCodeName(cause.code), cause.message);
        return std::formatter<std::string>::format(text, ctx);
    }
};
