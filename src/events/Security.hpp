// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace uniui::events
{

/// @brief Limits enforced by validatePayload().
inline constexpr auto MaxPayloadSize = std::size_t { 10'000 };
inline constexpr auto MaxPayloadDepth = 10;
inline constexpr auto MaxStringLength = std::size_t { 1'000 };

/// @brief Value substituted for sensitive fields by redact().
inline constexpr auto RedactedMarker = std::string_view { "[REDACTED]" };

/// @brief Checks an action token before it is interpolated into a signal type.
///
/// The mouse, window, key and focus categories accept only their allowlisted actions.
/// The click, change and submit categories have fixed types and accept any action.
/// @return ok, or invalid_action for unknown actions and categories.
[[nodiscard]] auto validateEventAction(std::string_view category, std::string_view action) -> VoidResult;

/// @brief Estimated serialized size of a payload in bytes.
///
/// Strings count their byte length plus 10, numbers and booleans 20, objects and arrays the
/// sum of their elements, and anything else 10.
[[nodiscard]] auto payloadSize(nlohmann::json const& payload) -> std::size_t;

/// @brief Nesting depth of objects and arrays within a payload; a flat object has depth 0.
[[nodiscard]] auto payloadDepth(nlohmann::json const& payload) -> int;

/// @brief Checks a payload against the size, depth and string length limits, in that order.
/// @return ok, or payload_too_large, payload_too_deep, string_too_long or invalid_payload.
[[nodiscard]] auto validatePayload(nlohmann::json const& payload) -> VoidResult;

/// @brief Removes markup characters and entities from a string.
[[nodiscard]] auto sanitizeString(std::string_view value) -> std::string;

/// @brief Sanitizes every string of a payload, recursing into nested objects.
///
/// Lists are passed through unchanged.
[[nodiscard]] auto sanitize(nlohmann::json const& payload) -> nlohmann::json;

/// @brief Returns true if a field name looks like it holds a credential.
[[nodiscard]] auto shouldRedact(std::string_view key) -> bool;

/// @brief Replaces the values of credential-like top-level fields with RedactedMarker.
[[nodiscard]] auto redact(nlohmann::json const& payload) -> nlohmann::json;

/// @brief Validates, sanitizes and redacts a payload, stopping at the first failure.
[[nodiscard]] auto secure(nlohmann::json const& payload) -> Result<nlohmann::json>;

} // namespace uniui::events
