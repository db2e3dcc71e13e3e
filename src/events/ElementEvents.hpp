// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <iur/Element.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace uniui::events
{

/// @brief A handler invocation produced from an element event.
///
/// @c name is the handler's signal name, or "mfa_call" for remote calls, in which case
/// the payload holds `{module, function, args, context}`.
struct HandlerSignal
{
    std::string name;
    nlohmann::json payload = nlohmann::json::object();

    auto operator==(HandlerSignal const&) const -> bool = default;
};

/// @brief Returns the handler an element declares for an event (click, change, submit, focus, blur).
[[nodiscard]] auto getHandler(iur::Element const& element, std::string_view event) -> std::optional<iur::Handler>;

/// @brief Builds the handler invocation for an element event.
///
/// The payload gets the element id; a named handler's own payload is merged over it.
/// @return The signal, no_handler if the element has none for @p event, or
///         missing_element_id if the element has no id.
[[nodiscard]] auto buildHandlerSignal(iur::Element const& element,
                                      std::string_view event,
                                      nlohmann::json const& payload = nlohmann::json::object())
    -> Result<HandlerSignal>;

/// @brief Adds `element_id: "unknown"` and a millisecond `timestamp` where missing.
[[nodiscard]] auto normalizePayload(nlohmann::json payload) -> nlohmann::json;

/// @brief Checks that a handler signal has a name and an object payload with an element id.
[[nodiscard]] auto validateSignal(HandlerSignal const& signal) -> VoidResult;

/// @brief Extracts coordinates, modifier flags and the timestamp from a raw platform event.
///
/// Aliases are normalized: `control` to `ctrl`, `modifier_alt` to `alt`, `modifier_shift`
/// to `shift`, `modifier_meta` to `meta`, and `time`, `timestamp_ms` or `ms` to `timestamp`.
[[nodiscard]] auto extractMetadata(nlohmann::json const& platformEvent) -> nlohmann::json;

} // namespace uniui::events
