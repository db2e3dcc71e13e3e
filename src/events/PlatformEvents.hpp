// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <events/Signal.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uniui::events
{

/// @brief Web hook names that may appear in a `unified.web.<hook>` signal type.
inline constexpr auto AllowedHooks = std::array<std::string_view, 11> {
    "scroll_handler", "resize_handler",      "focus_handler", "blur_handler",
    "scroll_tracker", "resize_observer",     "visibility_observer",
    "connecting",     "connected",           "disconnected",  "reconnecting",
};

/// @brief WebSocket reconnection back-off parameters.
inline constexpr auto BaseReconnectDelayMs = 1'000;
inline constexpr auto MaxReconnectDelayMs = 32'000;
inline constexpr auto MaxReconnectAttempts = 10;

/// @brief Per-call overrides for platform event signals.
struct EventOptions
{
    std::optional<std::string> source; ///< Defaults to "/unified_ui/<platform>".
    std::optional<std::string> subject;
};

/// @brief Raw event types understood on a platform.
[[nodiscard]] auto eventTypes(Platform platform) -> std::span<std::string_view const>;

/// @brief Default signal source of a platform, e.g. "/unified_ui/desktop".
[[nodiscard]] auto defaultSource(Platform platform) -> std::string;

/// @brief Converts a raw platform event into a validated signal.
///
/// Mouse and window events take their action from `data.action`, web hooks their name
/// from `data.hook_name`; both are checked against allowlists before the signal type is
/// built. The payload is validated and `platform` is merged into the signal data.
/// @return The signal, or invalid_event, invalid_action, invalid_hook or a payload error.
[[nodiscard]] auto toSignal(Platform platform,
                            std::string_view eventType,
                            nlohmann::json const& data,
                            EventOptions const& options = {}) -> Result<Signal>;

// {{{ Event builders
[[nodiscard]] auto buttonClick(Platform platform,
                               std::string_view widgetId,
                               nlohmann::json action,
                               EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto inputChange(Platform platform,
                               std::string_view widgetId,
                               std::string_view value,
                               EventOptions const& options = {}) -> Result<Signal>;

/// @brief Form submission; credential-like fields of @p data are redacted first.
[[nodiscard]] auto formSubmit(Platform platform,
                              std::string_view formId,
                              nlohmann::json const& data,
                              EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto keyPress(Platform platform,
                            std::string_view key,
                            std::vector<std::string> const& modifiers = {},
                            EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto keyRelease(Platform platform,
                              std::string_view key,
                              std::vector<std::string> const& modifiers = {},
                              EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto mouseClick(Platform platform,
                              std::string_view widgetId,
                              std::string_view button = "left",
                              int x = 0,
                              int y = 0,
                              EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto mouseDoubleClick(Platform platform,
                                    std::string_view widgetId,
                                    std::string_view button = "left",
                                    int x = 0,
                                    int y = 0,
                                    EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto mouseMove(Platform platform,
                             int x,
                             int y,
                             std::vector<std::string> const& buttons = {},
                             EventOptions const& options = {}) -> Result<Signal>;

[[nodiscard]] auto mouseScroll(Platform platform,
                               int x,
                               int y,
                               std::string_view direction = "down",
                               int delta = 1,
                               EventOptions const& options = {}) -> Result<Signal>;

// Window events are desktop only.
[[nodiscard]] auto windowResize(int width, int height, EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowMove(int x, int y, EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowClose(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowMinimize(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowMaximize(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowRestore(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowFocus(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto windowBlur(EventOptions const& options = {}) -> Result<Signal>;

// Hook and WebSocket events are web only.
[[nodiscard]] auto hookEvent(std::string_view hookName,
                             nlohmann::json data,
                             EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto wsConnecting(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto wsConnected(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto wsDisconnected(EventOptions const& options = {}) -> Result<Signal>;
[[nodiscard]] auto wsReconnecting(int attempt, int delayMs, EventOptions const& options = {}) -> Result<Signal>;
// }}}

/// @brief Exponential back-off delay before reconnection attempt @p attempt (1-based).
/// @return The delay capped at MaxReconnectDelayMs, or std::nullopt once attempts are exhausted.
[[nodiscard]] auto reconnectDelay(int attempt) -> std::optional<int>;

} // namespace uniui::events
