// SPDX-License-Identifier: Apache-2.0
#include <events/PlatformEvents.hpp>
#include <events/Security.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace uniui::events
{

namespace
{
    constexpr auto TerminalEvents =
        std::array<std::string_view, 7> { "click", "change", "submit", "key_press", "mouse", "focus", "blur" };

    constexpr auto DesktopEvents = std::array<std::string_view, 8> {
        "click", "change", "submit", "key_press", "mouse", "focus", "blur", "window",
    };

    constexpr auto WebEvents = std::array<std::string_view, 8> {
        "click", "change", "submit", "key_press", "key_release", "focus", "blur", "hook",
    };

    auto stringField(nlohmann::json const& data, char const* key) -> std::optional<std::string>
    {
        if (data.is_object() && data.contains(key) && data[key].is_string())
            return data[key].get<std::string>();
        return std::nullopt;
    }

    /// Builds the signal type for an event, validating interpolated tokens first.
    auto signalTypeFor(std::string_view eventType, nlohmann::json const& data) -> Result<std::string>
    {
        if (eventType == "key_press")
            return std::format("{}.key.pressed", SignalNamespace);
        if (eventType == "key_release")
            return std::format("{}.key.released", SignalNamespace);

        if (eventType == "mouse" || eventType == "window")
        {
            auto const action = stringField(data, "action");
            if (!action)
                return makeError(ErrorCode::InvalidAction, std::format("{} event without an action", eventType));
            if (auto valid = validateEventAction(eventType, *action); !valid)
                return std::unexpected(valid.error());
            return std::format("{}.{}.{}", SignalNamespace, eventType, *action);
        }

        if (eventType == "hook")
        {
            auto const hook = stringField(data, "hook_name");
            if (!hook || std::ranges::find(AllowedHooks, *hook) == AllowedHooks.end())
            {
                log::debug("Rejected web hook '{}'", hook.value_or(""));
                return makeError(ErrorCode::InvalidHook, std::format("Invalid hook: {}", hook.value_or("")));
            }
            return std::format("{}.web.{}", SignalNamespace, *hook);
        }

        return signalType(eventType);
    }

    auto toJsonList(std::vector<std::string> const& values) -> nlohmann::json
    {
        auto list = nlohmann::json::array();
        for (auto const& value: values)
            list.push_back(value);
        return list;
    }

    auto window(std::string_view action, nlohmann::json extra, EventOptions const& options) -> Result<Signal>
    {
        extra["action"] = action;
        return toSignal(Platform::Desktop, "window", extra, options);
    }

    auto hook(std::string_view hookName, nlohmann::json data, EventOptions const& options) -> Result<Signal>
    {
        return toSignal(Platform::Web, "hook", { { "hook_name", hookName }, { "data", std::move(data) } }, options);
    }
} // namespace

auto eventTypes(Platform platform) -> std::span<std::string_view const>
{
    switch (platform)
    {
        case Platform::Terminal: return TerminalEvents;
        case Platform::Desktop: return DesktopEvents;
        case Platform::Web: return WebEvents;
    }
    return {};
}

auto defaultSource(Platform platform) -> std::string
{
    return std::format("{}/{}", DefaultSource, platformToString(platform));
}

auto toSignal(Platform platform, std::string_view eventType, nlohmann::json const& data, EventOptions const& options)
    -> Result<Signal>
{
    auto const supported = eventTypes(platform);
    if (std::ranges::find(supported, eventType) == supported.end())
    {
        return makeError(ErrorCode::InvalidEvent,
                         std::format("Unsupported {} event: {}", platformToString(platform), eventType));
    }

    auto type = signalTypeFor(eventType, data);
    if (!type)
        return std::unexpected(type.error());

    if (auto valid = validatePayload(data); !valid)
        return std::unexpected(valid.error());

    auto signalData = data;
    signalData["platform"] = platformToString(platform);

    return createSignal(*type,
                        std::move(signalData),
                        SignalOptions {
                            .source = options.source.value_or(defaultSource(platform)),
                            .subject = options.subject,
                            .id = std::nullopt,
                        });
}

auto buttonClick(Platform platform, std::string_view widgetId, nlohmann::json action, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(platform, "click", { { "widget_id", widgetId }, { "action", std::move(action) } }, options);
}

auto inputChange(Platform platform, std::string_view widgetId, std::string_view value, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(platform, "change", { { "widget_id", widgetId }, { "value", value } }, options);
}

auto formSubmit(Platform platform, std::string_view formId, nlohmann::json const& data, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(platform, "submit", { { "form_id", formId }, { "data", redact(data) } }, options);
}

auto keyPress(Platform platform,
              std::string_view key,
              std::vector<std::string> const& modifiers,
              EventOptions const& options) -> Result<Signal>
{
    return toSignal(platform, "key_press", { { "key", key }, { "modifiers", toJsonList(modifiers) } }, options);
}

auto keyRelease(Platform platform,
                std::string_view key,
                std::vector<std::string> const& modifiers,
                EventOptions const& options) -> Result<Signal>
{
    return toSignal(platform, "key_release", { { "key", key }, { "modifiers", toJsonList(modifiers) } }, options);
}

auto mouseClick(
    Platform platform, std::string_view widgetId, std::string_view button, int x, int y, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(
        platform,
        "mouse",
        { { "widget_id", widgetId }, { "action", "click" }, { "button", button }, { "x", x }, { "y", y } },
        options);
}

auto mouseDoubleClick(
    Platform platform, std::string_view widgetId, std::string_view button, int x, int y, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(
        platform,
        "mouse",
        { { "widget_id", widgetId }, { "action", "double_click" }, { "button", button }, { "x", x }, { "y", y } },
        options);
}

auto mouseMove(Platform platform, int x, int y, std::vector<std::string> const& buttons, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(
        platform, "mouse", { { "action", "move" }, { "x", x }, { "y", y }, { "buttons", toJsonList(buttons) } }, options);
}

auto mouseScroll(Platform platform, int x, int y, std::string_view direction, int delta, EventOptions const& options)
    -> Result<Signal>
{
    return toSignal(platform,
                    "mouse",
                    { { "action", "scroll" }, { "x", x }, { "y", y }, { "direction", direction }, { "delta", delta } },
                    options);
}

auto windowResize(int width, int height, EventOptions const& options) -> Result<Signal>
{
    return window("resize", { { "width", width }, { "height", height } }, options);
}

auto windowMove(int x, int y, EventOptions const& options) -> Result<Signal>
{
    return window("move", { { "x", x }, { "y", y } }, options);
}

auto windowClose(EventOptions const& options) -> Result<Signal>
{
    return window("close", nlohmann::json::object(), options);
}

auto windowMinimize(EventOptions const& options) -> Result<Signal>
{
    return window("minimize", nlohmann::json::object(), options);
}

auto windowMaximize(EventOptions const& options) -> Result<Signal>
{
    return window("maximize", nlohmann::json::object(), options);
}

auto windowRestore(EventOptions const& options) -> Result<Signal>
{
    return window("restore", nlohmann::json::object(), options);
}

auto windowFocus(EventOptions const& options) -> Result<Signal>
{
    return window("focus", nlohmann::json::object(), options);
}

auto windowBlur(EventOptions const& options) -> Result<Signal>
{
    return window("blur", nlohmann::json::object(), options);
}

auto hookEvent(std::string_view hookName, nlohmann::json data, EventOptions const& options) -> Result<Signal>
{
    return hook(hookName, std::move(data), options);
}

auto wsConnecting(EventOptions const& options) -> Result<Signal>
{
    return hook("connecting", nlohmann::json::object(), options);
}

auto wsConnected(EventOptions const& options) -> Result<Signal>
{
    return hook("connected", nlohmann::json::object(), options);
}

auto wsDisconnected(EventOptions const& options) -> Result<Signal>
{
    return hook("disconnected", nlohmann::json::object(), options);
}

auto wsReconnecting(int attempt, int delayMs, EventOptions const& options) -> Result<Signal>
{
    return hook("reconnecting", { { "attempt", attempt }, { "delay_ms", delayMs } }, options);
}

auto reconnectDelay(int attempt) -> std::optional<int>
{
    if (attempt < 1 || attempt > MaxReconnectAttempts)
        return std::nullopt;

    auto delay = BaseReconnectDelayMs;
    for (auto i = 1; i < attempt && delay < MaxReconnectDelayMs; ++i)
        delay *= 2;
    return std::min(delay, MaxReconnectDelayMs);
}

} // namespace uniui::events
