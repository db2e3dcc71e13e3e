// SPDX-License-Identifier: Apache-2.0
#include <events/Security.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace uniui::events
{

namespace
{
    constexpr auto MouseActions = std::array<std::string_view, 8> {
        "click", "double_click", "right_click", "middle_click", "scroll", "move", "down", "up",
    };

    constexpr auto WindowActions = std::array<std::string_view, 10> {
        "move", "resize", "close", "minimize", "maximize", "restore", "focus", "blur", "show", "hide",
    };

    constexpr auto KeyActions = std::array<std::string_view, 4> { "press", "release", "down", "up" };

    constexpr auto FocusActions = std::array<std::string_view, 2> { "focus", "blur" };

    constexpr auto SensitivePatterns = std::array<std::string_view, 8> {
        "password", "passwd", "pwd", "secret", "token", "api_key", "apikey", "passphrase",
    };

    template <std::size_t N>
    auto contains(std::array<std::string_view, N> const& list, std::string_view value) -> bool
    {
        return std::ranges::find(list, value) != list.end();
    }

    /// Number of UTF-8 code points in @p text.
    auto codePointCount(std::string_view text) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(
            text, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
    }

    auto isContainer(nlohmann::json const& value) -> bool
    {
        return value.is_object() || value.is_array();
    }

    auto checkStringLengths(nlohmann::json const& payload, std::string const& path) -> VoidResult
    {
        if (payload.is_string())
        {
            if (codePointCount(payload.get_ref<std::string const&>()) > MaxStringLength)
                return makeError(ErrorCode::StringTooLong,
                                 std::format("Field '{}' exceeds {} characters", path, MaxStringLength));
            return {};
        }

        if (!isContainer(payload))
            return {};

        for (auto const& [key, value]: payload.items())
        {
            if (auto result = checkStringLengths(value, path.empty() ? key : std::format("{}.{}", path, key)); !result)
                return result;
        }
        return {};
    }

    auto replaceAll(std::string text, std::string_view from) -> std::string
    {
        auto pos = std::size_t { 0 };
        while ((pos = text.find(from, pos)) != std::string::npos)
            text.erase(pos, from.size());
        return text;
    }
} // namespace

auto validateEventAction(std::string_view category, std::string_view action) -> VoidResult
{
    auto const valid = [&] {
        if (category == "mouse")
            return contains(MouseActions, action);
        if (category == "window")
            return contains(WindowActions, action);
        if (category == "key")
            return contains(KeyActions, action);
        if (category == "focus")
            return contains(FocusActions, action);
        return category == "click" || category == "change" || category == "submit";
    }();

    if (!valid)
    {
        log::debug("Rejected {} action '{}'", category, action);
        return makeError(ErrorCode::InvalidAction, std::format("Invalid {} action: {}", category, action));
    }
    return {};
}

auto payloadSize(nlohmann::json const& payload) -> std::size_t
{
    if (payload.is_string())
        return payload.get_ref<std::string const&>().size() + 10;
    if (payload.is_number() || payload.is_boolean())
        return 20;
    if (!isContainer(payload))
        return 10;

    auto size = std::size_t { 0 };
    for (auto const& value: payload)
        size += payloadSize(value);
    return size;
}

auto payloadDepth(nlohmann::json const& payload) -> int
{
    auto depth = 0;
    if (!isContainer(payload))
        return depth;

    for (auto const& value: payload)
    {
        if (isContainer(value))
            depth = std::max(depth, payloadDepth(value) + 1);
    }
    return depth;
}

auto validatePayload(nlohmann::json const& payload) -> VoidResult
{
    if (!payload.is_object())
        return makeError(ErrorCode::InvalidPayload, "Payload must be an object");

    if (auto const size = payloadSize(payload); size > MaxPayloadSize)
    {
        log::debug("Rejected payload of {} bytes", size);
        return makeError(ErrorCode::PayloadTooLarge, std::format("Payload size {} exceeds {}", size, MaxPayloadSize));
    }

    if (auto const depth = payloadDepth(payload); depth > MaxPayloadDepth)
    {
        log::debug("Rejected payload nested {} levels deep", depth);
        return makeError(ErrorCode::PayloadTooDeep, std::format("Payload depth {} exceeds {}", depth, MaxPayloadDepth));
    }

    return checkStringLengths(payload, {});
}

auto sanitizeString(std::string_view value) -> std::string
{
    auto result = std::string(value);
    for (auto const token: { "&lt;", "&gt;", "&amp;", "<", ">", "&" })
        result = replaceAll(std::move(result), token);
    return result;
}

auto sanitize(nlohmann::json const& payload) -> nlohmann::json
{
    if (payload.is_string())
        return sanitizeString(payload.get_ref<std::string const&>());

    if (payload.is_object())
    {
        auto result = nlohmann::json::object();
        for (auto const& [key, value]: payload.items())
            result[key] = sanitize(value);
        return result;
    }

    return payload;
}

auto shouldRedact(std::string_view key) -> bool
{
    auto lower = std::string(key);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::any_of(SensitivePatterns,
                               [&](std::string_view pattern) { return lower.find(pattern) != std::string::npos; });
}

auto redact(nlohmann::json const& payload) -> nlohmann::json
{
    if (!payload.is_object())
        return payload;

    auto result = payload;
    for (auto& [key, value]: result.items())
    {
        if (shouldRedact(key))
            value = std::string(RedactedMarker);
    }
    return result;
}

auto secure(nlohmann::json const& payload) -> Result<nlohmann::json>
{
    if (auto valid = validatePayload(payload); !valid)
        return std::unexpected(valid.error());
    return redact(sanitize(payload));
}

} // namespace uniui::events
