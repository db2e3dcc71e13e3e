// SPDX-License-Identifier: Apache-2.0
#include <events/Signal.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <mutex>
#include <random>
#include <ranges>

namespace uniui::events
{

namespace
{
    auto validSegment(std::string_view segment) -> bool
    {
        if (segment.empty() || segment.front() < 'a' || segment.front() > 'z')
            return false;
        return std::ranges::all_of(segment, [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        });
    }
} // namespace

auto signalType(std::string_view name) -> Result<std::string>
{
    auto qualified = [](std::string_view suffix) {
        return std::format("{}.{}", SignalNamespace, suffix);
    };

    if (name == "click")
        return qualified("button.clicked");
    if (name == "change")
        return qualified("input.changed");
    if (name == "submit")
        return qualified("form.submitted");
    if (name == "focus")
        return qualified("element.focused");
    if (name == "blur")
        return qualified("element.blurred");
    if (name == "select")
        return qualified("item.selected");

    return makeError(ErrorCode::UnknownSignal, std::format("Unknown signal: {}", name));
}

auto validType(std::string_view type) -> VoidResult
{
    auto segments = std::size_t { 0 };
    for (auto const segment: std::views::split(type, '.'))
    {
        if (!validSegment(std::string_view(segment.begin(), segment.end())))
            return makeError(ErrorCode::InvalidTypeFormat, std::format("Invalid signal type: {}", type));
        ++segments;
    }

    if (segments < 3)
        return makeError(ErrorCode::InvalidTypeFormat, std::format("Invalid signal type: {}", type));
    return {};
}

auto generateUuid() -> std::string
{
    static auto mutex = std::mutex {};
    static auto engine = std::mt19937_64 { std::random_device {}() };

    auto const lock = std::lock_guard { mutex };
    auto const high = engine();
    auto const low = engine();

    auto bytes = std::array<std::uint8_t, 16> {};
    for (auto i = 0; i < 8; ++i)
    {
        bytes[i] = static_cast<std::uint8_t>(high >> (i * 8));
        bytes[8 + i] = static_cast<std::uint8_t>(low >> (i * 8));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    auto result = std::string {};
    for (auto i = 0u; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            result += '-';
        result += std::format("{:02x}", bytes[i]);
    }
    return result;
}

auto createSignal(std::string_view typeOrName, nlohmann::json data, SignalOptions options) -> Result<Signal>
{
    auto type = std::string(typeOrName);
    if (typeOrName.find('.') == std::string_view::npos)
    {
        auto resolved = signalType(typeOrName);
        if (!resolved)
            return std::unexpected(resolved.error());
        type = std::move(*resolved);
    }

    if (auto valid = validType(type); !valid)
        return std::unexpected(valid.error());

    return Signal {
        .type = std::move(type),
        .data = data.is_null() ? nlohmann::json::object() : std::move(data),
        .source = options.source.value_or(std::string(DefaultSource)),
        .id = options.id ? std::move(*options.id) : generateUuid(),
        .subject = std::move(options.subject),
    };
}

auto signalToJson(Signal const& signal) -> nlohmann::json
{
    auto result = nlohmann::json {
        { "type", signal.type },
        { "data", signal.data },
        { "source", signal.source },
        { "id", signal.id },
    };
    if (signal.subject)
        result["subject"] = *signal.subject;
    return result;
}

} // namespace uniui::events
