// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace uniui
{

/// @brief Output platform a UI tree can be rendered on.
enum class Platform
{
    Terminal,
    Desktop,
    Web,
};

/// @brief All platforms in their canonical order.
inline constexpr auto AllPlatforms = std::array { Platform::Terminal, Platform::Desktop, Platform::Web };

/// @brief Converts a Platform enum to its string representation.
/// @param platform The platform to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto platformToString(Platform platform) -> std::string_view
{
    switch (platform)
    {
        case Platform::Terminal: return "terminal";
        case Platform::Desktop: return "desktop";
        case Platform::Web: return "web";
    }
    return "unknown";
}

/// @brief Parses a string to a Platform enum value.
/// @param str The string to parse.
/// @return The corresponding Platform, or std::nullopt if the name is not a platform.
[[nodiscard]] constexpr auto platformFromString(std::string_view str) -> std::optional<Platform>
{
    if (str == "terminal")
        return Platform::Terminal;
    if (str == "desktop")
        return Platform::Desktop;
    if (str == "web")
        return Platform::Web;
    return std::nullopt;
}

} // namespace uniui
