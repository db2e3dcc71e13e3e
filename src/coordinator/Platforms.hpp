// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <array>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uniui::coordinator
{

/// @brief Environment variables whose presence indicates a graphical session.
inline constexpr auto DesktopEnvironmentVariables = std::array<std::string_view, 7> {
    "DISPLAY",
    "WAYLAND_DISPLAY",
    "XDG_CURRENT_DESKTOP",
    "XDG_SESSION_TYPE",
    "GNOME_DESKTOP_SESSION_ID",
    "KDE_FULL_SESSION",
    "SESSION_MANAGER",
};

/// @brief Looks up an environment variable; std::nullopt if unset.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Reads the process environment.
[[nodiscard]] auto processEnvironment(std::string_view name) -> std::optional<std::string>;

/// @brief Inputs of platform detection.
struct DetectionOptions
{
    bool webEnabled = false; ///< Set when the application serves a web front end.
    EnvironmentLookup environment = processEnvironment;
};

/// @brief Picks the platform the application most likely runs on.
///
/// Web wins when enabled, desktop when a graphical session is visible in the environment,
/// terminal otherwise.
[[nodiscard]] auto detectPlatform(DetectionOptions const& options = {}) -> Platform;

[[nodiscard]] auto isTerminal(DetectionOptions const& options = {}) -> bool;
[[nodiscard]] auto isDesktop(DetectionOptions const& options = {}) -> bool;
[[nodiscard]] auto isWeb(DetectionOptions const& options = {}) -> bool;

/// @brief Whether @p name names a platform with a renderer.
[[nodiscard]] auto supportsPlatform(std::string_view name) -> bool;

/// @brief All platforms that have a renderer, in canonical order.
[[nodiscard]] auto availableRenderers() -> std::vector<Platform>;

/// @brief Filters configured platform names down to the known ones, in canonical order.
///
/// An empty list enables every available renderer. Unknown names are logged and skipped.
[[nodiscard]] auto enabledRenderers(std::span<std::string const> configured) -> std::vector<Platform>;

/// @brief Resolves a platform name.
/// @return The platform, or invalid_platform.
[[nodiscard]] auto selectRenderer(std::string_view name) -> Result<Platform>;

/// @brief Resolves a list of platform names, failing on the first unknown one.
[[nodiscard]] auto selectRenderers(std::span<std::string const> names) -> Result<std::vector<Platform>>;

} // namespace uniui::coordinator
