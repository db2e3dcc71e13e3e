// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Platforms.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>

namespace uniui::coordinator
{

auto processEnvironment(std::string_view name) -> std::optional<std::string>
{
    auto const* const value = std::getenv(std::string(name).c_str());
    if (!value)
        return std::nullopt;
    return std::string(value);
}

auto detectPlatform(DetectionOptions const& options) -> Platform
{
    if (options.webEnabled)
        return Platform::Web;

    if (options.environment)
    {
        auto const graphical = std::ranges::any_of(DesktopEnvironmentVariables, [&](std::string_view variable) {
            auto const value = options.environment(variable);
            return value && !value->empty();
        });
        if (graphical)
            return Platform::Desktop;
    }

    return Platform::Terminal;
}

auto isTerminal(DetectionOptions const& options) -> bool
{
    return detectPlatform(options) == Platform::Terminal;
}

auto isDesktop(DetectionOptions const& options) -> bool
{
    return detectPlatform(options) == Platform::Desktop;
}

auto isWeb(DetectionOptions const& options) -> bool
{
    return detectPlatform(options) == Platform::Web;
}

auto supportsPlatform(std::string_view name) -> bool
{
    return platformFromString(name).has_value();
}

auto availableRenderers() -> std::vector<Platform>
{
    return { AllPlatforms.begin(), AllPlatforms.end() };
}

auto enabledRenderers(std::span<std::string const> configured) -> std::vector<Platform>
{
    if (configured.empty())
        return availableRenderers();

    auto enabled = std::vector<Platform> {};
    for (auto const platform: AllPlatforms)
    {
        if (std::ranges::find(configured, platformToString(platform)) != configured.end())
            enabled.push_back(platform);
    }

    for (auto const& name: configured)
    {
        if (!supportsPlatform(name))
            log::warning("Ignoring unknown platform in configuration: {}", name);
    }

    return enabled;
}

auto selectRenderer(std::string_view name) -> Result<Platform>
{
    if (auto const platform = platformFromString(name))
        return *platform;
    return makeError(ErrorCode::InvalidPlatform, std::format("Unknown platform: {}", name));
}

auto selectRenderers(std::span<std::string const> names) -> Result<std::vector<Platform>>
{
    auto platforms = std::vector<Platform> {};
    platforms.reserve(names.size());

    for (auto const& name: names)
    {
        auto platform = selectRenderer(name);
        if (!platform)
            return std::unexpected(platform.error());
        platforms.push_back(*platform);
    }

    return platforms;
}

} // namespace uniui::coordinator
