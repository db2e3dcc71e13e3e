// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Types.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace uniui
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\uniui";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/uniui";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/uniui";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/uniui";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto configFromJson(nlohmann::json const& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config document must be an object");

    auto config = AppConfig {};

    if (root.contains("platforms"))
    {
        auto const& platforms = root["platforms"];
        if (!platforms.is_array())
            return makeError(ErrorCode::ConfigError, "'platforms' must be a list of platform names");

        config.platforms.clear();
        for (auto const& name: platforms)
        {
            if (!name.is_string() || !platformFromString(name.get<std::string>()))
                return makeError(ErrorCode::ConfigError, std::format("Unknown platform in config: {}", name.dump()));
            config.platforms.push_back(name.get<std::string>());
        }
    }

    config.renderTimeoutMs = json::getIntOr(root, "renderTimeoutMs", config.renderTimeoutMs);
    if (config.renderTimeoutMs <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("'renderTimeoutMs' must be positive, got {}", config.renderTimeoutMs));

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto const level = log::parseLevel(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
    config.logLevel = *level;

    // Web section
    if (root.contains("web"))
        config.web.enabled = json::getBoolOr(root["web"], "enabled", false);

    // Renderer options
    if (root.contains("renderer"))
    {
        if (!root["renderer"].is_object())
            return makeError(ErrorCode::ConfigError, "'renderer' must be an object");
        config.renderer = root["renderer"];
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto document = json::readFile(path);
    if (!document)
    {
        if (document.error().code == ErrorCode::IoError)
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));
        return std::unexpected(document.error());
    }

    return configFromJson(*document);
}

auto configToJson(AppConfig const& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["platforms"] = config.platforms;
    root["renderTimeoutMs"] = config.renderTimeoutMs;
    root["logLevel"] = log::levelName(config.logLevel);
    root["web"] = { { "enabled", config.web.enabled } };
    root["renderer"] = config.renderer;
    return root;
}

auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace uniui
