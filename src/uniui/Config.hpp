// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace uniui
{

/// @brief Web front end section.
struct WebConfig
{
    /// @brief Whether the application serves a web front end; makes detection pick web.
    bool enabled = false;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Enabled platform names. Empty means every available renderer.
    std::vector<std::string> platforms = { "terminal", "desktop", "web" };

    int renderTimeoutMs = 5000;
    log::Level logLevel = log::Level::Info;
    WebConfig web;

    /// @brief Options passed to every renderer as its config.
    nlohmann::json renderer = nlohmann::json::object();
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, the defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds a configuration from a parsed config document.
[[nodiscard]] auto configFromJson(nlohmann::json const& root) -> Result<AppConfig>;

[[nodiscard]] auto configToJson(AppConfig const& config) -> nlohmann::json;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace uniui
