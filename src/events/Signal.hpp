// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace uniui::events
{

/// @brief Namespace of every signal type emitted by this library.
inline constexpr auto SignalNamespace = std::string_view { "unified" };

/// @brief Source used when the caller does not supply one.
inline constexpr auto DefaultSource = std::string_view { "/unified_ui" };

/// @brief Names of the standard signals, in canonical order.
inline constexpr auto StandardSignals =
    std::array<std::string_view, 6> { "click", "change", "submit", "focus", "blur", "select" };

/// @brief A typed, namespaced event record.
///
/// The type has the form `domain.entity.action`, with at least three segments each
/// matching `[a-z][a-z0-9_]*`.
struct Signal
{
    std::string type;
    nlohmann::json data = nlohmann::json::object();
    std::string source { DefaultSource };
    std::string id;
    std::optional<std::string> subject;

    auto operator==(Signal const&) const -> bool = default;
};

/// @brief Optional fields for createSignal().
struct SignalOptions
{
    std::optional<std::string> source;
    std::optional<std::string> subject;
    std::optional<std::string> id; ///< Defaults to a random UUIDv4.
};

/// @brief Maps a standard signal name to its type ("click" -> "unified.button.clicked").
/// @return The type, or an unknown_signal error.
[[nodiscard]] auto signalType(std::string_view name) -> Result<std::string>;

/// @brief Checks the `domain.entity.action` format of a signal type.
[[nodiscard]] auto validType(std::string_view type) -> VoidResult;

/// @brief Generates a random version 4 UUID string.
[[nodiscard]] auto generateUuid() -> std::string;

/// @brief Creates a signal of the given type.
///
/// @p typeOrName may be a full signal type or a standard signal name.
/// @return The signal, or invalid_type_format / unknown_signal.
[[nodiscard]] auto createSignal(std::string_view typeOrName,
                                nlohmann::json data = nlohmann::json::object(),
                                SignalOptions options = {}) -> Result<Signal>;

[[nodiscard]] auto signalToJson(Signal const& signal) -> nlohmann::json;

} // namespace uniui::events
