// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace uniui::renderers
{

/// @brief Metadata key under which render() and update() keep the last IUR they converted.
constexpr auto LastIurKey = std::string_view { "last_iur" };

/// @brief The value returned by a renderer's render() and update().
///
/// States are plain values. The helpers below return modified copies and never mutate
/// their input, so a state can be handed to another thread without synchronization.
///
/// @tparam Native The platform's native output type.
template <typename Native>
struct RendererState
{
    Platform platform = Platform::Terminal;
    std::optional<Native> root;                      ///< Converted output; empty if the root is invisible.
    std::map<std::string, nlohmann::json> widgets;   ///< Element metadata by element id.
    std::uint64_t version = 1;
    nlohmann::json config = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();

    auto operator==(RendererState const&) const -> bool = default;
};

template <typename Native>
[[nodiscard]] auto withRoot(RendererState<Native> state, std::optional<Native> root) -> RendererState<Native>
{
    state.root = std::move(root);
    return state;
}

template <typename Native>
[[nodiscard]] auto bumpVersion(RendererState<Native> state) -> RendererState<Native>
{
    ++state.version;
    return state;
}

template <typename Native>
[[nodiscard]] auto putWidget(RendererState<Native> state, std::string const& id, nlohmann::json widget)
    -> RendererState<Native>
{
    state.widgets[id] = std::move(widget);
    return state;
}

template <typename Native>
[[nodiscard]] auto getWidget(RendererState<Native> const& state, std::string const& id) -> std::optional<nlohmann::json>
{
    if (auto const it = state.widgets.find(id); it != state.widgets.end())
        return it->second;
    return std::nullopt;
}

template <typename Native>
[[nodiscard]] auto removeWidget(RendererState<Native> state, std::string const& id) -> RendererState<Native>
{
    state.widgets.erase(id);
    return state;
}

/// @brief Merges @p options into the state's config; keys in @p options win.
template <typename Native>
[[nodiscard]] auto withConfig(RendererState<Native> state, nlohmann::json const& options) -> RendererState<Native>
{
    if (options.is_object())
        state.config.update(options);
    return state;
}

template <typename Native>
[[nodiscard]] auto withMetadata(RendererState<Native> state, std::string const& key, nlohmann::json value)
    -> RendererState<Native>
{
    state.metadata[key] = std::move(value);
    return state;
}

/// @brief Returns the JSON form of the IUR tree the state was last rendered from.
template <typename Native>
[[nodiscard]] auto lastIur(RendererState<Native> const& state) -> std::optional<nlohmann::json>
{
    auto const key = std::string(LastIurKey);
    if (!state.metadata.is_object() || !state.metadata.contains(key))
        return std::nullopt;
    return state.metadata.at(key);
}

} // namespace uniui::renderers
