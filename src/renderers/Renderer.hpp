// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <iur/Element.hpp>
#include <iur/TreeUtils.hpp>
#include <renderers/State.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <format>
#include <optional>

namespace uniui::renderers
{

/// @brief Common render/update/destroy lifecycle of the platform renderers.
///
/// Subclasses supply the recursive convert() step. Rendering is a pure function of the
/// IUR tree and the options: the renderer object itself holds no mutable state and may be
/// shared between threads.
///
/// @tparam Native The platform's native output type. Must be equality comparable.
template <typename Native>
class Renderer
{
  public:
    using State = RendererState<Native>;

    virtual ~Renderer() = default;

    [[nodiscard]] virtual auto platform() const noexcept -> Platform = 0;

    /// @brief Converts one IUR node and its subtree.
    /// @return The native output, or std::nullopt for an invisible node.
    [[nodiscard]] virtual auto convert(iur::Element const& element, State const& state) const
        -> std::optional<Native> = 0;

    /// @brief Releases native resources held by a state. Value outputs need no cleanup.
    [[nodiscard]] virtual auto destroy(State const& /*state*/) const -> VoidResult { return {}; }

    /// @brief Converts the whole tree into a fresh state with version 1.
    [[nodiscard]] auto render(iur::Element const& iur,
                              nlohmann::json const& options = nlohmann::json::object()) const -> Result<State>
    {
        if (!options.is_null() && !options.is_object())
            return makeError(ErrorCode::ConfigError, "Renderer options must be an object");

        try
        {
            auto state = State { .platform = platform() };
            state = withConfig(std::move(state), options);
            state.root = convert(iur, state);
            state.widgets = indexWidgets(iur);
            state.metadata[std::string(LastIurKey)] = iur::toJson(iur);
            log::debug("{}: rendered {} at version {}", platformToString(platform()), iur::typeName(iur), state.version);
            return state;
        }
        catch (std::exception const& e)
        {
            return makeError(ErrorCode::RenderError,
                             std::format("{} render failed: {}", platformToString(platform()), e.what()));
        }
    }

    /// @brief Re-renders when the tree or the merged config changed.
    ///
    /// An unchanged tree with an unchanged config returns @p state as is. Otherwise the
    /// whole tree is reconverted, the root is replaced if it differs, and the version is
    /// bumped by one when the root or the config changed.
    [[nodiscard]] auto update(iur::Element const& iur,
                              State const& state,
                              nlohmann::json const& options = nlohmann::json::object()) const -> Result<State>
    {
        if (!options.is_null() && !options.is_object())
            return makeError(ErrorCode::ConfigError, "Renderer options must be an object");

        try
        {
            auto next = withConfig(state, options);
            auto const iurJson = iur::toJson(iur);
            auto const previous = lastIur(state);
            auto const configChanged = next.config != state.config;
            auto const iurChanged = !previous || *previous != iurJson;

            if (!configChanged && !iurChanged)
            {
                log::debug("{}: update skipped, nothing changed", platformToString(platform()));
                return state;
            }

            auto root = convert(iur, next);
            auto const rootChanged = root != state.root;
            if (rootChanged)
                next.root = std::move(root);

            next.widgets = indexWidgets(iur);
            next.metadata[std::string(LastIurKey)] = iurJson;
            if (rootChanged || configChanged)
                next = bumpVersion(std::move(next));

            log::debug("{}: updated (root changed: {}, config changed: {}), version {}",
                       platformToString(platform()),
                       rootChanged,
                       configChanged,
                       next.version);
            return next;
        }
        catch (std::exception const& e)
        {
            return makeError(ErrorCode::RenderError,
                             std::format("{} update failed: {}", platformToString(platform()), e.what()));
        }
    }

  protected:
    Renderer() = default;
    Renderer(Renderer const&) = default;
    Renderer(Renderer&&) = default;
    auto operator=(Renderer const&) -> Renderer& = default;
    auto operator=(Renderer&&) -> Renderer& = default;

  private:
    [[nodiscard]] static auto indexWidgets(iur::Element const& root) -> std::map<std::string, nlohmann::json>
    {
        auto widgets = std::map<std::string, nlohmann::json> {};
        iur::traverse(root, [&](iur::Element const& element, int) {
            if (auto id = iur::elementId(element))
                widgets.emplace(std::move(*id), iur::metadata(element));
        });
        return widgets;
    }
};

} // namespace uniui::renderers
