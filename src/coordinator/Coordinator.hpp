// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <iur/Element.hpp>
#include <renderers/State.hpp>
#include <renderers/desktop/Widget.hpp>
#include <renderers/terminal/Node.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace uniui::coordinator
{

using TerminalState = renderers::RendererState<terminal::Node>;
using DesktopState = renderers::RendererState<desktop::Widget>;
using WebState = renderers::RendererState<std::string>;

/// @brief The state of whichever renderer produced it.
using AnyRendererState = std::variant<TerminalState, DesktopState, WebState>;

[[nodiscard]] auto statePlatform(AnyRendererState const& state) -> Platform;
[[nodiscard]] auto stateVersion(AnyRendererState const& state) -> std::uint64_t;

/// @brief Per-platform outcome, keyed by the platform name as requested.
using RenderResults = std::map<std::string, Result<AnyRendererState>>;

/// @brief Renders an IUR tree with the given options on one platform.
using RenderFunction = std::function<Result<AnyRendererState>(iur::Element const& iur, nlohmann::json const& options)>;

/// @brief The render entry points the coordinator uses, one per platform.
struct RendererSet
{
    RenderFunction terminal;
    RenderFunction desktop;
    RenderFunction web;

    [[nodiscard]] auto forPlatform(Platform platform) const -> RenderFunction const&;
};

/// @brief The built-in terminal, desktop and web renderers.
[[nodiscard]] auto defaultRenderers() -> RendererSet;

inline constexpr auto DefaultRenderTimeout = std::chrono::milliseconds { 5000 };

/// @brief Renders on each requested platform in turn.
///
/// An unknown platform name yields invalid_platform for that entry only. The call itself
/// fails only for options that are not an object.
[[nodiscard]] auto renderOn(iur::Element const& iur,
                            std::span<std::string const> platforms,
                            nlohmann::json const& options = nlohmann::json::object(),
                            RendererSet const& renderers = defaultRenderers()) -> Result<RenderResults>;

/// @brief Owns the threads started by concurrentRender().
///
/// A platform that misses its deadline keeps running on its thread until it finishes.
/// Those threads are joined by wait() or on destruction, so the owner must outlive every
/// concurrentRender() call it is passed to.
class RenderWorkers
{
  public:
    RenderWorkers() = default;
    ~RenderWorkers();

    RenderWorkers(RenderWorkers const&) = delete;
    RenderWorkers& operator=(RenderWorkers const&) = delete;

    void spawn(std::function<void()> task);

    /// Blocks until every spawned task has finished.
    void wait();

  private:
    std::mutex _mutex;
    std::vector<std::jthread> _threads;
};

/// @brief Like renderOn(), but renders every platform on a thread owned by @p workers.
///
/// Each task gets its own copy of the tree and options. Results are collected once all
/// tasks finished or the shared @p timeout elapsed; a late platform is reported as a
/// timeout while its thread runs to completion under @p workers.
[[nodiscard]] auto concurrentRender(RenderWorkers& workers,
                                    iur::Element const& iur,
                                    std::span<std::string const> platforms,
                                    nlohmann::json const& options = nlohmann::json::object(),
                                    std::chrono::milliseconds timeout = DefaultRenderTimeout,
                                    RendererSet const& renderers = defaultRenderers()) -> Result<RenderResults>;

/// @brief Deep-merges state records in order.
///
/// Nested objects under a shared key are merged recursively; for any other value the last
/// state wins.
[[nodiscard]] auto mergeStates(std::span<nlohmann::json const> states) -> nlohmann::json;

/// @brief Resolves a conflict between two versions of a state: the new one wins.
[[nodiscard]] auto conflictResolution(nlohmann::json const& oldState, nlohmann::json const& newState)
    -> nlohmann::json;

/// @brief Acknowledges a shared state for the given renderer states.
[[nodiscard]] auto syncState(nlohmann::json const& state, std::map<Platform, AnyRendererState> const& rendererStates)
    -> VoidResult;

/// @brief Acknowledges a shared state broadcast to the given renderer states.
[[nodiscard]] auto broadcastState(nlohmann::json const& state,
                                  std::map<Platform, AnyRendererState> const& rendererStates) -> VoidResult;

} // namespace uniui::coordinator
