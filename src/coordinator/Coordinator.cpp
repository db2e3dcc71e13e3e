// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Coordinator.hpp>

#include <coordinator/Platforms.hpp>
#include <core/Log.hpp>
#include <renderers/desktop/DesktopRenderer.hpp>
#include <renderers/terminal/TerminalRenderer.hpp>
#include <renderers/web/WebRenderer.hpp>

#include <exception>
#include <format>
#include <future>
#include <memory>
#include <thread>

namespace uniui::coordinator
{

namespace
{
    template <typename R>
    auto renderWith(iur::Element const& iur, nlohmann::json const& options) -> Result<AnyRendererState>
    {
        return R {}.render(iur, options).transform([](auto state) { return AnyRendererState { std::move(state) }; });
    }

    auto checkOptions(nlohmann::json const& options) -> VoidResult
    {
        if (!options.is_null() && !options.is_object())
            return makeError(ErrorCode::ConfigError, "Render options must be an object");
        return {};
    }

    auto renderOne(RenderFunction const& render,
                   Platform platform,
                   iur::Element const& iur,
                   nlohmann::json const& options) -> Result<AnyRendererState>
    {
        if (!render)
            return makeError(ErrorCode::RenderError,
                             std::format("No renderer registered for {}", platformToString(platform)));
        return render(iur, options);
    }

    /// Runs renderOne() and turns anything it throws into a render_error.
    auto guardedRender(RenderFunction const& render,
                       Platform platform,
                       iur::Element const& iur,
                       nlohmann::json const& options) -> Result<AnyRendererState>
    {
        try
        {
            return renderOne(render, platform, iur, options);
        }
        catch (std::exception const& e)
        {
            return makeError(ErrorCode::RenderError,
                             std::format("{} render raised: {}", platformToString(platform), e.what()));
        }
        catch (...)
        {
            return makeError(ErrorCode::RenderError,
                             std::format("{} render raised a non-standard exception", platformToString(platform)));
        }
    }

    void logFailure(std::string const& name, Result<AnyRendererState> const& result)
    {
        if (!result)
            log::warning("Rendering on {} failed: {}", name, result.error());
    }

    void deepMerge(nlohmann::json& target, nlohmann::json const& source)
    {
        if (!target.is_object() || !source.is_object())
        {
            target = source;
            return;
        }

        for (auto const& [key, value]: source.items())
        {
            auto it = target.find(key);
            if (it != target.end() && it->is_object() && value.is_object())
                deepMerge(*it, value);
            else
                target[key] = value;
        }
    }
} // namespace

auto statePlatform(AnyRendererState const& state) -> Platform
{
    return std::visit([](auto const& s) { return s.platform; }, state);
}

auto stateVersion(AnyRendererState const& state) -> std::uint64_t
{
    return std::visit([](auto const& s) { return s.version; }, state);
}

auto RendererSet::forPlatform(Platform platform) const -> RenderFunction const&
{
    switch (platform)
    {
        case Platform::Terminal: return terminal;
        case Platform::Desktop: return desktop;
        case Platform::Web: return web;
    }
    return terminal;
}

auto defaultRenderers() -> RendererSet
{
    return RendererSet {
        .terminal = renderWith<terminal::TerminalRenderer>,
        .desktop = renderWith<desktop::DesktopRenderer>,
        .web = renderWith<web::WebRenderer>,
    };
}

auto renderOn(iur::Element const& iur,
              std::span<std::string const> platforms,
              nlohmann::json const& options,
              RendererSet const& renderers) -> Result<RenderResults>
{
    if (auto valid = checkOptions(options); !valid)
        return std::unexpected(valid.error());

    auto results = RenderResults {};
    for (auto const& name: platforms)
    {
        auto platform = selectRenderer(name);
        if (!platform)
        {
            log::warning("Skipping render on unknown platform {}", name);
            results.insert_or_assign(name, std::unexpected(platform.error()));
            continue;
        }

        auto result = guardedRender(renderers.forPlatform(*platform), *platform, iur, options);
        logFailure(name, result);
        results.insert_or_assign(name, std::move(result));
    }

    return results;
}

RenderWorkers::~RenderWorkers()
{
    wait();
}

void RenderWorkers::spawn(std::function<void()> task)
{
    auto const lock = std::scoped_lock(_mutex);
    _threads.emplace_back(std::move(task));
}

void RenderWorkers::wait()
{
    auto threads = std::vector<std::jthread> {};
    {
        auto const lock = std::scoped_lock(_mutex);
        threads.swap(_threads);
    }
    for (auto& thread: threads)
        thread.join();
}

auto concurrentRender(RenderWorkers& workers,
                      iur::Element const& iur,
                      std::span<std::string const> platforms,
                      nlohmann::json const& options,
                      std::chrono::milliseconds timeout,
                      RendererSet const& renderers) -> Result<RenderResults>
{
    if (auto valid = checkOptions(options); !valid)
        return std::unexpected(valid.error());

    struct Pending
    {
        std::string name;
        std::future<Result<AnyRendererState>> future;
    };

    auto results = RenderResults {};
    auto pending = std::vector<Pending> {};
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    for (auto const& name: platforms)
    {
        auto platform = selectRenderer(name);
        if (!platform)
        {
            log::warning("Skipping render on unknown platform {}", name);
            results.insert_or_assign(name, std::unexpected(platform.error()));
            continue;
        }

        // The promise is shared so that a task outliving its deadline still has somewhere
        // to put its result.
        auto promise = std::make_shared<std::promise<Result<AnyRendererState>>>();
        pending.push_back({ .name = name, .future = promise->get_future() });

        workers.spawn([promise, render = renderers.forPlatform(*platform), target = *platform, iur, options]() {
            promise->set_value(guardedRender(render, target, iur, options));
        });
    }

    for (auto& [name, future]: pending)
    {
        if (future.wait_until(deadline) != std::future_status::ready)
        {
            log::warning("Rendering on {} timed out after {}ms", name, timeout.count());
            results.insert_or_assign(
                name, makeError(ErrorCode::Timeout, std::format("{} render timed out after {}ms", name, timeout.count())));
            continue;
        }

        auto result = future.get();
        logFailure(name, result);
        results.insert_or_assign(name, std::move(result));
    }

    return results;
}

auto mergeStates(std::span<nlohmann::json const> states) -> nlohmann::json
{
    auto merged = nlohmann::json::object();
    for (auto const& state: states)
        deepMerge(merged, state);
    return merged;
}

auto conflictResolution(nlohmann::json const& /*oldState*/, nlohmann::json const& newState) -> nlohmann::json
{
    return newState;
}

auto syncState(nlohmann::json const& state, std::map<Platform, AnyRendererState> const& rendererStates)
    -> VoidResult
{
    log::debug("Synchronizing state with {} keys across {} renderers",
               state.is_object() ? state.size() : 0,
               rendererStates.size());
    return {};
}

auto broadcastState(nlohmann::json const& state, std::map<Platform, AnyRendererState> const& rendererStates)
    -> VoidResult
{
    for (auto const& [platform, rendererState]: rendererStates)
        log::trace("Broadcasting state to {} (version {})", platformToString(platform), stateVersion(rendererState));
    log::debug("Broadcast state with {} keys", state.is_object() ? state.size() : 0);
    return {};
}

} // namespace uniui::coordinator
