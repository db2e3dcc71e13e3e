// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Dispatch.hpp>

#include <coordinator/Platforms.hpp>
#include <core/Log.hpp>
#include <events/PlatformEvents.hpp>

#include <format>
#include <vector>

namespace uniui::coordinator
{

namespace
{
    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto remoteKey(std::string_view module, std::string_view function) -> std::string
    {
        return std::format("{}.{}", module, function);
    }
} // namespace

// {{{ RemoteCallRegistry

void RemoteCallRegistry::add(std::string_view module, std::string_view function, RemoteFunction fn)
{
    auto lock = std::lock_guard(_mutex);
    _functions.insert_or_assign(remoteKey(module, function), std::move(fn));
}

void RemoteCallRegistry::remove(std::string_view module, std::string_view function)
{
    auto lock = std::lock_guard(_mutex);
    _functions.erase(remoteKey(module, function));
}

auto RemoteCallRegistry::contains(std::string_view module, std::string_view function) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _functions.contains(remoteKey(module, function));
}

auto RemoteCallRegistry::invoke(RemoteCall const& call, events::Signal const& signal) const -> VoidResult
{
    auto const key = remoteKey(call.module, call.function);
    auto fn = RemoteFunction {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _functions.find(key);
        if (it == _functions.end())
            return makeError(ErrorCode::NotFound, std::format("No remote function registered as {}", key));
        fn = it->second;
    }
    return fn(call.args, signal);
}

// }}}

auto normalizeEvent(std::string_view platform, std::string_view eventType, nlohmann::json const& data)
    -> Result<events::Signal>
{
    auto const selected = selectRenderer(platform);
    if (!selected)
        return std::unexpected(selected.error());

    if (!data.is_object())
        return makeError(ErrorCode::InvalidEvent,
                         std::format("Event payload for {} {} must be an object", platform, eventType));

    return events::toSignal(*selected, eventType, data);
}

// {{{ EventDispatcher

EventDispatcher::EventDispatcher(std::shared_ptr<RemoteCallRegistry const> registry):
    _registry(std::move(registry))
{
}

auto EventDispatcher::deliver(events::Signal const& signal, Target const& target) const -> VoidResult
{
    auto const invalid = [](std::string_view what) -> VoidResult {
        return makeError(ErrorCode::InvalidTarget, std::format("Invalid dispatch target: {}", what));
    };

    return std::visit(
        overloaded {
            [&](std::monostate) -> VoidResult { return invalid("unsupported shape"); },
            [&](std::shared_ptr<Mailbox> const& mailbox) -> VoidResult {
                if (!mailbox)
                    return invalid("null mailbox");
                return mailbox->push(signal);
            },
            [&](SignalHandler const& handler) -> VoidResult {
                if (!handler)
                    return invalid("empty callback");
                return handler(signal);
            },
            [&](Notification const& notify) -> VoidResult {
                if (!notify)
                    return invalid("empty callback");
                return notify();
            },
            [&](RemoteCall const& call) -> VoidResult {
                if (call.module.empty() || call.function.empty())
                    return invalid("remote call without module or function");
                if (!_registry)
                    return makeError(ErrorCode::NotFound,
                                     std::format("No remote call registry for {}.{}", call.module, call.function));
                return _registry->invoke(call, signal);
            },
        },
        target);
}

auto EventDispatcher::dispatchEvent(std::string_view platform,
                                    std::string_view eventType,
                                    nlohmann::json const& data,
                                    Target const& target) const -> Result<events::Signal>
{
    auto signal = normalizeEvent(platform, eventType, data);
    if (!signal)
        return signal;

    if (auto delivered = deliver(*signal, target); !delivered)
    {
        log::debug("Dispatch of {} failed: {}", signal->type, delivered.error());
        return std::unexpected(std::move(delivered.error()));
    }

    log::debug("Dispatched {} from {}", signal->type, signal->source);
    return signal;
}

auto EventDispatcher::broadcastEvent(std::string_view platform,
                                     std::string_view eventType,
                                     nlohmann::json const& data,
                                     std::span<Target const> targets) const -> Result<events::Signal>
{
    auto signal = normalizeEvent(platform, eventType, data);
    if (!signal)
        return signal;

    auto failures = std::vector<Error> {};
    for (auto const& target: targets)
    {
        if (auto delivered = deliver(*signal, target); !delivered)
            failures.push_back(std::move(delivered.error()));
    }

    if (!failures.empty())
    {
        log::debug("Broadcast of {} failed for {} of {} targets", signal->type, failures.size(), targets.size());
        return std::unexpected(Error {
            .code = ErrorCode::DispatchFailed,
            .message = std::format("{} of {} targets rejected {}", failures.size(), targets.size(), signal->type),
            .causes = std::move(failures),
        });
    }

    log::debug("Broadcast {} to {} targets", signal->type, targets.size());
    return signal;
}

// }}}

} // namespace uniui::coordinator
