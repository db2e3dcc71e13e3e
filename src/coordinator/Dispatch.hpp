// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <coordinator/Mailbox.hpp>
#include <core/Error.hpp>
#include <events/Signal.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace uniui::coordinator
{

/// @brief Receives a dispatched signal; an error return rejects it.
using SignalHandler = std::function<VoidResult(events::Signal const& signal)>;

/// @brief Is told that a signal was dispatched, without receiving it.
using Notification = std::function<VoidResult()>;

/// @brief Names a function in a RemoteCallRegistry plus its leading arguments.
struct RemoteCall
{
    std::string module;
    std::string function;
    nlohmann::json args = nlohmann::json::array();
};

/// @brief Where a dispatched signal goes.
///
/// std::monostate stands for a target of no supported shape and is rejected with
/// invalid_target, as are null mailboxes and empty callbacks.
using Target = std::variant<std::monostate, std::shared_ptr<Mailbox>, SignalHandler, Notification, RemoteCall>;

/// @brief Function invoked for a RemoteCall target with the call's args and the signal.
using RemoteFunction = std::function<VoidResult(nlohmann::json const& args, events::Signal const& signal)>;

/// @brief Thread-safe table of remote-call functions keyed by "Module.function".
class RemoteCallRegistry
{
  public:
    void add(std::string_view module, std::string_view function, RemoteFunction fn);
    void remove(std::string_view module, std::string_view function);
    [[nodiscard]] auto contains(std::string_view module, std::string_view function) const -> bool;

    /// @brief Invokes the registered function outside the registry lock.
    /// @return The function's result, or not_found if nothing is registered under the name.
    [[nodiscard]] auto invoke(RemoteCall const& call, events::Signal const& signal) const -> VoidResult;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, RemoteFunction, std::less<>> _functions;
};

/// @brief Converts a raw platform event into a validated signal.
/// @return The signal, or invalid_platform, invalid_event (non-object payload), or the
///         action and payload errors of the platform event layer.
[[nodiscard]] auto normalizeEvent(std::string_view platform,
                                  std::string_view eventType,
                                  nlohmann::json const& data) -> Result<events::Signal>;

/// @brief Delivers and normalizes events to dispatch targets.
class EventDispatcher
{
  public:
    explicit EventDispatcher(std::shared_ptr<RemoteCallRegistry const> registry = {});

    /// @brief Delivers one signal to one target.
    [[nodiscard]] auto deliver(events::Signal const& signal, Target const& target) const -> VoidResult;

    /// @brief Normalizes a raw event and delivers it to @p target.
    /// @return The delivered signal, or the normalization or delivery error.
    [[nodiscard]] auto dispatchEvent(std::string_view platform,
                                     std::string_view eventType,
                                     nlohmann::json const& data,
                                     Target const& target) const -> Result<events::Signal>;

    /// @brief Normalizes a raw event and delivers it to every target.
    ///
    /// Every target is attempted. Any failure yields dispatch_failed carrying the
    /// individual errors as causes, even if other targets accepted the signal.
    [[nodiscard]] auto broadcastEvent(std::string_view platform,
                                      std::string_view eventType,
                                      nlohmann::json const& data,
                                      std::span<Target const> targets) const -> Result<events::Signal>;

  private:
    std::shared_ptr<RemoteCallRegistry const> _registry;
};

} // namespace uniui::coordinator
