// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <events/Signal.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace uniui::coordinator
{

/// @brief Thread-safe signal queue that receives dispatched events.
///
/// Producers push from any thread; a consumer drains with tryPop() or blocks in waitPop().
/// Once closed, the mailbox rejects new signals but still hands out the queued ones.
class Mailbox
{
  public:
    /// @brief Queues a signal.
    /// @return not_found if the mailbox has been closed.
    [[nodiscard]] auto push(events::Signal signal) -> VoidResult;

    [[nodiscard]] auto tryPop() -> std::optional<events::Signal>;

    /// @brief Waits up to @p timeout for a signal.
    [[nodiscard]] auto waitPop(std::chrono::milliseconds timeout) -> std::optional<events::Signal>;

    [[nodiscard]] auto size() const -> std::size_t;

    void close();
    [[nodiscard]] auto closed() const -> bool;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<events::Signal> _queue;
    bool _closed = false;
};

} // namespace uniui::coordinator
