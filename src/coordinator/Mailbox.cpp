// SPDX-License-Identifier: Apache-2.0
#include <coordinator/Mailbox.hpp>

namespace uniui::coordinator
{

auto Mailbox::push(events::Signal signal) -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
            return makeError(ErrorCode::NotFound, "Mailbox is closed");
        _queue.push_back(std::move(signal));
    }
    _cv.notify_one();
    return {};
}

auto Mailbox::tryPop() -> std::optional<events::Signal>
{
    auto lock = std::lock_guard(_mutex);
    if (_queue.empty())
        return std::nullopt;

    auto signal = std::move(_queue.front());
    _queue.pop_front();
    return signal;
}

auto Mailbox::waitPop(std::chrono::milliseconds timeout) -> std::optional<events::Signal>
{
    auto lock = std::unique_lock(_mutex);
    if (!_cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; }) || _queue.empty())
        return std::nullopt;

    auto signal = std::move(_queue.front());
    _queue.pop_front();
    return signal;
}

auto Mailbox::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _queue.size();
}

void Mailbox::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

auto Mailbox::closed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

} // namespace uniui::coordinator
