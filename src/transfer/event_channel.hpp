#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

#include "transfer/events.hpp"

namespace xdcc::transfer {

enum class PollStatus
{
    Event,
    Timeout,
    Ended,
};

struct PollResult
{
    PollStatus status;
    std::optional<TransferEvent> event;
};

/**
 * @brief Queue of transfer events between the transfer and one consumer
 *
 * The producer pushes events and closes the channel once, right after the
 * terminal event. The consumer polls until the stream ended.
 */
class EventChannel
{
 public:
    inline void push(TransferEvent event)
    {
        {
            std::lock_guard lock(_mutex);

            if (_closed) {
                throw std::logic_error("Push to closed event channel");
            }

            _events.push_back(std::move(event));
        }
        _cv.notify_one();
    }

    inline void close()
    {
        {
            std::lock_guard lock(_mutex);

            if (_closed) {
                throw std::logic_error("Event channel closed twice");
            }

            _closed = true;
        }
        _cv.notify_all();
    }

    /**
     * @brief Block until next event; nullopt when the stream ended
     */
    inline auto poll() -> std::optional<TransferEvent>
    {
        std::unique_lock lock(_mutex);
        _cv.wait(lock, [this] { return not _events.empty() or _closed; });

        return _pop();
    }

    /**
     * @brief Wait at most timeout for the next event
     */
    template<typename Rep, typename Period>
    inline auto poll_for(std::chrono::duration<Rep, Period> timeout) -> PollResult
    {
        std::unique_lock lock(_mutex);
        _cv.wait_for(lock, timeout, [this] {
            return not _events.empty() or _closed;
        });

        if (auto event = _pop()) {
            return {PollStatus::Event, std::move(event)};
        }

        return {_closed ? PollStatus::Ended : PollStatus::Timeout, std::nullopt};
    }

    inline auto ended() const -> bool
    {
        std::lock_guard lock(_mutex);
        return _closed and _events.empty();
    }

 private:
    inline auto _pop() -> std::optional<TransferEvent>
    {
        if (_events.empty()) {
            return std::nullopt;
        }

        auto event = std::move(_events.front());
        _events.pop_front();
        return event;
    }

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<TransferEvent> _events;
    bool _closed = false;
};

}  // namespace xdcc::transfer
