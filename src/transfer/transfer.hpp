#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include <asio/io_context.hpp>
#include <tl/expected.hpp>

#include "transfer/config.hpp"
#include "transfer/event_channel.hpp"
#include "transfer/events.hpp"
#include "transfer/failure.hpp"

namespace xdcc::transfer {

class Session;
class Receiver;

/**
 * @brief One pack download, from request to completion or abort
 *
 * start() runs the IRC phases on the calling thread, the download itself
 * runs on a worker thread. Progress is reported through events().
 */
class Transfer
{
 public:
    enum class State
    {
        Idle,
        Connecting,
        Requesting,
        AwaitingOffer,
        Downloading,
        Completed,
        Aborted,
    };

    explicit Transfer(TransferConfig config);
    ~Transfer();

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    /**
     * @brief Connect, request the pack and wait for the offer
     *
     * On success the download continues in the background. On failure the
     * transfer is Aborted and the event stream already ended.
     */
    auto start() -> tl::expected<void, Failure>;

    /**
     * @brief Cancel the transfer; safe from any thread, repeated calls are
     *  ignored
     */
    void abort();

    auto state() const -> State;
    auto events() -> EventChannel& { return _events; }

 private:
    void _set_state(State state);
    void _check_cancelled() const;
    auto _cancelled_or(const Failure& failure) const -> Failure;

    void _release();
    void _finish(TransferEvent terminal);
    void _work();

    TransferConfig _config;

    mutable std::mutex _mutex;
    State _state = State::Idle;
    std::atomic<bool> _cancel_requested = false;

    EventChannel _events;

    asio::io_context _io;
    std::unique_ptr<Session> _session;
    std::unique_ptr<Receiver> _receiver;

    std::jthread _worker;
};

inline auto is_terminal(Transfer::State state) -> bool
{
    return state == Transfer::State::Completed or state == Transfer::State::Aborted;
}

}  // namespace xdcc::transfer
