#include "transfer/transfer.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <utility>

#include <asio/post.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "transfer/receiver.hpp"
#include "transfer/session.hpp"

namespace xdcc::transfer {

Transfer::Transfer(TransferConfig config) : _config(std::move(config)) {}

Transfer::~Transfer()
{
    abort();

    if (_worker.joinable()) {
        _worker.join();
    }
}

auto Transfer::state() const -> State
{
    std::lock_guard lock(_mutex);
    return _state;
}

void Transfer::_set_state(State state)
{
    std::lock_guard lock(_mutex);

    _check_cancelled();

    spdlog::debug(
      "{}: {} -> {}",
      _config.locator,
      magic_enum::enum_name(_state),
      magic_enum::enum_name(state)
    );
    _state = state;
}

void Transfer::_check_cancelled() const
{
    if (_cancel_requested) {
        throw TransferFailure(Reason::Cancelled, "Transfer cancelled");
    }
}

auto Transfer::_cancelled_or(const Failure& failure) const -> Failure
{
    if (_cancel_requested) {
        return {Reason::Cancelled, "Transfer cancelled"};
    }
    return failure;
}

auto Transfer::start() -> tl::expected<void, Failure>
{
    {
        std::lock_guard lock(_mutex);

        if (_state == State::Aborted) {
            return tl::make_unexpected(Failure{Reason::Cancelled, "Transfer was aborted"});
        }
        if (_state != State::Idle) {
            return tl::make_unexpected(
              Failure{Reason::Cancelled, "Transfer already started"}
            );
        }

        _state = State::Connecting;
    }

    spdlog::info("Requesting {}", _config.locator);

    try {
        _session = std::make_unique<Session>(_io, _config);
        _session->connect();
        _check_cancelled();
        _session->register_nick();

        _set_state(State::Requesting);
        _session->join_channel();
        _session->request_pack();

        _set_state(State::AwaitingOffer);
        auto offer = _session->await_offer();

        _receiver = std::make_unique<Receiver>(_io, _config, std::move(offer));
        _set_state(State::Downloading);
    }
    catch (const TransferFailure& e) {
        const auto failure = _cancelled_or(e.failure());
        spdlog::error("{}: {}", _config.locator, failure.to_string());

        _release();
        _finish(Aborted{failure});
        return tl::make_unexpected(failure);
    }
    catch (const std::exception& e) {
        const auto failure = _cancelled_or({Reason::Network, e.what()});
        spdlog::error("{}: {}", _config.locator, failure.to_string());

        _release();
        _finish(Aborted{failure});
        return tl::make_unexpected(failure);
    }

    _session->keep_alive();
    _worker = std::jthread([this] { _work(); });

    return {};
}

void Transfer::_work()
{
    TransferEvent terminal;

    try {
        terminal = _receiver->run([this](TransferEvent event) {
            _events.push(std::move(event));
        });

        _session->quit("Transfer complete");
        spdlog::info("{}: done", _config.locator);
    }
    catch (const TransferFailure& e) {
        terminal = Aborted{_cancelled_or(e.failure())};
    }
    catch (const std::exception& e) {
        terminal = Aborted{_cancelled_or({Reason::Io, e.what()})};
    }

    if (const auto* aborted = std::get_if<Aborted>(&terminal)) {
        spdlog::error("{}: {}", _config.locator, aborted->failure.to_string());
    }

    _release();
    _finish(std::move(terminal));
}

/**
 * @brief Close both connections and run their handlers to completion
 */
void Transfer::_release()
{
    if (_receiver) {
        _receiver->close();
    }
    if (_session) {
        _session->close();
    }

    _io.restart();
    _io.run();
}

void Transfer::_finish(TransferEvent terminal)
{
    std::lock_guard lock(_mutex);

    _state = std::holds_alternative<Completed>(terminal) ? State::Completed
                                                         : State::Aborted;
    _events.push(std::move(terminal));
    _events.close();
}

void Transfer::abort()
{
    std::lock_guard lock(_mutex);

    switch (_state) {
        case State::Idle:
            _state = State::Aborted;
            _events.push(Aborted{{Reason::Cancelled, "Transfer cancelled"}});
            _events.close();
            return;

        case State::Completed:
        case State::Aborted:
            return;

        default:
            break;
    }

    if (_cancel_requested.exchange(true)) {
        return;
    }

    spdlog::debug("{}: abort requested", _config.locator);

    asio::post(_io, [this] {
        if (_receiver) {
            _receiver->close();
        }
        if (_session) {
            _session->close();
        }
    });
}

}  // namespace xdcc::transfer
