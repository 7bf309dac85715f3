#include "transfer/session.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <asio/error.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "dcc/offer.hpp"
#include "irc/message.hpp"
#include "misc/tools.hpp"
#include "transfer/failure.hpp"
#include "transfer/rejection.hpp"
#include "xdcc/config.hpp"

namespace xdcc::transfer {

using namespace std::chrono_literals;

namespace {

auto network_failure(std::string_view what, const asio::error_code& ec)
  -> TransferFailure
{
    if (ec == asio::error::timed_out) {
        return {Reason::Timeout, fmt::format("{}: timed out", what), ec};
    }

    return {Reason::Network, fmt::format("{}: {}", what, ec.message()), ec};
}

auto same_name(std::string_view lhs, std::string_view rhs) -> bool
{
    return utils::to_lower(lhs) == utils::to_lower(rhs);
}

}  // namespace

Session::Session(asio::io_context& io, const TransferConfig& config) :
  _config(config),
  _stream(io, config.locator.network),
  _nick(config.nickname.empty() ? random_nickname() : config.nickname),
  _logger(spdlog::default_logger())
{
}

auto Session::_try_connect(std::uint16_t port, bool tls)
  -> tl::expected<void, asio::error_code>
{
    const auto& host = _config.locator.network;

    return _stream.connect(host, port, _config.timeouts.connect)
      .and_then([&] {
          if (not tls) {
              return tl::expected<void, asio::error_code>{};
          }
          return _stream.start_tls(host, _config.timeouts.connect);
      });
}

void Session::connect()
{
    const auto& locator = _config.locator;
    const auto port_or = [&](std::uint16_t fallback) {
        return locator.port != 0 ? locator.port : fallback;
    };

    if (_config.security != Security::Plain) {
        const auto port = port_or(DEFAULT_TLS_PORT);
        auto connected = _try_connect(port, true);

        if (connected) {
            _logger->debug("Connected to {}:{} over TLS", locator.network, port);
            return;
        }

        if (_config.security == Security::TlsOnly) {
            throw network_failure(
              fmt::format("TLS connection to {}:{}", locator.network, port),
              connected.error()
            );
        }

        _logger->info(
          "TLS to {}:{} failed ({}), falling back to plaintext",
          locator.network,
          port,
          connected.error().message()
        );
    }

    const auto port = port_or(DEFAULT_PLAIN_PORT);
    auto connected = _try_connect(port, false);

    if (not connected) {
        throw network_failure(
          fmt::format("Connection to {}:{}", locator.network, port),
          connected.error()
        );
    }

    _logger->debug("Connected to {}:{}", locator.network, port);
}

void Session::_send(const std::string& line)
{
    auto written = _stream.write(line, WRITE_TIMEOUT);

    if (not written) {
        throw network_failure("Send to server", written.error());
    }
}

/**
 * @brief Next message that is not a PING
 *
 * A server ERROR line ends the session.
 */
auto Session::_read_message(Clock::time_point deadline, std::string_view phase)
  -> irc::Message
{
    for (;;) {
        const auto left = std::chrono::duration_cast<net::Timeout>(
          deadline - Clock::now()
        );

        if (left <= 0ms) {
            throw TransferFailure(Reason::Timeout, fmt::format("{} timed out", phase));
        }

        auto line = _stream.read_line(left);
        if (not line) {
            throw network_failure(phase, line.error());
        }

        auto msg = irc::unpack_message(*line);
        if (not msg) {
            _logger->debug(
              "Skipping bad line ({}): {}", magic_enum::enum_name(msg.error()), *line
            );
            continue;
        }

        if (msg->is("PING")) {
            _send(irc::pack_pong(msg->trailing()));
            continue;
        }

        if (msg->is("ERROR")) {
            throw TransferFailure(
              Reason::Network, fmt::format("Server closed link: {}", msg->trailing())
            );
        }

        return std::move(*msg);
    }
}

void Session::register_nick()
{
    const auto deadline = Clock::now() + _config.timeouts.registration;
    const auto base_nick = _nick;

    _send(irc::pack_nick(_nick));
    _send(irc::pack_user(_nick));

    int attempt = 0;
    for (;;) {
        auto msg = _read_message(deadline, "Registration");

        if (msg.is(irc::numeric::WELCOME)) {
            if (not msg.param(0).empty()) {
                _nick = msg.param(0);
            }
            _logger->debug("Registered on {} as {}", _config.locator.network, _nick);
            return;
        }

        if (msg.is(irc::numeric::NICKNAME_IN_USE)) {
            if (++attempt >= MAX_NICK_ATTEMPTS) {
                throw TransferFailure(
                  Reason::Network, fmt::format("Nickname in use: {}", msg.trailing())
                );
            }

            _nick = fmt::format("{}{}", base_nick, attempt);
            _logger->debug("Nickname taken, retrying as {}", _nick);
            _send(irc::pack_nick(_nick));
            continue;
        }

        if (msg.is(irc::numeric::ERRONEOUS_NICKNAME)) {
            throw TransferFailure(
              Reason::Network,
              fmt::format("Nickname {} refused: {}", _nick, msg.trailing())
            );
        }
    }
}

void Session::join_channel()
{
    const auto& locator = _config.locator;

    if (not locator.has_channel()) {
        return;
    }

    const auto channel = locator.channel_name();
    const auto deadline = Clock::now() + _config.timeouts.join;

    _send(irc::pack_join(channel));

    for (;;) {
        auto msg = _read_message(deadline, fmt::format("Join {}", channel));

        if (msg.is("JOIN") and _is_me(msg.nick()) and
            same_name(msg.param(0), channel)) {
            _logger->debug("Joined {}", channel);
            return;
        }

        if (msg.is(irc::numeric::END_OF_NAMES) and same_name(msg.param(1), channel)) {
            _logger->debug("Joined {} (end of names)", channel);
            return;
        }

        if (msg.is(irc::numeric::BANNED_FROM_CHANNEL)) {
            throw TransferFailure(Reason::Banned, std::string{msg.trailing()});
        }

        if (msg.is(irc::numeric::NO_SUCH_CHANNEL) or
            msg.is(irc::numeric::CHANNEL_IS_FULL) or
            msg.is(irc::numeric::INVITE_ONLY_CHANNEL) or
            msg.is(irc::numeric::BAD_CHANNEL_KEY) or
            msg.is(irc::numeric::NEED_REGGED_NICK)) {
            throw TransferFailure(
              Reason::ChannelRequired,
              fmt::format("Can't join {}: {}", channel, msg.trailing())
            );
        }
    }
}

void Session::request_pack()
{
    const auto& locator = _config.locator;

    _logger->debug("Requesting pack #{} from {}", locator.pack, locator.bot);
    _send(irc::pack_xdcc_send(locator.bot, locator.pack));
}

auto Session::_is_bot(std::string_view nick) const -> bool
{
    return same_name(nick, _config.locator.bot);
}

auto Session::_is_me(std::string_view nick) const -> bool
{
    return same_name(nick, _nick);
}

void Session::_handle_ctcp(const irc::Message& msg, const irc::CtcpMsg& ctcp)
{
    if (msg.is("PRIVMSG") and ctcp.command == "VERSION") {
        _send(irc::pack_ctcp_reply(
          msg.nick(), {.command = "VERSION", .args = "xdcc"}
        ));
        return;
    }

    _logger->debug("Ignoring CTCP {} from {}", ctcp.command, msg.nick());
}

auto Session::await_offer() -> dcc::Offer
{
    const auto& bot = _config.locator.bot;
    const auto deadline = Clock::now() + _config.timeouts.offer;

    for (;;) {
        auto msg = _read_message(deadline, fmt::format("Waiting for offer from {}", bot));

        if (msg.is(irc::numeric::NO_SUCH_NICK) or
            msg.is(irc::numeric::CANNOT_SEND_TO_CHANNEL)) {
            if (_is_bot(msg.param(1))) {
                throw TransferFailure(
                  Reason::Rejected, fmt::format("{}: {}", bot, msg.trailing())
                );
            }
            continue;
        }

        if (not(msg.is("PRIVMSG") or msg.is("NOTICE")) or not _is_me(msg.param(0))) {
            continue;
        }

        const auto text = msg.trailing();

        if (auto ctcp = irc::unpack_ctcp(text)) {
            if (not _is_bot(msg.nick()) or ctcp->command != "DCC") {
                _handle_ctcp(msg, *ctcp);
                continue;
            }

            auto offer = dcc::unpack_offer(*ctcp);
            if (offer) {
                _logger->debug(
                  "Offer from {}: {} at {}:{}", bot, offer->filename, offer->host, offer->port
                );
                return std::move(*offer);
            }

            switch (offer.error()) {
                case dcc::Error::NOT_DCC_SEND:
                    _logger->warn("Ignoring DCC {} from {}", ctcp->args, bot);
                    continue;
                case dcc::Error::REVERSE_DCC:
                    throw TransferFailure(
                      Reason::UnsupportedOffer,
                      fmt::format("Reverse DCC offer: {}", ctcp->args)
                    );
                default:
                    throw TransferFailure(
                      Reason::MalformedOffer,
                      fmt::format(
                        "{}: {}", magic_enum::enum_name(offer.error()), ctcp->args
                      )
                    );
            }
        }

        if (not _is_bot(msg.nick())) {
            continue;
        }

        const auto reason = classify_rejection(text);
        if (not reason) {
            _logger->info("{}: {}", bot, text);
            continue;
        }

        throw TransferFailure(*reason, std::string{text});
    }
}

void Session::keep_alive()
{
    _stream.async_read_line([this](asio::error_code ec, std::string line) {
        if (ec) {
            _logger->debug("IRC connection idle loop ended: {}", ec.message());
            return;
        }

        if (auto msg = irc::unpack_message(line); msg and msg->is("PING")) {
            _stream.async_write(irc::pack_pong(msg->trailing()));
        }

        keep_alive();
    });
}

void Session::quit(std::string_view reason)
{
    if (not _stream.is_open()) {
        return;
    }

    // PONGs from the idle loop may still be queued
    _stream.async_write(irc::pack_quit(reason));

    if (auto sent = _stream.flush(WRITE_TIMEOUT); not sent) {
        _logger->debug("QUIT not sent: {}", sent.error().message());
    }
}

void Session::close()
{
    _stream.close();
}

}  // namespace xdcc::transfer
