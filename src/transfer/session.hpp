#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

#include "dcc/types.hpp"
#include "irc/types.hpp"
#include "misc/stream.hpp"
#include "transfer/config.hpp"

namespace xdcc::transfer {

/**
 * @brief IRC connection of one transfer
 *
 * Every blocking step throws TransferFailure when it can't be completed.
 */
class Session
{
 public:
    using Clock = std::chrono::steady_clock;

    constexpr static int MAX_NICK_ATTEMPTS = 5;
    constexpr static auto WRITE_TIMEOUT = std::chrono::seconds(10);

    Session(asio::io_context& io, const TransferConfig& config);

    /**
     * @brief Connect to the network honoring the security preference
     */
    void connect();

    /**
     * @brief NICK/USER until welcome, resolving nickname collisions
     */
    void register_nick();

    /**
     * @brief Join locator channel if it has one
     */
    void join_channel();

    void request_pack();
    auto await_offer() -> dcc::Offer;

    /**
     * @brief Keep answering PINGs in the background while the download runs
     */
    void keep_alive();

    void quit(std::string_view reason);
    void close();

 private:
    auto _try_connect(std::uint16_t port, bool tls)
      -> tl::expected<void, asio::error_code>;

    auto _read_message(Clock::time_point deadline, std::string_view phase)
      -> irc::Message;
    void _send(const std::string& line);

    auto _is_bot(std::string_view nick) const -> bool;
    auto _is_me(std::string_view nick) const -> bool;

    void _handle_ctcp(const irc::Message& msg, const irc::CtcpMsg& ctcp);

    const TransferConfig& _config;
    net::Stream _stream;
    std::string _nick;

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace xdcc::transfer
