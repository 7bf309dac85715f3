#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "irc/types.hpp"

namespace xdcc::irc {

auto unpack_message(std::string_view line) -> tl::expected<Message, Error>;
auto unpack_ctcp(std::string_view text) -> std::optional<CtcpMsg>;

auto pack_message(const Message& msg) -> std::string;

auto pack_nick(std::string_view nick) -> std::string;
auto pack_user(std::string_view nick) -> std::string;
auto pack_join(std::string_view channel) -> std::string;
auto pack_pong(std::string_view token) -> std::string;
auto pack_quit(std::string_view reason) -> std::string;
auto pack_privmsg(std::string_view target, std::string_view text)
  -> std::string;
auto pack_notice(std::string_view target, std::string_view text)
  -> std::string;
auto pack_ctcp(std::string_view target, const CtcpMsg& ctcp) -> std::string;

// CTCP replies travel as NOTICE
auto pack_ctcp_reply(std::string_view target, const CtcpMsg& ctcp)
  -> std::string;

auto pack_xdcc_send(std::string_view bot, std::uint32_t pack) -> std::string;

}  // namespace xdcc::irc
