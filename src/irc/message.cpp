#include "irc/message.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "irc/types.hpp"

namespace xdcc::irc {

namespace {

auto next_word(std::string_view& rest) -> std::string_view
{
    const auto end = rest.find(' ');
    const auto word = rest.substr(0, end);

    rest = end == std::string_view::npos ? std::string_view{}
                                         : rest.substr(end + 1);

    while (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }

    return word;
}

/**
 * @brief Drop characters that would break line framing
 */
auto sanitize(std::string_view part) -> std::string
{
    std::string clean{part};
    std::erase_if(clean, [](char c) { return c == '\r' or c == '\n' or c == '\0'; });
    return clean;
}

}  // namespace

auto unpack_message(std::string_view line) -> tl::expected<Message, Error>
{
    while (line.ends_with('\n') or line.ends_with('\r')) {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return tl::make_unexpected(Error::EMPTY_LINE);
    }

    // IRCv3 message tags are not used
    if (line.starts_with('@')) {
        next_word(line);
    }

    Message msg;

    if (line.starts_with(':')) {
        line.remove_prefix(1);
        msg.prefix = next_word(line);

        if (msg.prefix.empty()) {
            return tl::make_unexpected(Error::MALFORMED_PREFIX);
        }
    }

    msg.command = next_word(line);
    if (msg.command.empty()) {
        return tl::make_unexpected(Error::MISSING_COMMAND);
    }

    std::ranges::transform(msg.command, msg.command.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    while (not line.empty()) {
        if (line.starts_with(':')) {
            msg.params.emplace_back(line.substr(1));
            break;
        }
        msg.params.emplace_back(next_word(line));
    }

    return msg;
}

auto unpack_ctcp(std::string_view text) -> std::optional<CtcpMsg>
{
    if (text.size() < 2 or text.front() != CTCP_DELIMITER) {
        return std::nullopt;
    }

    text.remove_prefix(1);

    // Closing delimiter is optional in the wild
    if (text.ends_with(CTCP_DELIMITER)) {
        text.remove_suffix(1);
    }

    CtcpMsg ctcp;
    ctcp.command = next_word(text);
    ctcp.args = text;

    if (ctcp.command.empty()) {
        return std::nullopt;
    }

    std::ranges::transform(ctcp.command, ctcp.command.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    return ctcp;
}

auto pack_message(const Message& msg) -> std::string
{
    std::string line;

    if (not msg.prefix.empty()) {
        line += fmt::format(":{} ", sanitize(msg.prefix));
    }

    line += sanitize(msg.command);

    for (std::size_t i = 0; i < msg.params.size(); i++) {
        const auto param = sanitize(msg.params[i]);
        const bool is_last = i + 1 == msg.params.size();

        if (is_last and (param.empty() or param.starts_with(':') or
                         param.find(' ') != std::string::npos)) {
            line += fmt::format(" :{}", param);
        }
        else {
            line += fmt::format(" {}", param);
        }
    }

    if (line.size() > MAX_LINE_LENGTH - 2) {
        line.resize(MAX_LINE_LENGTH - 2);
    }

    return line + "\r\n";
}

auto pack_nick(std::string_view nick) -> std::string
{
    return pack_message({.command = "NICK", .params = {std::string{nick}}});
}

auto pack_user(std::string_view nick) -> std::string
{
    return pack_message(
      {.command = "USER",
       .params = {std::string{nick}, "0", "*", std::string{nick}}}
    );
}

auto pack_join(std::string_view channel) -> std::string
{
    return pack_message({.command = "JOIN", .params = {std::string{channel}}});
}

auto pack_pong(std::string_view token) -> std::string
{
    return pack_message({.command = "PONG", .params = {std::string{token}}});
}

auto pack_quit(std::string_view reason) -> std::string
{
    return pack_message({.command = "QUIT", .params = {std::string{reason}}});
}

auto pack_privmsg(std::string_view target, std::string_view text)
  -> std::string
{
    return pack_message(
      {.command = "PRIVMSG", .params = {std::string{target}, std::string{text}}}
    );
}

auto pack_ctcp(std::string_view target, const CtcpMsg& ctcp) -> std::string
{
    const auto body = ctcp.args.empty()
                        ? ctcp.command
                        : fmt::format("{} {}", ctcp.command, ctcp.args);

    return pack_privmsg(
      target, fmt::format("{0}{1}{0}", CTCP_DELIMITER, body)
    );
}

auto pack_notice(std::string_view target, std::string_view text)
  -> std::string
{
    return pack_message(
      {.command = "NOTICE", .params = {std::string{target}, std::string{text}}}
    );
}

auto pack_ctcp_reply(std::string_view target, const CtcpMsg& ctcp) -> std::string
{
    const auto body = ctcp.args.empty()
                        ? ctcp.command
                        : fmt::format("{} {}", ctcp.command, ctcp.args);

    return pack_notice(
      target, fmt::format("{0}{1}{0}", CTCP_DELIMITER, body)
    );
}

auto pack_xdcc_send(std::string_view bot, std::uint32_t pack) -> std::string
{
    return pack_ctcp(bot, {.command = "XDCC", .args = fmt::format("SEND #{}", pack)});
}

}  // namespace xdcc::irc
