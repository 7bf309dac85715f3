#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace xdcc::irc {

constexpr std::size_t MAX_LINE_LENGTH = 512;
constexpr char CTCP_DELIMITER = '\x01';

namespace numeric {

constexpr std::string_view WELCOME = "001";
constexpr std::string_view NO_SUCH_NICK = "401";
constexpr std::string_view NO_SUCH_CHANNEL = "403";
constexpr std::string_view CANNOT_SEND_TO_CHANNEL = "404";
constexpr std::string_view END_OF_NAMES = "366";
constexpr std::string_view ERRONEOUS_NICKNAME = "432";
constexpr std::string_view NICKNAME_IN_USE = "433";
constexpr std::string_view CHANNEL_IS_FULL = "471";
constexpr std::string_view INVITE_ONLY_CHANNEL = "473";
constexpr std::string_view BANNED_FROM_CHANNEL = "474";
constexpr std::string_view BAD_CHANNEL_KEY = "475";
constexpr std::string_view NEED_REGGED_NICK = "477";

}  // namespace numeric

enum class Error
{
    EMPTY_LINE,
    MALFORMED_PREFIX,
    MISSING_COMMAND,
};

/**
 * @brief One IRC protocol line
 *
 * Trailing parameter (after " :") is stored as the last element of params.
 */
struct Message
{
    std::string prefix;
    std::string command;
    std::vector<std::string> params;

    /**
     * @brief Nickname part of the prefix ("nick!user@host" -> "nick")
     */
    auto nick() const -> std::string_view
    {
        std::string_view source{prefix};
        return source.substr(0, source.find('!'));
    }

    auto param(std::size_t idx) const -> std::string_view
    {
        return idx < params.size() ? std::string_view{params[idx]}
                                   : std::string_view{};
    }

    auto trailing() const -> std::string_view
    {
        return params.empty() ? std::string_view{}
                              : std::string_view{params.back()};
    }

    auto is(std::string_view verb) const -> bool { return command == verb; }
};

/**
 * @brief Client-to-client message embedded into PRIVMSG or NOTICE
 */
struct CtcpMsg
{
    std::string command;
    std::string args;
};

}  // namespace xdcc::irc
