#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <tl/expected.hpp>

namespace xdcc {

enum class LocatorError
{
    EMPTY,
    BAD_SCHEME,
    BAD_NETWORK,
    BAD_PATH,
    BAD_CHANNEL,
    BAD_BOT,
    BAD_PACK,
};

/**
 * @brief Identifies one pack offered by one bot
 *
 * Text form: irc://<network>[:<port>]/[#<channel>/]<bot>/<pack>
 *
 * Channel is kept without the leading '#'. Port 0 means "network default".
 */
struct Locator
{
    constexpr static std::string_view SCHEME = "irc://";

    std::string network;
    std::uint16_t port = 0;
    std::string channel;
    std::string bot;
    std::uint32_t pack = 0;

    static auto parse(std::string_view) -> tl::expected<Locator, LocatorError>;

    auto to_string() const -> std::string;

    auto has_channel() const -> bool { return not channel.empty(); }

    /**
     * @brief Channel name as used on the wire ("#name")
     */
    auto channel_name() const -> std::string { return "#" + channel; }

    auto operator<=>(const Locator&) const = default;
};

}  // namespace xdcc

template<>
struct fmt::formatter<xdcc::Locator> : fmt::formatter<std::string_view>
{
    auto format(const xdcc::Locator& locator, fmt::format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(
          locator.to_string(), ctx
        );
    }
};
