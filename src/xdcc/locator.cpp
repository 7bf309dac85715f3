#include "xdcc/locator.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "misc/parse_ip_port.hpp"
#include "misc/tools.hpp"

namespace xdcc {

namespace {

auto is_valid_component(std::string_view part) -> bool
{
    if (part.empty()) {
        return false;
    }

    return std::ranges::none_of(part, [](unsigned char c) {
        return c == '/' or std::isspace(c) or std::iscntrl(c);
    });
}

auto strip_channel_prefix(std::string_view channel) -> std::string_view
{
    if (channel.starts_with("%23")) {
        channel.remove_prefix(3);
    }
    else if (channel.starts_with('#')) {
        channel.remove_prefix(1);
    }
    return channel;
}

}  // namespace

auto Locator::parse(std::string_view text) -> tl::expected<Locator, LocatorError>
{
    text = utils::trim(text);

    if (text.empty()) {
        return tl::make_unexpected(LocatorError::EMPTY);
    }

    if (not text.starts_with(SCHEME)) {
        return tl::make_unexpected(LocatorError::BAD_SCHEME);
    }
    text.remove_prefix(SCHEME.size());

    const auto segments = utils::split(text, '/');
    if (segments.size() != 3 and segments.size() != 4) {
        return tl::make_unexpected(LocatorError::BAD_PATH);
    }

    Locator locator;

    auto host_port = utils::parse_host_port(std::string{segments[0]});
    if (not host_port) {
        return tl::make_unexpected(LocatorError::BAD_NETWORK);
    }
    std::tie(locator.network, locator.port) = *host_port;

    auto bot_segment = segments[1];
    auto pack_segment = segments[2];

    if (segments.size() == 4) {
        const auto channel = strip_channel_prefix(segments[1]);
        if (not is_valid_component(channel)) {
            return tl::make_unexpected(LocatorError::BAD_CHANNEL);
        }
        locator.channel = channel;

        bot_segment = segments[2];
        pack_segment = segments[3];
    }

    if (not is_valid_component(bot_segment)) {
        return tl::make_unexpected(LocatorError::BAD_BOT);
    }
    locator.bot = bot_segment;

    if (pack_segment.starts_with('#')) {
        pack_segment.remove_prefix(1);
    }

    auto pack = utils::to_integer<std::uint32_t>(pack_segment);
    if (not pack or *pack == 0) {
        return tl::make_unexpected(LocatorError::BAD_PACK);
    }
    locator.pack = *pack;

    return locator;
}

auto Locator::to_string() const -> std::string
{
    auto address = port == 0 ? network : fmt::format("{}:{}", network, port);

    if (has_channel()) {
        return fmt::format(
          "{}{}/{}/{}/{}", SCHEME, address, channel_name(), bot, pack
        );
    }

    return fmt::format("{}{}/{}/{}", SCHEME, address, bot, pack);
}

}  // namespace xdcc
