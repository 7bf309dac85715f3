#include "dcc/offer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "dcc/types.hpp"
#include "irc/types.hpp"
#include "misc/tools.hpp"

namespace xdcc::dcc {

namespace {

auto next_token(std::string_view& rest) -> std::string_view
{
    while (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }

    const auto end = rest.find(' ');
    const auto token = rest.substr(0, end);
    rest = end == std::string_view::npos ? std::string_view{}
                                         : rest.substr(end + 1);
    return token;
}

auto next_filename(std::string_view& rest) -> tl::expected<std::string, Error>
{
    while (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }

    if (not rest.starts_with('"')) {
        return std::string{next_token(rest)};
    }

    const auto closing = rest.find('"', 1);
    if (closing == std::string_view::npos) {
        return tl::make_unexpected(Error::BAD_FILENAME);
    }

    std::string filename{rest.substr(1, closing - 1)};
    rest.remove_prefix(closing + 1);

    return filename;
}

auto parse_host(std::string_view host) -> tl::expected<std::string, Error>
{
    if (host.empty()) {
        return tl::make_unexpected(Error::BAD_HOST);
    }

    if (std::ranges::all_of(host, [](unsigned char c) { return std::isdigit(c); })) {
        auto address = utils::to_integer<std::uint32_t>(host);
        if (not address or *address == 0) {
            return tl::make_unexpected(Error::BAD_HOST);
        }
        return host_from_integer(*address);
    }

    const bool is_address_text = std::ranges::all_of(host, [](unsigned char c) {
        return std::isalnum(c) or c == '.' or c == ':' or c == '-';
    });

    if (not is_address_text) {
        return tl::make_unexpected(Error::BAD_HOST);
    }

    return std::string{host};
}

}  // namespace

auto unpack_offer(const irc::CtcpMsg& ctcp) -> tl::expected<Offer, Error>
{
    if (ctcp.command != "DCC") {
        return tl::make_unexpected(Error::NOT_DCC_SEND);
    }

    std::string_view args{ctcp.args};
    const auto verb = utils::to_lower(next_token(args));

    if (verb != "send") {
        return tl::make_unexpected(Error::NOT_DCC_SEND);
    }

    return unpack_offer(args);
}

auto unpack_offer(std::string_view args) -> tl::expected<Offer, Error>
{
    args = utils::trim(args);

    auto filename = next_filename(args);
    if (not filename) {
        return tl::make_unexpected(filename.error());
    }
    if (filename->empty()) {
        return tl::make_unexpected(Error::MISSING_FIELDS);
    }

    const auto host_token = next_token(args);
    const auto port_token = next_token(args);
    const auto size_token = next_token(args);

    if (host_token.empty() or port_token.empty()) {
        return tl::make_unexpected(Error::MISSING_FIELDS);
    }

    auto port = utils::to_integer<std::uint32_t>(port_token);
    if (not port or *port > 65535) {
        return tl::make_unexpected(Error::BAD_PORT);
    }

    // Port 0 asks us to listen (reverse DCC); only client-initiated streams
    // are supported.
    if (*port == 0) {
        return tl::make_unexpected(Error::REVERSE_DCC);
    }

    auto host = parse_host(host_token);
    if (not host) {
        return tl::make_unexpected(host.error());
    }

    Offer offer{
      .filename = std::move(*filename),
      .host = std::move(*host),
      .port = static_cast<std::uint16_t>(*port),
      .size = std::nullopt,
    };

    if (not size_token.empty()) {
        auto size = utils::to_integer<std::uint64_t>(size_token);
        if (not size) {
            return tl::make_unexpected(Error::BAD_SIZE);
        }
        offer.size = *size;
    }

    return offer;
}

auto pack_ack(AckMsg ack) -> std::vector<std::uint8_t>
{
    const auto value = static_cast<std::uint32_t>(ack.received & 0xFFFFFFFF);

    return {
      static_cast<std::uint8_t>((value >> 24) & 0xFF),
      static_cast<std::uint8_t>((value >> 16) & 0xFF),
      static_cast<std::uint8_t>((value >> 8) & 0xFF),
      static_cast<std::uint8_t>(value & 0xFF),
    };
}

auto unpack_ack(std::span<const std::uint8_t> msg) -> tl::expected<AckMsg, Error>
{
    if (msg.size() < AckMsg::SIZE) {
        return tl::make_unexpected(Error::MISSING_FIELDS);
    }

    return AckMsg{
      .received = (std::uint32_t)msg[0] << 24 | ((std::uint32_t)msg[1] << 16) |
                  ((std::uint32_t)msg[2] << 8) | ((std::uint32_t)msg[3])
    };
}

auto host_from_integer(std::uint32_t address) -> std::string
{
    return fmt::format(
      "{}.{}.{}.{}", (address >> 24) & 0xFF, (address >> 16) & 0xFF,
      (address >> 8) & 0xFF, address & 0xFF
    );
}

auto safe_filename(std::string_view offered) -> std::string
{
    const auto slash = offered.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        offered.remove_prefix(slash + 1);
    }

    std::string name;
    for (unsigned char c : offered) {
        if (not std::iscntrl(c)) {
            name.push_back(static_cast<char>(c));
        }
    }

    while (name.starts_with('.')) {
        name.erase(0, 1);
    }

    return name.empty() ? std::string{"download.bin"} : name;
}

}  // namespace xdcc::dcc
