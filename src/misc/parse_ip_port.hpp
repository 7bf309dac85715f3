#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <tuple>

#include "misc/tools.hpp"

namespace xdcc::utils {

/**
 * @brief Split "<host>[:<port>]" into host and port (0 if omitted)
 *
 * Host is a DNS name or a dotted IPv4 address.
 */
inline auto parse_host_port(const std::string& host_port_str)
  -> std::optional<std::tuple<std::string, std::uint16_t>>
{
    static const std::regex host_port_regex(  //
      R"(([A-Za-z0-9](?:[A-Za-z0-9\-.]*[A-Za-z0-9])?)(?::(\d{1,5}))?)"
    );
    std::smatch match;

    if (not std::regex_match(host_port_str, match, host_port_regex)) {
        return std::nullopt;
    }

    auto host = match[1].str();

    if (not match[2].matched) {
        return std::tuple{host, std::uint16_t{0}};
    }

    auto port = to_integer<unsigned>(match[2].str());
    if (not port or *port == 0 or *port > 65535) {
        return std::nullopt;
    }

    return std::tuple{host, static_cast<std::uint16_t>(*port)};
}

}  // namespace xdcc::utils
