#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "dcc/types.hpp"
#include "irc/types.hpp"

namespace xdcc::dcc {

auto unpack_offer(const irc::CtcpMsg& ctcp) -> tl::expected<Offer, Error>;
auto unpack_offer(std::string_view send_args) -> tl::expected<Offer, Error>;

auto pack_ack(AckMsg ack) -> std::vector<std::uint8_t>;
auto unpack_ack(std::span<const std::uint8_t> msg) -> tl::expected<AckMsg, Error>;

/**
 * @brief Dotted quad for an address sent as a host-order integer
 */
auto host_from_integer(std::uint32_t address) -> std::string;

/**
 * @brief Offered file name reduced to something safe to create locally
 */
auto safe_filename(std::string_view offered) -> std::string;

}  // namespace xdcc::dcc
