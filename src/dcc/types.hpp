#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace xdcc::dcc {

/**
 * @brief Acknowledge counter: big-endian 32-bit count of received bytes
 */
struct AckMsg
{
    constexpr static std::size_t SIZE = 4;

    std::uint64_t received;
};

/**
 * @brief File offer sent by a bot: CTCP "DCC SEND <file> <host> <port> [size]"
 */
struct Offer
{
    std::string filename;
    std::string host;
    std::uint16_t port;
    std::optional<std::uint64_t> size;
};

enum class Error
{
    NOT_DCC_SEND,
    MISSING_FIELDS,
    BAD_FILENAME,
    BAD_HOST,
    BAD_PORT,
    BAD_SIZE,
    REVERSE_DCC,
};

}  // namespace xdcc::dcc
