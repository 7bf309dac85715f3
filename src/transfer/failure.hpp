#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace xdcc::transfer {

enum class Reason
{
    Network,
    Timeout,
    MalformedOffer,
    UnsupportedOffer,
    QueueFull,
    NoSlots,
    ChannelRequired,
    Banned,
    Rejected,
    Io,
    SizeMismatch,
    Cancelled,
};

/**
 * @brief Why a transfer ended without the file
 *
 * For rejections message keeps the text sent by the bot or the server.
 */
struct Failure
{
    Reason reason;
    std::string message;
    std::error_code cause = {};

    auto to_string() const -> std::string
    {
        return fmt::format("{}: {}", magic_enum::enum_name(reason), message);
    }
};

inline auto is_rejection(Reason reason) -> bool
{
    switch (reason) {
        case Reason::QueueFull:
        case Reason::NoSlots:
        case Reason::ChannelRequired:
        case Reason::Banned:
        case Reason::Rejected:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Carries a Failure out of the protocol code
 */
class TransferFailure : public std::runtime_error
{
 public:
    explicit TransferFailure(Failure failure) :
      std::runtime_error(failure.to_string()),
      _failure(std::move(failure))
    {
    }

    TransferFailure(Reason reason, std::string message, std::error_code cause = {}) :
      TransferFailure(Failure{reason, std::move(message), cause})
    {
    }

    auto failure() const -> const Failure& { return _failure; }

 private:
    Failure _failure;
};

}  // namespace xdcc::transfer
