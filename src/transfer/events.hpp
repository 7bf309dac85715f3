#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "transfer/failure.hpp"

namespace xdcc::transfer {

/**
 * @brief File stream connected, bytes are about to flow
 */
struct Started
{
    std::optional<std::uint64_t> announced_size;
    std::string filename;
    std::filesystem::path path;
};

struct Progress
{
    std::uint64_t bytes_since_last;

    // Bytes per second over the recent window
    double rate;

    std::uint64_t bytes_total;
};

struct Completed
{
    std::uint64_t bytes_total;
    std::filesystem::path path;
};

struct Aborted
{
    Failure failure;
};

using TransferEvent = std::variant<Started, Progress, Completed, Aborted>;

template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline auto is_terminal(const TransferEvent& event) -> bool
{
    return std::holds_alternative<Completed>(event) or
           std::holds_alternative<Aborted>(event);
}

}  // namespace xdcc::transfer
