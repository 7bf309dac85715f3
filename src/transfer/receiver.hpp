#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

#include <asio/io_context.hpp>

#include "dcc/types.hpp"
#include "misc/stream.hpp"
#include "transfer/config.hpp"
#include "transfer/events.hpp"

namespace xdcc::transfer {

using namespace std::chrono_literals;

constexpr auto PROGRESS_INTERVAL = 500ms;
constexpr std::uint64_t PROGRESS_BYTES = 4 * 1024 * 1024;
constexpr auto RATE_WINDOW = 3s;

/**
 * @brief Where the offered file is written to
 *
 * An empty output path or an existing directory gets the sanitised offered
 * name appended, anything else is used as the file path.
 */
auto resolve_output_path(
  const std::filesystem::path& output_path, const dcc::Offer& offer
) -> std::filesystem::path;

/**
 * @brief Client side of a passive DCC SEND
 */
class Receiver
{
 public:
    using EmitFn = std::function<void(TransferEvent)>;

    constexpr static std::size_t BUFFER_SIZE = 64 * 1024;

    Receiver(asio::io_context& io, const TransferConfig& config, dcc::Offer offer);

    /**
     * @brief Download the whole file
     *
     * Emits Started and Progress through emit and returns the Completed
     * event. Throws TransferFailure otherwise.
     */
    auto run(const EmitFn& emit) -> Completed;

    void close();

 private:
    const TransferConfig& _config;
    dcc::Offer _offer;
    net::Stream _stream;
};

}  // namespace xdcc::transfer
