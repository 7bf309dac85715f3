#include "transfer/receiver.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>

#include <asio/error.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "dcc/offer.hpp"
#include "transfer/failure.hpp"
#include "transfer/rate_meter.hpp"

namespace xdcc::transfer {

namespace fs = std::filesystem;

auto resolve_output_path(const fs::path& output_path, const dcc::Offer& offer)
  -> fs::path
{
    const auto filename = dcc::safe_filename(offer.filename);

    if (output_path.empty()) {
        return filename;
    }

    std::error_code ec;
    if (fs::is_directory(output_path, ec)) {
        return output_path / filename;
    }

    return output_path;
}

Receiver::Receiver(
  asio::io_context& io, const TransferConfig& config, dcc::Offer offer
) :
  _config(config),
  _offer(std::move(offer)),
  _stream(io, fmt::format("dcc:{}:{}", _offer.host, _offer.port))
{
}

auto Receiver::run(const EmitFn& emit) -> Completed
{
    using Clock = RateMeter::Clock;

    if (auto connected = _stream.connect(_offer.host, _offer.port, _config.timeouts.connect);
        not connected) {
        const auto& ec = connected.error();
        throw TransferFailure(
          ec == asio::error::timed_out ? Reason::Timeout : Reason::Network,
          fmt::format("DCC connection to {}:{}: {}", _offer.host, _offer.port, ec.message()),
          ec
        );
    }

    const auto path = resolve_output_path(_config.output_path, _offer);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (not file) {
        const std::error_code ec(errno, std::system_category());
        throw TransferFailure(
          Reason::Io, fmt::format("Can't open {}: {}", path.string(), ec.message()), ec
        );
    }

    spdlog::debug("Receiving {} into {}", _offer.filename, path.string());

    emit(Started{
      .announced_size = _offer.size,
      .filename = _offer.filename,
      .path = path,
    });

    std::array<std::uint8_t, BUFFER_SIZE> buffer{};
    RateMeter meter(RATE_WINDOW);

    std::uint64_t received = 0;
    std::uint64_t pending = 0;
    auto last_progress = Clock::now();

    const auto emit_progress = [&](Clock::time_point now) {
        emit(Progress{
          .bytes_since_last = pending,
          .rate = meter.rate(now),
          .bytes_total = received,
        });
        pending = 0;
        last_progress = now;
    };

    while (not _offer.size or received < *_offer.size) {
        auto read = _stream.read_some(buffer, _config.timeouts.stall);

        if (not read) {
            const auto& ec = read.error();

            if (ec == asio::error::eof) {
                if (_offer.size) {
                    throw TransferFailure(
                      Reason::SizeMismatch,
                      fmt::format(
                        "Stream ended after {} of {} bytes", received, *_offer.size
                      )
                    );
                }
                break;
            }

            throw TransferFailure(
              ec == asio::error::timed_out ? Reason::Timeout : Reason::Network,
              fmt::format("DCC stream: {}", ec.message()),
              ec
            );
        }

        const auto count = *read;
        received += count;

        if (_offer.size and received > *_offer.size) {
            throw TransferFailure(
              Reason::SizeMismatch,
              fmt::format("Got {} bytes, {} announced", received, *_offer.size)
            );
        }

        if (not file.write(reinterpret_cast<const char*>(buffer.data()),
                           static_cast<std::streamsize>(count))) {
            const std::error_code ec(errno, std::system_category());
            throw TransferFailure(
              Reason::Io, fmt::format("Write to {}: {}", path.string(), ec.message()), ec
            );
        }

        const auto ack = dcc::pack_ack({.received = received});
        if (auto acked = _stream.write(ack, _config.timeouts.stall); not acked) {
            spdlog::debug("DCC ack not sent: {}", acked.error().message());
        }

        const auto now = Clock::now();
        meter.add(now, count);
        pending += count;

        if (pending >= PROGRESS_BYTES or now - last_progress >= PROGRESS_INTERVAL) {
            emit_progress(now);
        }
    }

    file.flush();
    file.close();

    if (file.fail()) {
        const std::error_code ec(errno, std::system_category());
        throw TransferFailure(
          Reason::Io, fmt::format("Flush {}: {}", path.string(), ec.message()), ec
        );
    }

    if (pending > 0) {
        emit_progress(Clock::now());
    }

    _stream.close();

    return Completed{.bytes_total = received, .path = path};
}

void Receiver::close()
{
    _stream.close();
}

}  // namespace xdcc::transfer
