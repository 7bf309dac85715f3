#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

namespace xdcc::transfer {

/**
 * @brief Throughput over a sliding time window
 */
class RateMeter
{
 public:
    using Clock = std::chrono::steady_clock;

    explicit RateMeter(std::chrono::milliseconds window) : _window(window) {}

    inline void add(Clock::time_point at, std::uint64_t bytes)
    {
        if (not _first_sample) {
            _first_sample = at;
        }

        _samples.emplace_back(at, bytes);

        while (not _samples.empty() and _samples.front().first < at - _window) {
            _samples.pop_front();
        }
    }

    /**
     * @brief Bytes per second, measured over the window or since the first
     *  sample if that is shorter
     */
    inline auto rate(Clock::time_point now) const -> double
    {
        if (not _first_sample) {
            return 0.0;
        }

        std::uint64_t bytes = 0;
        for (const auto& [at, count] : _samples) {
            if (at >= now - _window) {
                bytes += count;
            }
        }

        const auto span = std::clamp<Clock::duration>(
          now - *_first_sample, std::chrono::milliseconds(1), _window
        );

        return static_cast<double>(bytes) /
               std::chrono::duration<double>(span).count();
    }

 private:
    std::chrono::milliseconds _window;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> _samples;
    std::optional<Clock::time_point> _first_sample;
};

}  // namespace xdcc::transfer
