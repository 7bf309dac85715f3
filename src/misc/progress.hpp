#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <indicators/color.hpp>
#include <indicators/dynamic_progress.hpp>
#include <indicators/progress_bar.hpp>

namespace xdcc::utils {

namespace ind = indicators;

using MultiprogressBar = ind::DynamicProgress<ind::ProgressBar>;

constexpr static auto DEFAULT_BAR_COLOR = ind::Color::grey;

auto progress_bar(std::string prefix, ind::Color color = DEFAULT_BAR_COLOR)
  -> std::unique_ptr<ind::ProgressBar>;

/**
 * @brief Show received bytes, percentage when the total is known, and rate
 */
void set_progress(
  ind::ProgressBar& bar,
  std::uint64_t received,
  std::optional<std::uint64_t> total,
  double rate
);

void set_finished(ind::ProgressBar& bar, const std::string& text, ind::Color color);

}  // namespace xdcc::utils
