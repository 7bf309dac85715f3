#include "misc/progress.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <indicators/color.hpp>
#include <indicators/font_style.hpp>
#include <indicators/progress_bar.hpp>
#include <indicators/setting.hpp>

#include "xdcc/size.hpp"

namespace xdcc::utils {

auto progress_bar(std::string prefix, ind::Color color)
  -> std::unique_ptr<ind::ProgressBar>
{
    using namespace indicators;

    return std::make_unique<ProgressBar>(
      option::BarWidth{40}, option::Start{"["}, option::Fill{"■"},
      option::Lead{"■"}, option::Remainder{"-"}, option::End{" ]"},
      option::PrefixText{std::move(prefix)}, option::PostfixText{"..."},
      option::ForegroundColor{color},
      option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
      option::ShowElapsedTime{true}
    );
}

void set_progress(
  ind::ProgressBar& bar,
  std::uint64_t received,
  std::optional<std::uint64_t> total,
  double rate
)
{
    const auto speed = format_size(static_cast<std::int64_t>(rate));

    if (not total or *total == 0) {
        bar.set_option(ind::option::PostfixText{fmt::format(
          "{} {}/s", format_size(static_cast<std::int64_t>(received)), speed
        )});
        return;
    }

    bar.set_option(ind::option::PostfixText{fmt::format(
      "{}/{} {}/s",
      format_size(static_cast<std::int64_t>(received)),
      format_size(static_cast<std::int64_t>(*total)),
      speed
    )});

    const auto progress =
      static_cast<std::size_t>((double(received) / double(*total)) * 100.0);
    bar.set_progress(progress);
}

void set_finished(ind::ProgressBar& bar, const std::string& text, ind::Color color)
{
    bar.set_option(ind::option::ForegroundColor{color});
    bar.set_option(ind::option::PostfixText{text});
    bar.mark_as_completed();
}

}  // namespace xdcc::utils
