#include "xdcc/size.hpp"

#include <cctype>
#include <cmath>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "misc/tools.hpp"

namespace xdcc {

namespace {

auto is_decimal_number(std::string_view number) -> bool
{
    bool have_digit = false;
    bool have_point = false;

    for (auto c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            have_digit = true;
        }
        else if (c == '.' and not have_point) {
            have_point = true;
        }
        else {
            return false;
        }
    }

    return have_digit;
}

auto to_double(std::string_view number) -> tl::expected<double, SizeError>
{
    if (not is_decimal_number(number)) {
        return tl::make_unexpected(SizeError::BAD_NUMBER);
    }

    double value{};
    auto result = std::from_chars(
      number.data(), number.data() + number.size(), value,
      std::chars_format::fixed
    );

    if (result.ec != std::errc{} or result.ptr != number.end()) {
        return tl::make_unexpected(SizeError::BAD_NUMBER);
    }

    return value;
}

auto unit_multiplier(char unit) -> tl::expected<std::int64_t, SizeError>
{
    switch (unit) {
        case 'K':
            return KILOBYTE;
        case 'M':
            return MEGABYTE;
        case 'G':
            return GIGABYTE;
        default:
            return tl::make_unexpected(SizeError::BAD_UNIT);
    }
}

// Stays below INT64_MAX after double rounding
constexpr double MAX_SIZE = 9.2e18;

auto scale(double value, std::int64_t multiplier) -> tl::expected<std::int64_t, SizeError>
{
    const auto bytes = value * static_cast<double>(multiplier);

    if (not std::isfinite(bytes) or bytes >= MAX_SIZE) {
        return tl::make_unexpected(SizeError::TOO_LARGE);
    }

    return static_cast<std::int64_t>(bytes);
}

}  // namespace

auto parse_file_size(std::string_view size_str)
  -> tl::expected<std::int64_t, SizeError>
{
    if (size_str.empty()) {
        return tl::make_unexpected(SizeError::EMPTY);
    }

    const auto unit = size_str.back();
    const auto number = size_str.substr(0, size_str.size() - 1);

    if (std::isdigit(static_cast<unsigned char>(unit)) or unit == '.') {
        return tl::make_unexpected(SizeError::BAD_UNIT);
    }

    auto multiplier = unit_multiplier(unit);
    if (not multiplier) {
        return tl::make_unexpected(multiplier.error());
    }

    return to_double(number).and_then([&](double value) {
        return scale(value, *multiplier);
    });
}

auto parse_size_filter(std::string_view size_str)
  -> tl::expected<std::int64_t, SizeError>
{
    const auto lowered = utils::to_lower(utils::trim(size_str));
    const std::string_view text{lowered};

    if (text.empty()) {
        return tl::make_unexpected(SizeError::EMPTY);
    }

    const auto number_end = text.find_first_not_of("0123456789.");
    const auto number = text.substr(0, number_end);
    const auto unit = number_end == std::string_view::npos
                        ? std::string_view{}
                        : utils::trim(text.substr(number_end));

    auto value = to_double(number);
    if (not value) {
        return tl::make_unexpected(value.error());
    }

    if (unit.empty()) {
        return scale(*value, 1);
    }

    auto multiplier = unit_multiplier(
      static_cast<char>(std::toupper(static_cast<unsigned char>(unit.front())))
    );
    if (not multiplier) {
        return tl::make_unexpected(multiplier.error());
    }

    return scale(*value, *multiplier);
}

auto format_size(std::int64_t bytes) -> std::string
{
    if (bytes < 0) {
        return "--";
    }

    const auto value = static_cast<double>(bytes);

    if (bytes >= GIGABYTE) {
        return fmt::format("{:.2f}GB", value / GIGABYTE);
    }
    if (bytes >= MEGABYTE) {
        return fmt::format("{:.2f}MB", value / MEGABYTE);
    }
    if (bytes >= KILOBYTE) {
        return fmt::format("{:.2f}KB", value / KILOBYTE);
    }

    return fmt::format("{}B", bytes);
}

}  // namespace xdcc
