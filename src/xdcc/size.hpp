#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace xdcc {

constexpr std::int64_t KILOBYTE = 1024;
constexpr std::int64_t MEGABYTE = KILOBYTE * 1024;
constexpr std::int64_t GIGABYTE = MEGABYTE * 1024;

/**
 * @brief Size of a record whose size is not known
 */
constexpr std::int64_t UNKNOWN_SIZE = -1;

enum class SizeError
{
    EMPTY,
    BAD_NUMBER,
    BAD_UNIT,
    TOO_LARGE,
};

/**
 * @brief Parse size token as published by pack lists: "1.5G", "500M", "10K"
 *
 * The unit letter is mandatory. Fractional values are truncated after
 * scaling.
 */
auto parse_file_size(std::string_view) -> tl::expected<std::int64_t, SizeError>;

/**
 * @brief Lenient size parser for user filters: "1gb", "500 MB", "42"
 *
 * Case-insensitive, unit is optional (bytes) and only its first letter
 * counts.
 */
auto parse_size_filter(std::string_view)
  -> tl::expected<std::int64_t, SizeError>;

auto format_size(std::int64_t bytes) -> std::string;

}  // namespace xdcc
