#pragma once

#include <filesystem>
#include <string>

namespace xdcc {

constexpr auto OUTPUT_DIR_ENV = "XDCC_OUTPUT_DIR";
constexpr auto NICK_ENV = "XDCC_NICK";

/**
 * @brief Directory downloads go to when none is given on the command line
 *
 * $XDCC_OUTPUT_DIR, then ~/Downloads (created if missing), then the current
 * directory.
 */
auto default_output_dir() -> std::filesystem::path;

/**
 * @brief $XDCC_NICK or a random "xdccNNNNN"
 */
auto default_nickname() -> std::string;

auto random_nickname() -> std::string;

}  // namespace xdcc
