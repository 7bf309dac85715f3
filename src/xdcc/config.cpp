#include "xdcc/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace xdcc {

namespace fs = std::filesystem;

auto default_output_dir() -> fs::path
{
    if (const char* dir = std::getenv(OUTPUT_DIR_ENV); dir and *dir) {
        return dir;
    }

    const char* home = std::getenv("HOME");
    if (not home or not *home) {
        return ".";
    }

    auto downloads = fs::path(home) / "Downloads";

    std::error_code ec;
    if (fs::is_directory(downloads, ec)) {
        return downloads;
    }

    if (fs::create_directories(downloads, ec); ec) {
        spdlog::debug("Can't create {}: {}", downloads.string(), ec.message());
        return ".";
    }

    return downloads;
}

auto default_nickname() -> std::string
{
    if (const char* nick = std::getenv(NICK_ENV); nick and *nick) {
        return nick;
    }

    return random_nickname();
}

auto random_nickname() -> std::string
{
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> digits(0, 99999);

    return fmt::format("xdcc{:05}", digits(gen));
}

}  // namespace xdcc
