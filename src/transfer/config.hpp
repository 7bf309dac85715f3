#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "xdcc/locator.hpp"

namespace xdcc::transfer {

using namespace std::chrono_literals;

constexpr std::uint16_t DEFAULT_PLAIN_PORT = 6667;
constexpr std::uint16_t DEFAULT_TLS_PORT = 6697;

enum class Security
{
    Plain,
    PreferTls,
    TlsOnly,
};

struct TransferTimeouts
{
    std::chrono::milliseconds connect = 15s;
    std::chrono::milliseconds registration = 60s;
    std::chrono::milliseconds join = 30s;
    std::chrono::milliseconds offer = 60s;

    // No bytes on the file stream for that long aborts the download
    std::chrono::milliseconds stall = 120s;
};

struct TransferConfig
{
    Locator locator;

    // Directory (offered file name is appended) or full file path
    std::filesystem::path output_path;

    Security security = Security::PreferTls;

    // Empty means a random one
    std::string nickname;

    TransferTimeouts timeouts;
};

}  // namespace xdcc::transfer
