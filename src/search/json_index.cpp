#include "search/json_index.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "misc/tools.hpp"
#include "xdcc/locator.hpp"
#include "xdcc/size.hpp"

namespace xdcc::search {

using Json = nlohmann::json;

namespace {

auto entry_size(const Json& entry) -> std::int64_t
{
    if (not entry.contains("size")) {
        return UNKNOWN_SIZE;
    }

    const auto& size = entry.at("size");

    if (size.is_number_unsigned()) {
        const auto bytes = size.get<std::uint64_t>();
        return bytes <= std::uint64_t(std::numeric_limits<std::int64_t>::max())
                 ? std::int64_t(bytes)
                 : UNKNOWN_SIZE;
    }

    // nlohmann_json stores only negative integers as signed
    if (size.is_number_integer()) {
        return UNKNOWN_SIZE;
    }

    if (size.is_string()) {
        return parse_file_size(size.get<std::string>()).value_or(UNKNOWN_SIZE);
    }

    return UNKNOWN_SIZE;
}

/**
 * @brief Pack number given as 5 or "#5"
 */
auto entry_pack(const Json& pack) -> std::uint32_t
{
    if (pack.is_number_unsigned()) {
        const auto number = pack.get<std::uint64_t>();
        return number <= std::numeric_limits<std::uint32_t>::max()
                 ? std::uint32_t(number)
                 : 0;
    }

    if (not pack.is_string()) {
        return 0;
    }

    std::string_view text = pack.get_ref<const std::string&>();
    if (text.starts_with('#')) {
        text.remove_prefix(1);
    }

    // 0 is rejected by the locator validation below
    return utils::to_integer<std::uint32_t>(text).value_or(0);
}

auto entry_locator(const Json& entry) -> tl::expected<Locator, std::string>
{
    if (entry.contains("url")) {
        const auto url = entry.at("url").get<std::string>();

        return Locator::parse(url).map_error([&](LocatorError e) {
            return fmt::format("{} ({})", url, magic_enum::enum_name(e));
        });
    }

    const auto port = entry.value("port", 0);
    if (port < 0 or port > 65535) {
        return tl::make_unexpected(fmt::format("bad port {}", port));
    }

    Locator locator{
      .network = entry.at("network").get<std::string>(),
      .port = static_cast<std::uint16_t>(port),
      .channel = entry.value("channel", std::string{}),
      .bot = entry.at("bot").get<std::string>(),
      .pack = entry_pack(entry.at("pack")),
    };

    if (locator.channel.starts_with('#')) {
        locator.channel.erase(0, 1);
    }

    // Same validation as for the text form
    return Locator::parse(locator.to_string()).map_error([&](LocatorError e) {
        return fmt::format("{} ({})", locator.to_string(), magic_enum::enum_name(e));
    });
}

auto matches(const std::string& name, const Keywords& keywords) -> bool
{
    return std::ranges::all_of(keywords, [&](const auto& keyword) {
        return utils::contains_nocase(name, keyword);
    });
}

}  // namespace

JsonIndexProvider::JsonIndexProvider(std::filesystem::path path) :
  _path(std::move(path))
{
}

auto JsonIndexProvider::name() const -> std::string
{
    return fmt::format("json:{}", _path.filename().string());
}

auto JsonIndexProvider::search(const Keywords& keywords)
  -> tl::expected<std::vector<FileRecord>, std::string>
{
    std::ifstream file(_path);
    if (not file) {
        return tl::make_unexpected(fmt::format("Can't open {}", _path.string()));
    }

    Json catalog;
    try {
        catalog = Json::parse(file);
    }
    catch (const Json::parse_error& e) {
        return tl::make_unexpected(
          fmt::format("Bad catalog {}: {}", _path.string(), e.what())
        );
    }

    if (not catalog.is_array()) {
        return tl::make_unexpected(
          fmt::format("Bad catalog {}: top level must be an array", _path.string())
        );
    }

    std::vector<FileRecord> records;

    for (const auto& entry : catalog) {
        try {
            const auto name = entry.at("name").get<std::string>();
            if (not matches(name, keywords)) {
                continue;
            }

            auto locator = entry_locator(entry);
            if (not locator) {
                spdlog::debug("{}: skipping entry {}", this->name(), locator.error());
                continue;
            }

            records.push_back({
              .locator = std::move(*locator),
              .name = name,
              .size = entry_size(entry),
              .slot = entry.value("slot", 0),
            });
        }
        catch (const Json::exception& e) {
            spdlog::debug("{}: skipping entry: {}", this->name(), e.what());
        }
    }

    return records;
}

}  // namespace xdcc::search
