#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "search/types.hpp"

namespace xdcc::search {

/**
 * @brief Provider backed by a local JSON pack catalog
 *
 * The catalog is an array of objects, either
 *   {"network", "port"?, "channel"?, "bot", "pack", "name", "size", "slot"?}
 * or
 *   {"url": "irc://...", "name", "size", "slot"?}.
 * "size" is a byte count or a size token such as "1.5G".
 *
 * The file is read on every search.
 */
class JsonIndexProvider : public SearchProvider
{
 public:
    explicit JsonIndexProvider(std::filesystem::path path);

    auto name() const -> std::string override;
    auto search(const Keywords& keywords)
      -> tl::expected<std::vector<FileRecord>, std::string> override;

 private:
    std::filesystem::path _path;
};

}  // namespace xdcc::search
