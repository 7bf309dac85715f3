#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "xdcc/locator.hpp"
#include "xdcc/size.hpp"

namespace xdcc::search {

using Keywords = std::vector<std::string>;

/**
 * @brief One pack found by a provider
 */
struct FileRecord
{
    Locator locator;
    std::string name;

    // Bytes, UNKNOWN_SIZE when the provider could not tell
    std::int64_t size = UNKNOWN_SIZE;

    int slot = 0;
};

/**
 * @brief Search backend
 *
 * Returning an error or throwing means the provider contributes nothing to
 * the current search.
 */
class SearchProvider
{
 public:
    virtual ~SearchProvider() = default;

    virtual auto name() const -> std::string = 0;
    virtual auto search(const Keywords& keywords)
      -> tl::expected<std::vector<FileRecord>, std::string> = 0;
};

using ProviderPtr = std::shared_ptr<SearchProvider>;

}  // namespace xdcc::search
