#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "search/types.hpp"

namespace xdcc::search {

using namespace std::chrono_literals;

/**
 * @brief Queries all registered providers at once and merges their results
 *
 * Results are deduplicated by locator and sorted by size, largest first.
 * Providers still running when the deadline fires are abandoned.
 */
class ProviderAggregator
{
 public:
    constexpr static std::size_t MAX_PROVIDERS = 100;

    // Capacity hint only, results are never truncated
    constexpr static std::size_t MAX_RESULTS = 1024;

    constexpr static auto DEFAULT_TIMEOUT = 10s;

    explicit ProviderAggregator(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    /**
     * @return false when the provider limit is reached
     */
    auto add_provider(ProviderPtr provider) -> bool;

    auto search(const Keywords& keywords)
      -> tl::expected<std::vector<FileRecord>, std::string>;

    auto providers() const -> std::size_t { return _providers.size(); }
    auto timeout() const -> std::chrono::milliseconds { return _timeout; }

 private:
    std::chrono::milliseconds _timeout;
    std::vector<ProviderPtr> _providers;
};

}  // namespace xdcc::search
