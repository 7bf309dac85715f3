#include "search/aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace xdcc::search {

namespace {

/**
 * @brief State shared between one search call and its provider threads
 *
 * Outlives the call while abandoned providers still run.
 */
struct SearchRound
{
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t pending = 0;
    bool closed = false;
    std::vector<std::vector<FileRecord>> shards;

    void hand_over(std::vector<FileRecord> batch)
    {
        {
            std::lock_guard lock(mutex);

            --pending;
            if (closed) {
                return;
            }
            if (not batch.empty()) {
                shards.push_back(std::move(batch));
            }
        }
        cv.notify_all();
    }
};

auto query(SearchProvider& provider, const Keywords& keywords)
  -> std::vector<FileRecord>
{
    try {
        auto found = provider.search(keywords);

        if (not found) {
            spdlog::warn("Provider {} failed: {}", provider.name(), found.error());
            return {};
        }

        spdlog::debug("Provider {}: {} results", provider.name(), found->size());
        return std::move(*found);
    }
    catch (const std::exception& e) {
        spdlog::warn("Provider {} threw: {}", provider.name(), e.what());
    }

    return {};
}

}  // namespace

ProviderAggregator::ProviderAggregator(std::chrono::milliseconds timeout) :
  _timeout(timeout)
{
}

auto ProviderAggregator::add_provider(ProviderPtr provider) -> bool
{
    if (_providers.size() >= MAX_PROVIDERS) {
        spdlog::warn(
          "Provider {} not added: limit of {} reached", provider->name(), MAX_PROVIDERS
        );
        return false;
    }

    _providers.push_back(std::move(provider));
    return true;
}

auto ProviderAggregator::search(const Keywords& keywords)
  -> tl::expected<std::vector<FileRecord>, std::string>
{
    if (_providers.empty()) {
        return std::vector<FileRecord>{};
    }

    const auto deadline = std::chrono::steady_clock::now() + _timeout;
    auto round = std::make_shared<SearchRound>();

    for (const auto& provider : _providers) {
        {
            std::lock_guard lock(round->mutex);
            ++round->pending;
        }

        try {
            std::thread([round, provider, keywords] {
                round->hand_over(query(*provider, keywords));
            }).detach();
        }
        catch (const std::system_error& e) {
            spdlog::warn("Can't query provider {}: {}", provider->name(), e.what());

            std::lock_guard lock(round->mutex);
            --round->pending;
        }
    }

    std::vector<std::vector<FileRecord>> shards;
    {
        std::unique_lock lock(round->mutex);

        if (not round->cv.wait_until(lock, deadline, [&] { return round->pending == 0; })) {
            spdlog::warn(
              "Search timed out, {} of {} providers abandoned",
              round->pending,
              _providers.size()
            );
        }

        round->closed = true;
        shards = std::move(round->shards);
    }

    std::map<Locator, FileRecord> merged;
    for (auto& shard : shards) {
        for (auto& record : shard) {
            auto locator = record.locator;
            merged.insert_or_assign(std::move(locator), std::move(record));
        }
    }

    std::vector<FileRecord> results;
    results.reserve(std::min(merged.size(), MAX_RESULTS));

    for (auto& [_, record] : merged) {
        results.push_back(std::move(record));
    }

    std::ranges::sort(results, std::greater{}, &FileRecord::size);

    return results;
}

}  // namespace xdcc::search
