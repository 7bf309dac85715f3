#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <indicators/color.hpp>
#include <indicators/cursor_control.hpp>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "misc/progress.hpp"
#include "misc/tools.hpp"
#include "search/aggregator.hpp"
#include "search/filter.hpp"
#include "search/json_index.hpp"
#include "transfer/transfer.hpp"
#include "xdcc/config.hpp"
#include "xdcc/locator.hpp"
#include "xdcc/size.hpp"

using Json = nlohmann::json;
namespace fs = std::filesystem;

#ifdef ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

using Args = std::vector<std::string>;

auto search_command(const Args& args) -> ExitCode;
auto fetch_command(const Args& args) -> ExitCode;

namespace {

std::atomic<bool> interrupted = false;

void on_interrupt(int)
{
    interrupted = true;
}

void setup_logging(bool verbose)
{
    auto logger = spdlog::stderr_color_mt("xdcc");
    spdlog::set_default_logger(logger);

    auto internal_logger = spdlog::stderr_color_mt("internal_logger");

#ifdef NDEBUG
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::err);
#else
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
#endif
    internal_logger->set_level(spdlog::level::off);

    // SPDLOG_LEVEL=debug,internal_logger=debug
    spdlog::cfg::load_env_levels();
}

void usage(std::string_view self)
{
    // clang-format off
    spdlog::error("Usage:");
    spdlog::error("  {} [-v] search [--index <catalog.json>]... [--filter <expr>] [--json] [--timeout <s>] <keywords...>", self);
    spdlog::error("  {} [-v] fetch [-o <dir>] [-i <list file>] [--tls-only|--plain] [--nick <nick>] <locator...>", self);
    spdlog::error("  {} test", self);
    // clang-format on
}

/**
 * @brief Locators from a list file: one per line, '#' starts a comment line
 */
auto read_locator_list(const fs::path& path) -> std::optional<std::vector<std::string>>
{
    std::ifstream file(path);
    if (not file) {
        return std::nullopt;
    }

    std::vector<std::string> lines;
    std::string line;

    while (std::getline(file, line)) {
        const auto text = xdcc::utils::trim(line);
        if (text.empty() or text.starts_with('#')) {
            continue;
        }
        lines.emplace_back(text);
    }

    return lines;
}

}  // namespace


int main(int argc, char* argv[])
{
    Args args(argv + 1, argv + argc);

    const auto verbose = std::erase(args, "-v") > 0;
    setup_logging(verbose);

    if (args.empty()) {
        usage(argv[0]);
        return ExitCode::Fail;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    try {
        if (command == "test") {
#ifdef ENABLE_TESTS
            tests();
#else
            spdlog::error("Built without tests");
            return ExitCode::Fail;
#endif
            return ExitCode::Success;
        }

        if (command == "search") {
            return search_command(args);
        }

        if (command == "fetch") {
            return fetch_command(args);
        }
    }
    catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    usage(argv[0]);
    return ExitCode::Fail;
}


auto search_command(const Args& args) -> ExitCode
{
    using namespace xdcc;

    std::vector<fs::path> catalogs;
    std::string filter_expression;
    bool as_json = false;
    auto timeout = std::chrono::milliseconds(search::ProviderAggregator::DEFAULT_TIMEOUT);
    search::Keywords keywords;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--index") {
            EXPECTED(has_value, "{} needs a file", arg);
            catalogs.emplace_back(args[++i]);
        }
        else if (arg == "--filter") {
            EXPECTED(has_value, "{} needs an expression", arg);
            filter_expression = args[++i];
        }
        else if (arg == "--json") {
            as_json = true;
        }
        else if (arg == "--timeout") {
            EXPECTED(has_value, "{} needs seconds", arg);
            auto seconds = utils::to_integer<int>(args[++i]);
            EXPECTED(seconds and *seconds > 0, "Bad timeout: {}", args[i]);
            timeout = std::chrono::seconds(*seconds);
        }
        else {
            keywords.push_back(arg);
        }
    }

    if (catalogs.empty()) {
        spdlog::error("No catalog given, use --index <catalog.json>");
        return ExitCode::Fail;
    }

    search::ProviderAggregator aggregator(timeout);

    for (const auto& catalog : catalogs) {
        EXPECTED(fs::exists(catalog), "File not found: \"{}\"", catalog.c_str());
        EXPECTED(
          aggregator.add_provider(std::make_shared<search::JsonIndexProvider>(catalog)),
          "Too many catalogs: {}", catalogs.size()
        );
    }

    auto found = aggregator.search(keywords);
    EXPECTED(found.has_value(), "Search failed: {}", found.error());

    const auto results = search::Filter(filter_expression).apply(*found);

    if (as_json) {
        auto out = Json::array();
        for (const auto& record : results) {
            out.push_back({
              {"url", record.locator.to_string()},
              {"name", record.name},
              {"size", record.size},
              {"slot", record.slot},
            });
        }
        fmt::print("{}\n", out.dump(2));
        return ExitCode::Success;
    }

    for (const auto& record : results) {
        fmt::print("{:<60}  {:>10}  {}\n", record.name, format_size(record.size), record.locator);
    }

    spdlog::info("{} results", results.size());

    return ExitCode::Success;
}


auto fetch_command(const Args& args) -> ExitCode
{
    using namespace xdcc;
    using namespace std::chrono_literals;

    std::optional<fs::path> output_dir;
    auto security = transfer::Security::PreferTls;
    std::string nickname;
    std::vector<std::string> locator_texts;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "-o") {
            EXPECTED(has_value, "{} needs a directory", arg);
            output_dir = args[++i];
        }
        else if (arg == "-i") {
            EXPECTED(has_value, "{} needs a file", arg);
            auto listed = read_locator_list(args[++i]);
            EXPECTED(listed.has_value(), "Can't read list file \"{}\"", args[i]);
            locator_texts.insert(locator_texts.end(), listed->begin(), listed->end());
        }
        else if (arg == "--tls-only") {
            security = transfer::Security::TlsOnly;
        }
        else if (arg == "--plain") {
            security = transfer::Security::Plain;
        }
        else if (arg == "--nick") {
            EXPECTED(has_value, "{} needs a nickname", arg);
            nickname = args[++i];
        }
        else {
            locator_texts.push_back(arg);
        }
    }

    if (locator_texts.empty()) {
        spdlog::error("Nothing to fetch");
        return ExitCode::Fail;
    }

    std::vector<Locator> locators;
    for (const auto& text : locator_texts) {
        auto locator = Locator::parse(text);
        EXPECTED(
          locator.has_value(), "Bad locator \"{}\": {}", text,
          magic_enum::enum_name(locator.error())
        );
        locators.push_back(std::move(*locator));
    }

    if (output_dir) {
        std::error_code ec;
        fs::create_directories(*output_dir, ec);
        EXPECTED(not ec, "Can't create \"{}\": {}", output_dir->c_str(), ec.message());
    }
    else {
        output_dir = default_output_dir();
    }

    std::signal(SIGINT, on_interrupt);

    std::vector<std::unique_ptr<transfer::Transfer>> transfers;
    for (const auto& locator : locators) {
        transfers.push_back(std::make_unique<transfer::Transfer>(transfer::TransferConfig{
          .locator = locator,
          .output_path = *output_dir,
          .security = security,
          .nickname = nickname.empty() ? default_nickname() : nickname,
        }));
    }

    std::vector<std::unique_ptr<indicators::ProgressBar>> bars;
    std::vector<std::optional<std::uint64_t>> totals(transfers.size());

    utils::MultiprogressBar bars_view;
    bars_view.set_option(indicators::option::HideBarWhenComplete{false});

    for (const auto& locator : locators) {
        bars.push_back(utils::progress_bar(fmt::format("{}/#{} ", locator.bot, locator.pack)));
        bars_view.push_back(*bars.back());
    }

    indicators::show_console_cursor(false);

    // start() blocks until the offer arrived, so every transfer starts on its
    // own thread; their events are all consumed here
    std::vector<std::jthread> starters;
    for (auto& transfer : transfers) {
        starters.emplace_back([&transfer] {
            if (auto started = transfer->start(); not started) {
                spdlog::debug("Start failed: {}", started.error().to_string());
            }
        });
    }

    std::size_t failed = 0;
    std::vector<bool> ended(transfers.size(), false);
    bool aborting = false;

    while (std::count(ended.begin(), ended.end(), false) > 0) {
        if (interrupted and not aborting) {
            aborting = true;
            spdlog::warn("Interrupted, aborting transfers");
            for (auto& transfer : transfers) {
                transfer->abort();
            }
        }

        for (std::size_t i = 0; i < transfers.size(); ++i) {
            if (ended[i]) {
                continue;
            }

            auto& events = transfers[i]->events();
            auto& bar = *bars[i];

            for (auto polled = events.poll_for(0ms);
                 polled.status == transfer::PollStatus::Event;
                 polled = events.poll_for(0ms)) {
                std::visit(
                  transfer::overloaded{
                    [&](const transfer::Started& e) {
                        totals[i] = e.announced_size;
                        bar.set_option(indicators::option::PrefixText{
                          fmt::format("{} ", e.filename)
                        });
                    },
                    [&](const transfer::Progress& e) {
                        utils::set_progress(bar, e.bytes_total, totals[i], e.rate);
                    },
                    [&](const transfer::Completed& e) {
                        utils::set_finished(
                          bar,
                          fmt::format(
                            "{} -> {}", format_size(std::int64_t(e.bytes_total)),
                            e.path.string()
                          ),
                          indicators::Color::green
                        );
                    },
                    [&](const transfer::Aborted& e) {
                        ++failed;
                        utils::set_finished(bar, e.failure.to_string(), indicators::Color::red);
                    },
                  },
                  *polled.event
                );
            }

            ended[i] = events.ended();
        }

        std::this_thread::sleep_for(100ms);
    }

    indicators::show_console_cursor(true);

    EXPECTED(failed == 0, "{} of {} transfers failed", failed, transfers.size());

    fmt::print("Fetched {} files to {}\n", transfers.size(), output_dir->string());

    return ExitCode::Success;
}
