#include <array>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <istream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "dcc/offer.hpp"
#include "irc/message.hpp"
#include "misc/stream.hpp"
#include "search/aggregator.hpp"
#include "search/filter.hpp"
#include "search/json_index.hpp"
#include "transfer/event_channel.hpp"
#include "transfer/rate_meter.hpp"
#include "transfer/receiver.hpp"
#include "transfer/rejection.hpp"
#include "transfer/transfer.hpp"
#include "xdcc/locator.hpp"
#include "xdcc/size.hpp"

using namespace xdcc;
using namespace std::chrono_literals;
using namespace std::string_view_literals;

namespace fs = std::filesystem;

void test_size_parsing();
void test_locator();
void test_irc_messages();
void test_offer_parsing();
void test_ack();
void test_rejection_classification();
void test_rate_meter();
void test_event_channel();
void test_filter();
void test_json_index();
void test_aggregator_dedup_and_sort();
void test_aggregator_without_providers();
void test_aggregator_isolates_failures();
void test_aggregator_timeout();
void test_aggregator_provider_limit();
void test_abort_idle();
void test_transfer_completes();
void test_transfer_queue_full();
void test_transfer_unknown_rejection();
void test_transfer_banned_from_channel();
void test_transfer_malformed_offer();
void test_transfer_reverse_dcc();
void test_transfer_size_mismatch();
void test_transfer_abort_while_downloading();
void test_transfer_unannounced_size();
void test_transfer_oversized();
void test_transfer_offer_timeout();
void test_transfer_abort_during_start();
void test_stream_flush();

void tests()
{
    test_size_parsing();
    test_locator();
    test_irc_messages();
    test_offer_parsing();
    test_ack();
    test_rejection_classification();
    test_rate_meter();
    test_event_channel();
    test_filter();
    test_json_index();
    test_aggregator_dedup_and_sort();
    test_aggregator_without_providers();
    test_aggregator_isolates_failures();
    test_aggregator_timeout();
    test_aggregator_provider_limit();
    test_abort_idle();
    test_transfer_completes();
    test_transfer_queue_full();
    test_transfer_unknown_rejection();
    test_transfer_banned_from_channel();
    test_transfer_malformed_offer();
    test_transfer_reverse_dcc();
    test_transfer_size_mismatch();
    test_transfer_abort_while_downloading();
    test_transfer_unannounced_size();
    test_transfer_oversized();
    test_transfer_offer_timeout();
    test_transfer_abort_during_start();
    test_stream_flush();

    spdlog::info("All tests passed");
}

namespace {

auto temp_dir() -> fs::path
{
    std::random_device rd;
    auto dir = fs::temp_directory_path() / fmt::format("xdcc-tests-{}", rd());
    fs::create_directories(dir);
    return dir;
}

auto record(std::string network, std::string bot, std::uint32_t pack, std::int64_t size)
  -> search::FileRecord
{
    return {
      .locator = {.network = std::move(network), .bot = std::move(bot), .pack = pack},
      .name = fmt::format("file-{}.mkv", pack),
      .size = size,
    };
}

class StaticProvider : public search::SearchProvider
{
 public:
    StaticProvider(std::string name, std::vector<search::FileRecord> records) :
      _name(std::move(name)),
      _records(std::move(records))
    {
    }

    auto name() const -> std::string override { return _name; }

    auto search(const search::Keywords&)
      -> tl::expected<std::vector<search::FileRecord>, std::string> override
    {
        return _records;
    }

 private:
    std::string _name;
    std::vector<search::FileRecord> _records;
};

class FailingProvider : public search::SearchProvider
{
 public:
    auto name() const -> std::string override { return "failing"; }

    auto search(const search::Keywords&)
      -> tl::expected<std::vector<search::FileRecord>, std::string> override
    {
        return tl::make_unexpected("index is down");
    }
};

class ThrowingProvider : public search::SearchProvider
{
 public:
    auto name() const -> std::string override { return "throwing"; }

    auto search(const search::Keywords&)
      -> tl::expected<std::vector<search::FileRecord>, std::string> override
    {
        throw std::runtime_error("parser exploded");
    }
};

/**
 * @brief Blocks until released, then answers with one record
 */
class HungProvider : public search::SearchProvider
{
 public:
    explicit HungProvider(std::shared_future<void> release) :
      _release(std::move(release))
    {
    }

    auto name() const -> std::string override { return "hung"; }

    auto search(const search::Keywords&)
      -> tl::expected<std::vector<search::FileRecord>, std::string> override
    {
        _release.wait();
        return std::vector{record("late.net", "Late", 1, 1)};
    }

 private:
    std::shared_future<void> _release;
};

auto drain(transfer::EventChannel& channel) -> std::vector<transfer::TransferEvent>
{
    std::vector<transfer::TransferEvent> events;

    while (auto event = channel.poll()) {
        events.push_back(std::move(*event));
    }

    return events;
}

auto failure_of(const transfer::TransferEvent& event) -> transfer::Failure
{
    assert(std::holds_alternative<transfer::Aborted>(event));
    return std::get<transfer::Aborted>(event).failure;
}

/**
 * @brief How the fake bot answers a pack request
 */
struct BotScript
{
    std::string bot = "Bot";
    bool nick_taken = false;
    bool ban_join = false;

    // Notice sent before the offer, must not end the request
    std::string info_notice;

    // Sent instead of an offer
    std::string rejection;

    // CTCP "DCC ..." arguments replacing the generated offer
    std::string raw_offer;

    std::string filename = "some file.bin";
    std::string payload;
    std::optional<std::uint64_t> announced_size;

    // Send one chunk and wait for the client to go away
    bool stall = false;

    // Never answer the pack request
    bool silent = false;
};

/**
 * @brief IRC server with one XDCC bot plus its DCC sender, serving a single
 *  client on 127.0.0.1
 */
class FakeNetwork
{
 public:
    constexpr static std::size_t STALL_CHUNK = 1024;

    explicit FakeNetwork(BotScript script) :
      _script(std::move(script)),
      _irc(_io, {asio::ip::make_address("127.0.0.1"), 0}),
      _dcc(_io, {asio::ip::make_address("127.0.0.1"), 0}),
      _thread([this] { _serve(); })
    {
    }

    ~FakeNetwork()
    {
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    auto locator(std::string channel = {}) const -> Locator
    {
        return {
          .network = "127.0.0.1",
          .port = _irc.local_endpoint().port(),
          .channel = std::move(channel),
          .bot = _script.bot,
          .pack = 7,
        };
    }

    auto pong_seen() const -> bool { return _pong_seen; }
    auto request_seen() const -> bool { return _request_seen; }
    auto quit_line() const -> std::string
    {
        std::lock_guard lock(_mutex);
        return _quit_line;
    }

 private:
    using tcp = asio::ip::tcp;

    static auto read_line(tcp::socket& socket, asio::streambuf& buffer) -> std::string
    {
        asio::read_until(socket, buffer, "\r\n");

        std::istream stream(&buffer);
        std::string line;
        std::getline(stream, line);

        if (line.ends_with('\r')) {
            line.pop_back();
        }
        return line;
    }

    static void send(tcp::socket& socket, const std::string& line)
    {
        asio::write(socket, asio::buffer(line + "\r\n"));
    }

    void _serve()
    {
        try {
            _serve_client();
        }
        catch (const std::system_error& e) {
            spdlog::debug("Fake network: {}", e.what());
        }
    }

    void _serve_client()
    {
        tcp::socket client(_io);
        _irc.accept(client);

        asio::streambuf buffer;
        const auto& bot = _script.bot;

        auto line = read_line(client, buffer);
        assert(line.starts_with("NICK "));
        auto nick = line.substr(5);

        line = read_line(client, buffer);
        assert(line.starts_with("USER "));

        if (_script.nick_taken) {
            send(client, fmt::format(":fake.net 433 * {} :Nickname is already in use", nick));
            line = read_line(client, buffer);
            assert(line == "NICK " + nick + "1");
            nick = line.substr(5);
        }

        send(client, "PING :fake.net");
        line = read_line(client, buffer);
        assert(line == "PONG fake.net");
        _pong_seen = true;

        send(client, fmt::format(":fake.net 001 {} :Welcome to the fake network", nick));

        for (;;) {
            line = read_line(client, buffer);

            if (line.starts_with("JOIN ")) {
                const auto channel = line.substr(5);

                if (_script.ban_join) {
                    send(client, fmt::format(
                      ":fake.net 474 {} {} :Cannot join channel (+b)", nick, channel
                    ));
                    continue;
                }

                send(client, fmt::format(":{}!user@fake.host JOIN {}", nick, channel));
                send(client, fmt::format(":fake.net 366 {} {} :End of /NAMES list.", nick, channel));
                continue;
            }

            if (line.starts_with(fmt::format("PRIVMSG {} :", bot))) {
                assert(line == fmt::format("PRIVMSG {} :\x01XDCC SEND #7\x01", bot));
                _request_seen = true;
                break;
            }
        }

        if (_script.silent) {
            _wait_for_close(client, buffer);
            return;
        }

        const auto from_bot = fmt::format(":{}!bot@fake.host", bot);

        if (not _script.info_notice.empty()) {
            send(client, fmt::format("{} NOTICE {} :{}", from_bot, nick, _script.info_notice));
        }

        if (not _script.rejection.empty()) {
            send(client, fmt::format("{} NOTICE {} :{}", from_bot, nick, _script.rejection));
            _wait_for_close(client, buffer);
            return;
        }

        if (not _script.raw_offer.empty()) {
            send(client, fmt::format(
              "{} PRIVMSG {} :\x01{}\x01", from_bot, nick, _script.raw_offer
            ));
            _wait_for_close(client, buffer);
            return;
        }

        auto offer = fmt::format(
          "DCC SEND \"{}\" 2130706433 {}", _script.filename, _dcc.local_endpoint().port()
        );
        if (_script.announced_size) {
            offer += fmt::format(" {}", *_script.announced_size);
        }
        send(client, fmt::format("{} PRIVMSG {} :\x01{}\x01", from_bot, nick, offer));
        send(client, "PING :fake.net");

        _send_file();
        _wait_for_close(client, buffer);
    }

    void _send_file()
    {
        tcp::socket peer(_io);
        _dcc.accept(peer);

        const auto& payload = _script.payload;
        std::array<std::uint8_t, dcc::AckMsg::SIZE> ack{};

        if (_script.stall) {
            asio::write(peer, asio::buffer(payload.data(), STALL_CHUNK));
            for (;;) {
                asio::read(peer, asio::buffer(ack));
            }
        }

        asio::write(peer, asio::buffer(payload));

        std::uint64_t acked = 0;
        while (acked < payload.size()) {
            asio::read(peer, asio::buffer(ack));
            acked = dcc::unpack_ack(ack)->received;
        }

        const bool short_file =
          _script.announced_size and *_script.announced_size > payload.size();

        if (not _script.announced_size or short_file) {
            peer.shutdown(tcp::socket::shutdown_send);
            peer.close();
        }
    }

    void _wait_for_close(tcp::socket& client, asio::streambuf& buffer)
    {
        for (;;) {
            auto line = read_line(client, buffer);

            if (line.starts_with("QUIT")) {
                std::lock_guard lock(_mutex);
                _quit_line = std::move(line);
            }
        }
    }

    BotScript _script;
    std::atomic<bool> _pong_seen = false;
    std::atomic<bool> _request_seen = false;

    mutable std::mutex _mutex;
    std::string _quit_line;

    asio::io_context _io;
    asio::ip::tcp::acceptor _irc;
    asio::ip::tcp::acceptor _dcc;

    std::thread _thread;
};

auto make_config(const Locator& locator, const fs::path& output) -> transfer::TransferConfig
{
    return {
      .locator = locator,
      .output_path = output,
      .security = transfer::Security::Plain,
      .nickname = "tester",
      .timeouts = {.connect = 5s, .registration = 5s, .join = 5s, .offer = 5s, .stall = 10s},
    };
}

auto payload_of(std::size_t size) -> std::string
{
    std::string payload(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>('a' + i % 26);
    }
    return payload;
}

/**
 * @brief Start a transfer that must fail before the download
 */
auto failed_start(const BotScript& script, std::string channel = {}) -> transfer::Failure
{
    const auto dir = temp_dir();
    FakeNetwork network(script);

    transfer::Transfer transfer(make_config(network.locator(std::move(channel)), dir));

    auto started = transfer.start();
    assert(not started);
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    auto events = drain(transfer.events());
    assert(events.size() == 1);
    assert(transfer.events().ended());

    const auto failure = failure_of(events.front());
    assert(failure.reason == started.error().reason);

    // Second start is refused without touching the stream
    assert(not transfer.start());

    fs::remove_all(dir);
    return failure;
}

}  // namespace

void test_size_parsing()
{
    assert(parse_file_size("1.5G") == 1610612736);
    assert(parse_file_size("500M") == 524288000);
    assert(parse_file_size("10K") == 10240);
    assert(parse_file_size("0.5K") == 512);

    assert(parse_file_size("100").error() == SizeError::BAD_UNIT);
    assert(parse_file_size("").error() == SizeError::EMPTY);
    assert(parse_file_size("3X").error() == SizeError::BAD_UNIT);
    assert(parse_file_size("1.2.3M").error() == SizeError::BAD_NUMBER);
    assert(parse_file_size("M").error() == SizeError::BAD_NUMBER);
    assert(parse_file_size("99999999999G").error() == SizeError::TOO_LARGE);
    assert(parse_file_size("8000000000G") == 8000000000 * GIGABYTE);

    assert(parse_size_filter("1gb") == GIGABYTE);
    assert(parse_size_filter(" 500 MB ") == 500 * MEGABYTE);
    assert(parse_size_filter("2GiB") == 2 * GIGABYTE);
    assert(parse_size_filter("42") == 42);
    assert(not parse_size_filter("lots"));
    assert(not parse_size_filter("5 parsecs"));
    assert(parse_size_filter("20000000000000000000").error() == SizeError::TOO_LARGE);

    assert(format_size(-1) == "--");
    assert(format_size(512) == "512B");
    assert(format_size(1536) == "1.50KB");
    assert(format_size(1610612736) == "1.50GB");
}

void test_locator()
{
    {
        auto locator = Locator::parse("irc://irc.rizon.net/#NIBL/Ginpachi-Sensei/1234");
        assert(locator);
        assert(locator->network == "irc.rizon.net");
        assert(locator->port == 0);
        assert(locator->channel == "NIBL");
        assert(locator->bot == "Ginpachi-Sensei");
        assert(locator->pack == 1234);
        assert(locator->to_string() == "irc://irc.rizon.net/#NIBL/Ginpachi-Sensei/1234");
    }

    {
        auto locator = Locator::parse("irc://irc.example.org:6697/Bot/#5");
        assert(locator);
        assert(locator->port == 6697);
        assert(not locator->has_channel());
        assert(locator->pack == 5);
        assert(fmt::format("{}", *locator) == "irc://irc.example.org:6697/Bot/5");
    }

    // Channel prefix is optional and escaped form is accepted
    assert(Locator::parse("irc://net/news/Bot/1") == Locator::parse("irc://net/#news/Bot/1"));
    assert(Locator::parse("irc://net/%23news/Bot/1") == Locator::parse("irc://net/#news/Bot/1"));

    const std::vector<Locator> round_trip{
      {.network = "a.net", .bot = "b", .pack = 1},
      {.network = "10.0.0.1", .port = 7000, .channel = "chan", .bot = "[Bot]", .pack = 99},
      {.network = "irc.x", .channel = "#double", .bot = "bot", .pack = 4294967295},
    };
    for (const auto& locator : round_trip) {
        assert(Locator::parse(locator.to_string()) == locator);
    }

    assert(Locator::parse("").error() == LocatorError::EMPTY);
    assert(Locator::parse("http://net/Bot/1").error() == LocatorError::BAD_SCHEME);
    assert(Locator::parse("irc://net/Bot").error() == LocatorError::BAD_PATH);
    assert(Locator::parse("irc://net/a/b/c/d/e").error() == LocatorError::BAD_PATH);
    assert(Locator::parse("irc://net:0/Bot/1").error() == LocatorError::BAD_NETWORK);
    assert(Locator::parse("irc://net:99999/Bot/1").error() == LocatorError::BAD_NETWORK);
    assert(Locator::parse("irc:///Bot/1").error() == LocatorError::BAD_NETWORK);
    assert(Locator::parse("irc://net/#/Bot/1").error() == LocatorError::BAD_CHANNEL);
    assert(Locator::parse("irc://net//1").error() == LocatorError::BAD_BOT);
    assert(Locator::parse("irc://net/Bot/0").error() == LocatorError::BAD_PACK);
    assert(Locator::parse("irc://net/Bot/x1").error() == LocatorError::BAD_PACK);
    assert(Locator::parse("irc://net/B ot/1").error() == LocatorError::BAD_BOT);

    // Ordering is by network first
    auto a = Locator{.network = "a", .bot = "z", .pack = 9};
    auto b = Locator{.network = "b", .bot = "a", .pack = 1};
    assert(a < b);
}

void test_irc_messages()
{
    using namespace irc;

    {
        auto msg = unpack_message(":Bot!bot@host.net PRIVMSG me :hello there\r\n");
        assert(msg);
        assert(msg->prefix == "Bot!bot@host.net");
        assert(msg->nick() == "Bot");
        assert(msg->is("PRIVMSG"));
        assert(msg->param(0) == "me");
        assert(msg->trailing() == "hello there");
    }

    {
        auto msg = unpack_message("@time=2024-01-01T00:00:00Z :srv 001 me :Welcome");
        assert(msg);
        assert(msg->is(numeric::WELCOME));
        assert(msg->params.size() == 2);
    }

    {
        auto msg = unpack_message("ping :token");
        assert(msg);
        assert(msg->is("PING"));
        assert(msg->prefix.empty());
        assert(msg->trailing() == "token");
    }

    assert(unpack_message("\r\n").error() == Error::EMPTY_LINE);
    assert(unpack_message(": PRIVMSG x").error() == Error::MALFORMED_PREFIX);
    assert(unpack_message(":prefix").error() == Error::MISSING_COMMAND);

    {
        auto ctcp = unpack_ctcp("\x01" "DCC SEND file.bin 2130706433 5000 100\x01");
        assert(ctcp);
        assert(ctcp->command == "DCC");
        assert(ctcp->args == "SEND file.bin 2130706433 5000 100");

        assert(unpack_ctcp("\x01version")->command == "VERSION");
        assert(not unpack_ctcp("plain text"));
    }

    assert(pack_xdcc_send("Bot", 42) == "PRIVMSG Bot :\x01XDCC SEND #42\x01\r\n");
    assert(pack_nick("me") == "NICK me\r\n");
    assert(pack_user("me") == "USER me 0 * me\r\n");
    assert(pack_join("#chan") == "JOIN #chan\r\n");
    assert(pack_pong("irc.net") == "PONG irc.net\r\n");
    assert(pack_ctcp_reply("Bot", {.command = "VERSION", .args = "xdcc"}) ==
           "NOTICE Bot :\x01VERSION xdcc\x01\r\n");

    // Line breaks can't be smuggled into a message
    assert(pack_privmsg("Bot", "hi\r\nQUIT now") == "PRIVMSG Bot :hiQUIT now\r\n");

    const auto long_line = pack_privmsg("Bot", std::string(600, 'x'));
    assert(long_line.size() == MAX_LINE_LENGTH);
    assert(long_line.ends_with("\r\n"));
}

void test_offer_parsing()
{
    using namespace dcc;

    {
        auto offer = unpack_offer("file.bin 2130706433 5000 1048576");
        assert(offer);
        assert(offer->filename == "file.bin");
        assert(offer->host == "127.0.0.1");
        assert(offer->port == 5000);
        assert(offer->size == 1048576);
    }

    {
        auto offer = unpack_offer(R"("My Show - 01.mkv" 192.168.1.10 6000)");
        assert(offer);
        assert(offer->filename == "My Show - 01.mkv");
        assert(offer->host == "192.168.1.10");
        assert(not offer->size);
    }

    {
        auto offer = unpack_offer(irc::CtcpMsg{.command = "DCC", .args = "send a.txt 3232235777 1024 10"});
        assert(offer);
        assert(offer->host == "192.168.1.1");
    }

    assert(unpack_offer("file.bin 2130706433 0 100 77").error() == Error::REVERSE_DCC);
    assert(unpack_offer("file.bin 2130706433 70000 100").error() == Error::BAD_PORT);
    assert(unpack_offer("file.bin 2130706433 port 100").error() == Error::BAD_PORT);
    assert(unpack_offer("file.bin bad!host 5000 100").error() == Error::BAD_HOST);
    assert(unpack_offer("file.bin 2130706433 5000 -5").error() == Error::BAD_SIZE);
    assert(unpack_offer("file.bin 2130706433").error() == Error::MISSING_FIELDS);
    assert(unpack_offer(R"("unterminated 1 2 3)").error() == Error::BAD_FILENAME);
    assert(unpack_offer("").error() == Error::MISSING_FIELDS);

    assert(unpack_offer(irc::CtcpMsg{.command = "DCC", .args = "CHAT chat 1 2"}).error() == Error::NOT_DCC_SEND);
    assert(unpack_offer(irc::CtcpMsg{.command = "PING", .args = "123"}).error() == Error::NOT_DCC_SEND);

    {
        const Offer offer{.filename = "../file.bin", .host = "127.0.0.1", .port = 1};
        const auto dir = temp_dir();

        assert(transfer::resolve_output_path("", offer) == "file.bin");
        assert(transfer::resolve_output_path(dir, offer) == dir / "file.bin");
        assert(transfer::resolve_output_path(dir / "x.bin", offer) == dir / "x.bin");

        fs::remove_all(dir);
    }

    assert(safe_filename("../../etc/passwd") == "passwd");
    assert(safe_filename("C:\\temp\\movie.mkv") == "movie.mkv");
    assert(safe_filename("..") == "download.bin");
    assert(safe_filename(".hidden") == "hidden");
}

void test_ack()
{
    auto packed = dcc::pack_ack({.received = 0x01020304});
    assert((packed == std::vector<std::uint8_t>{1, 2, 3, 4}));
    assert(dcc::unpack_ack(packed)->received == 0x01020304);

    // Counter wraps at 4 GiB
    auto wrapped = dcc::pack_ack({.received = 0x100000005ull});
    assert(dcc::unpack_ack(wrapped)->received == 5);

    assert(not dcc::unpack_ack(std::vector<std::uint8_t>{1, 2}));
}

void test_rejection_classification()
{
    using transfer::Reason;
    using transfer::classify_rejection;

    assert(classify_rejection("** XDCC SEND denied, queue is full") == Reason::QueueFull);
    assert(classify_rejection("** All Slots Full, Main queue of size 10 is Full, Try Again Later") == Reason::QueueFull);
    assert(classify_rejection("** No Slots Open, Denied") == Reason::NoSlots);
    assert(classify_rejection("XDCC SEND denied, you must be on a known channel to request a pack") == Reason::ChannelRequired);
    assert(classify_rejection("You are BANNED from this bot") == Reason::Banned);
    assert(classify_rejection("** Invalid Pack Number, Try Again") == Reason::Rejected);

    assert(not classify_rejection("** Sending you pack #1 (\"file.mkv\"), which is 1GB"));
    assert(not classify_rejection("Added you to the main queue for pack 3 in position 2"));

    assert(transfer::is_rejection(Reason::QueueFull));
    assert(not transfer::is_rejection(Reason::Timeout));
}

void test_rate_meter()
{
    using Clock = transfer::RateMeter::Clock;

    transfer::RateMeter meter(3s);
    const auto t0 = Clock::now();

    assert(meter.rate(t0) == 0.0);

    meter.add(t0, 1000);
    meter.add(t0 + 1s, 1000);

    // Measured since the first sample while shorter than the window
    assert(meter.rate(t0 + 2s) == 1000.0);

    // Old samples leave the window
    meter.add(t0 + 10s, 3000);
    assert(meter.rate(t0 + 10s) == 1000.0);
}

void test_event_channel()
{
    transfer::EventChannel channel;

    auto polled = channel.poll_for(10ms);
    assert(polled.status == transfer::PollStatus::Timeout);

    channel.push(transfer::Progress{.bytes_since_last = 1, .rate = 1.0, .bytes_total = 1});
    channel.push(transfer::Completed{.bytes_total = 1});
    channel.close();

    polled = channel.poll_for(10ms);
    assert(polled.status == transfer::PollStatus::Event);
    assert(std::holds_alternative<transfer::Progress>(*polled.event));

    auto last = channel.poll();
    assert(last and transfer::is_terminal(*last));

    assert(not channel.poll());
    assert(channel.ended());
    assert(channel.poll_for(10ms).status == transfer::PollStatus::Ended);

    bool rejected = false;
    try {
        channel.push(transfer::Completed{});
    }
    catch (const std::logic_error&) {
        rejected = true;
    }
    assert(rejected);
}

void test_filter()
{
    const std::vector<search::FileRecord> records{
      {.locator = {.network = "n", .bot = "b", .pack = 1}, .name = "Show.S01E01.1080p.MKV", .size = 2 * GIGABYTE},
      {.locator = {.network = "n", .bot = "b", .pack = 2}, .name = "show.s01e02.720p.mp4", .size = 700 * MEGABYTE},
      {.locator = {.network = "n", .bot = "b", .pack = 3}, .name = "notes.txt", .size = UNKNOWN_SIZE},
    };

    assert(search::Filter("").apply(records).size() == 3);
    assert(search::Filter(">1GB").apply(records).size() == 1);
    assert(search::Filter("<1gb").apply(records).size() == 2);
    assert(search::Filter(".mkv").apply(records).front().locator.pack == 1);
    assert(search::Filter("S01E02").apply(records).front().locator.pack == 2);
    assert(search::Filter("1080P").matches(records[0]));
    assert(search::Filter(">lots").apply(records).empty());
}

void test_json_index()
{
    const auto dir = temp_dir();
    const auto catalog = dir / "catalog.json";

    {
        std::ofstream out(catalog);
        out << R"([
            {"network": "irc.rizon.net", "channel": "#news", "bot": "Bot", "pack": 1,
             "name": "Big.Show.S01E01.mkv", "size": "1.5G", "slot": 2},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": "#2",
             "name": "Big.Show.S01E02.mkv", "size": 1000},
            {"url": "irc://irc.abjects.net:6667/#beast/Other/9",
             "name": "Small.Show.mkv", "size": "bogus"},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": 0,
             "name": "Big.Show.broken.mkv", "size": 5},
            {"name": "Big.Show.no.locator"},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": -3,
             "name": "Big.Show.negative.mkv", "size": 5},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": 4294967297,
             "name": "Big.Show.huge.pack.mkv", "size": 5},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": 3,
             "name": "Tiny.Show.mkv", "size": -5},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": 4,
             "name": "Huge.Show.mkv", "size": 18446744073709551615},
            {"network": "irc.rizon.net", "bot": "Bot", "pack": 5,
             "name": "Odd.Show.mkv", "size": "99999999999G"}
        ])";
    }

    search::JsonIndexProvider provider(catalog);

    auto all = provider.search({});
    assert(all);
    assert(all->size() == 6);

    auto found = provider.search({"big", "SHOW"});
    assert(found);
    assert(found->size() == 2);
    assert(found->at(0).locator.channel == "news");
    assert(found->at(0).size == 1610612736);
    assert(found->at(0).slot == 2);
    assert(found->at(1).locator.pack == 2);

    auto small = provider.search({"small"});
    assert(small and small->size() == 1);
    assert(small->front().size == UNKNOWN_SIZE);
    assert(small->front().locator.port == 6667);

    for (const auto* odd : {"tiny", "huge", "odd"}) {
        auto found_odd = provider.search({odd});
        assert(found_odd and found_odd->size() == 1);
        assert(found_odd->front().size == UNKNOWN_SIZE);
    }

    search::JsonIndexProvider missing(dir / "missing.json");
    assert(not missing.search({}));

    {
        std::ofstream out(dir / "broken.json");
        out << "{ not json";
    }
    search::JsonIndexProvider broken(dir / "broken.json");
    assert(not broken.search({}));

    fs::remove_all(dir);
}

void test_aggregator_dedup_and_sort()
{
    search::ProviderAggregator aggregator(5s);

    aggregator.add_provider(std::make_shared<StaticProvider>(
      "first",
      std::vector{record("a.net", "Bot", 1, 100), record("a.net", "Bot", 2, 300), record("b.net", "Bot", 1, -1)}
    ));
    aggregator.add_provider(std::make_shared<StaticProvider>(
      "second",
      std::vector{record("a.net", "Bot", 2, 300), record("c.net", "Other", 7, 200), record("a.net", "Bot", 1, 100)}
    ));

    auto results = aggregator.search({"show"});
    assert(results);
    assert(results->size() == 4);

    for (std::size_t i = 0; i + 1 < results->size(); ++i) {
        assert((*results)[i].size >= (*results)[i + 1].size);
    }

    assert(results->front().locator.pack == 2);
    assert(results->back().size == -1);
}

void test_aggregator_without_providers()
{
    search::ProviderAggregator aggregator;

    const auto begin = std::chrono::steady_clock::now();
    auto results = aggregator.search({"anything"});

    assert(results);
    assert(results->empty());
    assert(std::chrono::steady_clock::now() - begin < 1s);
}

void test_aggregator_isolates_failures()
{
    search::ProviderAggregator aggregator(5s);

    aggregator.add_provider(std::make_shared<FailingProvider>());
    aggregator.add_provider(std::make_shared<ThrowingProvider>());
    aggregator.add_provider(std::make_shared<StaticProvider>(
      "ok", std::vector{record("a.net", "Bot", 1, 10)}
    ));

    auto results = aggregator.search({});
    assert(results);
    assert(results->size() == 1);
}

void test_aggregator_timeout()
{
    std::promise<void> release;
    search::ProviderAggregator aggregator(300ms);

    aggregator.add_provider(std::make_shared<HungProvider>(release.get_future().share()));
    aggregator.add_provider(std::make_shared<StaticProvider>(
      "prompt", std::vector{record("a.net", "Bot", 1, 10), record("a.net", "Bot", 2, 20)}
    ));

    const auto begin = std::chrono::steady_clock::now();
    auto results = aggregator.search({});
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    assert(results);
    assert(results->size() == 2);
    assert(elapsed >= 250ms);
    assert(elapsed < 3s);

    // The abandoned provider finishing later changes nothing
    const auto returned = *results;
    release.set_value();
    std::this_thread::sleep_for(50ms);

    assert(results->size() == returned.size());
}

void test_aggregator_provider_limit()
{
    search::ProviderAggregator aggregator;

    for (std::size_t i = 0; i < search::ProviderAggregator::MAX_PROVIDERS; ++i) {
        assert(aggregator.add_provider(std::make_shared<FailingProvider>()));
    }

    assert(not aggregator.add_provider(std::make_shared<FailingProvider>()));
    assert(aggregator.providers() == search::ProviderAggregator::MAX_PROVIDERS);
}

void test_abort_idle()
{
    transfer::Transfer transfer(make_config(
      {.network = "127.0.0.1", .port = 1, .bot = "Bot", .pack = 1}, "."
    ));

    transfer.abort();
    transfer.abort();

    assert(transfer.state() == transfer::Transfer::State::Aborted);

    auto events = drain(transfer.events());
    assert(events.size() == 1);
    assert(failure_of(events.front()).reason == transfer::Reason::Cancelled);

    auto started = transfer.start();
    assert(not started);
    assert(started.error().reason == transfer::Reason::Cancelled);
}

void test_transfer_completes()
{
    const auto dir = temp_dir();
    const auto payload = payload_of(300 * 1024 + 17);

    FakeNetwork network({
      .nick_taken = true,
      .info_notice = "** Sending you pack #7 (\"some file.bin\"), which is 300KB",
      .payload = payload,
      .announced_size = payload.size(),
    });

    transfer::Transfer transfer(make_config(network.locator("files"), dir));

    auto started = transfer.start();
    assert(started);

    auto events = drain(transfer.events());
    assert(network.pong_seen());
    assert(network.request_seen());
    assert(transfer.state() == transfer::Transfer::State::Completed);

    assert(events.size() >= 3);
    assert(std::holds_alternative<transfer::Started>(events.front()));

    const auto& started_event = std::get<transfer::Started>(events.front());
    assert(started_event.announced_size == payload.size());
    assert(started_event.filename == "some file.bin");
    assert(started_event.path == dir / "some file.bin");

    std::uint64_t total = 0;
    for (std::size_t i = 1; i + 1 < events.size(); ++i) {
        assert(std::holds_alternative<transfer::Progress>(events[i]));

        const auto& progress = std::get<transfer::Progress>(events[i]);
        assert(progress.bytes_total >= total);
        assert(progress.bytes_total == total + progress.bytes_since_last);
        total = progress.bytes_total;
    }
    assert(total == payload.size());

    assert(std::holds_alternative<transfer::Completed>(events.back()));
    assert(std::get<transfer::Completed>(events.back()).bytes_total == payload.size());

    std::ifstream file(dir / "some file.bin", std::ios::binary);
    const std::string written{std::istreambuf_iterator<char>(file), {}};
    assert(written == payload);

    // Terminal state absorbs further requests
    transfer.abort();
    assert(transfer.state() == transfer::Transfer::State::Completed);

    // QUIT goes out whole behind the PONG answering the mid-download PING
    for (int i = 0; i < 200 and network.quit_line().empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    assert(network.quit_line() == "QUIT :Transfer complete");

    fs::remove_all(dir);
}

void test_transfer_queue_full()
{
    const auto failure = failed_start({
      .rejection = "** All Slots Full, Main queue of size 10 is Full, Try Again Later",
    });

    assert(failure.reason == transfer::Reason::QueueFull);
}

void test_transfer_unknown_rejection()
{
    const auto failure = failed_start({.rejection = "** Invalid Pack Number, Try Again"});

    assert(failure.reason == transfer::Reason::Rejected);
    assert(failure.message == "** Invalid Pack Number, Try Again");
}

void test_transfer_banned_from_channel()
{
    const auto failure = failed_start({.ban_join = true}, "files");

    assert(failure.reason == transfer::Reason::Banned);
}

void test_transfer_malformed_offer()
{
    const auto failure = failed_start({.raw_offer = "DCC SEND file.bin not!a!host 5000 100"});

    assert(failure.reason == transfer::Reason::MalformedOffer);
}

void test_transfer_reverse_dcc()
{
    const auto failure = failed_start({.raw_offer = "DCC SEND file.bin 2130706433 0 100 12"});

    assert(failure.reason == transfer::Reason::UnsupportedOffer);
}

void test_transfer_size_mismatch()
{
    const auto dir = temp_dir();
    const auto payload = payload_of(1000);

    FakeNetwork network({.payload = payload, .announced_size = 2000});
    transfer::Transfer transfer(make_config(network.locator(), dir));

    assert(transfer.start());

    auto events = drain(transfer.events());
    assert(std::holds_alternative<transfer::Started>(events.front()));
    assert(failure_of(events.back()).reason == transfer::Reason::SizeMismatch);
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    fs::remove_all(dir);
}

void test_transfer_abort_while_downloading()
{
    const auto dir = temp_dir();
    const auto payload = payload_of(1024 * 1024);

    FakeNetwork network({.payload = payload, .announced_size = payload.size(), .stall = true});
    transfer::Transfer transfer(make_config(network.locator(), dir));

    assert(transfer.start());

    auto first = transfer.events().poll();
    assert(first and std::holds_alternative<transfer::Started>(*first));

    transfer.abort();
    transfer.abort();

    auto events = drain(transfer.events());
    assert(not events.empty());

    std::size_t terminal = 0;
    for (const auto& event : events) {
        assert(not std::holds_alternative<transfer::Started>(event));
        terminal += transfer::is_terminal(event) ? 1 : 0;
    }
    assert(terminal == 1);

    assert(failure_of(events.back()).reason == transfer::Reason::Cancelled);
    assert(transfer.events().ended());
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    transfer.abort();

    fs::remove_all(dir);
}

void test_transfer_unannounced_size()
{
    const auto dir = temp_dir();
    const auto payload = payload_of(64 * 1024 + 5);

    FakeNetwork network({.payload = payload});
    transfer::Transfer transfer(make_config(network.locator(), dir));

    assert(transfer.start());

    auto events = drain(transfer.events());
    assert(transfer.state() == transfer::Transfer::State::Completed);

    assert(std::holds_alternative<transfer::Started>(events.front()));
    assert(not std::get<transfer::Started>(events.front()).announced_size);

    assert(std::holds_alternative<transfer::Completed>(events.back()));
    assert(std::get<transfer::Completed>(events.back()).bytes_total == payload.size());

    std::ifstream file(dir / "some file.bin", std::ios::binary);
    const std::string written{std::istreambuf_iterator<char>(file), {}};
    assert(written == payload);

    fs::remove_all(dir);
}

void test_transfer_oversized()
{
    const auto dir = temp_dir();
    const auto payload = payload_of(4000);

    FakeNetwork network({.payload = payload, .announced_size = 1500});
    transfer::Transfer transfer(make_config(network.locator(), dir));

    assert(transfer.start());

    auto events = drain(transfer.events());
    assert(std::holds_alternative<transfer::Started>(events.front()));
    assert(failure_of(events.back()).reason == transfer::Reason::SizeMismatch);
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    fs::remove_all(dir);
}

void test_transfer_offer_timeout()
{
    const auto dir = temp_dir();

    FakeNetwork network({.silent = true});

    auto config = make_config(network.locator(), dir);
    config.timeouts.offer = 300ms;

    transfer::Transfer transfer(config);

    auto started = transfer.start();
    assert(not started);
    assert(started.error().reason == transfer::Reason::Timeout);
    assert(network.request_seen());
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    auto events = drain(transfer.events());
    assert(events.size() == 1);
    assert(failure_of(events.front()).reason == transfer::Reason::Timeout);

    fs::remove_all(dir);
}

void test_transfer_abort_during_start()
{
    const auto dir = temp_dir();

    FakeNetwork network({.silent = true});
    transfer::Transfer transfer(make_config(network.locator(), dir));

    auto started = std::async(std::launch::async, [&transfer] { return transfer.start(); });

    for (int i = 0; i < 500; ++i) {
        if (transfer.state() == transfer::Transfer::State::AwaitingOffer) {
            break;
        }
        std::this_thread::sleep_for(10ms);
    }
    assert(transfer.state() == transfer::Transfer::State::AwaitingOffer);

    transfer.abort();

    // Well before the offer timeout
    assert(started.wait_for(3s) == std::future_status::ready);

    auto result = started.get();
    assert(not result);
    assert(result.error().reason == transfer::Reason::Cancelled);
    assert(transfer.state() == transfer::Transfer::State::Aborted);

    auto events = drain(transfer.events());
    assert(events.size() == 1);
    assert(failure_of(events.front()).reason == transfer::Reason::Cancelled);

    fs::remove_all(dir);
}

void test_stream_flush()
{
    using tcp = asio::ip::tcp;

    asio::io_context server_io;
    tcp::acceptor acceptor(server_io, {asio::ip::make_address("127.0.0.1"), 0});

    auto received = std::async(std::launch::async, [&] {
        tcp::socket peer(server_io);
        acceptor.accept(peer);

        asio::streambuf buffer;
        asio::read_until(peer, buffer, "last\r\n");

        return std::string(
          asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data())
        );
    });

    asio::io_context io;
    net::Stream stream(io, "flush-test");

    assert(stream.flush(1s));

    assert(stream.connect("127.0.0.1", acceptor.local_endpoint().port(), 5s));

    stream.async_write("first\r\n");
    stream.async_write(std::string(64 * 1024, 'x') + "\r\n");
    stream.async_write("last\r\n");

    assert(stream.flush(5s));

    const auto text = received.get();
    assert(text.starts_with("first\r\nxxx"));
    assert(text.ends_with("x\r\nlast\r\n"));
    assert(text.size() == 7 + 64 * 1024 + 2 + 6);

    stream.close();
    io.restart();
    io.run();
}
