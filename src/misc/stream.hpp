#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>
#include <asio/ssl/stream.hpp>
#include <asio/streambuf.hpp>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

namespace xdcc::net {

using Timeout = std::chrono::milliseconds;

/**
 * @brief TCP stream, optionally wrapped into TLS, with blocking operations
 *  bounded by timeouts
 *
 * Blocking calls drive the io_context on the calling thread until the
 * operation or its timer completes, so they must not be called from inside a
 * completion handler. Asynchronous calls only queue work; the owner runs the
 * io_context and drains it after close() before destroying the stream.
 */
class Stream
{
 public:
    using LineHandler = std::function<void(asio::error_code, std::string)>;

    constexpr static std::size_t MAX_LINE_BUFFER = 16 * 1024;

    Stream(asio::io_context& io, std::string name);
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    auto connect(const std::string& host, std::uint16_t port, Timeout timeout)
      -> tl::expected<void, asio::error_code>;

    /**
     * @brief Upgrade connected stream to TLS (no certificate verification)
     */
    auto start_tls(const std::string& host, Timeout timeout)
      -> tl::expected<void, asio::error_code>;

    auto write(std::span<const std::uint8_t> data, Timeout timeout)
      -> tl::expected<std::size_t, asio::error_code>;
    auto write(std::string_view text, Timeout timeout)
      -> tl::expected<std::size_t, asio::error_code>;

    /**
     * @brief Read one '\n' terminated line without its line ending
     */
    auto read_line(Timeout timeout) -> tl::expected<std::string, asio::error_code>;

    auto read_some(std::span<std::uint8_t> buffer, Timeout timeout)
      -> tl::expected<std::size_t, asio::error_code>;

    void async_read_line(LineHandler handler);
    void async_write(std::string text);

    /**
     * @brief Wait until every queued async_write went out
     */
    auto flush(Timeout timeout) -> tl::expected<void, asio::error_code>;

    void close();

    auto is_open() const -> bool;

 private:
    using Completion = std::function<void(asio::error_code, std::size_t)>;
    using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

    auto _run(const std::function<void(Completion)>& initiate, Timeout timeout)
      -> tl::expected<std::size_t, asio::error_code>;

    template<typename Fn>
    auto _with_stream(Fn&& fn);

    auto _socket() -> asio::ip::tcp::socket& { return _stream->next_layer(); }
    auto _take_line(std::size_t length) -> std::string;
    void _write_next();

    asio::io_context& _io;
    std::string _name;

    asio::ip::tcp::resolver _resolver;
    asio::ssl::context _tls_context;
    std::unique_ptr<TlsStream> _stream;
    bool _tls_enabled = false;

    asio::streambuf _line_buffer;
    std::deque<std::string> _write_queue;
    Completion _on_flushed;

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace xdcc::net
