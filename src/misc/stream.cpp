#include "misc/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/read_until.hpp>
#include <asio/ssl/stream_base.hpp>
#include <asio/ssl/verify_mode.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace xdcc::net {

Stream::Stream(asio::io_context& io, std::string name) :
  _io(io),
  _name(std::move(name)),
  _resolver(io),
  _tls_context(asio::ssl::context::tls_client),
  _stream(std::make_unique<TlsStream>(io, _tls_context)),
  _line_buffer(MAX_LINE_BUFFER),
  _logger(spdlog::get("internal_logger"))
{
    if (not _logger) {
        _logger = spdlog::default_logger();
    }

    _tls_context.set_verify_mode(asio::ssl::verify_none);
}

Stream::~Stream()
{
    close();
}

template<typename Fn>
auto Stream::_with_stream(Fn&& fn)
{
    if (_tls_enabled) {
        return fn(*_stream);
    }
    return fn(_socket());
}

/**
 * @brief Start an async operation and drive the io_context until it finishes
 *
 * On timeout the socket is cancelled and the operation result is replaced by
 * asio::error::timed_out.
 */
auto Stream::_run(const std::function<void(Completion)>& initiate, Timeout timeout)
  -> tl::expected<std::size_t, asio::error_code>
{
    std::optional<asio::error_code> result;
    std::size_t bytes = 0;
    bool timer_done = false;
    bool timed_out = false;

    asio::steady_timer timer(_io, timeout);

    timer.async_wait([&](asio::error_code ec) {
        timer_done = true;

        if (ec == asio::error::operation_aborted) {  // timer canceled
            return;
        }

        if (not result) {
            _logger->debug("{}: timeout expired", _name);
            timed_out = true;

            asio::error_code ignored;
            _resolver.cancel();
            _socket().cancel(ignored);
        }
    });

    initiate([&](asio::error_code ec, std::size_t bytes_transferred) {
        result = ec;
        bytes = bytes_transferred;
        timer.cancel();
    });

    while (not result or not timer_done) {
        if (_io.stopped()) {
            _io.restart();
        }
        _io.run_one();
    }

    if (timed_out) {
        return tl::make_unexpected(asio::error::timed_out);
    }

    if (*result) {
        return tl::make_unexpected(*result);
    }

    return bytes;
}

auto Stream::connect(const std::string& host, std::uint16_t port, Timeout timeout)
  -> tl::expected<void, asio::error_code>
{
    close();

    _stream = std::make_unique<TlsStream>(_io, _tls_context);
    _line_buffer.consume(_line_buffer.size());

    _logger->debug("{}: connecting to {}:{}", _name, host, port);

    asio::ip::tcp::resolver::results_type endpoints;

    auto resolved = _run(
      [&](Completion done) {
          _resolver.async_resolve(
            host, std::to_string(port),
            [&endpoints, done](auto ec, auto results) {
                endpoints = std::move(results);
                done(ec, 0);
            }
          );
      },
      timeout
    );

    if (not resolved) {
        _logger->debug("{}: resolve failed: {}", _name, resolved.error().message());
        return tl::make_unexpected(resolved.error());
    }

    auto connected = _run(
      [&](Completion done) {
          asio::async_connect(
            _socket(), endpoints,
            [done](auto ec, const asio::ip::tcp::endpoint&) { done(ec, 0); }
          );
      },
      timeout
    );

    if (not connected) {
        _logger->debug("{}: connect failed: {}", _name, connected.error().message());
        close();
        return tl::make_unexpected(connected.error());
    }

    _logger->debug("{}: connected", _name);

    return {};
}

auto Stream::start_tls(const std::string& host, Timeout timeout)
  -> tl::expected<void, asio::error_code>
{
    if (not is_open()) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    SSL_set_tlsext_host_name(_stream->native_handle(), host.c_str());

    auto shaken = _run(
      [&](Completion done) {
          _stream->async_handshake(
            asio::ssl::stream_base::client,
            [done](auto ec) { done(ec, 0); }
          );
      },
      timeout
    );

    if (not shaken) {
        _logger->debug("{}: TLS handshake failed: {}", _name, shaken.error().message());
        close();
        return tl::make_unexpected(shaken.error());
    }

    _tls_enabled = true;
    _logger->debug("{}: TLS established", _name);

    return {};
}

auto Stream::write(std::span<const std::uint8_t> data, Timeout timeout)
  -> tl::expected<std::size_t, asio::error_code>
{
    if (not is_open()) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    return _run(
      [&](Completion done) {
          _with_stream([&](auto& stream) {
              asio::async_write(stream, asio::buffer(data.data(), data.size()), done);
          });
      },
      timeout
    );
}

auto Stream::write(std::string_view text, Timeout timeout)
  -> tl::expected<std::size_t, asio::error_code>
{
    _logger->debug("{} >> {}", _name, text.substr(0, text.find_last_not_of("\r\n") + 1));

    return write(
      std::span{reinterpret_cast<const std::uint8_t*>(text.data()), text.size()},
      timeout
    );
}

auto Stream::read_line(Timeout timeout) -> tl::expected<std::string, asio::error_code>
{
    if (not is_open()) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    auto length = _run(
      [&](Completion done) {
          _with_stream([&](auto& stream) {
              asio::async_read_until(stream, _line_buffer, '\n', done);
          });
      },
      timeout
    );

    if (not length) {
        return tl::make_unexpected(length.error());
    }

    return _take_line(*length);
}

auto Stream::read_some(std::span<std::uint8_t> buffer, Timeout timeout)
  -> tl::expected<std::size_t, asio::error_code>
{
    if (not is_open()) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    return _run(
      [&](Completion done) {
          _with_stream([&](auto& stream) {
              stream.async_read_some(asio::buffer(buffer.data(), buffer.size()), done);
          });
      },
      timeout
    );
}

void Stream::async_read_line(LineHandler handler)
{
    _with_stream([this, handler = std::move(handler)](auto& stream) mutable {
        asio::async_read_until(
          stream, _line_buffer, '\n',
          [this, handler = std::move(handler)](auto ec, std::size_t length) {
              if (ec) {
                  handler(ec, {});
                  return;
              }
              handler(ec, _take_line(length));
          }
        );
    });
}

void Stream::async_write(std::string text)
{
    _logger->debug("{} >> {}", _name, text.substr(0, text.find_last_not_of("\r\n") + 1));

    _write_queue.push_back(std::move(text));

    if (_write_queue.size() == 1) {
        _write_next();
    }
}

void Stream::_write_next()
{
    _with_stream([this](auto& stream) {
        asio::async_write(
          stream, asio::buffer(_write_queue.front()),
          [this](auto ec, std::size_t) {
              if (ec) {
                  _logger->debug("{}: write failed: {}", _name, ec.message());
                  _write_queue.clear();
              }
              else {
                  _write_queue.pop_front();
              }

              if (not _write_queue.empty()) {
                  _write_next();
                  return;
              }

              if (_on_flushed) {
                  std::exchange(_on_flushed, nullptr)(ec, 0);
              }
          }
        );
    });
}

auto Stream::flush(Timeout timeout) -> tl::expected<void, asio::error_code>
{
    if (_write_queue.empty()) {
        return {};
    }

    auto flushed = _run(
      [this](Completion done) { _on_flushed = std::move(done); },
      timeout
    );

    _on_flushed = nullptr;

    if (not flushed) {
        return tl::make_unexpected(flushed.error());
    }

    return {};
}

auto Stream::_take_line(std::size_t length) -> std::string
{
    auto begin = asio::buffers_begin(_line_buffer.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length));
    _line_buffer.consume(length);

    while (not line.empty() and (line.back() == '\n' or line.back() == '\r')) {
        line.pop_back();
    }

    _logger->debug("{} << {}", _name, line);

    return line;
}

void Stream::close()
{
    asio::error_code ignored;

    _resolver.cancel();

    if (_socket().is_open()) {
        _logger->debug("{}: closing", _name);
        _socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        _socket().close(ignored);
    }

    _tls_enabled = false;
}

auto Stream::is_open() const -> bool
{
    return _stream->next_layer().is_open();
}

}  // namespace xdcc::net
