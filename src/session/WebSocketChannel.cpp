// Repository: Seedling
// Component: WebSocket Frame Channel
// Purpose: Boost.Beast client transport (ws:// and wss://) for IFrameChannel.
// Copyright (c) 2025 RetroVue

#include "seedling/session/WebSocketChannel.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "seedling/util/Logger.hpp"

namespace seedling::session {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using util::Logger;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);

template <bool kTls>
class WebSocketChannel : public IFrameChannel {
 public:
  using Layer = std::conditional_t<kTls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
  using Stream = websocket::stream<Layer>;

  WebSocketChannel(net::io_context& ioc, WebSocketUrl url, std::shared_ptr<ssl::context> ssl_ctx)
      : resolver_(ioc), url_(std::move(url)), ssl_ctx_(std::move(ssl_ctx)) {
    if constexpr (kTls) {
      ws_ = std::make_unique<Stream>(ioc, *ssl_ctx_);
    } else {
      ws_ = std::make_unique<Stream>(ioc);
    }
  }

  void AsyncConnect(const ConnectionRequest& request, ChannelHandler handler) override {
    resolver_.async_resolve(
        url_.host, url_.port,
        [this, request, handler](const beast::error_code& ec, tcp::resolver::results_type results) {
          if (ec) {
            handler(ec);
            return;
          }
          beast::get_lowest_layer(*ws_).expires_after(kConnectTimeout);
          beast::get_lowest_layer(*ws_).async_connect(
              results,
              [this, request, handler](const beast::error_code& ec, const tcp::endpoint&) {
                if (ec) {
                  handler(ec);
                  return;
                }
                if constexpr (kTls) {
                  if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(),
                                                url_.host.c_str())) {
                    handler(beast::error_code(static_cast<int>(::ERR_get_error()),
                                              net::error::get_ssl_category()));
                    return;
                  }
                  ws_->next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
                  ws_->next_layer().async_handshake(
                      ssl::stream_base::client,
                      [this, request, handler](const beast::error_code& ec) {
                        if (ec) {
                          handler(ec);
                          return;
                        }
                        UpgradeToWebSocket(request, handler);
                      });
                } else {
                  UpgradeToWebSocket(request, handler);
                }
              });
        });
  }

  void AsyncWrite(std::vector<uint8_t> frame, ChannelHandler handler) override {
    write_buffer_ = std::move(frame);
    ws_->async_write(net::buffer(write_buffer_),
                     [handler](const beast::error_code& ec, std::size_t) { handler(ec); });
  }

  void AsyncRead(ChannelReadHandler handler) override {
    ws_->async_read(read_buffer_, [this, handler](const beast::error_code& ec, std::size_t n) {
      if (ec) {
        handler(ec, {});
        return;
      }
      if (!ws_->got_binary()) {
        Logger::Warn("[WebSocketChannel] Skipping non-binary message (" + std::to_string(n) +
                     " bytes)");
        read_buffer_.consume(read_buffer_.size());
        AsyncRead(handler);
        return;
      }
      const auto data = read_buffer_.data();
      const auto* begin = static_cast<const uint8_t*>(data.data());
      std::vector<uint8_t> message(begin, begin + data.size());
      read_buffer_.consume(read_buffer_.size());
      handler({}, std::move(message));
    });
  }

  void AsyncClose(ChannelHandler handler) override {
    ws_->async_close(websocket::close_code::normal,
                     [handler](const beast::error_code& ec) { handler(ec); });
  }

  void Close() override {
    resolver_.cancel();
    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(*ws_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(*ws_).close();
  }

 private:
  void UpgradeToWebSocket(const ConnectionRequest& request, ChannelHandler handler) {
    // The websocket stream runs its own timers from here on.
    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    const auto headers = request.headers;
    ws_->set_option(websocket::stream_base::decorator(
        [headers](websocket::request_type& req) {
          req.set(beast::http::field::user_agent, "seedlingd");
          for (const auto& [name, value] : headers) {
            req.set(name, value);
          }
        }));
    ws_->binary(true);
    const std::string host_header = url_.host + ":" + url_.port;
    ws_->async_handshake(host_header, url_.target,
                         [handler](const beast::error_code& ec) { handler(ec); });
  }

  tcp::resolver resolver_;
  WebSocketUrl url_;
  std::shared_ptr<ssl::context> ssl_ctx_;
  std::unique_ptr<Stream> ws_;
  beast::flat_buffer read_buffer_;
  std::vector<uint8_t> write_buffer_;
};

}  // namespace

std::optional<WebSocketUrl> ParseWebSocketUrl(const std::string& url) {
  WebSocketUrl out;
  std::string rest;
  if (url.rfind("wss://", 0) == 0) {
    out.tls = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    out.tls = false;
    rest = url.substr(5);
  } else {
    return std::nullopt;
  }

  const size_t slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  out.target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (!out.target.empty() && out.target[0] == '?') {
    out.target = "/" + out.target;
  }

  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
    if (out.port.empty() ||
        out.port.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
  } else {
    out.host = authority;
    out.port = out.tls ? "443" : "80";
  }
  if (out.host.empty()) return std::nullopt;
  return out;
}

std::unique_ptr<IFrameChannel> MakeWebSocketChannel(net::io_context& ioc, const std::string& url) {
  auto parsed = ParseWebSocketUrl(url);
  if (!parsed) {
    throw std::invalid_argument("unsupported ASR url: " + url);
  }
  if (!parsed->tls) {
    return std::make_unique<WebSocketChannel<false>>(ioc, std::move(*parsed), nullptr);
  }
  auto ctx = std::make_shared<ssl::context>(ssl::context::tlsv12_client);
  ctx->set_default_verify_paths();
  ctx->set_verify_mode(ssl::verify_peer);
  return std::make_unique<WebSocketChannel<true>>(ioc, std::move(*parsed), std::move(ctx));
}

}  // namespace seedling::session
