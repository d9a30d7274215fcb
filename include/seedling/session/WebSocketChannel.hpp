// Repository: Seedling
// Component: WebSocket Frame Channel
// Purpose: Boost.Beast client transport (ws:// and wss://) for IFrameChannel.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_SESSION_WEB_SOCKET_CHANNEL_HPP_
#define SEEDLING_SESSION_WEB_SOCKET_CHANNEL_HPP_

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "seedling/session/IFrameChannel.hpp"

namespace seedling::session {

struct WebSocketUrl {
  bool tls = false;
  std::string host;
  std::string port;
  std::string target;  // path + query, at least "/"
};

// Accepts ws://host[:port][/path] and wss://host[:port][/path].
std::optional<WebSocketUrl> ParseWebSocketUrl(const std::string& url);

// Plain or TLS channel depending on the URL scheme. TLS peers are verified
// against the system trust store and the URL host name (SNI is sent).
// Throws std::invalid_argument for an unsupported URL.
std::unique_ptr<IFrameChannel> MakeWebSocketChannel(boost::asio::io_context& ioc,
                                                    const std::string& url);

}  // namespace seedling::session

#endif  // SEEDLING_SESSION_WEB_SOCKET_CHANNEL_HPP_
