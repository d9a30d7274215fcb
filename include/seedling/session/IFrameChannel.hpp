// Repository: Seedling
// Component: Frame Channel Interface
// Purpose: Message-oriented full-duplex transport used by StreamingSession.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_SESSION_I_FRAME_CHANNEL_HPP_
#define SEEDLING_SESSION_I_FRAME_CHANNEL_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace seedling::session {

// Where to connect and which headers to attach to the upgrade request.
struct ConnectionRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
};

using ChannelHandler = std::function<void(const boost::system::error_code&)>;
using ChannelReadHandler =
    std::function<void(const boost::system::error_code&, std::vector<uint8_t>)>;

// IFrameChannel carries whole binary messages. Implementations are bound to
// one io_context; every method must be called from, and every handler is
// invoked on, that context's thread.
//
// At most one AsyncRead and one AsyncWrite may be outstanding at a time.
class IFrameChannel {
 public:
  virtual ~IFrameChannel() = default;

  virtual void AsyncConnect(const ConnectionRequest& request, ChannelHandler handler) = 0;

  // `frame` is kept alive by the channel until the handler runs.
  virtual void AsyncWrite(std::vector<uint8_t> frame, ChannelHandler handler) = 0;

  // Delivers the next binary message. Non-binary messages are skipped.
  virtual void AsyncRead(ChannelReadHandler handler) = 0;

  // Graceful close handshake.
  virtual void AsyncClose(ChannelHandler handler) = 0;

  // Immediate close. Outstanding operations complete with an error.
  virtual void Close() = 0;
};

using FrameChannelFactory = std::function<std::unique_ptr<IFrameChannel>(
    boost::asio::io_context& ioc, const std::string& url)>;

}  // namespace seedling::session

#endif  // SEEDLING_SESSION_I_FRAME_CHANNEL_HPP_
