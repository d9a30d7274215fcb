// Repository: Seedling
// Component: Control Server
// Purpose: Loopback HTTP/1.1 listener that feeds requests to the ControlApi.
// Copyright (c) 2025 RetroVue

#include "seedling/control/ControlServer.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "seedling/util/Logger.hpp"

namespace seedling::control {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using util::Logger;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);
constexpr const char* kServerName = "seedlingd";

void Fail(const beast::error_code& ec, const char* what) {
  Logger::Warn(std::string("[ControlServer] ") + what + ": " + ec.message());
}

// One keep-alive connection. Reads run on the connection's strand; the
// request is handed to the handler pool and the reply posted back.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, ControlApi& api, net::thread_pool& handlers)
      : stream_(std::move(socket)), api_(api), handlers_(handlers) {}

  void Run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    request_ = {};
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      DoClose();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        Fail(ec, "read");
      }
      return;
    }

    const std::string method(request_.method_string());
    const std::string target(request_.target());
    auto self = shared_from_this();
    net::post(handlers_, [self, method, target] {
      HttpReply reply;
      try {
        reply = self->api_.Handle(method, target);
      } catch (const std::exception& e) {
        Logger::Error(std::string("[ControlServer] Handler failed: ") + e.what());
        reply.status = 500;
        reply.body = std::string("{\"status\":\"error\",\"message\":\"internal error\"}");
      }
      net::post(self->stream_.get_executor(),
                [self, reply = std::move(reply)]() mutable { self->Respond(std::move(reply)); });
    });
  }

  void Respond(HttpReply reply) {
    auto res = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(reply.status), request_.version());
    res->set(http::field::server, kServerName);
    res->set(http::field::content_type, "application/json");
    res->keep_alive(request_.keep_alive());
    res->body() = std::move(reply.body);
    res->prepare_payload();

    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                        self->OnWrite(res->need_eof(), ec);
                      });
  }

  void OnWrite(bool close, beast::error_code ec) {
    if (ec) {
      Fail(ec, "write");
      return;
    }
    if (close) {
      DoClose();
      return;
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  ControlApi& api_;
  net::thread_pool& handlers_;
};

}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(net::io_context& ioc, ControlApi& api, net::thread_pool& handlers)
      : ioc_(ioc), acceptor_(ioc), api_(api), handlers_(handlers) {}

  // Throws std::runtime_error naming the failing step.
  void Open(const tcp::endpoint& endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw std::runtime_error("open: " + ec.message());
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("set_option: " + ec.message());
    acceptor_.bind(endpoint, ec);
    if (ec) throw std::runtime_error("bind: " + ec.message());
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("listen: " + ec.message());
  }

  uint16_t port() const {
    beast::error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
  }

  void Run() { DoAccept(); }

  void Close() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
      beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
  }

  void OnAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;
    if (ec) {
      Fail(ec, "accept");
    } else {
      std::make_shared<HttpSession>(std::move(socket), api_, handlers_)->Run();
    }
    if (acceptor_.is_open()) DoAccept();
  }

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  ControlApi& api_;
  net::thread_pool& handlers_;
};

ControlServer::ControlServer(ControlApi& api, ControlServerConfig config)
    : api_(api), config_(std::move(config)), ioc_(config_.io_threads > 0 ? config_.io_threads : 1) {}

ControlServer::~ControlServer() {
  Stop();
}

void ControlServer::Start() {
  if (running_.exchange(true)) return;

  beast::error_code ec;
  const auto address = net::ip::make_address(config_.bind_address, ec);
  if (ec) {
    running_ = false;
    throw std::runtime_error("invalid bind address '" + config_.bind_address + "'");
  }

  handlers_ = std::make_unique<net::thread_pool>(
      static_cast<std::size_t>(config_.handler_threads > 0 ? config_.handler_threads : 1));
  listener_ = std::make_shared<Listener>(ioc_, api_, *handlers_);
  try {
    listener_->Open(tcp::endpoint{address, config_.port});
  } catch (const std::runtime_error& e) {
    listener_.reset();
    handlers_->join();
    handlers_.reset();
    running_ = false;
    throw std::runtime_error("cannot listen on " + config_.bind_address + ":" +
                             std::to_string(config_.port) + " (" + e.what() + ")");
  }
  bound_port_ = listener_->port();
  listener_->Run();

  const int threads = config_.io_threads > 0 ? config_.io_threads : 1;
  io_threads_.reserve(static_cast<std::size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this] {
      for (;;) {
        try {
          ioc_.run();
          break;
        } catch (const std::exception& e) {
          Logger::Error(std::string("[ControlServer] I/O thread: ") + e.what());
        }
      }
    });
  }
  Logger::Info("[ControlServer] Listening on http://" + config_.bind_address + ":" +
               std::to_string(bound_port_));
}

void ControlServer::Stop() {
  if (!running_.exchange(false)) return;
  if (listener_) listener_->Close();
  // Let in-flight handlers finish before the I/O context goes away.
  if (handlers_) handlers_->join();
  ioc_.stop();
  for (auto& t : io_threads_) {
    if (t.joinable()) t.join();
  }
  io_threads_.clear();
  listener_.reset();
  handlers_.reset();
  Logger::Info("[ControlServer] Stopped");
}

}  // namespace seedling::control
