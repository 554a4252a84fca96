// Copyright (c) 2025 The Unicity Foundation
// WebSocket transport implementation using boost::asio and boost::beast

#include "network/websocket_transport.hpp"
#include "util/logging.hpp"

namespace teleophub {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Request target without the query string
std::string TargetPath(beast::string_view target) {
  std::string path(target.data(), target.size());
  auto query = path.find('?');
  if (query != std::string::npos) {
    path.resize(query);
  }
  return path;
}

} // namespace

// ============================================================================
// WebSocketConnection
// ============================================================================

std::atomic<uint64_t> WebSocketConnection::next_id_{1};

#ifdef TELEOPHUB_TESTS
std::atomic<std::chrono::milliseconds> WebSocketConnection::handshake_timeout_override_ms_{std::chrono::milliseconds{0}};
std::atomic<size_t> WebSocketConnection::send_queue_limit_override_bytes_{0};
#endif

TransportConnectionPtr WebSocketConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &address,
    uint16_t port, const std::string &path, ConnectCallback callback) {
  auto conn = std::shared_ptr<WebSocketConnection>(new WebSocketConnection(
      io_context, tcp::socket(boost::asio::make_strand(io_context)), false,
      path));
  // Defer onto the strand so the object lifetime is extended regardless of
  // what the caller does with the return value
  boost::asio::post(conn->ws_.get_executor(),
                    [conn, address, port, callback]() mutable {
                      conn->do_connect(address, port, std::move(callback));
                    });
  return conn;
}

void WebSocketConnection::accept_inbound(boost::asio::io_context &io_context,
                                         tcp::socket socket,
                                         const std::string &path,
                                         AcceptCallback on_upgraded) {
  std::string remote_addr;
  uint16_t remote_port = 0;
  boost::system::error_code ec;
  auto remote_ep = socket.remote_endpoint(ec);
  if (!ec) {
    remote_addr = remote_ep.address().to_string();
    remote_port = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }

  auto conn = std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(io_context, std::move(socket), true, path));
  conn->remote_addr_ = remote_addr;
  conn->remote_port_ = remote_port;

  boost::asio::dispatch(conn->ws_.get_executor(),
                        [conn, cb = std::move(on_upgraded)]() mutable {
                          conn->do_read_upgrade(std::move(cb));
                        });
}

WebSocketConnection::WebSocketConnection(boost::asio::io_context &io_context,
                                         tcp::socket socket, bool is_inbound,
                                         std::string path)
    : io_context_(io_context), ws_(std::move(socket)), path_(std::move(path)),
      is_inbound_(is_inbound), id_(next_id_++) {}

WebSocketConnection::~WebSocketConnection() {
  // Cleanup happens in close_impl() while the shared_ptr is still alive.
  // Do not log here; the logging subsystem may already be gone at exit.
}

void WebSocketConnection::do_read_upgrade(AcceptCallback on_upgraded) {
  beast::get_lowest_layer(ws_).expires_after(handshake_timeout());

  http::async_read(
      ws_.next_layer(), read_buffer_, upgrade_request_,
      [this, self = shared_from_this(),
       on_upgraded](beast::error_code ec, std::size_t) mutable {
        if (ec) {
          LOG_NET_DEBUG("upgrade request from {}:{} failed: {}", remote_addr_,
                        remote_port_, ec.message());
          close_impl();
          return;
        }

        if (!websocket::is_upgrade(upgrade_request_)) {
          LOG_NET_DEBUG("non-websocket request from {}:{}", remote_addr_,
                        remote_port_);
          reject_upgrade(http::status::bad_request);
          return;
        }

        std::string target = TargetPath(upgrade_request_.target());
        if (target != path_) {
          LOG_NET_DEBUG("websocket request for unknown path {} from {}:{}",
                        target, remote_addr_, remote_port_);
          reject_upgrade(http::status::not_found);
          return;
        }

        // Beast's own timeouts take over once the stream is a websocket
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::server));
        ws_.read_message_max(MAX_FRAME_SIZE);

        ws_.async_accept(
            upgrade_request_,
            [this, self, on_upgraded](beast::error_code ec) {
              if (ec) {
                LOG_NET_DEBUG("websocket accept from {}:{} failed: {}",
                              remote_addr_, remote_port_, ec.message());
                close_impl();
                return;
              }

              read_buffer_.consume(read_buffer_.size());
              open_ = true;
              LOG_NET_DEBUG("websocket connection {} from {}:{} upgraded", id_,
                            remote_addr_, remote_port_);

              if (on_upgraded) {
                try {
                  on_upgraded(self);
                } catch (const std::exception &e) {
                  LOG_NET_ERROR("exception in accept callback: {}", e.what());
                }
              }
            });
      });
}

void WebSocketConnection::reject_upgrade(http::status status) {
  auto res = std::make_shared<http::response<http::string_body>>(
      status, upgrade_request_.version());
  res->set(http::field::content_type, "text/plain");
  res->keep_alive(false);
  auto reason = http::obsolete_reason(status);
  res->body() = std::string(reason.data(), reason.size()) + "\n";
  res->prepare_payload();

  http::async_write(ws_.next_layer(), *res,
                    [this, self = shared_from_this(),
                     res](beast::error_code ec, std::size_t) {
                      if (ec) {
                        LOG_NET_TRACE("failed to send rejection to {}:{}: {}",
                                      remote_addr_, remote_port_, ec.message());
                      }
                      close_impl();
                    });
}

void WebSocketConnection::do_connect(const std::string &address, uint16_t port,
                                     ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;

  // Covers resolve + TCP connect; the websocket handshake uses Beast's
  // suggested client timeouts
  beast::get_lowest_layer(ws_).expires_after(handshake_timeout());

  resolver_ = std::make_shared<tcp::resolver>(ws_.get_executor());
  resolver_->async_resolve(
      address, std::to_string(port),
      [this, self = shared_from_this(), address,
       callback](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          LOG_NET_TRACE("failed to resolve {}: {}", address, ec.message());
          finish_connect(false, callback);
          return;
        }

        beast::get_lowest_layer(ws_).async_connect(
            results,
            [this, self, address,
             callback](beast::error_code ec,
                       tcp::resolver::results_type::endpoint_type ep) {
              if (ec) {
                LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
                finish_connect(false, callback);
                return;
              }

              remote_addr_ = ep.address().to_string();
              remote_port_ = ep.port();

              beast::get_lowest_layer(ws_).expires_never();
              ws_.set_option(websocket::stream_base::timeout::suggested(
                  beast::role_type::client));
              ws_.read_message_max(MAX_FRAME_SIZE);

              std::string host = address + ":" + std::to_string(ep.port());
              ws_.async_handshake(
                  host, path_, [this, self, callback](beast::error_code ec) {
                    if (ec) {
                      LOG_NET_TRACE("websocket handshake with {}:{} failed: {}",
                                    remote_addr_, remote_port_, ec.message());
                      finish_connect(false, callback);
                      return;
                    }
                    open_ = true;
                    LOG_NET_TRACE("connected to ws://{}:{}{}", remote_addr_,
                                  remote_port_, path_);
                    finish_connect(true, callback);
                  });
            });
      });
}

void WebSocketConnection::finish_connect(bool success,
                                         const ConnectCallback &callback) {
  resolver_.reset();
  if (!success) {
    close_impl();
  }
  if (callback) {
    try {
      callback(success);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in connect callback: {}", e.what());
    }
  }
}

void WebSocketConnection::start() {
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void WebSocketConnection::start_read_impl() {
  if (!open_)
    return;

  ws_.async_read(
      read_buffer_, [this, self = shared_from_this()](beast::error_code ec,
                                                      std::size_t) {
        if (!open_) {
          close_impl();
          return;
        }

        if (ec) {
          if (ec != websocket::error::closed &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_,
                          remote_port_, ec.message());
          }
          close_impl();
          return;
        }

        std::string frame = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());

        if (!ws_.got_text()) {
          LOG_NET_DEBUG("dropping binary frame ({} bytes) from {}:{}",
                        frame.size(), remote_addr_, remote_port_);
        } else {
          ReceiveCallback saved_receive_cb = receive_callback_;
          if (saved_receive_cb) {
            try {
              saved_receive_cb(frame);
            } catch (const std::exception &e) {
              LOG_NET_WARN("exception in receive callback from {}:{}: {}",
                           remote_addr_, remote_port_, e.what());
            }
          }
        }

        // The receive callback may have closed the connection
        if (!open_) {
          return;
        }

        start_read_impl();
      });
}

// Returns false only if the connection is already closed at call time.
// Queue overflow is enforced on the strand and closes the connection.
bool WebSocketConnection::send(const std::string &frame) {
  if (!open_) return false;
  // Copy before leaving the caller's thread
  auto payload = std::make_shared<const std::string>(frame);
  boost::asio::dispatch(ws_.get_executor(),
                        [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    size_t limit = send_queue_limit();
    if (send_queue_bytes_ + payload->size() > limit) {
      LOG_NET_WARN("Send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), disconnecting node connection {}:{}",
                   send_queue_bytes_, payload->size(), limit,
                   remote_addr_, remote_port_);
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void WebSocketConnection::do_write_impl() {
  if (!open_)
    return;

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  ws_.text(true);
  ws_.async_write(
      boost::asio::buffer(*data_ptr),
      [this, self = shared_from_this(), data_ptr](beast::error_code ec,
                                                  std::size_t) {
        // Send queue was already cleared by close_impl()
        if (!open_) {
          return;
        }

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          close_impl();
          return;
        }

        send_queue_bytes_ -= data_ptr->size();
        send_queue_.pop();

        do_write_impl();
      });
}

void WebSocketConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering the strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void WebSocketConnection::close() {
  boost::asio::dispatch(ws_.get_executor(),
                        [this, self = shared_from_this()]() { close_impl(); });
}

void WebSocketConnection::close_impl() {
  bool was_open = open_.exchange(false);

  // Connections that never completed the handshake were never reported, so
  // the callback set is empty and this is a no-op for them
  deliver_disconnect_once();
  receive_callback_ = {};

  if (resolver_) {
    resolver_->cancel();
    resolver_.reset();
  }

  std::queue<std::shared_ptr<const std::string>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_ = false;

  if (was_open && ws_.is_open()) {
    // Orderly close handshake; Beast's close timeout bounds a silent peer
    ws_.async_close(websocket::close_code::normal,
                    [this, self = shared_from_this()](beast::error_code ec) {
                      if (ec && ec != boost::asio::error::operation_aborted) {
                        LOG_NET_TRACE("close handshake with {}:{} failed: {}",
                                      remote_addr_, remote_port_, ec.message());
                      }
                      beast::error_code ignored;
                      beast::get_lowest_layer(ws_).socket().close(ignored);
                    });
    return;
  }

  beast::error_code ignored;
  beast::get_lowest_layer(ws_).socket().close(ignored);
}

bool WebSocketConnection::is_open() const { return open_; }

#ifdef TELEOPHUB_TESTS
void WebSocketConnection::SetHandshakeTimeoutForTest(std::chrono::milliseconds timeout_ms) {
  handshake_timeout_override_ms_.store(timeout_ms, std::memory_order_relaxed);
}

void WebSocketConnection::ResetHandshakeTimeoutForTest() {
  handshake_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void WebSocketConnection::SetSendQueueLimitForTest(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void WebSocketConnection::ResetSendQueueLimitForTest() {
  send_queue_limit_override_bytes_.store(0, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds WebSocketConnection::handshake_timeout() const {
#ifdef TELEOPHUB_TESTS
  auto ms = handshake_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
#endif
  return DEFAULT_HANDSHAKE_TIMEOUT;
}

size_t WebSocketConnection::send_queue_limit() const {
#ifdef TELEOPHUB_TESTS
  size_t limit = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
  if (limit > 0) return limit;
#endif
  return DEFAULT_SEND_QUEUE_LIMIT;
}

std::string WebSocketConnection::remote_address() const {
  return remote_addr_;
}

uint16_t WebSocketConnection::remote_port() const { return remote_port_; }

void WebSocketConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(ws_.get_executor(), [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(ws_.get_executor(), [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    if (disconnect_delivered_) {
      return;
    }
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(size_t io_threads, std::string path)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads),
      path_(std::move(path)) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

TransportConnectionPtr WebSocketTransport::connect(const std::string &address,
                                                   uint16_t port,
                                                   ConnectCallback callback) {
  if (!io_context_) return {};
  return WebSocketConnection::create_outbound(*io_context_, address, port,
                                              path_, std::move(callback));
}

bool WebSocketTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (!io_context_) return false;
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    // Record the actual bound port (handles ephemeral port 0)
    {
      boost::system::error_code ec;
      auto ep = acceptor_->local_endpoint(ec);
      last_listen_port_ = ec ? 0 : ep.port();
    }

    LOG_NET_INFO("listening on port {} (path {})",
                 last_listen_port_ ? last_listen_port_ : port, path_);
    start_accept();
    return true;

  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    accept_callback_ = {};
    return false;
  }
}

void WebSocketTransport::start_accept() {
  if (!acceptor_)
    return;

  // Each accepted socket gets its own strand
  acceptor_->async_accept(boost::asio::make_strand(*io_context_),
                          [this](const boost::system::error_code &ec,
                                 tcp::socket socket) {
                            handle_accept(ec, std::move(socket));
                          });
}

void WebSocketTransport::handle_accept(const boost::system::error_code &ec,
                                       tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(tcp::no_delay(true), opt_ec);

  if (!io_context_) {
    return;
  }

  boost::system::error_code ep_ec;
  auto remote_ep = socket.remote_endpoint(ep_ec);
  if (!ep_ec) {
    LOG_NET_DEBUG("connection from {}:{} accepted",
                  remote_ep.address().to_string(), remote_ep.port());
  }

  WebSocketConnection::accept_inbound(*io_context_, std::move(socket), path_,
                                      accept_callback_);

  start_accept();
}

void WebSocketTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;

  // Release anything the callback captured
  accept_callback_ = {};
}

void WebSocketTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

uint16_t WebSocketTransport::listening_port() const {
  return last_listen_port_;
}

void WebSocketTransport::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down

  stop_listening();

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  io_threads_.clear();

  // io_context_ itself is destroyed only in the destructor so it outlives
  // every connection that still references it
}

} // namespace network
} // namespace teleophub
