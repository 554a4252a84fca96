#pragma once

#include "network/transport.hpp"
#include <utility>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

namespace teleophub {
namespace network {

/**
 * WebSocketConnection - Boost.Beast WebSocket implementation of TransportConnection
 *
 * The underlying tcp_stream is bound to a strand; every completion handler and
 * every piece of mutable state below runs on that strand.
 *
 * Inbound: the HTTP upgrade request is read under a handshake deadline, the
 * request target must match the configured path, then the WebSocket accept
 * completes and start() begins the read loop.
 * Outbound: resolve, connect, WebSocket handshake against the path.
 */
class WebSocketConnection
    : public TransportConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  /**
   * Create outbound connection (will connect and handshake)
   */
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context,
                  const std::string &address, uint16_t port,
                  const std::string &path, ConnectCallback callback);

  /**
   * Create inbound connection from an accepted socket. The accept callback
   * fires once the WebSocket upgrade succeeds; failed upgrades are closed
   * without ever being reported.
   */
  static void accept_inbound(boost::asio::io_context &io_context,
                             boost::asio::ip::tcp::socket socket,
                             const std::string &path,
                             AcceptCallback on_upgraded);

  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection&) = delete;
  WebSocketConnection& operator=(const WebSocketConnection&) = delete;
  WebSocketConnection(WebSocketConnection&&) = delete;
  WebSocketConnection& operator=(WebSocketConnection&&) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::string &frame) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

#ifdef TELEOPHUB_TESTS
  // Test-only: override handshake timeout (0ms disables override)
  static void SetHandshakeTimeoutForTest(std::chrono::milliseconds timeout_ms);
  static void ResetHandshakeTimeoutForTest();

  // Test-only: override send queue byte limit (0 disables override)
  static void SetSendQueueLimitForTest(size_t bytes);
  static void ResetSendQueueLimitForTest();
#endif

  static constexpr size_t DEFAULT_SEND_QUEUE_LIMIT = 16 * 1024 * 1024;
  static constexpr size_t MAX_FRAME_SIZE = 4 * 1024 * 1024;

private:
  using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  WebSocketConnection(boost::asio::io_context &io_context,
                      boost::asio::ip::tcp::socket socket, bool is_inbound,
                      std::string path);

  // Inbound upgrade
  void do_read_upgrade(AcceptCallback on_upgraded);
  void reject_upgrade(boost::beast::http::status status);

  // Outbound connect + handshake
  void do_connect(const std::string &address, uint16_t port,
                  ConnectCallback callback);
  void finish_connect(bool success, const ConnectCallback &callback);

  // Strand-serialized internals
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void deliver_disconnect_once();

  std::chrono::milliseconds handshake_timeout() const;
  size_t send_queue_limit() const;

  boost::asio::io_context &io_context_;
  WsStream ws_;
  boost::beast::flat_buffer read_buffer_;
  boost::beast::http::request<boost::beast::http::string_body> upgrade_request_;
  std::string path_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on the strand)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on the strand)
  std::queue<std::shared_ptr<const std::string>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_{false};

  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

  static constexpr std::chrono::milliseconds DEFAULT_HANDSHAKE_TIMEOUT{std::chrono::seconds(10)};

#ifdef TELEOPHUB_TESTS
  static std::atomic<std::chrono::milliseconds> handshake_timeout_override_ms_;
  static std::atomic<size_t> send_queue_limit_override_bytes_;
#endif

  // Set once the WebSocket handshake has completed and cleared on close
  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * WebSocketTransport - Boost.Asio acceptor plus io_context thread pool
 *
 * Every connection accepted or opened by this transport uses the same
 * WebSocket path (default "/ws/rpc").
 */
class WebSocketTransport : public Transport {
public:
  explicit WebSocketTransport(size_t io_threads = 1,
                              std::string path = "/ws/rpc");
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  // Transport interface
  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  const std::string &path() const { return path_; }

  // Return bound listening port (0 if not listening)
  uint16_t listening_port() const;

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // Destroyed only in the destructor so connections holding strands on it
  // never outlive it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};
  std::string path_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};
};

} // namespace network
} // namespace teleophub
