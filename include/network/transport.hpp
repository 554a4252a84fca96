#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace teleophub {
namespace network {

// Abstract transport interface for node connections
// Allows dependency injection of different implementations:
// - WebSocketTransport: Boost.Beast WebSocket over TCP
// - MockTransport: in-memory frames for testing (in test/)

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Callback types for transport events
using ConnectCallback = std::function<void(bool success)>;
// One complete text frame per invocation
using ReceiveCallback = std::function<void(const std::string &frame)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one duplex, message-framed connection to a node
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving frames (callbacks invoked when a frame arrives or the
  // connection closes)
  virtual void start() = 0;

  // Send one text frame
  // - Returns false if the connection is already closed at call time.
  // - Returns true if the implementation accepted the frame. A later queue
  //   overflow or write error closes the connection and is reported through
  //   the disconnect callback, not through this return value.
  virtual bool send(const std::string &frame) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - factory for connections
// Provides outbound connection initiation (node simulator, tests) and inbound
// acceptance (the hub)
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate outbound connection (callback called on success/fail)
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections (returns true if listening started)
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Run transport event loop (spawns IO threads and returns)
  virtual void run() = 0;

  // Stop transport (stops listening and the event loop)
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace teleophub
