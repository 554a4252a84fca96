#pragma once

#include "network/node_types.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace teleophub {
namespace network {

class ConnectionRegistry;
class RequestCorrelator;

/**
 * NodeGateway - outbound calls and notifications to nodes
 *
 * Call() blocks the calling thread until the node replies, the timeout
 * elapses or the node disconnects. Never call it from a connection's IO
 * thread: the reply is delivered on that same thread.
 *
 * Thread-safe; any number of callers may target the same node.
 */
class NodeGateway {
public:
  static constexpr std::chrono::milliseconds DEFAULT_CALL_TIMEOUT{std::chrono::seconds(30)};

  NodeGateway(ConnectionRegistry &registry, RequestCorrelator &correlator,
              std::chrono::milliseconds default_timeout = DEFAULT_CALL_TIMEOUT);

  NodeGateway(const NodeGateway&) = delete;
  NodeGateway& operator=(const NodeGateway&) = delete;

  /**
   * Correlated request/response call
   * @return the node's "result" value
   * @throws NotConnectedError  no connection for key (nothing sent)
   * @throws TransportError     the connection refused the frame
   * @throws TimeoutError       no reply within the timeout
   * @throws RemoteError        the node replied with an error object
   * @throws DisconnectedError  the node disconnected while the call was pending
   */
  nlohmann::json Call(NodeKey key, const std::string &method,
                      const nlohmann::json &params = nlohmann::json::object());
  nlohmann::json Call(NodeKey key, const std::string &method,
                      const nlohmann::json &params,
                      std::chrono::milliseconds timeout);

  /**
   * Fire-and-forget notification (no id). Never throws.
   * @return false if the node is not connected or the frame was refused
   */
  bool Notify(NodeKey key, const std::string &method,
              const nlohmann::json &params = nlohmann::json::object());

  bool IsConnected(NodeKey key) const;

  std::chrono::milliseconds GetDefaultTimeout() const { return default_timeout_; }

private:
  ConnectionRegistry &registry_;
  RequestCorrelator &correlator_;
  const std::chrono::milliseconds default_timeout_;
};

} // namespace network
} // namespace teleophub
