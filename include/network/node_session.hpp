#pragma once

#include "network/node_types.hpp"
#include "network/transport.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace teleophub {
namespace network {

class ConnectionRegistry;
class RequestCorrelator;
class RequestDispatcher;

class NodeSession;
using NodeSessionPtr = std::shared_ptr<NodeSession>;

/**
 * NodeSession - one node connection's receive path
 *
 * Lifecycle: ACCEPTED -> ACTIVE -> CLOSED, or ACCEPTED -> CLOSED when the
 * connection drops before the node registers.
 *
 * Inbound frames (one at a time, on the connection's strand):
 * - request  -> RequestDispatcher, reply sent back on the same connection
 * - response -> RequestCorrelator::Resolve(bound key, id), once ACTIVE
 * - anything else is logged and dropped; the connection stays up
 *
 * On disconnect the session unregisters its binding (identity-checked) and,
 * when this connection was still the registered one and the policy says so,
 * fails the node's pending calls with DisconnectedError.
 */
class NodeSession : public std::enable_shared_from_this<NodeSession> {
public:
  enum class State { ACCEPTED, ACTIVE, CLOSED };

  struct Options {
    Options() {}
    bool fail_pending_on_disconnect = true;
  };

  // Called once, after the session reached CLOSED
  using CloseCallback = std::function<void(uint64_t connection_id)>;

  static NodeSessionPtr Create(TransportConnectionPtr connection,
                               ConnectionRegistry &registry,
                               RequestCorrelator &correlator,
                               RequestDispatcher &dispatcher,
                               Options options = {},
                               CloseCallback on_closed = {});

  NodeSession(const NodeSession&) = delete;
  NodeSession& operator=(const NodeSession&) = delete;

  // Install transport callbacks and start reading
  void Start();

  // Close the underlying connection; teardown follows via the disconnect path
  void Close();

  // Transport callbacks (public for in-memory tests)
  void HandleFrame(const std::string &text);
  void HandleDisconnect();

  /**
   * Bind this connection to key in the registry and move to ACTIVE.
   * Binding to a different key first releases the old binding.
   * @throws std::runtime_error if the session is already CLOSED
   */
  void Bind(NodeKey key);

  // Serialize and send; false if the connection refused the frame
  bool SendEnvelope(const nlohmann::json &envelope);

  State GetState() const;
  std::optional<NodeKey> GetNodeKey() const;

  uint64_t connection_id() const { return connection_id_; }
  const TransportConnectionPtr &connection() const { return connection_; }

private:
  NodeSession(TransportConnectionPtr connection, ConnectionRegistry &registry,
              RequestCorrelator &correlator, RequestDispatcher &dispatcher,
              Options options, CloseCallback on_closed);

  void HandleResponse(const nlohmann::json &envelope);

  TransportConnectionPtr connection_;
  const uint64_t connection_id_;
  ConnectionRegistry &registry_;
  RequestCorrelator &correlator_;
  RequestDispatcher &dispatcher_;
  const Options options_;
  CloseCallback on_closed_;

  // Guards state_ and node_key_; registry updates happen under it so a
  // binding can never outlive the session's CLOSED transition
  mutable std::mutex mutex_;
  State state_ = State::ACCEPTED;
  std::optional<NodeKey> node_key_;
};

const char *SessionStateName(NodeSession::State state);

} // namespace network
} // namespace teleophub
