#pragma once

#include "network/connection_registry.hpp"
#include "network/node_commands.hpp"
#include "network/node_gateway.hpp"
#include "network/node_registration.hpp"
#include "network/node_session.hpp"
#include "network/request_correlator.hpp"
#include "network/request_dispatcher.hpp"
#include "network/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace teleophub {

namespace store {
class NodeStore;
}

namespace network {

// NodeHub - top-level owner of the node-facing control plane
// Owns the transport, registry, correlator, dispatcher (with the
// backend.register handler installed), gateway, typed commands and the
// live-session table. Everything else receives these by reference.
class NodeHub {
public:
  struct Config {
    uint16_t listen_port;     // WebSocket listen port (0 = ephemeral)
    bool listen_enabled;      // Accept node connections
    std::string ws_path;      // WebSocket endpoint path
    size_t io_threads;        // Transport IO threads
    std::chrono::milliseconds default_call_timeout;
    bool fail_pending_on_disconnect;  // false = pending calls run to their timeout

    Config()
        : listen_port(8000), listen_enabled(true), ws_path("/ws/rpc"),
          io_threads(1),
          default_call_timeout(NodeGateway::DEFAULT_CALL_TIMEOUT),
          fail_pending_on_disconnect(true) {}
  };

  // Snapshot of one connected node for diagnostics
  struct ConnectedNode {
    NodeKey key;
    uint64_t connection_id;
    std::string remote_address;
    uint16_t remote_port;
  };

  /**
   * @param config     Hub configuration
   * @param node_store Persistence collaborator (must outlive the hub)
   * @param transport  Optional transport (nullptr = WebSocketTransport)
   */
  NodeHub(const Config &config, store::NodeStore &node_store,
          std::shared_ptr<Transport> transport = nullptr);
  ~NodeHub();

  NodeHub(const NodeHub&) = delete;
  NodeHub& operator=(const NodeHub&) = delete;

  // Lifecycle
  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Turn an accepted connection into a session (transport accept path)
  NodeSessionPtr handle_inbound_connection(TransportConnectionPtr connection);

  // Component access
  NodeGateway &gateway() { return gateway_; }
  NodeCommands &commands() { return commands_; }
  ConnectionRegistry &registry() { return registry_; }
  RequestCorrelator &correlator() { return correlator_; }
  RequestDispatcher &dispatcher() { return dispatcher_; }
  const Config &config() const { return config_; }

  // Diagnostics
  size_t session_count() const { return sessions_.Size(); }
  size_t connected_node_count() const { return registry_.Size(); }
  size_t pending_call_count() const { return correlator_.PendingCount(); }
  std::vector<ConnectedNode> get_connected_nodes() const;

private:
  void on_session_closed(uint64_t connection_id);

  Config config_;

  // Declared first so it is destroyed after every session that references it
  std::shared_ptr<Transport> transport_;

  ConnectionRegistry registry_;
  RequestCorrelator correlator_;
  RequestDispatcher dispatcher_;
  NodeRegistration registration_;
  NodeGateway gateway_;
  NodeCommands commands_;

  util::ThreadSafeMap<uint64_t, NodeSessionPtr> sessions_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
};

} // namespace network
} // namespace teleophub
