// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_hub.hpp"
#include "network/websocket_transport.hpp"
#include "util/logging.hpp"

namespace teleophub {
namespace network {

NodeHub::NodeHub(const Config &config, store::NodeStore &node_store,
                 std::shared_ptr<Transport> transport)
    : config_(config), transport_(std::move(transport)),
      registration_(node_store),
      gateway_(registry_, correlator_, config.default_call_timeout),
      commands_(gateway_) {
  if (!transport_) {
    transport_ = std::make_shared<WebSocketTransport>(config_.io_threads,
                                                      config_.ws_path);
  }
  registration_.Install(dispatcher_);
}

NodeHub::~NodeHub() { stop(); }

bool NodeHub::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  // Set before any connection can be accepted
  running_.store(true, std::memory_order_release);

  if (config_.listen_enabled) {
    bool listening = transport_->listen(
        config_.listen_port, [this](TransportConnectionPtr connection) {
          handle_inbound_connection(std::move(connection));
        });
    if (!listening) {
      LOG_NET_ERROR("failed to listen for nodes on port {}", config_.listen_port);
      running_.store(false, std::memory_order_release);
      return false;
    }
  }

  transport_->run();

  LOG_NET_INFO("node hub started (listen={}, path={}, call timeout={}ms, fail pending on disconnect={})",
               config_.listen_enabled, config_.ws_path,
               config_.default_call_timeout.count(),
               config_.fail_pending_on_disconnect);
  return true;
}

void NodeHub::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  bool was_running = running_.exchange(false, std::memory_order_acq_rel);

  if (transport_) {
    transport_->stop_listening();
  }

  // Close sessions while the transport can still flush close frames
  auto sessions = sessions_.TakeAll();
  for (auto &[id, session] : sessions) {
    session->Close();
  }

  if (transport_) {
    transport_->stop();
  }

  registry_.Clear();
  size_t failed = correlator_.CancelEverything();

  if (was_running) {
    LOG_NET_INFO("node hub stopped ({} session(s) closed, {} pending call(s) failed)",
                 sessions.size(), failed);
  }
}

NodeSessionPtr NodeHub::handle_inbound_connection(TransportConnectionPtr connection) {
  if (!connection) {
    return nullptr;
  }
  if (!running_.load(std::memory_order_acquire)) {
    LOG_NET_DEBUG("rejecting connection {}: hub not running",
                  connection->connection_id());
    connection->close();
    return nullptr;
  }

  NodeSession::Options options;
  options.fail_pending_on_disconnect = config_.fail_pending_on_disconnect;

  auto session = NodeSession::Create(
      connection, registry_, correlator_, dispatcher_, options,
      [this](uint64_t connection_id) { on_session_closed(connection_id); });

  sessions_.Insert(session->connection_id(), session);
  session->Start();

  LOG_NET_INFO("node connection {} from {}:{}", connection->connection_id(),
               connection->remote_address(), connection->remote_port());
  return session;
}

void NodeHub::on_session_closed(uint64_t connection_id) {
  sessions_.Erase(connection_id);
}

std::vector<NodeHub::ConnectedNode> NodeHub::get_connected_nodes() const {
  std::vector<ConnectedNode> nodes;
  for (NodeKey key : registry_.ConnectedKeys()) {
    TransportConnectionPtr conn = registry_.Get(key);
    if (!conn) {
      continue;  // disconnected since the key snapshot
    }
    nodes.push_back(ConnectedNode{key, conn->connection_id(),
                                  conn->remote_address(), conn->remote_port()});
  }
  return nodes;
}

} // namespace network
} // namespace teleophub
