#include "network/connection_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace teleophub {
namespace network {

TransportConnectionPtr ConnectionRegistry::Register(NodeKey key,
                                                    TransportConnectionPtr conn) {
  auto previous = connections_.Exchange(key, std::move(conn));
  if (!previous) {
    return nullptr;
  }
  LOG_NET_DEBUG("node {} connection {} superseded", key,
                *previous ? (*previous)->connection_id() : 0);
  return *previous;
}

TransportConnectionPtr ConnectionRegistry::Get(NodeKey key) const {
  auto conn = connections_.Get(key);
  return conn ? *conn : nullptr;
}

bool ConnectionRegistry::Unregister(NodeKey key,
                                    const TransportConnectionPtr &conn) {
  return connections_.EraseIf(key, [&conn](const TransportConnectionPtr &current) {
    return current == conn;
  });
}

bool ConnectionRegistry::IsConnected(NodeKey key) const {
  return connections_.Contains(key);
}

size_t ConnectionRegistry::Size() const { return connections_.Size(); }

std::vector<NodeKey> ConnectionRegistry::ConnectedKeys() const {
  auto keys = connections_.GetKeys();
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<std::pair<NodeKey, TransportConnectionPtr>> ConnectionRegistry::Clear() {
  return connections_.TakeAll();
}

} // namespace network
} // namespace teleophub
