#pragma once

#include "network/node_types.hpp"
#include "network/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <vector>

namespace teleophub {
namespace network {

/**
 * ConnectionRegistry - node key -> currently active connection
 *
 * At most one entry per node key. A newer connection for the same key
 * supersedes the older one; removal is identity-checked so a stale
 * connection's teardown cannot evict its replacement.
 *
 * Thread-safe. Owned by NodeHub and shared by reference.
 */
class ConnectionRegistry {
public:
  ConnectionRegistry() = default;

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // Bind key to conn; returns the superseded connection (null if none)
  TransportConnectionPtr Register(NodeKey key, TransportConnectionPtr conn);

  // Current connection for key (null if none)
  TransportConnectionPtr Get(NodeKey key) const;

  // Remove key only if it is still bound to this exact connection instance
  bool Unregister(NodeKey key, const TransportConnectionPtr &conn);

  bool IsConnected(NodeKey key) const;

  size_t Size() const;

  // Sorted ascending
  std::vector<NodeKey> ConnectedKeys() const;

  // Remove every entry, returning what was bound (shutdown)
  std::vector<std::pair<NodeKey, TransportConnectionPtr>> Clear();

private:
  util::ThreadSafeMap<NodeKey, TransportConnectionPtr> connections_;
};

} // namespace network
} // namespace teleophub
