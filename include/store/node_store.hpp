// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node_types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace teleophub {
namespace store {

using network::NodeKey;

struct NodeRecord {
  NodeKey id = 0;
  std::string uuid;
  int64_t created_at = 0;  // Unix seconds
  int64_t updated_at = 0;  // refreshed on every registration
};

/**
 * NodeStore - durable node identities
 *
 * Maps the client-chosen uuid to a server-assigned key that never changes
 * for that uuid. Implementations must be thread-safe.
 */
class NodeStore {
public:
  virtual ~NodeStore() = default;

  /**
   * Key for uuid, creating the record on first sight
   * @throws std::invalid_argument if uuid is empty
   * @throws std::runtime_error if a new record could not be persisted
   */
  virtual NodeKey FindOrCreate(const std::string &uuid) = 0;

  virtual std::optional<NodeRecord> Get(NodeKey key) const = 0;
  virtual std::optional<NodeRecord> FindByUuid(const std::string &uuid) const = 0;

  // Ordered by key
  virtual std::vector<NodeRecord> List() const = 0;

  virtual size_t Size() const = 0;
};

/**
 * MemoryNodeStore - in-memory NodeStore; keys start at 1
 *
 * Subclasses add durability by overriding Persist(), which runs with the
 * store lock held after every change.
 */
class MemoryNodeStore : public NodeStore {
public:
  MemoryNodeStore() = default;
  ~MemoryNodeStore() override = default;

  MemoryNodeStore(const MemoryNodeStore&) = delete;
  MemoryNodeStore& operator=(const MemoryNodeStore&) = delete;

  NodeKey FindOrCreate(const std::string &uuid) override;
  std::optional<NodeRecord> Get(NodeKey key) const override;
  std::optional<NodeRecord> FindByUuid(const std::string &uuid) const override;
  std::vector<NodeRecord> List() const override;
  size_t Size() const override;

protected:
  // Called with mutex_ held; return false if the change could not be saved
  virtual bool Persist() { return true; }

  // Insert a loaded record (mutex_ held); false on invalid or duplicate
  bool AddRecordLocked(const NodeRecord &record);

  mutable std::mutex mutex_;
  std::map<NodeKey, NodeRecord> records_;
  std::unordered_map<std::string, NodeKey> by_uuid_;
  NodeKey next_key_ = 1;
};

} // namespace store
} // namespace teleophub
