// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/node_store.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <stdexcept>

namespace teleophub {
namespace store {

NodeKey MemoryNodeStore::FindOrCreate(const std::string &uuid) {
  if (uuid.empty()) {
    throw std::invalid_argument("Missing uuid parameter");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  int64_t now = util::GetTime();

  auto it = by_uuid_.find(uuid);
  if (it != by_uuid_.end()) {
    NodeRecord &record = records_[it->second];
    record.updated_at = now;
    // The key is already durable; a failed timestamp save is not fatal
    if (!Persist()) {
      LOG_STORE_WARN("could not persist updated_at for node {}", record.id);
    }
    LOG_STORE_TRACE("found node {} for uuid {}", record.id, uuid);
    return record.id;
  }

  NodeRecord record;
  record.id = next_key_;
  record.uuid = uuid;
  record.created_at = now;
  record.updated_at = now;

  records_.emplace(record.id, record);
  by_uuid_.emplace(uuid, record.id);
  ++next_key_;

  if (!Persist()) {
    records_.erase(record.id);
    by_uuid_.erase(uuid);
    --next_key_;
    throw std::runtime_error("Failed to persist node registration");
  }

  LOG_STORE_INFO("created node {} for uuid {}", record.id, uuid);
  return record.id;
}

std::optional<NodeRecord> MemoryNodeStore::Get(NodeKey key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(key);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<NodeRecord> MemoryNodeStore::FindByUuid(const std::string &uuid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_uuid_.find(uuid);
  if (it == by_uuid_.end()) {
    return std::nullopt;
  }
  return records_.at(it->second);
}

std::vector<NodeRecord> MemoryNodeStore::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<NodeRecord> result;
  result.reserve(records_.size());
  for (const auto &[key, record] : records_) {
    result.push_back(record);
  }
  return result;
}

size_t MemoryNodeStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

bool MemoryNodeStore::AddRecordLocked(const NodeRecord &record) {
  if (record.id <= 0 || record.uuid.empty()) {
    return false;
  }
  if (records_.count(record.id) > 0 || by_uuid_.count(record.uuid) > 0) {
    return false;
  }
  records_.emplace(record.id, record);
  by_uuid_.emplace(record.uuid, record.id);
  if (record.id >= next_key_) {
    next_key_ = record.id + 1;
  }
  return true;
}

} // namespace store
} // namespace teleophub
