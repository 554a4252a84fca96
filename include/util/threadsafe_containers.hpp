#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace teleophub {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded wrapper around std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<NodeKey, TransportConnectionPtr> connections_;
 *   auto previous = connections_.Exchange(key, conn);
 *   auto conn = connections_.Get(key);
 *   connections_.EraseIf(key, [&](const auto& current) { return current == conn; });
 *
 * Design decisions:
 * - Every operation takes the lock exactly once, so compound operations
 *   (exchange, conditional erase) are atomic with respect to each other
 * - No iterator API: callers get snapshots (GetKeys/TakeAll)
 * - EraseIf's predicate runs with the lock held; it must not call back into
 *   the same map
 */
template <typename Key, typename Value>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or overwrite
     * Returns true if inserted, false if an existing value was replaced
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Insert or overwrite, returning the value that was replaced (if any)
     */
    std::optional<Value> Exchange(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            map_.emplace(key, std::move(value));
            return std::nullopt;
        }
        std::optional<Value> previous(std::move(it->second));
        it->second = std::move(value);
        return previous;
    }

    /**
     * Copy of the value for key, or std::nullopt
     */
    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    /**
     * Remove entry by key
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * Remove entry only if predicate(current_value) holds
     * Returns true if removed
     */
    template <typename Pred>
    bool EraseIf(const Key& key, Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !predicate(it->second)) {
            return false;
        }
        map_.erase(it);
        return true;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    std::vector<Key> GetKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, _] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

    /**
     * Remove every entry and return them (used for shutdown sweeps)
     */
    std::vector<std::pair<Key, Value>> TakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<Key, Value>> all(map_.begin(), map_.end());
        map_.clear();
        return all;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Value> map_;
};

} // namespace util
} // namespace teleophub
