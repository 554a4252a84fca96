#pragma once

#include "network/node_types.hpp"
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace teleophub {
namespace network {

/**
 * RequestCorrelator - pending control-plane -> node calls
 *
 * Each outstanding call is one record keyed by (node key, call id) holding a
 * one-shot promise. The record is removed exactly once, by whichever of
 * Resolve (reply), AwaitCall (deadline), CancelAll (disconnect) or Abandon
 * (send failure) gets to it first; the others find nothing and do nothing.
 * Promises are fulfilled outside the lock.
 *
 * Call ids come from a per-node counter starting at 1 and never repeat for a
 * node within the process lifetime.
 *
 * Thread-safe. Owned by NodeHub.
 */
class RequestCorrelator {
public:
  struct CallTicket {
    NodeKey node_key = 0;
    CallId call_id = 0;
    // Fulfilled with the full response envelope, or DisconnectedError
    std::future<nlohmann::json> reply;
  };

  RequestCorrelator() = default;

  RequestCorrelator(const RequestCorrelator&) = delete;
  RequestCorrelator& operator=(const RequestCorrelator&) = delete;

  // Allocate an id and store the pending record
  CallTicket BeginCall(NodeKey key, const std::string &method = {});

  /**
   * Route a response envelope to its pending call.
   * Returns false (and drops the envelope) for unknown, already resolved,
   * duplicate or foreign ids.
   */
  bool Resolve(NodeKey key, CallId id, const nlohmann::json &envelope);

  /**
   * Block until the reply arrives or the timeout elapses.
   * @return the "result" member (JSON null if absent)
   * @throws TimeoutError if the deadline won
   * @throws RemoteError if the node answered with an error object
   * @throws DisconnectedError if CancelAll failed the call
   */
  nlohmann::json AwaitCall(CallTicket &ticket, std::chrono::milliseconds timeout);

  // Remove a record without fulfilling it (request never went out)
  bool Abandon(NodeKey key, CallId id);

  // Fail every pending call for key with DisconnectedError; returns count
  size_t CancelAll(NodeKey key);

  // Fail every pending call for every node (shutdown); returns count
  size_t CancelEverything();

  size_t PendingCount() const;
  size_t PendingCount(NodeKey key) const;
  bool IsPending(NodeKey key, CallId id) const;

private:
  struct PendingCall {
    std::promise<nlohmann::json> promise;
    std::string method;
    std::chrono::steady_clock::time_point started;
  };

  using CallKey = std::pair<NodeKey, CallId>;

  mutable std::mutex mutex_;
  std::map<CallKey, PendingCall> pending_;
  std::unordered_map<NodeKey, CallId> next_call_id_;
};

} // namespace network
} // namespace teleophub
