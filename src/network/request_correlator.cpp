// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/request_correlator.hpp"
#include "network/jsonrpc.hpp"
#include "network/rpc_errors.hpp"
#include "util/logging.hpp"
#include <limits>
#include <vector>

namespace teleophub {
namespace network {

using json = nlohmann::json;

namespace {

json ExtractResult(const json &envelope) {
  auto error = envelope.find("error");
  if (error != envelope.end() && !error->is_null()) {
    int code = jsonrpc::INTERNAL_ERROR;
    std::string message;
    if (error->is_object()) {
      auto c = error->find("code");
      if (c != error->end() && c->is_number_integer()) {
        code = c->get<int>();
      }
      auto m = error->find("message");
      if (m != error->end() && m->is_string()) {
        message = m->get<std::string>();
      } else {
        message = error->dump();
      }
    } else {
      message = error->dump();
    }
    throw RemoteError(code, message);
  }

  auto result = envelope.find("result");
  if (result == envelope.end()) {
    return nullptr;
  }
  return *result;
}

} // namespace

RequestCorrelator::CallTicket RequestCorrelator::BeginCall(NodeKey key,
                                                           const std::string &method) {
  CallTicket ticket;
  ticket.node_key = key;

  std::lock_guard<std::mutex> lock(mutex_);
  CallId &counter = next_call_id_[key];
  CallId id;
  do {
    id = ++counter;
  } while (pending_.count({key, id}) > 0);

  PendingCall call;
  call.method = method;
  call.started = std::chrono::steady_clock::now();
  ticket.reply = call.promise.get_future();
  ticket.call_id = id;
  pending_.emplace(CallKey{key, id}, std::move(call));
  return ticket;
}

bool RequestCorrelator::Resolve(NodeKey key, CallId id, const json &envelope) {
  std::promise<json> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find({key, id});
    if (it == pending_.end()) {
      LOG_NET_DEBUG("dropping reply from node {} for unknown call id {}", key, id);
      return false;
    }
    promise = std::move(it->second.promise);
    pending_.erase(it);
  }
  promise.set_value(envelope);
  return true;
}

json RequestCorrelator::AwaitCall(CallTicket &ticket,
                                  std::chrono::milliseconds timeout) {
  if (ticket.reply.wait_for(timeout) != std::future_status::ready) {
    bool removed = false;
    std::string method;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find({ticket.node_key, ticket.call_id});
      if (it != pending_.end()) {
        method = std::move(it->second.method);
        pending_.erase(it);
        removed = true;
      }
    }
    if (removed) {
      LOG_NET_DEBUG("call {} ({}) to node {} timed out after {} ms",
                    ticket.call_id, method, ticket.node_key, timeout.count());
      throw TimeoutError(ticket.node_key, ticket.call_id);
    }
    // A reply or disconnect took the record first and is fulfilling the
    // promise right now; get() below waits for it
  }

  json envelope = ticket.reply.get();
  return ExtractResult(envelope);
}

bool RequestCorrelator::Abandon(NodeKey key, CallId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.erase({key, id}) > 0;
}

size_t RequestCorrelator::CancelAll(NodeKey key) {
  std::vector<std::promise<json>> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.lower_bound({key, std::numeric_limits<CallId>::min()});
    while (it != pending_.end() && it->first.first == key) {
      failed.push_back(std::move(it->second.promise));
      it = pending_.erase(it);
    }
  }

  for (auto &promise : failed) {
    promise.set_exception(std::make_exception_ptr(DisconnectedError(key)));
  }
  if (!failed.empty()) {
    LOG_NET_DEBUG("failed {} pending call(s) for disconnected node {}",
                  failed.size(), key);
  }
  return failed.size();
}

size_t RequestCorrelator::CancelEverything() {
  std::vector<std::pair<NodeKey, std::promise<json>>> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[call_key, call] : pending_) {
      failed.emplace_back(call_key.first, std::move(call.promise));
    }
    pending_.clear();
  }

  for (auto &[key, promise] : failed) {
    promise.set_exception(std::make_exception_ptr(DisconnectedError(key)));
  }
  return failed.size();
}

size_t RequestCorrelator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

size_t RequestCorrelator::PendingCount(NodeKey key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  auto it = pending_.lower_bound({key, std::numeric_limits<CallId>::min()});
  while (it != pending_.end() && it->first.first == key) {
    ++count;
    ++it;
  }
  return count;
}

bool RequestCorrelator::IsPending(NodeKey key, CallId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count({key, id}) > 0;
}

} // namespace network
} // namespace teleophub
