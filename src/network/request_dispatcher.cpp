#include "network/request_dispatcher.hpp"
#include "network/jsonrpc.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace teleophub {
namespace network {

using json = nlohmann::json;

void RequestDispatcher::RegisterHandler(const std::string& method,
                                        RequestHandler handler) {
  if (method.empty()) {
    LOG_NET_WARN("Attempted to register handler for empty method");
    return;
  }

  // Prevent std::bad_function_call at dispatch time
  if (!handler) {
    LOG_NET_WARN("Attempted to register empty handler for method: {}", method);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[method] = std::move(handler);
  LOG_NET_DEBUG("Registered handler for method: {}", method);
}

void RequestDispatcher::UnregisterHandler(const std::string& method) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(method) > 0) {
    LOG_NET_DEBUG("Unregistered handler for method: {}", method);
  }
}

json RequestDispatcher::Dispatch(NodeSession& session, const json& request) {
  json id = jsonrpc::RequestId(request);

  std::string method;
  auto m = request.find("method");
  if (m != request.end() && m->is_string()) {
    method = m->get<std::string>();
  }
  if (method.empty()) {
    return jsonrpc::MakeError(id, jsonrpc::INVALID_REQUEST, "Invalid Request");
  }

  // Get handler (lock scope minimized)
  RequestHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(method);
    if (it != handlers_.end()) {
      handler = it->second;
    }
  }

  if (!handler) {
    LOG_NET_DEBUG("No handler for method: {}", method);
    return jsonrpc::MakeError(id, jsonrpc::METHOD_NOT_FOUND, "Method not found");
  }

  json params = json::object();
  auto p = request.find("params");
  if (p != request.end() && !p->is_null()) {
    params = *p;
  }

  // Execute handler outside the lock
  try {
    return jsonrpc::MakeResult(id, handler(session, params));
  } catch (const std::exception& e) {
    LOG_NET_WARN("Handler exception for method {}: {}", method, e.what());
    return jsonrpc::MakeError(id, jsonrpc::INTERNAL_ERROR, e.what());
  }
}

bool RequestDispatcher::HasHandler(const std::string& method) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(method) > 0;
}

std::vector<std::string> RequestDispatcher::GetRegisteredMethods() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(handlers_.size());
  for (const auto& [method, _] : handlers_) {
    result.push_back(method);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace network
} // namespace teleophub
