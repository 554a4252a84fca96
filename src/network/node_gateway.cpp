// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_gateway.hpp"
#include "network/connection_registry.hpp"
#include "network/jsonrpc.hpp"
#include "network/request_correlator.hpp"
#include "network/rpc_errors.hpp"
#include "util/logging.hpp"

namespace teleophub {
namespace network {

using json = nlohmann::json;

NodeGateway::NodeGateway(ConnectionRegistry &registry,
                         RequestCorrelator &correlator,
                         std::chrono::milliseconds default_timeout)
    : registry_(registry), correlator_(correlator),
      default_timeout_(default_timeout) {}

json NodeGateway::Call(NodeKey key, const std::string &method,
                       const json &params) {
  return Call(key, method, params, default_timeout_);
}

json NodeGateway::Call(NodeKey key, const std::string &method,
                       const json &params, std::chrono::milliseconds timeout) {
  TransportConnectionPtr conn = registry_.Get(key);
  if (!conn) {
    throw NotConnectedError(key);
  }

  auto ticket = correlator_.BeginCall(key, method);
  std::string frame =
      jsonrpc::Serialize(jsonrpc::MakeRequest(method, params, ticket.call_id));

  if (!conn->send(frame)) {
    correlator_.Abandon(key, ticket.call_id);
    throw TransportError("Failed to send " + method + " to node " +
                         std::to_string(key));
  }

  LOG_NET_TRACE("call {} {} sent to node {}", ticket.call_id, method, key);
  return correlator_.AwaitCall(ticket, timeout);
}

bool NodeGateway::Notify(NodeKey key, const std::string &method,
                         const json &params) {
  TransportConnectionPtr conn = registry_.Get(key);
  if (!conn) {
    LOG_NET_WARN("cannot notify node {} ({}): not connected", key, method);
    return false;
  }

  if (!conn->send(jsonrpc::Serialize(jsonrpc::MakeNotification(method, params)))) {
    LOG_NET_WARN("failed to send notification {} to node {}", method, key);
    return false;
  }
  return true;
}

bool NodeGateway::IsConnected(NodeKey key) const {
  return registry_.IsConnected(key);
}

} // namespace network
} // namespace teleophub
