#pragma once

#include <nlohmann/json.hpp>

namespace teleophub {

namespace store {
class NodeStore;
} // namespace store

namespace network {

class NodeSession;
class RequestDispatcher;

/**
 * NodeRegistration - "backend.register" handler
 *
 * params: {"uuid": "<client id>"}  ->  result: {"id": <node key>}
 *
 * Resolves the uuid through the NodeStore and binds the calling session's
 * connection to the resulting key.
 */
class NodeRegistration {
public:
  static constexpr const char *METHOD = "backend.register";

  explicit NodeRegistration(store::NodeStore &store);

  // Register METHOD with the dispatcher
  void Install(RequestDispatcher &dispatcher);

  // @throws std::invalid_argument("Missing uuid parameter")
  nlohmann::json Handle(NodeSession &session, const nlohmann::json &params);

private:
  store::NodeStore &store_;
};

} // namespace network
} // namespace teleophub
