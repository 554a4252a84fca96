#ifndef TELEOPHUB_NETWORK_REQUEST_DISPATCHER_HPP
#define TELEOPHUB_NETWORK_REQUEST_DISPATCHER_HPP

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace teleophub {
namespace network {

class NodeSession;

/**
 * RequestDispatcher - node-initiated JSON-RPC calls via handler registry
 *
 * Design:
 * - Components register a handler per method ("backend.register", ...)
 * - Thread-safe registration and dispatch
 * - Dispatch always produces a reply envelope echoing the request id
 *   (JSON null if the request carried none)
 *
 * Handlers run synchronously on the session's receive path and must not
 * block on outbound node calls.
 *
 * Usage:
 *   RequestDispatcher dispatcher;
 *   dispatcher.RegisterHandler("backend.register",
 *     [this](NodeSession& s, const json& params) {
 *       return registration_.Handle(s, params);
 *     });
 *   json reply = dispatcher.Dispatch(session, request);
 */
class RequestDispatcher {
public:
  // Returns the "result" value; throws to produce an internal-error reply
  using RequestHandler =
      std::function<nlohmann::json(NodeSession &, const nlohmann::json &params)>;

  RequestDispatcher() = default;
  ~RequestDispatcher() = default;

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;

  /**
   * Register handler for a method (replaces any existing one)
   *
   * Empty method names and empty handlers are rejected with a warning.
   */
  void RegisterHandler(const std::string& method, RequestHandler handler);

  void UnregisterHandler(const std::string& method);

  /**
   * Run the handler for request["method"] and build the reply envelope
   *
   * - no handler:       error -32601 "Method not found"
   * - handler throws:   error -32603 with the exception message
   * - otherwise:        result envelope with the handler's return value
   */
  nlohmann::json Dispatch(NodeSession& session, const nlohmann::json& request);

  bool HasHandler(const std::string& method) const;

  // Sorted
  std::vector<std::string> GetRegisteredMethods() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, RequestHandler> handlers_;
};

} // namespace network
} // namespace teleophub

#endif // TELEOPHUB_NETWORK_REQUEST_DISPATCHER_HPP
