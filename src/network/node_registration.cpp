#include "network/node_registration.hpp"
#include "network/node_session.hpp"
#include "network/request_dispatcher.hpp"
#include "store/node_store.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace teleophub {
namespace network {

using json = nlohmann::json;

NodeRegistration::NodeRegistration(store::NodeStore &store) : store_(store) {}

void NodeRegistration::Install(RequestDispatcher &dispatcher) {
  dispatcher.RegisterHandler(METHOD, [this](NodeSession &session, const json &params) {
    return Handle(session, params);
  });
}

json NodeRegistration::Handle(NodeSession &session, const json &params) {
  std::string uuid;
  if (params.is_object()) {
    auto it = params.find("uuid");
    if (it != params.end() && it->is_string()) {
      uuid = it->get<std::string>();
    }
  }
  if (uuid.empty()) {
    throw std::invalid_argument("Missing uuid parameter");
  }

  NodeKey key = store_.FindOrCreate(uuid);
  session.Bind(key);

  const auto &conn = session.connection();
  LOG_NET_INFO("node {} registered (uuid {}, connection {} from {}:{})", key,
               uuid, session.connection_id(), conn->remote_address(),
               conn->remote_port());

  return json{{"id", key}};
}

} // namespace network
} // namespace teleophub
