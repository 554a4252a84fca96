#include "network/node_commands.hpp"
#include "network/node_gateway.hpp"
#include "network/rpc_errors.hpp"

namespace teleophub {
namespace network {

using json = nlohmann::json;

NodeCommands::NodeCommands(NodeGateway &gateway) : gateway_(gateway) {}

json NodeCommands::GetRpcMethods(NodeKey key) {
  json result = gateway_.Call(key, "node.get_rpc_methods");
  if (!result.is_object() || !result.contains("methods")) {
    throw ProtocolError("Invalid method list from node");
  }
  return result["methods"];
}

json NodeCommands::GetDeviceTypes(NodeKey key) {
  return gateway_.Call(key, "node.get_device_types");
}

std::vector<std::string> NodeCommands::GetDeviceCategories(NodeKey key) {
  json types = GetDeviceTypes(key);
  if (!types.is_object()) {
    throw ProtocolError("Invalid device type list from node");
  }
  std::vector<std::string> categories;
  categories.reserve(types.size());
  for (const auto &item : types.items()) {
    categories.push_back(item.key());
  }
  return categories;
}

json NodeCommands::GetTeleopGroupTypes(NodeKey key) {
  return gateway_.Call(key, "node.get_teleop_group_types");
}

json NodeCommands::TestDevice(NodeKey key, const std::string &category,
                              const std::string &type, const json &config) {
  json params = {{"category", category}, {"type", type}, {"config", config}};
  return RequireSuccess(gateway_.Call(key, "node.test_device", params),
                        "Device test failed");
}

json NodeCommands::StartTeleopGroup(NodeKey key, int64_t group_id) {
  return RequireSuccess(
      gateway_.Call(key, "node.start_teleop_group", {{"id", group_id}}),
      "Failed to start teleop group");
}

json NodeCommands::StopTeleopGroup(NodeKey key, int64_t group_id) {
  return RequireSuccess(
      gateway_.Call(key, "node.stop_teleop_group", {{"id", group_id}}),
      "Failed to stop teleop group");
}

bool NodeCommands::NotifyConfigUpdate(NodeKey key) {
  return gateway_.Notify(key, "node.update_config");
}

bool NodeCommands::NotifyStartTeleopGroup(NodeKey key, int64_t group_id) {
  return gateway_.Notify(key, "node.start_teleop_group", {{"id", group_id}});
}

bool NodeCommands::NotifyStopTeleopGroup(NodeKey key, int64_t group_id) {
  return gateway_.Notify(key, "node.stop_teleop_group", {{"id", group_id}});
}

json NodeCommands::RequireSuccess(const json &result, const std::string &failure) {
  if (!result.is_object()) {
    throw CommandRejectedError(failure);
  }
  auto it = result.find("success");
  if (it == result.end() || !it->is_boolean() || !it->get<bool>()) {
    throw CommandRejectedError(failure);
  }
  return result;
}

} // namespace network
} // namespace teleophub
