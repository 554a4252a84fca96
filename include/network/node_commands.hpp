#pragma once

#include "network/node_types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace teleophub {
namespace network {

class NodeGateway;

/**
 * NodeCommands - typed wrappers for the methods nodes implement
 *
 * Every call goes through NodeGateway with its default timeout and
 * propagates the gateway's errors unchanged. Commands whose node result must
 * carry "success": true throw CommandRejectedError otherwise.
 */
class NodeCommands {
public:
  explicit NodeCommands(NodeGateway &gateway);

  // node.get_rpc_methods -> the "methods" member
  // @throws ProtocolError if the result is not an object with "methods"
  nlohmann::json GetRpcMethods(NodeKey key);

  // node.get_device_types -> {category: {type: type_info, ...}, ...}
  nlohmann::json GetDeviceTypes(NodeKey key);

  // Category names of GetDeviceTypes(), sorted
  std::vector<std::string> GetDeviceCategories(NodeKey key);

  // node.get_teleop_group_types
  nlohmann::json GetTeleopGroupTypes(NodeKey key);

  // node.test_device; returns the node's result on success
  nlohmann::json TestDevice(NodeKey key, const std::string &category,
                            const std::string &type,
                            const nlohmann::json &config);

  // node.start_teleop_group / node.stop_teleop_group with {"id": group_id}
  nlohmann::json StartTeleopGroup(NodeKey key, int64_t group_id);
  nlohmann::json StopTeleopGroup(NodeKey key, int64_t group_id);

  // Notifications (no reply); false if not delivered
  bool NotifyConfigUpdate(NodeKey key);
  bool NotifyStartTeleopGroup(NodeKey key, int64_t group_id);
  bool NotifyStopTeleopGroup(NodeKey key, int64_t group_id);

private:
  nlohmann::json RequireSuccess(const nlohmann::json &result,
                                const std::string &failure);

  NodeGateway &gateway_;
};

} // namespace network
} // namespace teleophub
