// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

/**
 * Admin RPC Server Implementation - Unix Domain Sockets
 *
 * The socket file is created at datadir/node.sock with owner-only
 * permissions. Each accepted client is handed to the worker pool, which
 * reads one request, runs the command and writes one reply.
 */

#include "network/rpc_server.hpp"
#include "network/node_hub.hpp"
#include "network/rpc_errors.hpp"
#include "store/node_store.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace teleophub {
namespace rpc {

using json = nlohmann::json;

namespace {

// Per-client socket timeout so a silent client cannot pin a worker
constexpr int CLIENT_IO_TIMEOUT_SEC = 5;

void SendAll(int fd, const std::string &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
    if (n <= 0) {
      LOG_RPC_DEBUG("failed to write RPC reply: {}", std::strerror(errno));
      return;
    }
    total += static_cast<size_t>(n);
  }
}

void RequireParams(const std::vector<std::string> &params, size_t count,
                   const char *usage) {
  if (params.size() < count) {
    throw std::invalid_argument(std::string("Usage: ") + usage);
  }
}

network::NodeKey ParseNodeKey(const std::string &str) {
  auto key = util::SafeParseInt64(str, 1, std::numeric_limits<int64_t>::max());
  if (!key) {
    throw std::invalid_argument("Invalid node key: " + str);
  }
  return *key;
}

int64_t ParseGroupId(const std::string &str) {
  auto id = util::SafeParseInt64(str, 0, std::numeric_limits<int64_t>::max());
  if (!id) {
    throw std::invalid_argument("Invalid teleop group id: " + str);
  }
  return *id;
}

json ParseJsonParam(const std::string &str) {
  json value = json::parse(str, nullptr, false);
  if (value.is_discarded()) {
    throw std::invalid_argument("Invalid JSON: " + str);
  }
  return value;
}

json RecordToJson(const store::NodeRecord &record) {
  return json{{"id", record.id},
              {"uuid", record.uuid},
              {"created_at", record.created_at},
              {"updated_at", record.updated_at}};
}

} // namespace

RPCServer::RPCServer(const std::string &socket_path, network::NodeHub &hub,
                     store::NodeStore &node_store,
                     std::function<void()> shutdown_callback,
                     size_t worker_threads, size_t max_queued_clients)
    : socket_path_(socket_path), hub_(hub), node_store_(node_store),
      shutdown_callback_(std::move(shutdown_callback)),
      worker_threads_(worker_threads), max_queued_clients_(max_queued_clients),
      server_fd_(-1), running_(false),
      shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  // Hub commands
  handlers_["getinfo"] = [this](const auto &p) { return HandleGetInfo(p); };
  handlers_["listnodes"] = [this](const auto &p) { return HandleListNodes(p); };
  handlers_["getnode"] = [this](const auto &p) { return HandleGetNode(p); };

  // Node calls
  handlers_["callnode"] = [this](const auto &p) { return HandleCallNode(p); };
  handlers_["notifynode"] = [this](const auto &p) {
    return HandleNotifyNode(p);
  };
  handlers_["getrpcmethods"] = [this](const auto &p) {
    return HandleGetRpcMethods(p);
  };
  handlers_["getdevicetypes"] = [this](const auto &p) {
    return HandleGetDeviceTypes(p);
  };
  handlers_["getdevicecategories"] = [this](const auto &p) {
    return HandleGetDeviceCategories(p);
  };
  handlers_["getteleopgrouptypes"] = [this](const auto &p) {
    return HandleGetTeleopGroupTypes(p);
  };
  handlers_["testdevice"] = [this](const auto &p) {
    return HandleTestDevice(p);
  };
  handlers_["startteleopgroup"] = [this](const auto &p) {
    return HandleStartTeleopGroup(p);
  };
  handlers_["stopteleopgroup"] = [this](const auto &p) {
    return HandleStopTeleopGroup(p);
  };
  handlers_["updateconfig"] = [this](const auto &p) {
    return HandleUpdateConfig(p);
  };

  // Control commands
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  // sun_path is a fixed-size buffer; refuse to silently truncate
  if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
    LOG_RPC_ERROR("RPC socket path too long: {}", socket_path_);
    return false;
  }

  // Remove stale socket file from a previous run
  unlink(socket_path_.c_str());

  // Owner-only socket file
  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_RPC_ERROR("Failed to create RPC socket: {}", std::strerror(errno));
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_RPC_ERROR("Failed to bind RPC socket to {}: {}", socket_path_,
                  std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }

  umask(old_umask);
  chmod(socket_path_.c_str(), 0600);

  if (listen(server_fd_, 16) < 0) {
    LOG_RPC_ERROR("Failed to listen on RPC socket: {}", std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  workers_ = std::make_unique<util::ThreadPool>(worker_threads_, max_queued_clients_);
  shutting_down_.store(false, std::memory_order_release);
  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_RPC_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  if (server_fd_ >= 0) {
    // shutdown() wakes the thread blocked in accept()
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Let in-flight commands finish (node calls are bounded by their timeout)
  if (workers_) {
    workers_->shutdown();
    workers_->wait_for_completion();
    workers_.reset();
  }

  unlink(socket_path_.c_str());

  LOG_RPC_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd =
        accept(server_fd_, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_RPC_WARN("failed to accept RPC connection: {}", std::strerror(errno));
      }
      continue;
    }

    struct timeval tv;
    tv.tv_sec = CLIENT_IO_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    try {
      workers_->enqueue([this, client_fd]() {
        HandleClient(client_fd);
        close(client_fd);
      });
    } catch (const std::runtime_error &e) {
      LOG_RPC_WARN("rejecting RPC client: {}", e.what());
      SendAll(client_fd, util::JsonError("Server busy"));
      close(client_fd);
    }
  }
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendAll(client_fd, util::JsonError("Server shutting down"));
    return;
  }

  // Read until newline, EOF or the size cap
  std::string request;
  std::vector<char> buffer(4096);
  while (request.find('\n') == std::string::npos) {
    ssize_t received = recv(client_fd, buffer.data(), buffer.size(), 0);
    if (received <= 0) {
      break;
    }
    request.append(buffer.data(), static_cast<size_t>(received));
    if (request.size() > MAX_REQUEST_SIZE) {
      LOG_RPC_ERROR("RPC request too large: {} bytes", request.size());
      SendAll(client_fd, util::JsonError("Request too large"));
      return;
    }
  }

  if (request.empty()) {
    return;
  }

  std::string method;
  std::vector<std::string> params;

  json j = json::parse(request, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    LOG_RPC_WARN("RPC request is not a JSON object");
    SendAll(client_fd, util::JsonError("Invalid JSON"));
    return;
  }

  if (!j.contains("method") || !j["method"].is_string()) {
    SendAll(client_fd, util::JsonError("Missing or invalid method field"));
    return;
  }
  method = j["method"].get<std::string>();

  if (j.contains("params")) {
    if (j["params"].is_array()) {
      for (const auto &param : j["params"]) {
        // Non-string params are forwarded as their JSON text
        params.push_back(param.is_string() ? param.get<std::string>()
                                           : param.dump());
      }
    } else if (j["params"].is_string()) {
      params.push_back(j["params"].get<std::string>());
    }
  }

  SendAll(client_fd, ExecuteCommand(method, params));
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return util::JsonError("Unknown command");
  }

  try {
    json reply = {{"result", it->second(params)}};
    return reply.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
  } catch (const std::exception &e) {
    LOG_RPC_WARN("RPC command '{}' failed: {}", method, e.what());
    return util::JsonError(e.what());
  }
}

// ============================================================================
// Hub commands
// ============================================================================

json RPCServer::HandleGetInfo(const std::vector<std::string> &) {
  const auto &config = hub_.config();
  return json{{"version", GetVersionString()},
              {"running", hub_.is_running()},
              {"listen", config.listen_enabled},
              {"port", config.listen_port},
              {"path", config.ws_path},
              {"sessions", hub_.session_count()},
              {"connected_nodes", hub_.connected_node_count()},
              {"known_nodes", node_store_.Size()},
              {"pending_calls", hub_.pending_call_count()},
              {"call_timeout_ms", config.default_call_timeout.count()},
              {"fail_pending_on_disconnect", config.fail_pending_on_disconnect},
              {"time", util::FormatTime(util::GetTime())}};
}

json RPCServer::DescribeNode(int64_t key) const {
  auto record = node_store_.Get(key);
  if (!record) {
    throw std::invalid_argument("Node not found");
  }

  json node = RecordToJson(*record);
  node["connected"] = false;
  for (const auto &connected : hub_.get_connected_nodes()) {
    if (connected.key == key) {
      node["connected"] = true;
      node["addr"] = connected.remote_address + ":" +
                     std::to_string(connected.remote_port);
      node["connection_id"] = connected.connection_id;
      break;
    }
  }
  return node;
}

json RPCServer::HandleListNodes(const std::vector<std::string> &params) {
  std::vector<store::NodeRecord> records;
  if (!params.empty()) {
    auto record = node_store_.FindByUuid(params[0]);
    if (record) {
      records.push_back(*record);
    }
  } else {
    records = node_store_.List();
  }

  json nodes = json::array();
  for (const auto &record : records) {
    nodes.push_back(DescribeNode(record.id));
  }
  return nodes;
}

json RPCServer::HandleGetNode(const std::vector<std::string> &params) {
  RequireParams(params, 1, "getnode <key>");
  return DescribeNode(ParseNodeKey(params[0]));
}

// ============================================================================
// Node calls
// ============================================================================

json RPCServer::HandleCallNode(const std::vector<std::string> &params) {
  RequireParams(params, 2, "callnode <key> <method> [params-json] [timeout-seconds]");
  network::NodeKey key = ParseNodeKey(params[0]);
  const std::string &method = params[1];
  json call_params = params.size() > 2 ? ParseJsonParam(params[2]) : json::object();

  if (params.size() > 3) {
    auto seconds = util::SafeParseInt(params[3], 1, 3600);
    if (!seconds) {
      throw std::invalid_argument("Invalid timeout (1-3600 seconds): " + params[3]);
    }
    return hub_.gateway().Call(key, method, call_params,
                               std::chrono::seconds(*seconds));
  }
  return hub_.gateway().Call(key, method, call_params);
}

json RPCServer::HandleNotifyNode(const std::vector<std::string> &params) {
  RequireParams(params, 2, "notifynode <key> <method> [params-json]");
  network::NodeKey key = ParseNodeKey(params[0]);
  json call_params = params.size() > 2 ? ParseJsonParam(params[2]) : json::object();
  return hub_.gateway().Notify(key, params[1], call_params);
}

json RPCServer::HandleGetRpcMethods(const std::vector<std::string> &params) {
  RequireParams(params, 1, "getrpcmethods <key>");
  return json{{"methods", hub_.commands().GetRpcMethods(ParseNodeKey(params[0]))}};
}

json RPCServer::HandleGetDeviceTypes(const std::vector<std::string> &params) {
  RequireParams(params, 1, "getdevicetypes <key>");
  return hub_.commands().GetDeviceTypes(ParseNodeKey(params[0]));
}

json RPCServer::HandleGetDeviceCategories(const std::vector<std::string> &params) {
  RequireParams(params, 1, "getdevicecategories <key>");
  return hub_.commands().GetDeviceCategories(ParseNodeKey(params[0]));
}

json RPCServer::HandleGetTeleopGroupTypes(const std::vector<std::string> &params) {
  RequireParams(params, 1, "getteleopgrouptypes <key>");
  return hub_.commands().GetTeleopGroupTypes(ParseNodeKey(params[0]));
}

json RPCServer::HandleTestDevice(const std::vector<std::string> &params) {
  RequireParams(params, 4, "testdevice <key> <category> <type> <config-json>");
  return hub_.commands().TestDevice(ParseNodeKey(params[0]), params[1],
                                    params[2], ParseJsonParam(params[3]));
}

json RPCServer::HandleStartTeleopGroup(const std::vector<std::string> &params) {
  RequireParams(params, 2, "startteleopgroup <key> <group>");
  return hub_.commands().StartTeleopGroup(ParseNodeKey(params[0]),
                                          ParseGroupId(params[1]));
}

json RPCServer::HandleStopTeleopGroup(const std::vector<std::string> &params) {
  RequireParams(params, 2, "stopteleopgroup <key> <group>");
  return hub_.commands().StopTeleopGroup(ParseNodeKey(params[0]),
                                         ParseGroupId(params[1]));
}

json RPCServer::HandleUpdateConfig(const std::vector<std::string> &params) {
  RequireParams(params, 1, "updateconfig <key>");
  return hub_.commands().NotifyConfigUpdate(ParseNodeKey(params[0]));
}

// ============================================================================
// Control
// ============================================================================

json RPCServer::HandleStop(const std::vector<std::string> &) {
  LOG_INFO("Received stop command via RPC");

  // Reject requests that arrive from now on
  shutting_down_.store(true, std::memory_order_release);

  if (shutdown_callback_) {
    shutdown_callback_();
  }

  return "Teleophub stopping";
}

} // namespace rpc
} // namespace teleophub
