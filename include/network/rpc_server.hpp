// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/threadpool.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace teleophub {

// Forward declarations
namespace network {
class NodeHub;
}
namespace store {
class NodeStore;
}

namespace rpc {

/**
 * Admin RPC Server using Unix Domain Sockets (Local-Only Access)
 *
 * Operators reach the hub only through a socket file at datadir/node.sock
 * (mode 0600); there is no TCP admin port and no credentials. Access
 * control is file system permissions.
 *
 * Wire format, one request per connection:
 *   -> {"method": "callnode", "params": ["7", "node.ping", "{}"]}\n
 *   <- {"result": ...}\n   or   {"error": "..."}\n
 *
 * Clients are served on a worker pool: a command that forwards a call to a
 * node blocks its worker until the node answers or the call times out, while
 * other operators keep being served.
 */
class RPCServer {
public:
  // Returns the "result" value; throw to produce an error reply
  using CommandHandler =
      std::function<nlohmann::json(const std::vector<std::string> &)>;

  static constexpr size_t DEFAULT_WORKER_THREADS = 4;
  static constexpr size_t MAX_QUEUED_CLIENTS = 64;
  static constexpr size_t MAX_REQUEST_SIZE = 64 * 1024;

  RPCServer(const std::string &socket_path, network::NodeHub &hub,
            store::NodeStore &node_store,
            std::function<void()> shutdown_callback = nullptr,
            size_t worker_threads = DEFAULT_WORKER_THREADS,
            size_t max_queued_clients = MAX_QUEUED_CLIENTS);
  ~RPCServer();

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Run one command as if it arrived on the socket (returns the reply line)
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params);

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  // Command handlers - Hub
  nlohmann::json HandleGetInfo(const std::vector<std::string> &params);
  nlohmann::json HandleListNodes(const std::vector<std::string> &params);
  nlohmann::json HandleGetNode(const std::vector<std::string> &params);

  // Command handlers - Node calls
  nlohmann::json HandleCallNode(const std::vector<std::string> &params);
  nlohmann::json HandleNotifyNode(const std::vector<std::string> &params);
  nlohmann::json HandleGetRpcMethods(const std::vector<std::string> &params);
  nlohmann::json HandleGetDeviceTypes(const std::vector<std::string> &params);
  nlohmann::json HandleGetDeviceCategories(const std::vector<std::string> &params);
  nlohmann::json HandleGetTeleopGroupTypes(const std::vector<std::string> &params);
  nlohmann::json HandleTestDevice(const std::vector<std::string> &params);
  nlohmann::json HandleStartTeleopGroup(const std::vector<std::string> &params);
  nlohmann::json HandleStopTeleopGroup(const std::vector<std::string> &params);
  nlohmann::json HandleUpdateConfig(const std::vector<std::string> &params);

  // Command handlers - Control
  nlohmann::json HandleStop(const std::vector<std::string> &params);

  nlohmann::json DescribeNode(int64_t key) const;

private:
  std::string socket_path_;
  network::NodeHub &hub_;
  store::NodeStore &node_store_;
  std::function<void()> shutdown_callback_;
  size_t worker_threads_;
  size_t max_queued_clients_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;
  std::unique_ptr<util::ThreadPool> workers_;

  std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace teleophub
