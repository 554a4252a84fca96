// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace teleophub {
namespace rpc {

/**
 * Admin RPC client for teleophub-cli
 *
 * Connects to the hub's Unix domain socket, sends one request line and reads
 * the reply until the server closes the connection.
 */
class RPCClient {
public:
  /**
   * @param socket_path Path to Unix domain socket (e.g.,
   * ~/.teleophub/node.sock)
   */
  explicit RPCClient(const std::string &socket_path);
  ~RPCClient();

  RPCClient(const RPCClient &) = delete;
  RPCClient &operator=(const RPCClient &) = delete;

  /**
   * Connect to the hub
   * @return true if connected successfully
   */
  bool Connect();

  /**
   * Execute RPC command
   * @param method Command name (e.g., "getinfo", "callnode")
   * @param params Command parameters
   * @return Response string (JSON)
   */
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params = {});

  bool IsConnected() const { return socket_fd_ >= 0; }

  void Disconnect();

private:
  std::string socket_path_;
  int socket_fd_;
};

} // namespace rpc
} // namespace teleophub
