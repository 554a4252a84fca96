#pragma once

#include "network/node_hub.hpp"
#include "network/rpc_server.hpp"
#include "store/json_node_store.hpp"
#include "util/files.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>

namespace teleophub {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (nodes.json, node.sock, debug.log)
  std::filesystem::path datadir;

  // Node-facing hub configuration
  network::NodeHub::Config hub_config;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  network::NodeHub &hub() { return *hub_; }
  store::NodeStore &node_store() { return *node_store_; }

  // Status
  bool is_running() const { return running_; }

  // Shutdown request (for RPC stop command)
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<store::JsonFileNodeStore> node_store_;
  std::unique_ptr<network::NodeHub> hub_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  // Initialization steps
  bool init_datadir();
  bool init_store();
  bool init_hub();
  bool init_rpc();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace teleophub
