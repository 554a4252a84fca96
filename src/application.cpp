#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace teleophub {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::string listen_desc =
      config_.hub_config.listen_enabled
          ? "ws://0.0.0.0:" + std::to_string(config_.hub_config.listen_port) +
                config_.hub_config.ws_path
          : "disabled";

  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(listen_desc) << std::flush;

  LOG_INFO("Initializing Teleophub...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_store()) {
    LOG_ERROR("Failed to initialize node store");
    return false;
  }

  if (!init_hub()) {
    LOG_ERROR("Failed to initialize node hub");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting Teleophub...");

  setup_signal_handlers();

  if (!hub_->start()) {
    LOG_ERROR("Failed to start node hub");
    return false;
  }

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    hub_->stop();
    return false;
  }

  running_ = true;

  LOG_INFO("Teleophub started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (config_.hub_config.listen_enabled) {
    LOG_INFO("Accepting nodes on port {} path {}",
             config_.hub_config.listen_port, config_.hub_config.ws_path);
  } else {
    LOG_INFO("Inbound node connections disabled");
  }

  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down Teleophub...");

  running_ = false;

  // Stop the hub first: pending node calls fail fast, which releases any RPC
  // worker blocked on one
  if (hub_) {
    LOG_INFO("Stopping node hub...");
    hub_->stop();
  }

  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  // The store persists on every registration; a final save covers
  // best-effort updated_at changes
  if (node_store_) {
    LOG_INFO("Saving node store...");
    if (!node_store_->Save()) {
      LOG_ERROR("Failed to save node store");
    }
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  return true;
}

bool Application::init_store() {
  LOG_INFO("Loading node store...");

  node_store_ = std::make_unique<store::JsonFileNodeStore>(config_.datadir.string());
  if (!node_store_->Load()) {
    LOG_ERROR("Failed to load {}", node_store_->GetPath());
    return false;
  }

  LOG_INFO("Known nodes: {}", node_store_->Size());
  return true;
}

bool Application::init_hub() {
  LOG_INFO("Initializing node hub...");

  hub_ = std::make_unique<network::NodeHub>(config_.hub_config, *node_store_);
  return true;
}

bool Application::init_rpc() {
  LOG_INFO("Initializing RPC server...");

  std::string socket_path = (config_.datadir / "node.sock").string();

  auto shutdown_callback = [this]() { this->request_shutdown(); };

  rpc_server_ = std::make_unique<rpc::RPCServer>(socket_path, *hub_, *node_store_,
                                                 shutdown_callback);
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace teleophub
