#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <chrono>
#include <filesystem>
#include <system_error>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.teleophub)\n"
      << "  --port=<port>        WebSocket listen port for nodes (default: 8000)\n"
      << "  --nolisten           Do not accept node connections\n"
      << "  --wspath=<path>      WebSocket endpoint path (default: /ws/rpc)\n"
      << "  --calltimeout=<sec>  Default timeout for calls to nodes (default: 30)\n"
      << "  --keeppending        Let pending calls run to their timeout when a\n"
      << "                       node disconnects (default: fail them at once)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, rpc, store, app, all\n"
      << "                       Can be comma-separated: --debug=network,rpc\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    teleophub::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << teleophub::GetFullVersionString() << std::endl;
        std::cout << teleophub::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = teleophub::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.hub_config.listen_port = *port_opt;
      } else if (arg == "--nolisten") {
        config.hub_config.listen_enabled = false;
      } else if (arg.find("--wspath=") == 0) {
        std::string path = arg.substr(9);
        if (path.empty() || path[0] != '/') {
          std::cerr << "Error: Invalid WebSocket path: " << path << std::endl;
          std::cerr << "Path must start with '/'" << std::endl;
          return 1;
        }
        config.hub_config.ws_path = path;
      } else if (arg.find("--calltimeout=") == 0) {
        auto secs = teleophub::util::SafeParseInt(arg.substr(14), 1, 3600);
        if (!secs) {
          std::cerr << "Error: Invalid call timeout: " << arg.substr(14) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.hub_config.default_call_timeout = std::chrono::seconds(*secs);
      } else if (arg == "--keeppending") {
        config.hub_config.fail_pending_on_disconnect = false;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : teleophub::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir
                << ": " << ec.message() << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    teleophub::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        teleophub::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        teleophub::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        teleophub::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Nested scope: app destructor runs before LogManager::Shutdown() so no
    // connection callback logs after the logger is gone
    {
      teleophub::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    teleophub::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    teleophub::util::LogManager::Shutdown();
    return 1;
  }
}
