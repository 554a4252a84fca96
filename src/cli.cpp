// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include "util/files.hpp"
#include "version.hpp"
#include <iostream>
#include <string>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "Teleophub CLI - Control nodes through a running hub\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.teleophub)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Hub:\n"
      << "  getinfo              Get general hub information\n"
      << "  listnodes [uuid]     List known nodes and their connection state\n"
      << "  getnode <key>        Get one node by key\n"
      << "\n"
      << "Nodes:\n"
      << "  callnode <key> <method> [params-json] [timeout-seconds]\n"
      << "                       Call a method on a node and wait for the result\n"
      << "  notifynode <key> <method> [params-json]\n"
      << "                       Send a notification to a node\n"
      << "  getrpcmethods <key>  List the methods a node supports\n"
      << "  getdevicetypes <key> Get the device types a node supports\n"
      << "  getdevicecategories <key>\n"
      << "                       Get the device categories a node supports\n"
      << "  getteleopgrouptypes <key>\n"
      << "                       Get the teleop group types a node supports\n"
      << "  testdevice <key> <category> <type> <config-json>\n"
      << "                       Test a device configuration on a node\n"
      << "  startteleopgroup <key> <group>\n"
      << "  stopteleopgroup <key> <group>\n"
      << "                       Start or stop a teleop group on a node\n"
      << "  updateconfig <key>   Tell a node to reload its configuration\n"
      << "\n"
      << "Control:\n"
      << "  stop                 Stop the hub\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::string datadir = teleophub::util::get_default_datadir().string();
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      // Options are only recognized before the command
      if (command.empty() && (arg == "--help" || arg == "-h")) {
        PrintUsage(argv[0]);
        return 0;
      } else if (command.empty() && (arg == "--version" || arg == "-v")) {
        std::cout << teleophub::GetFullVersionString() << std::endl;
        std::cout << teleophub::GetCopyrightString() << std::endl;
        return 0;
      } else if (command.empty() && arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // RPC is local-only: there is no network admin port
    std::string socket_path = datadir + "/node.sock";
    teleophub::rpc::RPCClient client(socket_path);

    if (!client.Connect()) {
      std::cerr << "Error: Cannot connect to hub at " << socket_path << "\n"
                << "Make sure teleophubd is running.\n";
      return 1;
    }

    std::string response = client.ExecuteCommand(command, params);
    std::cout << response;

    // Non-zero exit status when the hub reported an error
    return response.rfind("{\"error\"", 0) == 0 ? 1 : 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
