// Copyright (c) 2025 The Unicity Foundation
// Node Simulator - Test utility for manual end-to-end checks
//
// This tool connects to a hub as a node, registers with a uuid and answers a
// small set of node methods. It should ONLY be used against test hubs.

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>

#include "network/jsonrpc.hpp"
#include "network/websocket_transport.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

using namespace teleophub;
using json = nlohmann::json;
namespace jsonrpc = network::jsonrpc;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop = true; }

std::string random_uuid() {
    std::random_device rd;
    std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int> hex(0, 15);
    std::ostringstream out;
    const char* digits = "0123456789abcdef";
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) out << '-';
        int d = hex(rng);
        if (i == 12) d = 4;                 // version 4
        if (i == 16) d = (d & 0x3) | 0x8;   // RFC 4122 variant
        out << digits[d];
    }
    return out.str();
}

} // namespace

class NodeSimulator {
public:
    NodeSimulator(std::string uuid, bool verbose)
        : uuid_(std::move(uuid)), verbose_(verbose) {}

    void attach(network::TransportConnectionPtr conn) { conn_ = std::move(conn); }

    // Send backend.register; the reply arrives through on_frame
    void register_with_hub() {
        send(jsonrpc::MakeRequest("backend.register", json{{"uuid", uuid_}}, next_id_++));
        std::cout << "→ backend.register uuid=" << uuid_ << std::endl;
    }

    void on_frame(const std::string& text) {
        if (verbose_) {
            std::cout << "← " << text << std::endl;
        }

        auto frame = jsonrpc::ClassifyFrame(text);
        switch (frame.kind) {
        case jsonrpc::FrameKind::RESPONSE:
            handle_response(frame.envelope);
            break;
        case jsonrpc::FrameKind::REQUEST:
            handle_request(frame.envelope);
            break;
        case jsonrpc::FrameKind::MALFORMED:
            std::cerr << "✗ Malformed frame from hub: " << frame.error << std::endl;
            break;
        }
    }

    int64_t node_key() const { return node_key_; }

private:
    void send(const json& envelope) {
        std::string text = jsonrpc::Serialize(envelope);
        if (verbose_) {
            std::cout << "→ " << text << std::endl;
        }
        if (!conn_ || !conn_->send(text)) {
            std::cerr << "✗ Send failed (connection closed)" << std::endl;
        }
    }

    void handle_response(const json& response) {
        if (response.contains("error")) {
            std::cerr << "✗ Hub returned error: " << response["error"].dump() << std::endl;
            return;
        }
        const json& result = response["result"];
        if (result.is_object() && result.contains("id") && result["id"].is_number_integer()) {
            node_key_ = result["id"].get<int64_t>();
            std::cout << "✓ Registered as node " << node_key_ << std::endl;
        }
    }

    void handle_request(const json& request) {
        const std::string method = request["method"].get<std::string>();
        const json params = request.value("params", json::object());
        const bool is_notification = !request.contains("id");

        std::cout << "← " << (is_notification ? "notification " : "call ") << method << std::endl;

        if (is_notification) {
            return;
        }

        json id = jsonrpc::RequestId(request);
        if (method == "node.get_rpc_methods") {
            send(jsonrpc::MakeResult(id, json{{"methods", json::array({"node.get_rpc_methods",
                                                                        "node.get_device_types",
                                                                        "node.ping"})}}));
        } else if (method == "node.get_device_types") {
            send(jsonrpc::MakeResult(id, json{{"camera", json::array({"usb", "rtsp"})},
                                              {"joystick", json::array({"gamepad"})}}));
        } else if (method == "node.ping") {
            send(jsonrpc::MakeResult(id, json{{"pong", true}, {"echo", params}}));
        } else {
            send(jsonrpc::MakeError(id, jsonrpc::METHOD_NOT_FOUND, "Method not found"));
        }
    }

    std::string uuid_;
    bool verbose_;
    network::TransportConnectionPtr conn_;
    network::CallId next_id_{1};
    std::atomic<int64_t> node_key_{0};
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n\n"
              << "Options:\n"
              << "  --host <host>     Hub host (default: 127.0.0.1)\n"
              << "  --port <port>     Hub port (default: 8000)\n"
              << "  --path <path>     WebSocket path (default: /ws/rpc)\n"
              << "  --uuid <uuid>     Node uuid (default: random)\n"
              << "  --verbose         Print every frame\n"
              << "  --help            Show this help message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    std::string path = "/ws/rpc";
    std::string uuid;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            auto parsed = util::SafeParsePort(argv[++i]);
            if (!parsed) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            port = *parsed;
        } else if (arg == "--path" && i + 1 < argc) {
            path = argv[++i];
        } else if (arg == "--uuid" && i + 1 < argc) {
            uuid = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (uuid.empty()) {
        uuid = random_uuid();
    }

    util::LogManager::Initialize(verbose ? "debug" : "warn");

    std::cout << "=== Node Simulator ===" << std::endl;
    std::cout << "Target: ws://" << host << ":" << port << path << std::endl;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int exit_code = 0;
    {
        network::WebSocketTransport transport(1, path);
        transport.run();

        NodeSimulator simulator(uuid, verbose);
        std::atomic<bool> disconnected{false};
        std::promise<bool> connected;
        auto connected_future = connected.get_future();

        auto conn = transport.connect(host, port, [&connected](bool success) {
            connected.set_value(success);
        });

        if (!conn || connected_future.wait_for(std::chrono::seconds(15)) != std::future_status::ready ||
            !connected_future.get()) {
            std::cerr << "✗ Connection failed" << std::endl;
            exit_code = 1;
        } else {
            std::cout << "✓ Connected to " << host << ":" << port << std::endl;
            simulator.attach(conn);
            conn->set_receive_callback([&simulator](const std::string& frame) { simulator.on_frame(frame); });
            conn->set_disconnect_callback([&disconnected]() { disconnected = true; });
            conn->start();
            simulator.register_with_hub();

            while (!g_stop && !disconnected) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            if (disconnected) {
                std::cout << "✗ Hub closed the connection" << std::endl;
            } else {
                std::cout << "Closing connection" << std::endl;
                conn->close();
            }
        }

        transport.stop();
    }

    util::LogManager::Shutdown();
    return exit_code;
}
