#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace teleophub {
namespace network {

// In-memory connection for unit tests. Frames "sent" by the hub are recorded;
// frames "received" from the node are injected with simulate_receive().
class MockTransportConnection : public TransportConnection,
                                public std::enable_shared_from_this<MockTransportConnection> {
public:
    // Invoked after each accepted send (outside the lock); lets a test play
    // the node and answer synchronously
    using SendHook = std::function<void(const std::string& frame)>;

    MockTransportConnection() : id_(next_id_.fetch_add(1)) {}

    void start() override { started_ = true; }

    bool send(const std::string& frame) override {
        SendHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_ || refuse_sends_) return false;
            sent_messages_.push_back(frame);
            hook = send_hook_;
        }
        if (hook) {
            hook(frame);
        }
        return true;
    }

    // Local close reports the disconnect exactly once, like the real transport
    void close() override {
        DisconnectCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            open_ = false;
            callback = disconnect_callback_;
        }
        if (callback) {
            callback();
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }
    std::string remote_address() const override { return "127.0.0.1"; }
    uint16_t remote_port() const override { return 40000; }
    bool is_inbound() const override { return true; }
    uint64_t connection_id() const override { return id_; }

    void set_receive_callback(ReceiveCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        receive_callback_ = std::move(callback);
    }
    void set_disconnect_callback(DisconnectCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_callback_ = std::move(callback);
    }

    void set_send_hook(SendHook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        send_hook_ = std::move(hook);
    }

    // send() returns false while set, as if the write path had failed
    void set_refuse_sends(bool refuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_sends_ = refuse;
    }

    // Frame arriving from the node
    void simulate_receive(const std::string& frame) {
        ReceiveCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = receive_callback_;
        }
        if (callback) {
            callback(frame);
        }
    }

    // Remote side dropped the connection
    void simulate_disconnect() { close(); }

    std::vector<std::string> get_sent_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_;
    }

    std::string last_sent_message() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_.empty() ? std::string() : sent_messages_.back();
    }

    void clear_sent_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_messages_.clear();
    }

    size_t sent_message_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_.size();
    }

    bool was_started() const { return started_; }

private:
    static inline std::atomic<uint64_t> next_id_{1};

    const uint64_t id_;
    mutable std::mutex mutex_;
    bool open_ = true;
    bool refuse_sends_ = false;
    std::atomic<bool> started_{false};
    ReceiveCallback receive_callback_;
    DisconnectCallback disconnect_callback_;
    SendHook send_hook_;
    std::vector<std::string> sent_messages_;
};

using MockConnectionPtr = std::shared_ptr<MockTransportConnection>;

// In-memory transport: accepted connections are injected by the test
class MockTransport : public Transport {
public:
    TransportConnectionPtr connect(const std::string&, uint16_t,
                                   ConnectCallback callback) override {
        auto conn = std::make_shared<MockTransportConnection>();
        if (callback) callback(true);
        return conn;
    }

    bool listen(uint16_t port, AcceptCallback accept_callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_listen_) return false;
        listening_ = true;
        listen_port_ = port;
        accept_callback_ = std::move(accept_callback);
        return true;
    }

    void stop_listening() override {
        std::lock_guard<std::mutex> lock(mutex_);
        listening_ = false;
        accept_callback_ = {};
    }

    void run() override {
        running_ = true;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = run_hook_;
        }
        if (hook) hook();
    }

    void stop() override {
        stop_listening();
        running_ = false;
    }

    bool is_running() const override { return running_; }

    // A node connects; returns the connection handed to the hub (or null if
    // nothing is listening)
    MockConnectionPtr inject_inbound() {
        AcceptCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!listening_) return nullptr;
            callback = accept_callback_;
        }
        auto conn = std::make_shared<MockTransportConnection>();
        if (callback) callback(conn);
        return conn;
    }

    // Invoked from run(), after the IO loop would have started
    void set_run_hook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        run_hook_ = std::move(hook);
    }

    void set_fail_listen(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_listen_ = fail;
    }

    bool is_listening() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listening_;
    }

    uint16_t listen_port() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listen_port_;
    }

private:
    mutable std::mutex mutex_;
    bool listening_ = false;
    bool fail_listen_ = false;
    uint16_t listen_port_ = 0;
    std::atomic<bool> running_{false};
    AcceptCallback accept_callback_;
    std::function<void()> run_hook_;
};

} // namespace network
} // namespace teleophub
