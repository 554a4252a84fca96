// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_session.hpp"
#include "network/connection_registry.hpp"
#include "network/jsonrpc.hpp"
#include "network/request_correlator.hpp"
#include "network/request_dispatcher.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace teleophub {
namespace network {

using json = nlohmann::json;

namespace {

// Keep malformed-frame log lines bounded
constexpr size_t MAX_LOGGED_FRAME = 200;

std::string Excerpt(const std::string &text) {
  if (text.size() <= MAX_LOGGED_FRAME) {
    return text;
  }
  return text.substr(0, MAX_LOGGED_FRAME) + "...";
}

} // namespace

const char *SessionStateName(NodeSession::State state) {
  switch (state) {
  case NodeSession::State::ACCEPTED:
    return "accepted";
  case NodeSession::State::ACTIVE:
    return "active";
  case NodeSession::State::CLOSED:
    return "closed";
  }
  return "unknown";
}

NodeSessionPtr NodeSession::Create(TransportConnectionPtr connection,
                                   ConnectionRegistry &registry,
                                   RequestCorrelator &correlator,
                                   RequestDispatcher &dispatcher,
                                   Options options, CloseCallback on_closed) {
  if (!connection) {
    throw std::invalid_argument("NodeSession requires a connection");
  }
  return NodeSessionPtr(new NodeSession(std::move(connection), registry,
                                        correlator, dispatcher, options,
                                        std::move(on_closed)));
}

NodeSession::NodeSession(TransportConnectionPtr connection,
                         ConnectionRegistry &registry,
                         RequestCorrelator &correlator,
                         RequestDispatcher &dispatcher, Options options,
                         CloseCallback on_closed)
    : connection_(std::move(connection)),
      connection_id_(connection_->connection_id()), registry_(registry),
      correlator_(correlator), dispatcher_(dispatcher), options_(options),
      on_closed_(std::move(on_closed)) {}

void NodeSession::Start() {
  std::weak_ptr<NodeSession> weak = shared_from_this();

  connection_->set_receive_callback([weak](const std::string &frame) {
    if (auto self = weak.lock()) {
      self->HandleFrame(frame);
    }
  });
  connection_->set_disconnect_callback([weak]() {
    if (auto self = weak.lock()) {
      self->HandleDisconnect();
    }
  });
  connection_->start();
}

void NodeSession::Close() { connection_->close(); }

void NodeSession::HandleFrame(const std::string &text) {
  if (GetState() == State::CLOSED) {
    return;
  }

  jsonrpc::InboundFrame frame = jsonrpc::ClassifyFrame(text);
  switch (frame.kind) {
  case jsonrpc::FrameKind::MALFORMED:
    LOG_NET_WARN("dropping malformed frame from connection {} ({}): {}",
                 connection_id_, frame.error, Excerpt(text));
    return;

  case jsonrpc::FrameKind::REQUEST: {
    json reply = dispatcher_.Dispatch(*this, frame.envelope);
    if (!SendEnvelope(reply)) {
      LOG_NET_DEBUG("could not deliver reply on connection {}", connection_id_);
    }
    return;
  }

  case jsonrpc::FrameKind::RESPONSE:
    HandleResponse(frame.envelope);
    return;
  }
}

void NodeSession::HandleResponse(const json &envelope) {
  auto key = GetNodeKey();
  if (!key) {
    LOG_NET_WARN("dropping response from unregistered connection {}",
                 connection_id_);
    return;
  }

  auto id = jsonrpc::ResponseId(envelope);
  if (!id) {
    LOG_NET_WARN("dropping response with non-integer id from node {}: {}",
                 *key, Excerpt(envelope.dump()));
    return;
  }

  correlator_.Resolve(*key, *id, envelope);
}

void NodeSession::HandleDisconnect() {
  std::optional<NodeKey> key;
  bool was_registered = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
      return;
    }
    state_ = State::CLOSED;
    key = node_key_;
    if (key) {
      was_registered = registry_.Unregister(*key, connection_);
    }
  }

  if (key) {
    LOG_NET_INFO("node {} disconnected (connection {})", *key, connection_id_);
    // A superseded connection must not fail calls issued on its replacement
    if (was_registered && options_.fail_pending_on_disconnect) {
      correlator_.CancelAll(*key);
    }
  } else {
    LOG_NET_DEBUG("connection {} closed before registration", connection_id_);
  }

  CloseCallback on_closed = std::move(on_closed_);
  on_closed_ = {};
  if (on_closed) {
    on_closed(connection_id_);
  }
}

void NodeSession::Bind(NodeKey key) {
  std::optional<NodeKey> released;
  bool released_registered = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::CLOSED) {
      throw std::runtime_error("Connection closed");
    }
    if (node_key_ && *node_key_ != key) {
      released = node_key_;
      released_registered = registry_.Unregister(*node_key_, connection_);
    }
    node_key_ = key;
    state_ = State::ACTIVE;
    registry_.Register(key, connection_);
  }

  if (released) {
    LOG_NET_INFO("connection {} rebound from node {} to node {}",
                 connection_id_, *released, key);
    if (released_registered && options_.fail_pending_on_disconnect) {
      correlator_.CancelAll(*released);
    }
  }
}

bool NodeSession::SendEnvelope(const json &envelope) {
  return connection_->send(jsonrpc::Serialize(envelope));
}

NodeSession::State NodeSession::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<NodeKey> NodeSession::GetNodeKey() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return node_key_;
}

} // namespace network
} // namespace teleophub
