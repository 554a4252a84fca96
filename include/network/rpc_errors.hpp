// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node_types.hpp"
#include <stdexcept>
#include <string>

namespace teleophub {
namespace network {

/**
 * Errors surfaced by the outbound call path (NodeGateway, NodeCommands)
 *
 * Callers that do not care about the specific failure catch NodeRpcError;
 * the admin RPC server maps each subclass to a JSON error string.
 */
class NodeRpcError : public std::runtime_error {
public:
  explicit NodeRpcError(const std::string &what) : std::runtime_error(what) {}
};

// Target node has no registered connection. Nothing was transmitted.
class NotConnectedError : public NodeRpcError {
public:
  explicit NotConnectedError(NodeKey key)
      : NodeRpcError("Node " + std::to_string(key) + " is not connected"),
        key_(key) {}

  NodeKey node_key() const { return key_; }

private:
  NodeKey key_;
};

// No reply arrived before the call's deadline
class TimeoutError : public NodeRpcError {
public:
  TimeoutError(NodeKey key, CallId id)
      : NodeRpcError("Call " + std::to_string(id) + " to node " +
                     std::to_string(key) + " timed out"),
        key_(key), id_(id) {}

  NodeKey node_key() const { return key_; }
  CallId call_id() const { return id_; }

private:
  NodeKey key_;
  CallId id_;
};

// Node answered with a JSON-RPC error object
class RemoteError : public NodeRpcError {
public:
  RemoteError(int code, const std::string &message)
      : NodeRpcError("Node error " + std::to_string(code) + ": " + message),
        code_(code), message_(message) {}

  int code() const { return code_; }
  const std::string &message() const { return message_; }

private:
  int code_;
  std::string message_;
};

// Node answered with something that is not a valid reply for the call
class ProtocolError : public NodeRpcError {
public:
  explicit ProtocolError(const std::string &what) : NodeRpcError(what) {}
};

// The connection refused the outgoing frame
class TransportError : public NodeRpcError {
public:
  explicit TransportError(const std::string &what) : NodeRpcError(what) {}
};

// The node's connection closed while the call was pending
class DisconnectedError : public NodeRpcError {
public:
  explicit DisconnectedError(NodeKey key)
      : NodeRpcError("Node " + std::to_string(key) +
                     " disconnected before replying"),
        key_(key) {}

  NodeKey node_key() const { return key_; }

private:
  NodeKey key_;
};

// Typed command reached the node but the node did not report success
class CommandRejectedError : public NodeRpcError {
public:
  explicit CommandRejectedError(const std::string &what) : NodeRpcError(what) {}
};

} // namespace network
} // namespace teleophub
