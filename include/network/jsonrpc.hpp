#pragma once

/*
 JSON-RPC 2.0 envelopes exchanged with nodes

 Every WebSocket text frame carries exactly one JSON object:
 - request:      {"jsonrpc":"2.0","method":m,"params":p,"id":n}
 - notification: {"jsonrpc":"2.0","method":m,"params":p}
 - response:     {"jsonrpc":"2.0","id":n,"result":r}
                 {"jsonrpc":"2.0","id":n,"error":{"code":c,"message":s}}

 Inbound frames are classified by shape only: a "method" member makes a
 request (notifications included), "id" plus "result" or "error" makes a
 response, anything else is malformed.
*/

#include "network/node_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace teleophub {
namespace network {
namespace jsonrpc {

constexpr const char *VERSION = "2.0";

// Standard error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

enum class FrameKind { REQUEST, RESPONSE, MALFORMED };

struct InboundFrame {
  FrameKind kind = FrameKind::MALFORMED;
  nlohmann::json envelope;
  // Reason for MALFORMED, for logging
  std::string error;
};

// Parse and classify one inbound text frame. Never throws.
InboundFrame ClassifyFrame(const std::string &text);

nlohmann::json MakeRequest(const std::string &method,
                           const nlohmann::json &params, CallId id);
nlohmann::json MakeNotification(const std::string &method,
                                const nlohmann::json &params);
nlohmann::json MakeResult(const nlohmann::json &id, const nlohmann::json &result);
nlohmann::json MakeError(const nlohmann::json &id, int code,
                         const std::string &message);

// "id" of a request envelope, or JSON null if it carried none
nlohmann::json RequestId(const nlohmann::json &request);

// Integer "id" of a response envelope; nullopt if absent or not an integer
std::optional<CallId> ResponseId(const nlohmann::json &response);

// Compact serialization for the wire. Invalid UTF-8 is replaced, never thrown.
std::string Serialize(const nlohmann::json &envelope);

} // namespace jsonrpc
} // namespace network
} // namespace teleophub
