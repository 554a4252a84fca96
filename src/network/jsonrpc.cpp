// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/jsonrpc.hpp"

namespace teleophub {
namespace network {
namespace jsonrpc {

using json = nlohmann::json;

InboundFrame ClassifyFrame(const std::string &text) {
  InboundFrame frame;

  // Non-throwing parse; discarded value on syntax error
  json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    frame.error = "invalid JSON";
    return frame;
  }
  if (!parsed.is_object()) {
    frame.error = "not a JSON object";
    return frame;
  }

  if (parsed.contains("method")) {
    if (!parsed["method"].is_string()) {
      frame.error = "method is not a string";
      return frame;
    }
    frame.kind = FrameKind::REQUEST;
  } else if (parsed.contains("id") &&
             (parsed.contains("result") || parsed.contains("error"))) {
    frame.kind = FrameKind::RESPONSE;
  } else {
    frame.error = "neither request nor response";
    return frame;
  }

  frame.envelope = std::move(parsed);
  return frame;
}

json MakeRequest(const std::string &method, const json &params, CallId id) {
  return json{{"jsonrpc", VERSION},
              {"method", method},
              {"params", params.is_null() ? json::object() : params},
              {"id", id}};
}

json MakeNotification(const std::string &method, const json &params) {
  return json{{"jsonrpc", VERSION},
              {"method", method},
              {"params", params.is_null() ? json::object() : params}};
}

json MakeResult(const json &id, const json &result) {
  return json{{"jsonrpc", VERSION}, {"id", id}, {"result", result}};
}

json MakeError(const json &id, int code, const std::string &message) {
  return json{{"jsonrpc", VERSION},
              {"id", id},
              {"error", {{"code", code}, {"message", message}}}};
}

json RequestId(const json &request) {
  auto it = request.find("id");
  if (it == request.end()) {
    return nullptr;
  }
  return *it;
}

std::optional<CallId> ResponseId(const json &response) {
  auto it = response.find("id");
  if (it == response.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<CallId>();
}

std::string Serialize(const json &envelope) {
  return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace jsonrpc
} // namespace network
} // namespace teleophub
