#pragma once

#include <cstdint>

namespace teleophub {
namespace network {

// Server-assigned synthetic node identity, stable across reconnects.
// Keys start at 1; 0 and negatives never name a node.
using NodeKey = int64_t;

// JSON-RPC id of a control-plane -> node call, unique per node while pending
using CallId = int64_t;

} // namespace network
} // namespace teleophub
