#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and admin-RPC string arguments
 - Centralized input validation to prevent crashes from malformed input

 Key functions:
 - SafeParseInt / SafeParseInt64: integers with bounds checking
 - SafeParsePort: port number (1-65535)
 - SplitList: comma separated option values
 - JsonError: admin RPC error reply

 All parse functions validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace teleophub {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking (node keys, group ids)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("8000") -> 8000
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Split on a separator, dropping empty items
 *
 * Example:
 *   SplitList("network,rpc,,store") -> {"network", "rpc", "store"}
 */
std::vector<std::string> SplitList(const std::string& str, char sep = ',');

/**
 * Admin RPC error reply, newline terminated
 *
 * Example:
 *   JsonError("Invalid node key") -> "{\"error\":\"Invalid node key\"}\n"
 */
std::string JsonError(const std::string& message);

} // namespace util
} // namespace teleophub
