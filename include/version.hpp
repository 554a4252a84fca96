// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace teleophub {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Teleophub Developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "Teleophub version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner printed before the logger takes over stdout
inline std::string GetStartupBanner(const std::string &listen_desc) {
  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "║                 T E L E O P H U B                             ║\n";
  banner +=
      "║            Node Control Plane / JSON-RPC Relay                ║\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  std::string version_str = GetVersionString();
  banner += "║  Version: " + version_str;
  // Box is 65 display chars. "║  Version: " = 12 display chars, closing "║" = 1
  size_t version_padding =
      version_str.length() < 52 ? 52 - version_str.length() : 0;
  banner += std::string(version_padding, ' ') + "║\n";

  banner += "║  Listen:  " + listen_desc;
  size_t listen_padding =
      listen_desc.length() < 52 ? 52 - listen_desc.length() : 0;
  banner += std::string(listen_padding, ' ') + "║\n";

  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += "║  " + GetCopyrightString();
  size_t copyright_padding = 61 - GetCopyrightString().length();
  banner += std::string(copyright_padding, ' ') + "║\n";
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace teleophub
