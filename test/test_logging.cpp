// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    teleophub::util::LogManager::Initialize(level, false, "");

    // "trace" must reach every component logger, not just the default one
    if (level == "trace") {
        teleophub::util::LogManager::SetComponentLevel("network", "trace");
        teleophub::util::LogManager::SetComponentLevel("rpc", "trace");
        teleophub::util::LogManager::SetComponentLevel("store", "trace");
        teleophub::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    teleophub::util::LogManager::Shutdown();
}
