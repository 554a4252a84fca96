#pragma once

#include <filesystem>
#include <string>

namespace teleophub {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file to ensure data is on disk
 * 3. fsync() the directory to ensure rename will be durable
 * 4. Atomic rename over original file
 *
 * Either the old file or the new file is always valid, never a
 * half-written one.
 */

/**
 * Write string to file atomically with the given permissions
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.teleophub (falls back to ./.teleophub)
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace teleophub
