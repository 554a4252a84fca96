#pragma once

#include "store/node_store.hpp"
#include <string>

namespace teleophub {
namespace store {

/**
 * JsonFileNodeStore - NodeStore persisted to <datadir>/nodes.json
 *
 * File format:
 *   {"version": 1, "next_key": 4,
 *    "nodes": [{"id": 1, "uuid": "...", "created_at": t, "updated_at": t}, ...]}
 *
 * Every change rewrites the file atomically (temp file + fsync + rename,
 * mode 0600). Keys continue after the highest key ever persisted.
 */
class JsonFileNodeStore : public MemoryNodeStore {
public:
  explicit JsonFileNodeStore(const std::string &datadir);

  /**
   * Load records from disk
   * Missing file is not an error (first run). Invalid entries are skipped.
   * @return false if the file exists but cannot be parsed
   */
  bool Load();

  // Rewrite the file from memory
  bool Save();

  const std::string &GetPath() const { return path_; }

  static constexpr int FILE_VERSION = 1;

protected:
  bool Persist() override;

private:
  bool SaveLocked();

  std::string path_;
};

} // namespace store
} // namespace teleophub
