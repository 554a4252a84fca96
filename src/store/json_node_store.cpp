#include "store/json_node_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace teleophub {
namespace store {

JsonFileNodeStore::JsonFileNodeStore(const std::string &datadir) {
  std::filesystem::path dir(datadir);
  path_ = (dir / "nodes.json").string();
}

bool JsonFileNodeStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!std::filesystem::exists(path_)) {
    LOG_STORE_TRACE("no existing node file at {}", path_);
    return true;
  }

  std::string data = util::read_file_string(path_);
  if (data.empty()) {
    LOG_STORE_ERROR("failed to read {}", path_);
    return false;
  }

  try {
    json j = json::parse(data);

    int version = j.value("version", 0);
    if (version != FILE_VERSION) {
      LOG_STORE_ERROR("unsupported node file version {} in {}", version, path_);
      return false;
    }

    size_t loaded = 0;
    size_t skipped = 0;
    for (const auto &entry : j.at("nodes")) {
      NodeRecord record;
      record.id = entry.value("id", NodeKey(0));
      record.uuid = entry.value("uuid", std::string());
      record.created_at = entry.value("created_at", int64_t(0));
      record.updated_at = entry.value("updated_at", record.created_at);
      if (AddRecordLocked(record)) {
        loaded++;
      } else {
        skipped++;
      }
    }

    // Never hand out a key that was issued before, even if its record was lost
    NodeKey next = j.value("next_key", NodeKey(1));
    if (next > next_key_) {
      next_key_ = next;
    }

    LOG_STORE_INFO("loaded {} node(s) from {} (skipped {})", loaded, path_,
                   skipped);
    return true;

  } catch (const std::exception &e) {
    LOG_STORE_ERROR("failed to parse {}: {}", path_, e.what());
    return false;
  }
}

bool JsonFileNodeStore::Save() {
  std::lock_guard<std::mutex> lock(mutex_);
  return SaveLocked();
}

bool JsonFileNodeStore::Persist() { return SaveLocked(); }

bool JsonFileNodeStore::SaveLocked() {
  try {
    json nodes = json::array();
    for (const auto &[key, record] : records_) {
      nodes.push_back({{"id", record.id},
                       {"uuid", record.uuid},
                       {"created_at", record.created_at},
                       {"updated_at", record.updated_at}});
    }
    json j = {{"version", FILE_VERSION},
              {"next_key", next_key_},
              {"nodes", std::move(nodes)}};

    // Owner-only: node identities are the only credential nodes present
    if (!util::atomic_write_file(path_, j.dump(2), 0600)) {
      LOG_STORE_ERROR("failed to save {}", path_);
      return false;
    }

    LOG_STORE_TRACE("saved {} node(s) to {}", records_.size(), path_);
    return true;

  } catch (const std::exception &e) {
    LOG_STORE_ERROR("failed to save {}: {}", path_, e.what());
    return false;
  }
}

} // namespace store
} // namespace teleophub
