#include "superint/core/save_store.h"

#include <stdexcept>

#include "superint/util/file_io.h"

namespace superint {
namespace {

constexpr const char* kRecordSuffix = ".json";

// Keys become file names, so only a conservative character set is accepted.
bool is_safe_key(const std::string& key) {
  if (key.empty() || key == "." || key == "..") return false;
  for (char c : key) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                    c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

} // namespace

std::optional<std::string> MemorySaveStore::get(const std::string& key) const {
  auto it = records_.find(key);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

void MemorySaveStore::put(const std::string& key, const std::string& value) { records_[key] = value; }

bool MemorySaveStore::remove(const std::string& key) { return records_.erase(key) > 0; }

std::vector<std::string> MemorySaveStore::keys() const {
  std::vector<std::string> out;
  out.reserve(records_.size());
  for (const auto& kv : records_) out.push_back(kv.first);
  return out;
}

DirectorySaveStore::DirectorySaveStore(std::string dir) : dir_(std::move(dir)) {}

std::string DirectorySaveStore::path_for(const std::string& key) const {
  if (!is_safe_key(key)) throw std::runtime_error("Invalid save key: '" + key + "'");
  return dir_ + "/" + key + kRecordSuffix;
}

std::optional<std::string> DirectorySaveStore::get(const std::string& key) const {
  if (!is_safe_key(key)) return std::nullopt;
  const std::string path = path_for(key);
  if (!file_exists(path)) return std::nullopt;
  return read_text_file(path);
}

void DirectorySaveStore::put(const std::string& key, const std::string& value) {
  write_text_file(path_for(key), value);
}

bool DirectorySaveStore::remove(const std::string& key) {
  if (!is_safe_key(key)) return false;
  return remove_file(path_for(key));
}

std::vector<std::string> DirectorySaveStore::keys() const {
  std::vector<std::string> out;
  const std::string suffix = kRecordSuffix;
  for (const std::string& name : list_files(dir_, suffix)) {
    out.push_back(name.substr(0, name.size() - suffix.size()));
  }
  return out;
}

} // namespace superint
