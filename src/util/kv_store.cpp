#include "orbitwarp/util/kv_store.h"

#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "orbitwarp/util/file_io.h"

namespace orbitwarp {

std::optional<std::string> InMemoryKeyValueStore::get(const std::string& key) const {
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void InMemoryKeyValueStore::put(const std::string& key, const std::string& value) { values_[key] = value; }

bool InMemoryKeyValueStore::erase(const std::string& key) { return values_.erase(key) > 0; }

FileKeyValueStore::FileKeyValueStore(std::string dir) : dir_(std::move(dir)) {
  if (dir_.empty()) dir_ = ".";
}

std::string FileKeyValueStore::path_for(const std::string& key) const {
  if (key.empty()) throw std::runtime_error("FileKeyValueStore: empty key");
  std::string name;
  name.reserve(key.size());
  for (unsigned char c : key) {
    const bool ok = std::isalnum(c) || c == '.' || c == '_' || c == '-';
    name.push_back(ok ? static_cast<char>(c) : '_');
  }
  return (std::filesystem::path(dir_) / (name + ".json")).string();
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
  const std::string path = path_for(key);
  if (!file_exists(path)) return std::nullopt;
  return read_text_file(path);
}

void FileKeyValueStore::put(const std::string& key, const std::string& value) {
  write_text_file(path_for(key), value);
}

bool FileKeyValueStore::erase(const std::string& key) { return remove_file(path_for(key)); }

} // namespace orbitwarp
