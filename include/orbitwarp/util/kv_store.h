#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace orbitwarp {

// Generic string key-value persistence.
//
// get() returns nullopt for a missing key. put() throws std::runtime_error when
// the value could not be stored.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> get(const std::string& key) const = 0;
  virtual void put(const std::string& key, const std::string& value) = 0;
  // Returns true if the key existed.
  virtual bool erase(const std::string& key) = 0;
};

class InMemoryKeyValueStore : public KeyValueStore {
 public:
  std::optional<std::string> get(const std::string& key) const override;
  void put(const std::string& key, const std::string& value) override;
  bool erase(const std::string& key) override;

  std::size_t size() const { return values_.size(); }

 private:
  std::map<std::string, std::string> values_;
};

// One file per key: <dir>/<key>.json, written with temp file + rename so a crash
// mid-save leaves the previous value intact. Characters outside [A-Za-z0-9._-] in
// keys are replaced with '_'.
class FileKeyValueStore : public KeyValueStore {
 public:
  explicit FileKeyValueStore(std::string dir);

  std::optional<std::string> get(const std::string& key) const override;
  void put(const std::string& key, const std::string& value) override;
  bool erase(const std::string& key) override;

  std::string path_for(const std::string& key) const;
  const std::string& dir() const { return dir_; }

 private:
  std::string dir_;
};

} // namespace orbitwarp
