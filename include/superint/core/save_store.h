#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace superint {

// Opaque string key-value medium for save records.
class SaveStore {
 public:
  virtual ~SaveStore() = default;

  virtual std::optional<std::string> get(const std::string& key) const = 0;
  // Throws std::runtime_error if the record cannot be written.
  virtual void put(const std::string& key, const std::string& value) = 0;
  // Returns false if the key did not exist.
  virtual bool remove(const std::string& key) = 0;
  // All keys currently stored, sorted.
  virtual std::vector<std::string> keys() const = 0;
};

class MemorySaveStore : public SaveStore {
 public:
  std::optional<std::string> get(const std::string& key) const override;
  void put(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  std::vector<std::string> keys() const override;

 private:
  std::map<std::string, std::string> records_;
};

// One "<key>.json" file per record inside a directory.
class DirectorySaveStore : public SaveStore {
 public:
  explicit DirectorySaveStore(std::string dir);

  std::optional<std::string> get(const std::string& key) const override;
  void put(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  std::vector<std::string> keys() const override;

  const std::string& dir() const { return dir_; }

 private:
  std::string path_for(const std::string& key) const;

  std::string dir_;
};

} // namespace superint
