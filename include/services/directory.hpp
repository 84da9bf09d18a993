#ifndef PODFS_SERVICES_DIRECTORY_HPP
#define PODFS_SERVICES_DIRECTORY_HPP

#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "services/service_error.hpp"
#include "store/store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace services {

struct DirectoryEntry {
  std::string name;
  bool is_file;

  bool operator<(const DirectoryEntry& other) const {
    return name < other.name || (name == other.name && is_file < other.is_file);
  }
  bool operator==(const DirectoryEntry& other) const {
    return name == other.name && is_file == other.is_file;
  }
};

// Index of the names present in each directory of a pod
class DirectoryIndex {
public:
  virtual ~DirectoryIndex() = default;

  // Both operations are idempotent
  virtual void add_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                         const std::string& name, bool is_file) = 0;
  virtual void remove_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                            const std::string& name, bool is_file) = 0;

  virtual std::vector<DirectoryEntry> list(const std::string& owner_address,
                                           const std::string& dir_path) = 0;
};

// Directory listings stored as JSON documents in the local Store
class LocalDirectory : public DirectoryIndex {
public:
  explicit LocalDirectory(store::Store& store);

  void add_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                 const std::string& name, bool is_file) override;
  void remove_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                    const std::string& name, bool is_file) override;
  std::vector<DirectoryEntry> list(const std::string& owner_address,
                                   const std::string& dir_path) override;

private:
  store::Store& store_;
  std::mutex mutex_;

  static std::string listing_key(const std::string& owner_address, const std::string& dir_path);
  std::set<DirectoryEntry> load(const std::string& key);
  void save(const std::string& key, const std::set<DirectoryEntry>& entries);
};

} // namespace services
} // namespace podfs

#endif // PODFS_SERVICES_DIRECTORY_HPP
