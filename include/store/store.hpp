#ifndef PODFS_STORE_STORE_HPP
#define PODFS_STORE_STORE_HPP

#include <string>
#include <filesystem>
#include <istream>
#include <ostream>
#include <stdexcept>
#include "utils/bytes.hpp"

namespace podfs {
namespace store {

// Keyed blob storage on the local filesystem. Keys are hashed and sharded
// into a directory tree; every write replaces the blob atomically.
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores data stream under given key, replacing any previous value
  void store(const std::string& key, std::istream& data);
  void store(const std::string& key, const utils::Bytes& data);
  // Streams the value stored under key into output, throws MissingContentError if absent
  void get(const std::string& key, std::ostream& output) const;
  utils::Bytes get(const std::string& key) const;
  // Removes data associated with given key
  void remove(const std::string& key);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  std::uintmax_t get_file_size(const std::string& key) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;

  
  // ---- SHARDED PATH SUPPORT ----
  // Creates a directory structure using parts of the key hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Unique sibling path used for write-then-rename
  std::filesystem::path temp_path_for(const std::filesystem::path& file_path) const;

  
  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  void verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// The requested key or address is not present in the store
class MissingContentError : public StoreError {
public:
  explicit MissingContentError(const std::string& key) 
    : StoreError("Store: No content for key: " + key), key_(key) {}

  const std::string& key() const { return key_; }

private:
  std::string key_;
};

} // namespace store
} // namespace podfs

#endif // PODFS_STORE_STORE_HPP
