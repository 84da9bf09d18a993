#include "store/store.hpp"
#include "crypto/hash.hpp"
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace store {
  
//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
// Initialize store with base directory path and ensure it exists
Store::Store(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path_.string();
  check_directory_exists(base_path_);
}

  
//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::store(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing data with key: " << key;

  if (data.bad() || data.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  std::filesystem::path file_path = resolve_key_path(key);
  check_directory_exists(file_path.parent_path());
  std::filesystem::path temp_path = temp_path_for(file_path);

  size_t bytes_written = 0;
  {
    // Open output file in binary mode for cross-platform consistency
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }

    char buffer[4096];
    while (data.read(buffer, sizeof(buffer))) {
      file.write(buffer, data.gcount());
      bytes_written += data.gcount();
    }

    // Handle final partial chunk if present
    if (data.gcount() > 0) {
      file.write(buffer, data.gcount());
      bytes_written += data.gcount();
    }

    if (data.bad() || !file.good()) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw StoreError("Store: Failed to write data for key: " + key);
    }
  }

  // Readers see either the old blob or the new one, never a partial write
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit key " << key << ": " << ec.message();
    throw StoreError("Store: Failed to commit file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << bytes_written << " bytes with key: " << key;
}

void Store::store(const std::string& key, const utils::Bytes& data) {
  std::stringstream input(utils::to_string(data));
  store(key, input);
}

void Store::get(const std::string& key, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving data for key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(key, file_path);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  size_t total_bytes = 0;

  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (file.bad() || !output.good()) {
    throw StoreError("Store: Failed to stream data for key: " + key);
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully streamed " << total_bytes << " bytes for key: " << key;
}

utils::Bytes Store::get(const std::string& key) const {
  std::stringstream output;
  get(key, output);
  return utils::to_bytes(output.str());
}
  
void Store::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Removing file with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);

  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file with key: " << key;
    throw MissingContentError(key);
  }
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_.string();
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}

  
//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  return std::filesystem::exists(resolve_key_path(key));
}

std::uintmax_t Store::get_file_size(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(key, file_path);
  return std::filesystem::file_size(file_path);
}

  
//==============================================
// SHARDED PATH SUPPORT
//==============================================

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;
  
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  
  path /= hash.substr(6);
  return path;
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(crypto::sha256_hex(key));
}

std::filesystem::path Store::temp_path_for(const std::filesystem::path& file_path) const {
  static std::atomic<uint64_t> counter{0};
  std::stringstream suffix;
  suffix << ".tmp-" << std::this_thread::get_id() << "-" << counter++;
  return file_path.string() + suffix.str();
}
  

//==============================================
// UTILITY METHODS 
//==============================================
  
void Store::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  // Another writer may have created it in the meantime
  if (ec && !std::filesystem::is_directory(path)) {
    throw StoreError("Store: Failed to create directory " + path.string() + ": " + ec.message());
  }
}

void Store::verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found: " << file_path.string();
    throw MissingContentError(key);
  }
}

} // namespace store
} // namespace podfs
