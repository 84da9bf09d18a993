#include "services/directory.hpp"
#include "crypto/hash.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace podfs {
namespace services {

LocalDirectory::LocalDirectory(store::Store& store) : store_(store) {}

//==============================================
// DIRECTORY OPERATIONS
//==============================================

void LocalDirectory::add_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                               const std::string& name, bool is_file) {
  const std::string key = listing_key(crypto::address_from_key(signing_key), dir_path);

  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load(key);
  if (entries.insert(DirectoryEntry{name, is_file}).second) {
    save(key, entries);
    BOOST_LOG_TRIVIAL(info) << "Directory: Added " << (is_file ? "file " : "directory ") << name
                            << " to " << dir_path;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Directory: Entry " << name << " already present in " << dir_path;
  }
}

void LocalDirectory::remove_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                                  const std::string& name, bool is_file) {
  const std::string key = listing_key(crypto::address_from_key(signing_key), dir_path);

  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load(key);
  if (entries.erase(DirectoryEntry{name, is_file}) > 0) {
    save(key, entries);
    BOOST_LOG_TRIVIAL(info) << "Directory: Removed " << name << " from " << dir_path;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Directory: Entry " << name << " not present in " << dir_path;
  }
}

std::vector<DirectoryEntry> LocalDirectory::list(const std::string& owner_address,
                                                 const std::string& dir_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load(listing_key(owner_address, dir_path));
  return std::vector<DirectoryEntry>(entries.begin(), entries.end());
}

//==============================================
// LISTING PERSISTENCE
//==============================================

std::string LocalDirectory::listing_key(const std::string& owner_address, const std::string& dir_path) {
  return "dir:" + owner_address + ":" + dir_path;
}

std::set<DirectoryEntry> LocalDirectory::load(const std::string& key) {
  std::set<DirectoryEntry> entries;

  std::stringstream document;
  try {
    store_.get(key, document);
  } catch (const store::MissingContentError&) {
    return entries;
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(document.str());
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory: Corrupt listing " << key << ": " << e.what();
    throw ServiceError("Directory: Corrupt listing document");
  }

  auto listing = root.find("entries");
  if (listing == root.end()) {
    return entries;
  }
  if (!listing->is_array()) {
    throw ServiceError("Directory: Listing entries are not a list");
  }
  for (const auto& item : *listing) {
    auto name = item.find("name");
    auto type = item.find("type");
    if (name == item.end() || type == item.end() || !name->is_string() || !type->is_string()) {
      throw ServiceError("Directory: Listing entry without name or type");
    }
    entries.insert(DirectoryEntry{name->get<std::string>(), *type == "file"});
  }
  return entries;
}

void LocalDirectory::save(const std::string& key, const std::set<DirectoryEntry>& entries) {
  nlohmann::json listing = nlohmann::json::array();
  for (const auto& entry : entries) {
    listing.push_back({{"name", entry.name}, {"type", entry.is_file ? "file" : "dir"}});
  }

  nlohmann::json root;
  root["entries"] = std::move(listing);

  std::stringstream document(root.dump());
  store_.store(key, document);
}

} // namespace services
} // namespace podfs
