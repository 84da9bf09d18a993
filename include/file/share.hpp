#ifndef PODFS_FILE_SHARE_HPP
#define PODFS_FILE_SHARE_HPP

#include <string>
#include "file/metadata.hpp"
#include "store/content_store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace file {

// Payload of a file share capsule
struct ShareInfo {
  FileMetadata meta;
  std::string source_address;   // address of the pod that shared the file

  bool operator==(const ShareInfo& other) const {
    return meta == other.meta && source_address == other.source_address;
  }
};

// Payload of a pod share capsule
struct SharedPodInfo {
  std::string pod_name;
  std::string pod_address;

  bool operator==(const SharedPodInfo& other) const {
    return pod_name == other.pod_name && pod_address == other.pod_address;
  }
};

// ---- CAPSULE DOCUMENTS ----
// {"meta":{...},"source_address":".."}
utils::Bytes encode_share_info(const ShareInfo& info);
// Throws CorruptShareInfo on structural mismatch, VersionError for unsupported metadata
ShareInfo decode_share_info(const utils::Bytes& document);

// {"pod_name":"..","pod_address":".."}
utils::Bytes encode_shared_pod_info(const SharedPodInfo& info);
SharedPodInfo decode_shared_pod_info(const utils::Bytes& document);


// ---- ENCRYPTED CAPSULES ----
// Uploads the capsule through the encrypted path, returns the encrypted reference string
std::string seal_share_info(store::ContentStore& store, const ShareInfo& info);
std::string seal_shared_pod_info(store::ContentStore& store, const SharedPodInfo& info);

// Throw InvalidReference before touching the store when reference has the wrong shape,
// NotFound when the capsule is not in the store, CorruptShareInfo when it does not
// decrypt or decode
ShareInfo open_share_info(store::ContentStore& store, const std::string& reference);
SharedPodInfo open_shared_pod_info(store::ContentStore& store, const std::string& reference);

// Throws InvalidReference unless reference has the encrypted reference shape
void assert_encrypted_reference(const std::string& reference);

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_SHARE_HPP
