#include "file/share.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/hash.hpp"
#include "file/file_error.hpp"
#include "json_fields.hpp"
#include "store/encrypted_store.hpp"
#include <boost/log/trivial.hpp>

namespace podfs {
namespace file {

namespace {

void assert_address(const std::string& address, const char* field) {
  if (!utils::is_hex(address, crypto::ADDRESS_SIZE * 2)) {
    throw CorruptShareInfo(std::string("field '") + field + "' is not an address");
  }
}

// Fetches and decrypts a capsule, mapping store and cipher failures to the share taxonomy
utils::Bytes open_capsule(store::ContentStore& store, const std::string& reference) {
  assert_encrypted_reference(reference);
  auto encrypted = store::EncryptedReference::parse(reference);

  store::EncryptedStore encrypted_store(store);
  try {
    return encrypted_store.get(encrypted);
  } catch (const store::MissingContentError&) {
    BOOST_LOG_TRIVIAL(warning) << "Share: No capsule at " << encrypted.address();
    throw NotFound("shared reference " + encrypted.address());
  } catch (const crypto::DecryptionError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Share: Capsule does not decrypt: " << e.what();
    throw CorruptShareInfo("capsule does not decrypt with the reference key");
  }
}

} // namespace

//==============================================
// CAPSULE DOCUMENTS
//==============================================

utils::Bytes encode_share_info(const ShareInfo& info) {
  json::Document root;
  root["meta"] = metadata_to_json(info.meta);
  root["source_address"] = info.source_address;
  return json::serialize(root, "share info");
}

ShareInfo decode_share_info(const utils::Bytes& document) {
  try {
    auto root = json::parse(document, "share info");
    json::assert_object(root, "share info");

    ShareInfo info;
    info.meta = metadata_from_json(json::require_object(root, "meta"));
    info.source_address = json::require_string(root, "source_address");
    assert_address(info.source_address, "source_address");
    return info;
  } catch (const DecodeError& e) {
    throw CorruptShareInfo(e.what());
  }
}

utils::Bytes encode_shared_pod_info(const SharedPodInfo& info) {
  json::Document root;
  root["pod_name"] = info.pod_name;
  root["pod_address"] = info.pod_address;
  return json::serialize(root, "shared pod info");
}

SharedPodInfo decode_shared_pod_info(const utils::Bytes& document) {
  try {
    auto root = json::parse(document, "shared pod info");
    json::assert_object(root, "shared pod info");

    SharedPodInfo info;
    info.pod_name = json::require_string(root, "pod_name");
    info.pod_address = json::require_string(root, "pod_address");
    assert_address(info.pod_address, "pod_address");
    return info;
  } catch (const DecodeError& e) {
    throw CorruptShareInfo(e.what());
  }
}

//==============================================
// ENCRYPTED CAPSULES
//==============================================

void assert_encrypted_reference(const std::string& reference) {
  if (!store::EncryptedReference::is_valid(reference)) {
    throw InvalidReference(reference);
  }
}

std::string seal_share_info(store::ContentStore& store, const ShareInfo& info) {
  store::EncryptedStore encrypted_store(store);
  auto reference = encrypted_store.put(encode_share_info(info));
  BOOST_LOG_TRIVIAL(info) << "Share: Sealed share info for " << info.meta.file_path << "/"
                          << info.meta.file_name << " at " << reference.address();
  return reference.str();
}

std::string seal_shared_pod_info(store::ContentStore& store, const SharedPodInfo& info) {
  store::EncryptedStore encrypted_store(store);
  auto reference = encrypted_store.put(encode_shared_pod_info(info));
  BOOST_LOG_TRIVIAL(info) << "Share: Sealed pod info for " << info.pod_name << " at " << reference.address();
  return reference.str();
}

ShareInfo open_share_info(store::ContentStore& store, const std::string& reference) {
  return decode_share_info(open_capsule(store, reference));
}

SharedPodInfo open_shared_pod_info(store::ContentStore& store, const std::string& reference) {
  return decode_shared_pod_info(open_capsule(store, reference));
}

} // namespace file
} // namespace podfs
