#include "store/content_store.hpp"
#include "crypto/hash.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace store {

namespace {

const std::string CONTENT_PREFIX = "content:";

} // namespace

bool is_reference(const std::string& value) {
  return utils::is_hex(value, REFERENCE_HEX_LENGTH);
}

LocalContentStore::LocalContentStore(Store& store) : store_(store) {}

Reference LocalContentStore::put(const utils::Bytes& data) {
  Reference reference = crypto::sha256_hex(data);

  // Same bytes, same address: an existing blob is already the right one
  if (!store_.has(CONTENT_PREFIX + reference)) {
    store_.store(CONTENT_PREFIX + reference, data);
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Put " << data.size() << " bytes at " << reference;
  return reference;
}

utils::Bytes LocalContentStore::get(const Reference& reference) {
  if (!is_reference(reference)) {
    throw StoreError("Content store: Malformed reference: " + reference);
  }

  std::string normalized = reference;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  utils::Bytes data = store_.get(CONTENT_PREFIX + normalized);

  if (crypto::sha256_hex(data) != normalized) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Integrity check failed for " << normalized;
    throw StoreError("Content store: Stored bytes do not match address " + normalized);
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Got " << data.size() << " bytes from " << normalized;
  return data;
}

} // namespace store
} // namespace podfs
