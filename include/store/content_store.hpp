#ifndef PODFS_STORE_CONTENT_STORE_HPP
#define PODFS_STORE_CONTENT_STORE_HPP

#include <string>
#include "store/store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace store {

// Content address: hex encoded SHA-256 of the stored bytes
using Reference = std::string;

static constexpr size_t REFERENCE_HEX_LENGTH = 64;

bool is_reference(const std::string& value);

// Immutable content-addressed storage
class ContentStore {
public:
  virtual ~ContentStore() = default;

  // Stores data and returns its content address
  virtual Reference put(const utils::Bytes& data) = 0;
  // Returns the data for an address, throws MissingContentError when unknown
  virtual utils::Bytes get(const Reference& reference) = 0;
};

// ContentStore on top of the local sharded filesystem Store
class LocalContentStore : public ContentStore {
public:
  explicit LocalContentStore(Store& store);

  Reference put(const utils::Bytes& data) override;
  utils::Bytes get(const Reference& reference) override;

private:
  Store& store_;
};

} // namespace store
} // namespace podfs

#endif // PODFS_STORE_CONTENT_STORE_HPP
