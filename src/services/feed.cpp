#include "services/feed.hpp"
#include "crypto/hash.hpp"
#include <cstring>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace services {

std::string topic_for_path(const std::string& full_path) {
  return crypto::sha256_hex(full_path);
}

LocalFeed::LocalFeed(store::Store& store) : store_(store) {}

//==============================================
// FEED OPERATIONS
//==============================================

void LocalFeed::publish(const std::string& topic, const utils::Bytes& payload,
                        const utils::Bytes& signing_key) {
  // Only the holder of the key can write under the derived owner address
  const std::string owner = crypto::address_from_key(signing_key);
  const std::string key = record_key(topic, owner);

  std::lock_guard<std::mutex> lock(mutex_);

  uint64_t sequence = 0;
  read_record(key, sequence);
  ++sequence;

  uint64_t network_sequence = boost::endian::native_to_big(sequence);
  utils::Bytes record(sizeof(network_sequence));
  std::memcpy(record.data(), &network_sequence, sizeof(network_sequence));
  record.insert(record.end(), payload.begin(), payload.end());

  store_.store(key, record);
  BOOST_LOG_TRIVIAL(info) << "Feed: Published " << payload.size() << " bytes on topic " << topic
                          << " for owner " << owner << " (sequence " << sequence << ")";
}

std::optional<utils::Bytes> LocalFeed::resolve(const std::string& topic,
                                               const std::string& owner_address) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t sequence = 0;
  auto payload = read_record(record_key(topic, owner_address), sequence);

  BOOST_LOG_TRIVIAL(debug) << "Feed: Resolve topic " << topic << " for owner " << owner_address
                           << (payload ? " found" : " not found");
  return payload;
}

uint64_t LocalFeed::sequence(const std::string& topic, const std::string& owner_address) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t sequence = 0;
  read_record(record_key(topic, owner_address), sequence);
  return sequence;
}

//==============================================
// RECORD SUPPORT
//==============================================

std::string LocalFeed::record_key(const std::string& topic, const std::string& owner_address) {
  return "feed:" + owner_address + ":" + topic;
}

std::optional<utils::Bytes> LocalFeed::read_record(const std::string& key, uint64_t& sequence) {
  utils::Bytes record;
  try {
    record = store_.get(key);
  } catch (const store::MissingContentError&) {
    sequence = 0;
    return std::nullopt;
  }

  uint64_t network_sequence = 0;
  if (record.size() < sizeof(network_sequence)) {
    BOOST_LOG_TRIVIAL(error) << "Feed: Truncated record for key " << key;
    throw ServiceError("Feed: Truncated feed record");
  }
  std::memcpy(&network_sequence, record.data(), sizeof(network_sequence));
  sequence = boost::endian::big_to_native(network_sequence);

  return utils::Bytes(record.begin() + sizeof(network_sequence), record.end());
}

} // namespace services
} // namespace podfs
