#ifndef PODFS_SERVICES_FEED_HPP
#define PODFS_SERVICES_FEED_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "services/service_error.hpp"
#include "store/store.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace services {

// Mutable owner-signed pointer keyed by (topic, owner address)
class FeedService {
public:
  virtual ~FeedService() = default;

  // Publishes payload as the latest value of topic for the owner bound to signing_key
  virtual void publish(const std::string& topic, const utils::Bytes& payload,
                       const utils::Bytes& signing_key) = 0;
  // Latest payload of topic for owner, std::nullopt if nothing was ever published
  virtual std::optional<utils::Bytes> resolve(const std::string& topic,
                                              const std::string& owner_address) = 0;
};

// Feed records kept in the local Store. A record is
// [u64 big-endian sequence number][payload], replaced atomically on publish.
class LocalFeed : public FeedService {
public:
  explicit LocalFeed(store::Store& store);

  void publish(const std::string& topic, const utils::Bytes& payload,
               const utils::Bytes& signing_key) override;
  std::optional<utils::Bytes> resolve(const std::string& topic,
                                      const std::string& owner_address) override;

  // Number of publishes seen for topic, 0 if none
  uint64_t sequence(const std::string& topic, const std::string& owner_address);

private:
  store::Store& store_;
  std::mutex mutex_;

  static std::string record_key(const std::string& topic, const std::string& owner_address);
  std::optional<utils::Bytes> read_record(const std::string& key, uint64_t& sequence);
};

// Topic for a full path inside a pod
std::string topic_for_path(const std::string& full_path);

} // namespace services
} // namespace podfs

#endif // PODFS_SERVICES_FEED_HPP
