#include "services/account.hpp"
#include "crypto/hash.hpp"
#include <boost/log/trivial.hpp>

namespace podfs {
namespace services {

static constexpr size_t SIGNING_KEY_SIZE = 32;

LocalAccount::LocalAccount(const std::map<std::string, utils::Bytes>& pods) : pods_(pods) {}

void LocalAccount::login() {
  std::lock_guard<std::mutex> lock(mutex_);
  authenticated_ = true;
  BOOST_LOG_TRIVIAL(info) << "Account: Session started with " << pods_.size() << " pods";
}

void LocalAccount::logout() {
  std::lock_guard<std::mutex> lock(mutex_);
  authenticated_ = false;
  BOOST_LOG_TRIVIAL(info) << "Account: Session ended";
}

bool LocalAccount::is_authenticated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return authenticated_;
}

PodInfo LocalAccount::create_pod(const std::string& pod_name) {
  utils::Bytes key = crypto::random_bytes(SIGNING_KEY_SIZE);
  add_pod(pod_name, key);
  return PodInfo{pod_name, crypto::address_from_key(key), key};
}

void LocalAccount::add_pod(const std::string& pod_name, const utils::Bytes& signing_key) {
  if (signing_key.empty()) {
    throw ServiceError("Account: Empty signing key for pod " + pod_name);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  pods_[pod_name] = signing_key;
}

PodInfo LocalAccount::resolve_pod(const std::string& pod_name) const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!authenticated_) {
    BOOST_LOG_TRIVIAL(warning) << "Account: Pod lookup without session: " << pod_name;
    throw NotAuthenticated();
  }

  auto it = pods_.find(pod_name);
  if (it == pods_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Account: Unknown pod: " << pod_name;
    throw PodNotFound(pod_name);
  }

  return PodInfo{pod_name, crypto::address_from_key(it->second), it->second};
}

} // namespace services
} // namespace podfs
