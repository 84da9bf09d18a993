#ifndef PODFS_SERVICES_ACCOUNT_HPP
#define PODFS_SERVICES_ACCOUNT_HPP

#include <map>
#include <mutex>
#include <string>
#include "services/service_error.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace services {

// Network identity of a pod owned by the session
struct PodInfo {
  std::string pod_name;
  std::string address;
  utils::Bytes signing_key;
};

class AccountSession {
public:
  virtual ~AccountSession() = default;

  // Throws NotAuthenticated without an active session, PodNotFound for unknown pods
  virtual PodInfo resolve_pod(const std::string& pod_name) const = 0;
};

// Account holding pod signing keys in memory
class LocalAccount : public AccountSession {
public:
  LocalAccount() = default;
  explicit LocalAccount(const std::map<std::string, utils::Bytes>& pods);

  void login();
  void logout();
  bool is_authenticated() const;

  // Registers a pod with a fresh random signing key and returns its identity
  PodInfo create_pod(const std::string& pod_name);
  void add_pod(const std::string& pod_name, const utils::Bytes& signing_key);

  PodInfo resolve_pod(const std::string& pod_name) const override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, utils::Bytes> pods_;
  bool authenticated_ = false;
};

} // namespace services
} // namespace podfs

#endif // PODFS_SERVICES_ACCOUNT_HPP
