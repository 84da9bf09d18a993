#ifndef PODFS_SERVICES_SERVICE_ERROR_HPP
#define PODFS_SERVICES_SERVICE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace podfs {
namespace services {

class ServiceError : public std::runtime_error {
public:
  explicit ServiceError(const std::string& message) : std::runtime_error(message) {}
};

// Caller has no active session
class NotAuthenticated : public ServiceError {
public:
  NotAuthenticated() : ServiceError("Account: Not authenticated") {}
};

class PodNotFound : public ServiceError {
public:
  explicit PodNotFound(const std::string& pod_name) 
    : ServiceError("Account: Pod not found: " + pod_name) {}
};

} // namespace services
} // namespace podfs

#endif // PODFS_SERVICES_SERVICE_ERROR_HPP
