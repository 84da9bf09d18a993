#ifndef PODFS_FILE_CONTEXT_HPP
#define PODFS_FILE_CONTEXT_HPP

#include "services/account.hpp"
#include "services/directory.hpp"
#include "services/feed.hpp"
#include "store/content_store.hpp"

namespace podfs {
namespace file {

// Collaborators one operation runs against. Passed explicitly into every
// call; account is null for unauthenticated callers.
struct Context {
  store::ContentStore& store;
  services::FeedService& feed;
  services::DirectoryIndex& directory;
  const services::AccountSession* account = nullptr;
};

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_CONTEXT_HPP
