#ifndef PODFS_FILE_FILE_HPP
#define PODFS_FILE_FILE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include "file/context.hpp"
#include "file/file_error.hpp"
#include "file/manifest.hpp"
#include "file/metadata.hpp"
#include "file/share.hpp"
#include "utils/bytes.hpp"

namespace podfs {
namespace file {

struct UploadOptions {
  uint64_t block_size = 1000000;
  std::string content_type;
  // Block uploads in flight at once, 1 uploads sequentially
  size_t max_concurrency = 1;
  // Checked between steps; raising it aborts with OperationCancelled
  const std::atomic<bool>* cancelled = nullptr;
};

struct DownloadOptions {
  size_t max_concurrency = 1;
  const std::atomic<bool>* cancelled = nullptr;
};

struct ReceiveOptions {
  // Leaf name in the importing pod, defaults to the shared file name
  std::optional<std::string> name;
};

// Files management: materializes payloads into blocks, manifests and feed
// published metadata, and shares them through encrypted capsules. Holds only
// default options; every call runs against the Context it is given.
class File {
public:
  // ---- CONSTRUCTOR ----
  File() = default;
  explicit File(UploadOptions upload_defaults, DownloadOptions download_defaults = {});


  // ---- UPLOAD ----
  FileMetadata upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                      const utils::Bytes& data, const std::optional<UploadOptions>& options = std::nullopt) const;
  FileMetadata upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                      const std::string& text, const std::optional<UploadOptions>& options = std::nullopt) const;
  FileMetadata upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                      std::istream& input, const std::optional<UploadOptions>& options = std::nullopt) const;


  // ---- DOWNLOAD AND DELETE ----
  utils::Bytes download(const Context& ctx, const std::string& pod_name, const std::string& full_path) const;
  // Reads under an explicit pod address; needs no account
  utils::Bytes download_from_address(const Context& ctx, const std::string& pod_address,
                                     const std::string& full_path) const;
  // Removes the directory entry only; blocks and feed history stay
  void remove(const Context& ctx, const std::string& pod_name, const std::string& full_path) const;


  // ---- SHARING ----
  std::string share(const Context& ctx, const std::string& pod_name, const std::string& full_path) const;
  std::string share_pod(const Context& ctx, const std::string& pod_name) const;
  ShareInfo get_shared_info(const Context& ctx, const std::string& reference) const;
  FileMetadata save_shared(const Context& ctx, const std::string& pod_name, const std::string& parent_path,
                           const std::string& reference, const ReceiveOptions& options = {}) const;
  utils::Bytes download_shared(const Context& ctx, const std::string& reference) const;
  utils::Bytes download_from_shared_pod(const Context& ctx, const std::string& pod_reference,
                                        const std::string& full_path) const;


  // ---- GETTERS ----
  const UploadOptions& default_upload_options() const { return upload_defaults_; }
  const DownloadOptions& default_download_options() const { return download_defaults_; }

private:
  using BlockSource = std::function<std::optional<utils::Bytes>()>;

  // ---- PARAMETERS ----
  UploadOptions upload_defaults_;
  DownloadOptions download_defaults_;


  // ---- UPLOAD PIPELINE ----
  // Validates, resolves the pod and hands a block source for the payload to upload_blocks
  FileMetadata upload_from(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                           const UploadOptions& options,
                           const std::function<BlockSource(const UploadOptions&)>& make_source) const;
  // Uploads every block the source yields, bounded by options.max_concurrency
  Blocks upload_blocks(const Context& ctx, const BlockSource& source, const UploadOptions& options) const;
  // Registers the directory entry, then publishes metadata on the path's feed topic
  void publish_metadata(const Context& ctx, const services::PodInfo& pod, const FileMetadata& meta,
                        const std::atomic<bool>* cancelled) const;


  // ---- DOWNLOAD PIPELINE ----
  // Latest published metadata for a normalized full path
  FileMetadata resolve_metadata(const Context& ctx, const std::string& pod_address,
                                const std::string& full_path) const;
  utils::Bytes download_data(const Context& ctx, const std::string& pod_address,
                             const std::string& full_path) const;
  // Fetches blocks concurrently and reassembles them in manifest order
  utils::Bytes fetch_blocks(const Context& ctx, const Blocks& blocks, const DownloadOptions& options) const;


  // ---- UTILITY METHODS ----
  static services::PodInfo resolve_pod(const Context& ctx, const std::string& pod_name);
  static void check_cancelled(const std::atomic<bool>* cancelled, const std::string& operation);
  static uint64_t unix_time();
};

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_FILE_HPP
