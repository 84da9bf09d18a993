#include "file/file.hpp"
#include "file/block_codec.hpp"
#include "file/path.hpp"
#include "services/feed.hpp"
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace podfs {
namespace file {

//==============================================
// CONSTRUCTOR
//==============================================

File::File(UploadOptions upload_defaults, DownloadOptions download_defaults)
  : upload_defaults_(std::move(upload_defaults))
  , download_defaults_(download_defaults) {
  if (upload_defaults_.block_size == 0) {
    throw InvalidBlockSize();
  }
}


//==============================================
// UPLOAD
//==============================================

FileMetadata File::upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                          const utils::Bytes& data, const std::optional<UploadOptions>& options) const {
  return upload_from(ctx, pod_name, full_path, options.value_or(upload_defaults_),
    [&data](const UploadOptions& effective) -> BlockSource {
      auto blocks = std::make_shared<std::vector<utils::Bytes>>(split(data, effective.block_size));
      auto index = std::make_shared<size_t>(0);
      return [blocks, index]() -> std::optional<utils::Bytes> {
        if (*index >= blocks->size()) {
          return std::nullopt;
        }
        return std::move((*blocks)[(*index)++]);
      };
    });
}

FileMetadata File::upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                          const std::string& text, const std::optional<UploadOptions>& options) const {
  return upload(ctx, pod_name, full_path, utils::to_bytes(text), options);
}

FileMetadata File::upload(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                          std::istream& input, const std::optional<UploadOptions>& options) const {
  return upload_from(ctx, pod_name, full_path, options.value_or(upload_defaults_),
    [&input](const UploadOptions& effective) -> BlockSource {
      auto reader = std::make_shared<BlockReader>(input, effective.block_size);
      return [reader]() { return reader->next(); };
    });
}

FileMetadata File::upload_from(const Context& ctx, const std::string& pod_name, const std::string& full_path,
                               const UploadOptions& options,
                               const std::function<BlockSource(const UploadOptions&)>& make_source) const {
  // Reject caller input before any remote call
  assert_pod_name(pod_name);
  PathInfo path_info = extract_path_info(full_path);
  if (options.block_size == 0) {
    throw InvalidBlockSize();
  }
  if (!utils::is_utf8(options.content_type)) {
    throw ValidationError("content type is not UTF-8");
  }

  BOOST_LOG_TRIVIAL(info) << "File: Uploading " << combine(path_info.path, path_info.filename)
                          << " to pod " << pod_name << " with block size " << options.block_size;

  services::PodInfo pod = resolve_pod(ctx, pod_name);
  const uint64_t now = unix_time();

  Blocks blocks = upload_blocks(ctx, make_source(options), options);

  uint64_t file_size = 0;
  for (const auto& block : blocks) {
    file_size += block.size;
  }

  // Every block reference is known at this point
  check_cancelled(options.cancelled, "upload before manifest");
  store::Reference blocks_reference = ctx.store.put(encode_manifest(blocks));
  BOOST_LOG_TRIVIAL(debug) << "File: Manifest with " << blocks.size() << " blocks at " << blocks_reference;

  FileMetadata meta;
  meta.version = META_VERSION;
  meta.pod_address = pod.address;
  meta.pod_name = pod_name;
  meta.file_path = path_info.path;
  meta.file_name = path_info.filename;
  meta.file_size = file_size;
  meta.block_size = options.block_size;
  meta.content_type = options.content_type;
  meta.compression = "";
  meta.creation_time = now;
  meta.access_time = now;
  meta.modification_time = now;
  meta.blocks_reference = blocks_reference;

  publish_metadata(ctx, pod, meta, options.cancelled);

  BOOST_LOG_TRIVIAL(info) << "File: Uploaded " << file_size << " bytes in " << blocks.size()
                          << " blocks to " << combine(meta.file_path, meta.file_name);
  return meta;
}

Blocks File::upload_blocks(const Context& ctx, const BlockSource& source, const UploadOptions& options) const {
  Blocks blocks;
  uint64_t index = 0;

  if (options.max_concurrency <= 1) {
    while (auto data = source()) {
      check_cancelled(options.cancelled, "block upload");
      Block block{block_name(index++), data->size(), data->size(), ""};
      block.reference = ctx.store.put(*data);
      BOOST_LOG_TRIVIAL(debug) << "File: Uploaded " << block.name << " (" << block.size << " bytes)";
      blocks.push_back(std::move(block));
    }
    return blocks;
  }

  boost::asio::thread_pool pool(options.max_concurrency);
  std::deque<std::pair<Block, std::future<store::Reference>>> in_flight;

  // Descriptors are collected in submission order, whatever order uploads finish in
  auto collect_oldest = [&]() {
    auto& [block, reference] = in_flight.front();
    block.reference = reference.get();
    BOOST_LOG_TRIVIAL(debug) << "File: Uploaded " << block.name << " (" << block.size << " bytes)";
    blocks.push_back(std::move(block));
    in_flight.pop_front();
  };

  try {
    while (auto data = source()) {
      check_cancelled(options.cancelled, "block upload");
      while (in_flight.size() >= options.max_concurrency) {
        collect_oldest();
      }

      Block block{block_name(index++), data->size(), data->size(), ""};
      auto task = std::make_shared<std::packaged_task<store::Reference()>>(
        [&store = ctx.store, payload = std::move(*data)]() { return store.put(payload); });
      in_flight.emplace_back(std::move(block), task->get_future());
      boost::asio::post(pool, [task]() { (*task)(); });
    }

    while (!in_flight.empty()) {
      collect_oldest();
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File: Block upload failed: " << e.what();
    // Uploads still running reference ctx.store
    pool.join();
    throw;
  }

  pool.join();
  return blocks;
}

void File::publish_metadata(const Context& ctx, const services::PodInfo& pod, const FileMetadata& meta,
                            const std::atomic<bool>* cancelled) const {
  const std::string full_path = combine(meta.file_path, meta.file_name);

  check_cancelled(cancelled, "directory registration");
  ctx.directory.add_entry(pod.signing_key, meta.file_path, meta.file_name, true);

  // A failed publish after registration leaves an entry without metadata; callers retry the whole upload
  check_cancelled(cancelled, "feed publish");
  ctx.feed.publish(services::topic_for_path(full_path), encode_metadata(meta), pod.signing_key);
}


//==============================================
// DOWNLOAD AND DELETE
//==============================================

utils::Bytes File::download(const Context& ctx, const std::string& pod_name, const std::string& full_path) const {
  assert_pod_name(pod_name);
  PathInfo path_info = extract_path_info(full_path);

  services::PodInfo pod = resolve_pod(ctx, pod_name);
  return download_data(ctx, pod.address, combine(path_info.path, path_info.filename));
}

utils::Bytes File::download_from_address(const Context& ctx, const std::string& pod_address,
                                         const std::string& full_path) const {
  PathInfo path_info = extract_path_info(full_path);
  return download_data(ctx, pod_address, combine(path_info.path, path_info.filename));
}

void File::remove(const Context& ctx, const std::string& pod_name, const std::string& full_path) const {
  assert_pod_name(pod_name);
  PathInfo path_info = extract_path_info(full_path);

  services::PodInfo pod = resolve_pod(ctx, pod_name);
  ctx.directory.remove_entry(pod.signing_key, path_info.path, path_info.filename, true);

  BOOST_LOG_TRIVIAL(info) << "File: Removed " << combine(path_info.path, path_info.filename)
                          << " from pod " << pod_name;
}

FileMetadata File::resolve_metadata(const Context& ctx, const std::string& pod_address,
                                    const std::string& full_path) const {
  auto payload = ctx.feed.resolve(services::topic_for_path(full_path), pod_address);
  if (!payload) {
    BOOST_LOG_TRIVIAL(warning) << "File: No metadata published for " << full_path << " under " << pod_address;
    throw NotFound(full_path);
  }

  FileMetadata meta;
  try {
    meta = decode_metadata(*payload);
  } catch (const DecodeError& e) {
    BOOST_LOG_TRIVIAL(error) << "File: Undecodable metadata for " << full_path << ": " << e.what();
    throw CorruptMetadata(e.what());
  }

  if (!store::is_reference(meta.blocks_reference)) {
    throw CorruptMetadata("malformed blocks reference for " + full_path);
  }
  return meta;
}

utils::Bytes File::download_data(const Context& ctx, const std::string& pod_address,
                                 const std::string& full_path) const {
  BOOST_LOG_TRIVIAL(info) << "File: Downloading " << full_path << " from " << pod_address;

  FileMetadata meta = resolve_metadata(ctx, pod_address, full_path);
  check_cancelled(download_defaults_.cancelled, "manifest fetch");

  utils::Bytes manifest;
  try {
    manifest = ctx.store.get(meta.blocks_reference);
  } catch (const store::MissingContentError&) {
    throw IncompleteBlocks("manifest " + meta.blocks_reference + " is missing");
  }

  Blocks blocks;
  try {
    blocks = decode_manifest(manifest);
  } catch (const DecodeError& e) {
    throw CorruptManifest(e.what());
  }

  uint64_t total = 0;
  for (const auto& block : blocks) {
    if (block.size > meta.block_size) {
      throw CorruptManifest(block.name + " is larger than the block size");
    }
    total += block.size;
  }
  if (total != meta.file_size) {
    throw CorruptManifest("block sizes add up to " + std::to_string(total) +
                          ", metadata says " + std::to_string(meta.file_size));
  }

  utils::Bytes data = fetch_blocks(ctx, blocks, download_defaults_);
  BOOST_LOG_TRIVIAL(info) << "File: Downloaded " << data.size() << " bytes from " << full_path;
  return data;
}

utils::Bytes File::fetch_blocks(const Context& ctx, const Blocks& blocks, const DownloadOptions& options) const {
  auto fetch = [&store = ctx.store](const Block& block) {
    utils::Bytes data;
    try {
      data = store.get(block.reference);
    } catch (const store::MissingContentError&) {
      throw IncompleteBlocks(block.name + " at " + block.reference + " is missing");
    }
    if (data.size() != block.size) {
      throw CorruptManifest(block.name + " has " + std::to_string(data.size()) +
                            " bytes, manifest says " + std::to_string(block.size));
    }
    return data;
  };

  std::vector<utils::Bytes> parts;
  parts.reserve(blocks.size());

  if (options.max_concurrency <= 1 || blocks.size() <= 1) {
    for (const auto& block : blocks) {
      check_cancelled(options.cancelled, "block fetch");
      parts.push_back(fetch(block));
    }
    return join(parts);
  }

  boost::asio::thread_pool pool(options.max_concurrency);
  std::deque<std::future<utils::Bytes>> in_flight;

  try {
    for (const auto& block : blocks) {
      check_cancelled(options.cancelled, "block fetch");
      while (in_flight.size() >= options.max_concurrency) {
        parts.push_back(in_flight.front().get());
        in_flight.pop_front();
      }

      auto task = std::make_shared<std::packaged_task<utils::Bytes()>>(
        [fetch, &block]() { return fetch(block); });
      in_flight.push_back(task->get_future());
      boost::asio::post(pool, [task]() { (*task)(); });
    }

    while (!in_flight.empty()) {
      parts.push_back(in_flight.front().get());
      in_flight.pop_front();
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File: Block fetch failed: " << e.what();
    pool.join();
    throw;
  }

  pool.join();
  return join(parts);
}


//==============================================
// SHARING
//==============================================

std::string File::share(const Context& ctx, const std::string& pod_name, const std::string& full_path) const {
  assert_pod_name(pod_name);
  PathInfo path_info = extract_path_info(full_path);

  services::PodInfo pod = resolve_pod(ctx, pod_name);
  // The capsule carries the record exactly as it was published
  FileMetadata meta = resolve_metadata(ctx, pod.address, combine(path_info.path, path_info.filename));

  std::string reference = seal_share_info(ctx.store, ShareInfo{meta, pod.address});
  BOOST_LOG_TRIVIAL(info) << "File: Shared " << full_path << " from pod " << pod_name;
  return reference;
}

std::string File::share_pod(const Context& ctx, const std::string& pod_name) const {
  assert_pod_name(pod_name);
  services::PodInfo pod = resolve_pod(ctx, pod_name);
  return seal_shared_pod_info(ctx.store, SharedPodInfo{pod_name, pod.address});
}

ShareInfo File::get_shared_info(const Context& ctx, const std::string& reference) const {
  return open_share_info(ctx.store, reference);
}

FileMetadata File::save_shared(const Context& ctx, const std::string& pod_name, const std::string& parent_path,
                               const std::string& reference, const ReceiveOptions& options) const {
  assert_pod_name(pod_name);
  assert_encrypted_reference(reference);
  const std::string parent = normalize_directory(parent_path);
  if (options.name) {
    assert_file_name(*options.name);
  }

  services::PodInfo pod = resolve_pod(ctx, pod_name);
  ShareInfo shared = get_shared_info(ctx, reference);

  // Content fields and creation time stay; location and identity become the importer's
  FileMetadata meta = shared.meta;
  meta.pod_name = pod_name;
  meta.pod_address = pod.address;
  meta.file_path = parent;
  meta.file_name = options.name.value_or(shared.meta.file_name);
  const uint64_t now = unix_time();
  meta.access_time = now;
  meta.modification_time = now;

  publish_metadata(ctx, pod, meta, nullptr);

  BOOST_LOG_TRIVIAL(info) << "File: Saved shared file as " << combine(meta.file_path, meta.file_name)
                          << " in pod " << pod_name;
  return meta;
}

utils::Bytes File::download_shared(const Context& ctx, const std::string& reference) const {
  ShareInfo shared = get_shared_info(ctx, reference);
  return download_data(ctx, shared.source_address, combine(shared.meta.file_path, shared.meta.file_name));
}

utils::Bytes File::download_from_shared_pod(const Context& ctx, const std::string& pod_reference,
                                            const std::string& full_path) const {
  assert_encrypted_reference(pod_reference);
  PathInfo path_info = extract_path_info(full_path);

  SharedPodInfo pod = open_shared_pod_info(ctx.store, pod_reference);
  return download_data(ctx, pod.pod_address, combine(path_info.path, path_info.filename));
}


//==============================================
// UTILITY METHODS
//==============================================

services::PodInfo File::resolve_pod(const Context& ctx, const std::string& pod_name) {
  if (!ctx.account) {
    throw NotAuthenticated();
  }
  return ctx.account->resolve_pod(pod_name);
}

void File::check_cancelled(const std::atomic<bool>* cancelled, const std::string& operation) {
  if (cancelled && cancelled->load()) {
    BOOST_LOG_TRIVIAL(warning) << "File: Cancelled during " << operation;
    throw OperationCancelled(operation);
  }
}

uint64_t File::unix_time() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace file
} // namespace podfs
