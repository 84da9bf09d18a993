#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <sstream>
#include <chrono>
#include <mutex>
#include <thread>
#include "crypto/hash.hpp"
#include "file/block_codec.hpp"
#include "file/file.hpp"
#include "file/path.hpp"
#include "store/encrypted_store.hpp"
#include "test_utils.hpp"

using namespace podfs;
using namespace podfs::file;
using ::testing::StrictMock;

namespace {

class MockAccount : public services::AccountSession {
public:
  MOCK_METHOD(services::PodInfo, resolve_pod, (const std::string& pod_name), (const, override));
};

// Shared log of collaborator calls, in the order they happened
struct EventLog {
  std::mutex mutex;
  std::vector<std::string> events;

  void add(const std::string& event) {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(event);
  }

  std::ptrdiff_t index_of(const std::string& event) {
    auto it = std::find(events.begin(), events.end(), event);
    return it == events.end() ? -1 : std::distance(events.begin(), it);
  }
};

// Content store wrapper that records puts and can stall, fail or cancel on demand
class InstrumentedStore : public store::ContentStore {
public:
  InstrumentedStore(store::ContentStore& inner, EventLog& log) : inner_(inner), log_(log) {}

  store::Reference put(const utils::Bytes& data) override {
    size_t count = ++puts_;
    if (fail_on_put_ && count == fail_on_put_) {
      throw store::StoreError("Injected failure");
    }
    if (cancel_after_put_ && count == cancel_after_put_ && cancel_flag_) {
      cancel_flag_->store(true);
    }
    if (stagger_ && !data.empty()) {
      // Earlier blocks finish later
      std::this_thread::sleep_for(std::chrono::milliseconds(data[0] % 7));
    }
    store::Reference reference = inner_.put(data);
    log_.add("put:" + reference);
    return reference;
  }

  utils::Bytes get(const store::Reference& reference) override {
    ++gets_;
    return inner_.get(reference);
  }

  void fail_on_put(size_t count) { fail_on_put_ = count; }
  void cancel_after_put(size_t count, std::atomic<bool>* flag) { cancel_after_put_ = count; cancel_flag_ = flag; }
  void stagger() { stagger_ = true; }
  size_t puts() const { return puts_; }

private:
  store::ContentStore& inner_;
  EventLog& log_;
  std::atomic<size_t> puts_{0};
  std::atomic<size_t> gets_{0};
  size_t fail_on_put_ = 0;
  size_t cancel_after_put_ = 0;
  std::atomic<bool>* cancel_flag_ = nullptr;
  bool stagger_ = false;
};

class RecordingFeed : public services::FeedService {
public:
  RecordingFeed(services::FeedService& inner, EventLog& log) : inner_(inner), log_(log) {}

  void publish(const std::string& topic, const utils::Bytes& payload, const utils::Bytes& signing_key) override {
    log_.add("publish");
    inner_.publish(topic, payload, signing_key);
  }

  std::optional<utils::Bytes> resolve(const std::string& topic, const std::string& owner_address) override {
    return inner_.resolve(topic, owner_address);
  }

private:
  services::FeedService& inner_;
  EventLog& log_;
};

class RecordingDirectory : public services::DirectoryIndex {
public:
  RecordingDirectory(services::DirectoryIndex& inner, EventLog& log) : inner_(inner), log_(log) {}

  void add_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                 const std::string& name, bool is_file) override {
    log_.add("add_entry");
    inner_.add_entry(signing_key, dir_path, name, is_file);
  }

  void remove_entry(const utils::Bytes& signing_key, const std::string& dir_path,
                    const std::string& name, bool is_file) override {
    inner_.remove_entry(signing_key, dir_path, name, is_file);
  }

  std::vector<services::DirectoryEntry> list(const std::string& owner_address,
                                             const std::string& dir_path) override {
    return inner_.list(owner_address, dir_path);
  }

private:
  services::DirectoryIndex& inner_;
  EventLog& log_;
};

} // namespace

class FileTest : public ::testing::Test {
protected:
  std::unique_ptr<test::LocalNetwork> net;
  services::PodInfo home;
  services::PodInfo other;
  File files;

  void SetUp() override {
    test::init_logging();
    net = std::make_unique<test::LocalNetwork>("file_test");
    home = net->account.create_pod("home");
    other = net->account.create_pod("other");
  }

  void TearDown() override {
    net.reset();
  }

  Context ctx() { return net->context(); }

  static UploadOptions with_block_size(uint64_t block_size, size_t concurrency = 1) {
    UploadOptions options;
    options.block_size = block_size;
    options.max_concurrency = concurrency;
    return options;
  }

  Blocks manifest_of(const FileMetadata& meta) {
    return decode_manifest(net->content.get(meta.blocks_reference));
  }

  bool listed(const services::PodInfo& pod, const std::string& dir, const std::string& name) {
    auto entries = net->directory.list(pod.address, dir);
    return std::find(entries.begin(), entries.end(), services::DirectoryEntry{name, true}) != entries.end();
  }
};

//==============================================
// UPLOAD AND DOWNLOAD
//==============================================

TEST_F(FileTest, RoundTripAcrossBlockBoundaries) {
  const uint64_t block_size = 1000;
  for (size_t size : {size_t{0}, size_t{1}, size_t{999}, size_t{1000}, size_t{1001}, size_t{3500}}) {
    const std::string path = "/sizes/file-" + std::to_string(size);
    auto data = test::make_payload(size);

    FileMetadata meta = files.upload(ctx(), "home", path, data, with_block_size(block_size));
    EXPECT_EQ(meta.file_size, size);
    EXPECT_EQ(manifest_of(meta).size(), (size + block_size - 1) / block_size) << "size " << size;
    EXPECT_EQ(files.download(ctx(), "home", path), data) << "size " << size;
  }
}

TEST_F(FileTest, DefaultBlockSizeSplitsLargePayload) {
  auto data = test::make_payload(2500000);
  FileMetadata meta = files.upload(ctx(), "home", "/big.bin", data);

  EXPECT_EQ(meta.block_size, 1000000u);
  Blocks blocks = manifest_of(meta);
  ASSERT_EQ(blocks.size(), 3u);
  EXPECT_EQ(blocks[0].size, 1000000u);
  EXPECT_EQ(blocks[1].size, 1000000u);
  EXPECT_EQ(blocks[2].size, 500000u);
  EXPECT_EQ(blocks[0].name, "block-00000");
  EXPECT_EQ(blocks[2].name, "block-00002");
  EXPECT_EQ(blocks[2].compressed_size, blocks[2].size);

  EXPECT_EQ(files.download(ctx(), "home", "/big.bin"), data);
}

TEST_F(FileTest, EmptyFileHasEmptyManifest) {
  FileMetadata meta = files.upload(ctx(), "home", "/empty", utils::Bytes{});
  EXPECT_EQ(meta.file_size, 0u);
  EXPECT_TRUE(manifest_of(meta).empty());
  EXPECT_TRUE(files.download(ctx(), "home", "/empty").empty());
}

TEST_F(FileTest, PublishedMetadataDescribesUpload) {
  UploadOptions options = with_block_size(4);
  options.content_type = "text/plain";
  FileMetadata meta = files.upload(ctx(), "home", "/docs/note.txt", std::string("hello world"), options);

  EXPECT_EQ(meta.version, META_VERSION);
  EXPECT_EQ(meta.pod_name, "home");
  EXPECT_EQ(meta.pod_address, home.address);
  EXPECT_EQ(meta.file_path, "/docs");
  EXPECT_EQ(meta.file_name, "note.txt");
  EXPECT_EQ(meta.file_size, 11u);
  EXPECT_EQ(meta.block_size, 4u);
  EXPECT_EQ(meta.content_type, "text/plain");
  EXPECT_TRUE(meta.compression.empty());
  EXPECT_TRUE(store::is_reference(meta.blocks_reference));
  EXPECT_GT(meta.creation_time, 0u);
  EXPECT_EQ(meta.creation_time, meta.access_time);
  EXPECT_EQ(meta.creation_time, meta.modification_time);

  auto payload = net->feed.resolve(services::topic_for_path("/docs/note.txt"), home.address);
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(decode_metadata(*payload), meta);
  EXPECT_TRUE(listed(home, "/docs", "note.txt"));
}

TEST_F(FileTest, ManifestReferencesMatchBlockContent) {
  auto data = test::make_payload(2500);
  FileMetadata meta = files.upload(ctx(), "home", "/hashes", data, with_block_size(1000));

  auto slices = split(data, 1000);
  Blocks blocks = manifest_of(meta);
  ASSERT_EQ(blocks.size(), slices.size());
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(blocks[i].reference, crypto::sha256_hex(slices[i]));
  }
}

TEST_F(FileTest, StreamAndTextUploadsMatchBytes) {
  const std::string text = "streamed payload spanning several blocks";
  std::istringstream input(text);

  FileMetadata from_stream = files.upload(ctx(), "home", "/stream.txt", input, with_block_size(8));
  FileMetadata from_text = files.upload(ctx(), "home", "/text.txt", text, with_block_size(8));

  EXPECT_EQ(from_stream.file_size, text.size());
  EXPECT_EQ(from_stream.blocks_reference, from_text.blocks_reference);
  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", "/stream.txt")), text);
}

TEST_F(FileTest, PathsAreNormalized) {
  files.upload(ctx(), "home", "//docs///a.txt/", std::string("normalized"));

  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", "/docs/a.txt")), "normalized");
  EXPECT_TRUE(listed(home, "/docs", "a.txt"));

  FileMetadata root = files.upload(ctx(), "home", "/top.txt", std::string("root"));
  EXPECT_EQ(root.file_path, "/");
  EXPECT_TRUE(listed(home, "/", "top.txt"));
}

TEST_F(FileTest, NonAsciiPathsRoundTrip) {
  const std::string path = "/d\xc3\xa9p\xc3\xb4t/na\xc3\xafve \xe2\x82\xac.txt";
  files.upload(ctx(), "home", path, std::string("accents"));

  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", path)), "accents");
  EXPECT_TRUE(listed(home, "/d\xc3\xa9p\xc3\xb4t", "na\xc3\xafve \xe2\x82\xac.txt"));
}

TEST_F(FileTest, ReuploadReplacesLatestVersion) {
  files.upload(ctx(), "home", "/v.txt", std::string("first"));
  files.upload(ctx(), "home", "/v.txt", std::string("second"));

  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", "/v.txt")), "second");
  EXPECT_EQ(net->feed.sequence(services::topic_for_path("/v.txt"), home.address), 2u);
  EXPECT_EQ(net->directory.list(home.address, "/").size(), 1u);
}

TEST_F(FileTest, PodsAreIsolated) {
  files.upload(ctx(), "home", "/same.txt", std::string("home data"));
  files.upload(ctx(), "other", "/same.txt", std::string("other data"));

  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", "/same.txt")), "home data");
  EXPECT_EQ(utils::to_string(files.download(ctx(), "other", "/same.txt")), "other data");
}

TEST_F(FileTest, ConcurrentTransfersKeepOrder) {
  EventLog log;
  InstrumentedStore staggered(net->content, log);
  staggered.stagger();
  Context context{staggered, net->feed, net->directory, &net->account};

  auto data = test::make_payload(25000);
  File concurrent(with_block_size(1000, 4), DownloadOptions{4, nullptr});
  FileMetadata meta = concurrent.upload(context, "home", "/parallel.bin", data);

  Blocks blocks = manifest_of(meta);
  auto slices = split(data, 1000);
  ASSERT_EQ(blocks.size(), 25u);
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(blocks[i].name, block_name(i));
    EXPECT_EQ(blocks[i].reference, crypto::sha256_hex(slices[i]));
  }

  EXPECT_EQ(concurrent.download(context, "home", "/parallel.bin"), data);
  EXPECT_EQ(files.download(ctx(), "home", "/parallel.bin"), data);
}

TEST_F(FileTest, ManifestFollowsBlocksAndPublishFollowsManifest) {
  EventLog log;
  InstrumentedStore store(net->content, log);
  RecordingFeed feed(net->feed, log);
  RecordingDirectory directory(net->directory, log);
  Context context{store, feed, directory, &net->account};

  auto data = test::make_payload(5500);
  FileMetadata meta = File(with_block_size(1000, 3)).upload(context, "home", "/ordered", data);

  const auto manifest_index = log.index_of("put:" + meta.blocks_reference);
  ASSERT_GE(manifest_index, 0);
  for (const auto& block : manifest_of(meta)) {
    const auto block_index = log.index_of("put:" + block.reference);
    ASSERT_GE(block_index, 0);
    EXPECT_LT(block_index, manifest_index) << block.name;
  }
  EXPECT_LT(manifest_index, log.index_of("add_entry"));
  EXPECT_LT(log.index_of("add_entry"), log.index_of("publish"));
  EXPECT_EQ(log.events.back(), "publish");
}

TEST_F(FileTest, FailedBlockUploadPublishesNothing) {
  for (size_t concurrency : {size_t{1}, size_t{4}}) {
    EventLog log;
    InstrumentedStore failing(net->content, log);
    failing.fail_on_put(3);
    Context context{failing, net->feed, net->directory, &net->account};

    const std::string path = "/broken-" + std::to_string(concurrency);
    EXPECT_THROW(files.upload(context, "home", path, test::make_payload(10000), with_block_size(1000, concurrency)),
                 store::StoreError);
    EXPECT_FALSE(net->feed.resolve(services::topic_for_path(path), home.address).has_value());
    EXPECT_TRUE(net->directory.list(home.address, "/").empty());
  }
}

//==============================================
// CANCELLATION
//==============================================

TEST_F(FileTest, CancelledUploadPublishesNothing) {
  std::atomic<bool> cancelled{true};
  UploadOptions options = with_block_size(100);
  options.cancelled = &cancelled;

  EXPECT_THROW(files.upload(ctx(), "home", "/cancel.txt", test::make_payload(1000), options), OperationCancelled);
  EXPECT_THROW(files.upload(ctx(), "home", "/cancel-empty.txt", utils::Bytes{}, options), OperationCancelled);
  EXPECT_FALSE(net->feed.resolve(services::topic_for_path("/cancel.txt"), home.address).has_value());
  EXPECT_TRUE(net->directory.list(home.address, "/").empty());
}

TEST_F(FileTest, CancellationMidUploadStopsBeforeManifest) {
  EventLog log;
  InstrumentedStore store(net->content, log);
  std::atomic<bool> cancelled{false};
  store.cancel_after_put(2, &cancelled);
  Context context{store, net->feed, net->directory, &net->account};

  UploadOptions options = with_block_size(100);
  options.cancelled = &cancelled;

  EXPECT_THROW(files.upload(context, "home", "/partial", test::make_payload(1000), options), OperationCancelled);
  EXPECT_EQ(store.puts(), 2u);
  EXPECT_FALSE(net->feed.resolve(services::topic_for_path("/partial"), home.address).has_value());
}

TEST_F(FileTest, CancelledDownloadThrows) {
  files.upload(ctx(), "home", "/later.txt", std::string("content"));

  std::atomic<bool> cancelled{true};
  File cancelling(UploadOptions{}, DownloadOptions{1, &cancelled});
  EXPECT_THROW(cancelling.download(ctx(), "home", "/later.txt"), OperationCancelled);
}

//==============================================
// VALIDATION AND IDENTITY
//==============================================

TEST_F(FileTest, InvalidInputFailsBeforeAnyCollaborator) {
  StrictMock<test::MockContentStore> store;
  StrictMock<test::MockFeed> feed;
  StrictMock<test::MockDirectory> directory;
  StrictMock<MockAccount> account;
  Context context{store, feed, directory, &account};

  EXPECT_THROW(files.upload(context, "home", "relative/path", std::string("x")), InvalidPath);
  EXPECT_THROW(files.upload(context, "home", "/a/../b", std::string("x")), InvalidPath);
  EXPECT_THROW(files.upload(context, "home", "/", std::string("x")), InvalidPath);
  EXPECT_THROW(files.upload(context, "", "/a", std::string("x")), InvalidPodName);
  EXPECT_THROW(files.upload(context, "a/b", "/a", std::string("x")), InvalidPodName);
  EXPECT_THROW(files.upload(context, "home", "/a", std::string("x"), with_block_size(0)), InvalidBlockSize);
  EXPECT_THROW(files.download(context, "home", "./a"), InvalidPath);
  EXPECT_THROW(files.remove(context, "home", ""), InvalidPath);
  EXPECT_THROW(files.share(context, "home", "no-slash"), InvalidPath);

  // Bytes that are not UTF-8 could be published but never decoded again
  EXPECT_THROW(files.upload(context, "home", "/docs/x\xffy.bin", std::string("hello")), InvalidPath);
  EXPECT_THROW(files.upload(context, "ho\xffme", "/a", std::string("x")), InvalidPodName);
  EXPECT_THROW(files.download(context, "home", "/\xc0\xaf"), InvalidPath);
  UploadOptions bad_type;
  bad_type.content_type = "text/\xfe";
  EXPECT_THROW(files.upload(context, "home", "/a", std::string("x"), bad_type), ValidationError);

  EXPECT_THROW(files.get_shared_info(context, "abc"), InvalidReference);
  EXPECT_THROW(files.download_shared(context, std::string(64, 'a')), InvalidReference);
  EXPECT_THROW(files.download_from_shared_pod(context, "xyz", "/a"), InvalidReference);
  EXPECT_THROW(files.save_shared(context, "home", "/", "abc"), InvalidReference);
  EXPECT_THROW(files.save_shared(context, "home", "relative", std::string(128, 'a')), InvalidPath);

  ReceiveOptions dotdot;
  dotdot.name = "..";
  EXPECT_THROW(files.save_shared(context, "home", "/", std::string(128, 'a'), dotdot), InvalidPath);
  ReceiveOptions nested;
  nested.name = "a/b";
  EXPECT_THROW(files.save_shared(context, "home", "/", std::string(128, 'a'), nested), InvalidPath);
  ReceiveOptions truncated;
  truncated.name = "copy\xe2\x82";
  EXPECT_THROW(files.save_shared(context, "home", "/", std::string(128, 'a'), truncated), InvalidPath);
}

TEST_F(FileTest, ZeroDefaultBlockSizeRejected) {
  EXPECT_THROW({ File rejected(with_block_size(0)); }, InvalidBlockSize);
}

TEST_F(FileTest, AnonymousCallerCannotWrite) {
  Context anonymous = net->anonymous_context();
  EXPECT_THROW(files.upload(anonymous, "home", "/a", std::string("x")), NotAuthenticated);
  EXPECT_THROW(files.download(anonymous, "home", "/a"), NotAuthenticated);
  EXPECT_THROW(files.remove(anonymous, "home", "/a"), NotAuthenticated);
  EXPECT_THROW(files.share(anonymous, "home", "/a"), NotAuthenticated);
  EXPECT_THROW(files.share_pod(anonymous, "home"), NotAuthenticated);
  EXPECT_THROW(files.save_shared(anonymous, "home", "/", std::string(128, 'a')), NotAuthenticated);
}

TEST_F(FileTest, LoggedOutSessionIsNotAuthenticated) {
  net->account.logout();
  EXPECT_THROW(files.upload(ctx(), "home", "/a", std::string("x")), NotAuthenticated);
}

TEST_F(FileTest, UnknownPod) {
  EXPECT_THROW(files.upload(ctx(), "nowhere", "/a", std::string("x")), PodNotFound);
  EXPECT_THROW(files.download(ctx(), "nowhere", "/a"), PodNotFound);
}

//==============================================
// MISSING AND CORRUPT DATA
//==============================================

TEST_F(FileTest, UnpublishedPathIsNotFound) {
  EXPECT_THROW(files.download(ctx(), "home", "/never.txt"), NotFound);
  EXPECT_THROW(files.download_from_address(ctx(), home.address, "/never.txt"), NotFound);
  EXPECT_THROW(files.share(ctx(), "home", "/never.txt"), NotFound);
}

TEST_F(FileTest, MissingBlockIsIncomplete) {
  FileMetadata meta = files.upload(ctx(), "home", "/holes", test::make_payload(3000), with_block_size(1000));
  net->store.remove("content:" + manifest_of(meta)[1].reference);

  EXPECT_THROW(files.download(ctx(), "home", "/holes"), IncompleteBlocks);
  File concurrent(UploadOptions{}, DownloadOptions{3, nullptr});
  EXPECT_THROW(concurrent.download(ctx(), "home", "/holes"), IncompleteBlocks);
}

TEST_F(FileTest, MissingManifestIsIncomplete) {
  FileMetadata meta = files.upload(ctx(), "home", "/nomanifest", test::make_payload(10));
  net->store.remove("content:" + meta.blocks_reference);
  EXPECT_THROW(files.download(ctx(), "home", "/nomanifest"), IncompleteBlocks);
}

TEST_F(FileTest, UndecodableMetadataIsCorrupt) {
  net->feed.publish(services::topic_for_path("/junk"), utils::to_bytes("{not json"), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/junk"), CorruptMetadata);

  FileMetadata meta = files.upload(ctx(), "home", "/badref", std::string("x"));
  meta.blocks_reference = "short";
  net->feed.publish(services::topic_for_path("/badref"), encode_metadata(meta), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/badref"), CorruptMetadata);
}

TEST_F(FileTest, UnsupportedMetadataVersion) {
  FileMetadata meta = files.upload(ctx(), "home", "/future", std::string("x"));
  meta.version = 3;
  net->feed.publish(services::topic_for_path("/future"), encode_metadata(meta), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/future"), VersionError);
}

TEST_F(FileTest, InconsistentManifestIsCorrupt) {
  FileMetadata meta = files.upload(ctx(), "home", "/sized", test::make_payload(2500), with_block_size(1000));

  FileMetadata wrong_size = meta;
  wrong_size.file_size = 2600;
  net->feed.publish(services::topic_for_path("/sized"), encode_metadata(wrong_size), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/sized"), CorruptManifest);

  FileMetadata small_blocks = meta;
  small_blocks.block_size = 500;
  net->feed.publish(services::topic_for_path("/sized"), encode_metadata(small_blocks), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/sized"), CorruptManifest);

  FileMetadata not_a_manifest = meta;
  not_a_manifest.blocks_reference = net->content.put(utils::to_bytes("[1,2,3]"));
  net->feed.publish(services::topic_for_path("/sized"), encode_metadata(not_a_manifest), home.signing_key);
  EXPECT_THROW(files.download(ctx(), "home", "/sized"), CorruptManifest);
}

//==============================================
// DELETE
//==============================================

TEST_F(FileTest, RemoveHidesListingOnly) {
  files.upload(ctx(), "home", "/docs/gone.txt", std::string("still here"));
  ASSERT_TRUE(listed(home, "/docs", "gone.txt"));

  files.remove(ctx(), "home", "/docs/gone.txt");
  EXPECT_FALSE(listed(home, "/docs", "gone.txt"));

  // Blocks and feed history remain
  EXPECT_EQ(utils::to_string(files.download_from_address(net->anonymous_context(), home.address, "/docs/gone.txt")),
            "still here");
  EXPECT_NO_THROW(files.remove(ctx(), "home", "/docs/gone.txt"));
}

//==============================================
// SHARING
//==============================================

TEST_F(FileTest, ShareRoundTrip) {
  auto data = test::make_payload(4200);
  FileMetadata meta = files.upload(ctx(), "home", "/docs/shared.bin", data, with_block_size(1000));

  std::string reference = files.share(ctx(), "home", "/docs/shared.bin");
  EXPECT_TRUE(store::EncryptedReference::is_valid(reference));

  ShareInfo info = files.get_shared_info(net->anonymous_context(), reference);
  EXPECT_EQ(info.meta, meta);
  EXPECT_EQ(info.source_address, home.address);

  EXPECT_EQ(files.download_shared(net->anonymous_context(), reference), data);
}

TEST_F(FileTest, SaveSharedIntoAnotherPod) {
  auto data = test::make_payload(2100);
  FileMetadata original = files.upload(ctx(), "home", "/docs/a.txt", data, with_block_size(1000));
  std::string reference = files.share(ctx(), "home", "/docs/a.txt");

  FileMetadata saved = files.save_shared(ctx(), "other", "//inbox/", reference);
  EXPECT_EQ(saved.pod_name, "other");
  EXPECT_EQ(saved.pod_address, other.address);
  EXPECT_EQ(saved.file_path, "/inbox");
  EXPECT_EQ(saved.file_name, "a.txt");
  EXPECT_EQ(saved.blocks_reference, original.blocks_reference);
  EXPECT_EQ(saved.file_size, original.file_size);
  EXPECT_EQ(saved.block_size, original.block_size);
  EXPECT_EQ(saved.creation_time, original.creation_time);
  EXPECT_GE(saved.modification_time, original.modification_time);

  EXPECT_TRUE(listed(other, "/inbox", "a.txt"));
  EXPECT_EQ(files.download(ctx(), "other", "/inbox/a.txt"), data);
  // The source pod is untouched
  EXPECT_EQ(files.download(ctx(), "home", "/docs/a.txt"), data);
}

TEST_F(FileTest, SaveSharedUnderNewName) {
  files.upload(ctx(), "home", "/a.txt", std::string("renamed"));
  std::string reference = files.share(ctx(), "home", "/a.txt");

  ReceiveOptions options;
  options.name = "b.txt";
  FileMetadata saved = files.save_shared(ctx(), "home", "/", reference, options);

  EXPECT_EQ(saved.file_name, "b.txt");
  EXPECT_EQ(utils::to_string(files.download(ctx(), "home", "/b.txt")), "renamed");
}

TEST_F(FileTest, SaveSharedWithUnknownCapsule) {
  EXPECT_THROW(files.save_shared(ctx(), "other", "/", std::string(128, 'c')), NotFound);
  EXPECT_TRUE(net->directory.list(other.address, "/").empty());
}

TEST_F(FileTest, SharedPodGivesReadAccess) {
  files.upload(ctx(), "home", "/photos/cat.jpg", std::string("meow"));
  std::string pod_reference = files.share_pod(ctx(), "home");
  EXPECT_TRUE(store::EncryptedReference::is_valid(pod_reference));

  auto data = files.download_from_shared_pod(net->anonymous_context(), pod_reference, "/photos/cat.jpg");
  EXPECT_EQ(utils::to_string(data), "meow");
  EXPECT_THROW(files.download_from_shared_pod(net->anonymous_context(), pod_reference, "/photos/dog.jpg"),
               NotFound);
}

TEST_F(FileTest, ShareCapsuleIsFixedAtShareTime) {
  files.upload(ctx(), "home", "/changing.txt", std::string("before"));
  std::string reference = files.share(ctx(), "home", "/changing.txt");
  files.upload(ctx(), "home", "/changing.txt", std::string("after"));

  // The capsule still names the first manifest, but download follows the latest feed entry
  ShareInfo info = files.get_shared_info(ctx(), reference);
  EXPECT_EQ(info.meta.file_size, 6u);
  EXPECT_EQ(utils::to_string(files.download_shared(ctx(), reference)), "after");
}

//==============================================
// PATHS
//==============================================

TEST(PathTest, ExtractPathInfo) {
  auto info = extract_path_info("/docs/reports/q1.pdf");
  EXPECT_EQ(info.path, "/docs/reports");
  EXPECT_EQ(info.filename, "q1.pdf");

  info = extract_path_info("/q1.pdf");
  EXPECT_EQ(info.path, "/");
  EXPECT_EQ(info.filename, "q1.pdf");

  info = extract_path_info("///a//b///");
  EXPECT_EQ(info.path, "/a");
  EXPECT_EQ(info.filename, "b");
}

TEST(PathTest, RejectsInvalidPaths) {
  for (const std::string& path : {"", "a/b", "/", "//", "/a/./b", "/a/..", "../a"}) {
    EXPECT_THROW(extract_path_info(path), InvalidPath) << path;
  }
  EXPECT_THROW(normalize_directory("docs"), InvalidPath);
  EXPECT_THROW(normalize_directory("/docs/.."), InvalidPath);
  // Invalid, overlong, surrogate and truncated UTF-8
  for (const std::string& path : {"/x\xffy", "/\xc0\xaf", "/\xed\xa0\x80", "/a\xe2\x82", "/\xf4\x90\x80\x80"}) {
    EXPECT_THROW(extract_path_info(path), InvalidPath);
  }
  EXPECT_NO_THROW(extract_path_info("/\xf0\x9f\x93\x84/\xe6\x96\x87.txt"));
}

TEST(PathTest, DirectoriesAndCombine) {
  EXPECT_EQ(normalize_directory("/"), "/");
  EXPECT_EQ(normalize_directory("//docs//sub/"), "/docs/sub");
  EXPECT_EQ(combine("/", "a.txt"), "/a.txt");
  EXPECT_EQ(combine("/docs", "a.txt"), "/docs/a.txt");
}

TEST(PathTest, PodNames) {
  EXPECT_NO_THROW(assert_pod_name("home"));
  EXPECT_THROW(assert_pod_name(""), InvalidPodName);
  EXPECT_THROW(assert_pod_name("a/b"), InvalidPodName);
  EXPECT_THROW(assert_pod_name("ho\xffme"), InvalidPodName);
  EXPECT_NO_THROW(assert_pod_name("m\xc3\xbcsli"));
}

TEST(PathTest, FileNames) {
  EXPECT_NO_THROW(assert_file_name("copy.txt"));
  for (const std::string& name : {"", ".", "..", "a/b", "x\xff"}) {
    EXPECT_THROW(assert_file_name(name), InvalidPath);
  }
}
