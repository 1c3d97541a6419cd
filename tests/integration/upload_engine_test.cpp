#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/engine/upload_engine.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace {

using upload::checkpoint::Checkpoint;
using upload::checkpoint::CheckpointStore;
using upload::engine::EngineOptions;
using upload::engine::RunReport;
using upload::engine::UploadEngine;
using upload::model::Destination;
using upload::model::UploadStatus;
using upload::planner::UploadRequest;
using upload::storage::ByteRange;
using upload::storage::MemoryObjectStore;
using upload::storage::ObjectStore;
using upload::storage::ProgressFn;
using upload::storage::RemotePart;
using upload::storage::UploadedPart;

constexpr std::uint64_t kPartSize = 1024;
constexpr char          kBucket[] = "bucket";
constexpr char          kRecord[] = "rec-1";

/*
  Forwards to a MemoryObjectStore while recording part uploads, tracking
  concurrency, and letting a test inject failures or rewrite results.
*/
class HookedObjectStore : public ObjectStore {
 public:
  explicit HookedObjectStore(std::shared_ptr<MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  std::string InitiateMultipartUpload(const Destination& destination) override {
    return inner_->InitiateMultipartUpload(destination);
  }

  std::vector<RemotePart> ListParts(const Destination& destination, const std::string& upload_id) override {
    if (list_parts_empty) return {};
    auto parts = inner_->ListParts(destination, upload_id);
    if (rewrite_listing) rewrite_listing(parts);
    return parts;
  }

  UploadedPart UploadPart(const Destination& destination, const std::string& upload_id, int part_number, const ByteRange& body,
                          const ProgressFn& progress, const upload::util::CancellationToken& cancel) override {
    auto now_in_flight = ++in_flight_;
    auto peak          = max_in_flight_.load();
    while (now_in_flight > peak && !max_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }
    struct Leave {
      std::atomic<int>& counter;
      ~Leave() {
        --counter;
      }
    } leave{in_flight_};

    {
      std::lock_guard lock(mutex_);
      parts_.push_back(part_number);
    }
    if (part_delay.count() > 0) {
      std::this_thread::sleep_for(part_delay);
    }
    if (before_part) {
      before_part(part_number);
    }

    auto part = inner_->UploadPart(destination, upload_id, part_number, body, progress, cancel);
    if (after_part) {
      after_part(part);
    }
    return part;
  }

  void CompleteMultipartUpload(const Destination& destination, const std::string& upload_id,
                               const std::vector<UploadedPart>& ordered_parts) override {
    inner_->CompleteMultipartUpload(destination, upload_id, ordered_parts);
  }

  void PutObject(const Destination& destination, const ByteRange& body, const ProgressFn& progress,
                 const upload::util::CancellationToken& cancel) override {
    if (put_delay.count() > 0) {
      std::this_thread::sleep_for(put_delay);
    }
    inner_->PutObject(destination, body, progress, cancel);
  }

  std::set<int> UploadedParts() const {
    std::lock_guard lock(mutex_);
    return std::set<int>(parts_.begin(), parts_.end());
  }

  int MaxInFlight() const {
    return max_in_flight_.load();
  }

  std::function<void(int)>                      before_part;
  std::function<void(UploadedPart&)>            after_part;
  std::function<void(std::vector<RemotePart>&)> rewrite_listing;
  std::chrono::milliseconds                     part_delay{0};
  std::chrono::milliseconds                     put_delay{0};
  bool                                          list_parts_empty = false;

 private:
  std::shared_ptr<MemoryObjectStore> inner_;
  mutable std::mutex                 mutex_;
  std::vector<int>                   parts_;
  std::atomic<int>                   in_flight_{0};
  std::atomic<int>                   max_in_flight_{0};
};

struct Fixture {
  std::filesystem::path              root;
  std::shared_ptr<MemoryObjectStore> memory = std::make_shared<MemoryObjectStore>();
  std::shared_ptr<CheckpointStore>   checkpoints;

  explicit Fixture(const std::string& name) {
    root = std::filesystem::temp_directory_path() /
           ("upload_engine_it_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "data");
    checkpoints = std::make_shared<CheckpointStore>(root / "cache");
  }

  ~Fixture() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  std::string WriteFile(const std::string& name, std::uint64_t size) const {
    auto          path = (root / "data" / name).string();
    std::ofstream out(path, std::ios::binary);
    for (std::uint64_t i = 0; i < size; ++i) {
      out.put(static_cast<char>((i * 31 + name.size()) % 251));
    }
    return path;
  }

  static std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  static UploadRequest Request(const std::string& path, const std::string& key) {
    UploadRequest request;
    request.path       = path;
    request.upload_url = std::string("https://s3.test/") + kBucket + "/" + key + "?X-Amz-Tagging=X-COS-RECORD-ID%3D" + kRecord +
                         "%26project%3Dtest&X-Amz-Signature=sig";
    return request;
  }

  static Destination Dest(const std::string& key) {
    return Destination{kBucket, key, {{"X-COS-RECORD-ID", kRecord}, {"project", "test"}}};
  }

  upload::checkpoint::CheckpointHandlePtr Handle(const std::string& path) const {
    return checkpoints->Open(kRecord, upload::util::HashLocalFile(path).sha256, path);
  }

  // Uploads the listed parts directly and records them in a checkpoint, as an interrupted run would have.
  std::string Seed(const std::string& path, const std::string& key, const std::set<int>& parts, std::uint64_t part_size = kPartSize) {
    auto dest      = Dest(key);
    auto upload_id = memory->InitiateMultipartUpload(dest);
    auto source    = upload::storage::FileSource::Open(path);

    Checkpoint checkpoint;
    checkpoint.upload_id = upload_id;
    checkpoint.part_size = part_size;
    upload::util::CancellationToken never;
    for (int part : parts) {
      auto offset = static_cast<std::uint64_t>(part - 1) * part_size;
      auto length = std::min(part_size, source->Size() - offset);
      auto done   = memory->UploadPart(dest, upload_id, part, ByteRange{source, offset, length}, {}, never);
      checkpoint.parts.push_back(done);
      checkpoint.uploaded_bytes += done.size;
    }
    Handle(path)->Save(checkpoint);
    return upload_id;
  }

  RunReport Run(const std::shared_ptr<ObjectStore>& store, const std::vector<UploadRequest>& requests, std::size_t threads = 4,
                std::uint64_t window = 3 * kPartSize, std::function<void(UploadEngine&)> with_engine = {}) {
    EngineOptions options;
    options.threads             = threads;
    options.part_size           = kPartSize;
    options.multipart_threshold = kPartSize;
    options.window_bytes        = window;

    UploadEngine engine(options, store, checkpoints, nullptr);
    if (with_engine) with_engine(engine);
    return engine.Run(requests);
  }
};

void TestSmallFileIsSinglePut() {
  Fixture fx("single");
  auto    path  = fx.WriteFile("small.bin", 700);
  auto    store = std::make_shared<HookedObjectStore>(fx.memory);

  auto report = fx.Run(store, {Fixture::Request(path, "dir/small.bin")});

  assert(report.AllSucceeded());
  assert(report.files.size() == 1);
  assert(report.files[0].status == UploadStatus::kUploadCompleted);
  assert(report.files[0].uploaded_bytes == 700);
  assert(fx.memory->PutObjectCalls() == 1);
  assert(fx.memory->UploadPartCalls() == 0);
  assert(fx.memory->GetObject(kBucket, "dir/small.bin") == Fixture::ReadFile(path));
  assert(fx.memory->GetObjectTags(kBucket, "dir/small.bin")->at("project") == "test");
  assert(!std::filesystem::exists(fx.checkpoints->CacheDir()) || std::filesystem::is_empty(fx.checkpoints->CacheDir()));
}

void TestMultipartUploadsEveryPartOnce() {
  Fixture fx("multipart");
  auto    path  = fx.WriteFile("big.bin", 5 * kPartSize - 100);
  auto    store = std::make_shared<HookedObjectStore>(fx.memory);

  std::mutex                   sizes_mutex;
  std::map<int, std::uint64_t> sizes;
  store->after_part = [&](UploadedPart& part) {
    std::lock_guard lock(sizes_mutex);
    sizes[part.part_number] = part.size;
  };

  auto report = fx.Run(store, {Fixture::Request(path, "big.bin")});

  assert(report.AllSucceeded());
  assert((store->UploadedParts() == std::set<int>{1, 2, 3, 4, 5}));
  assert(fx.memory->UploadPartCalls() == 5);
  assert(sizes.at(1) == kPartSize);
  assert(sizes.at(5) == kPartSize - 100);
  assert(fx.memory->GetObject(kBucket, "big.bin") == Fixture::ReadFile(path));
  assert(fx.memory->GetObjectTags(kBucket, "big.bin")->at("X-COS-RECORD-ID") == kRecord);
  assert(!fx.Handle(path)->Exists() && "checkpoint is removed after completion");
}

void TestResumeUploadsOnlyMissingParts() {
  Fixture fx("resume");
  auto    path      = fx.WriteFile("resume.bin", 5 * kPartSize);
  auto    upload_id = fx.Seed(path, "resume.bin", {1, 2, 3});
  auto    store     = std::make_shared<HookedObjectStore>(fx.memory);

  auto report = fx.Run(store, {Fixture::Request(path, "resume.bin")});

  assert(report.AllSucceeded());
  assert((store->UploadedParts() == std::set<int>{4, 5}));
  assert(fx.memory->InitiateCalls() == 1 && "the recorded upload is reused");
  assert(!fx.memory->HasUpload(upload_id));
  assert(fx.memory->GetObject(kBucket, "resume.bin") == Fixture::ReadFile(path));
  assert(!fx.Handle(path)->Exists());
}

void TestExpiredUploadStartsOver() {
  Fixture fx("expired");
  auto    path      = fx.WriteFile("expired.bin", 4 * kPartSize);
  auto    upload_id = fx.Seed(path, "expired.bin", {1, 2});
  fx.memory->ExpireUpload(upload_id);
  auto store = std::make_shared<HookedObjectStore>(fx.memory);

  auto report = fx.Run(store, {Fixture::Request(path, "expired.bin")});

  assert(report.AllSucceeded());
  assert(fx.memory->InitiateCalls() == 2);
  assert((store->UploadedParts() == std::set<int>{1, 2, 3, 4}));
  assert(fx.memory->GetObject(kBucket, "expired.bin") == Fixture::ReadFile(path));
}

void TestEmptyPartListingStartsOver() {
  Fixture fx("empty_listing");
  auto    path = fx.WriteFile("empty.bin", 3 * kPartSize);
  fx.Seed(path, "empty.bin", {1});
  auto store              = std::make_shared<HookedObjectStore>(fx.memory);
  store->list_parts_empty = true;

  auto report = fx.Run(store, {Fixture::Request(path, "empty.bin")});

  assert(report.AllSucceeded());
  assert(fx.memory->InitiateCalls() == 2);
  assert((store->UploadedParts() == std::set<int>{1, 2, 3}));
}

void TestChangedPartSizeDiscardsCheckpoint() {
  Fixture fx("part_size_change");
  auto    path = fx.WriteFile("resized.bin", 6 * kPartSize);
  fx.Seed(path, "resized.bin", {1}, 2 * kPartSize);
  auto store = std::make_shared<HookedObjectStore>(fx.memory);

  auto report = fx.Run(store, {Fixture::Request(path, "resized.bin")});

  assert(report.AllSucceeded());
  assert(fx.memory->InitiateCalls() == 2);
  assert((store->UploadedParts() == std::set<int>{1, 2, 3, 4, 5, 6}));
  assert(fx.memory->GetObject(kBucket, "resized.bin") == Fixture::ReadFile(path));
}

void TestPreviouslyUploadedFileIsSkipped() {
  Fixture fx("skip");
  auto    path  = fx.WriteFile("skip.bin", 4 * kPartSize);
  auto    store = std::make_shared<HookedObjectStore>(fx.memory);

  auto request   = Fixture::Request(path, "skip.bin");
  request.remote = upload::util::HashLocalFile(path);

  auto report = fx.Run(store, {request});

  assert(report.AllSucceeded());
  assert(report.files[0].status == UploadStatus::kPreviouslyUploaded);
  assert(fx.memory->PutObjectCalls() == 0);
  assert(fx.memory->InitiateCalls() == 0);
  assert(!fx.memory->GetObject(kBucket, "skip.bin").has_value());
}

void TestFailedPartKeepsCheckpointForNextRun() {
  Fixture fx("fail_then_resume");
  auto    path = fx.WriteFile("flaky.bin", 5 * kPartSize);

  auto first         = std::make_shared<HookedObjectStore>(fx.memory);
  first->before_part = [](int part) {
    if (part == 3) throw upload::util::TransportError("InternalError: injected");
  };

  auto failed = fx.Run(first, {Fixture::Request(path, "flaky.bin")}, 1);

  assert(failed.Failed() == 1);
  assert(failed.files[0].error.find("injected") != std::string::npos);
  assert(failed.FailureReport().find("Upload " + path + " failed with: \n") != std::string::npos);
  auto checkpoint = fx.Handle(path)->Load();
  assert(checkpoint.has_value());
  assert((checkpoint->PartNumbers() == std::set<int>{1, 2}));
  assert(checkpoint->uploaded_bytes == 2 * kPartSize);

  auto second = std::make_shared<HookedObjectStore>(fx.memory);
  auto report = fx.Run(second, {Fixture::Request(path, "flaky.bin")});

  assert(report.AllSucceeded());
  assert((second->UploadedParts() == std::set<int>{3, 4, 5}));
  assert(fx.memory->InitiateCalls() == 1);
  assert(fx.memory->GetObject(kBucket, "flaky.bin") == Fixture::ReadFile(path));
  assert(!fx.Handle(path)->Exists());
}

void TestSizeMismatchFailsAndKeepsCheckpoint() {
  Fixture fx("size_mismatch");
  auto    path      = fx.WriteFile("short.bin", 3 * kPartSize);
  auto    store     = std::make_shared<HookedObjectStore>(fx.memory);
  store->after_part = [](UploadedPart& part) {
    if (part.part_number == 2) part.size -= 1;
  };

  auto report = fx.Run(store, {Fixture::Request(path, "short.bin")});

  assert(report.Failed() == 1);
  assert(report.files[0].error == "Uploaded size: 3071, file size: 3072, does not match");
  assert(fx.Handle(path)->Exists());
  assert(!fx.memory->GetObject(kBucket, "short.bin").has_value());
}

void TestInFlightPartsStayWithinWindow() {
  Fixture fx("window");
  auto    path      = fx.WriteFile("window.bin", 12 * kPartSize);
  auto    store     = std::make_shared<HookedObjectStore>(fx.memory);
  store->part_delay = std::chrono::milliseconds(5);

  auto report = fx.Run(store, {Fixture::Request(path, "window.bin")}, 8, 3 * kPartSize);

  assert(report.AllSucceeded());
  assert(store->MaxInFlight() >= 1);
  assert(store->MaxInFlight() <= 3);
  assert(fx.memory->GetObject(kBucket, "window.bin") == Fixture::ReadFile(path));
}

void TestFailuresAreIsolatedPerFile() {
  Fixture fx("isolation");
  auto    good  = fx.WriteFile("good.bin", 2 * kPartSize + 1);
  auto    small = fx.WriteFile("small.bin", 10);
  auto    store = std::make_shared<HookedObjectStore>(fx.memory);

  auto missing       = (fx.root / "data" / "missing.bin").string();
  auto bad_url       = Fixture::Request(small, "unused");
  bad_url.upload_url = "not-a-url";

  auto report = fx.Run(store, {Fixture::Request(missing, "missing.bin"), Fixture::Request(good, "good.bin"), bad_url});

  assert(report.files.size() == 3);
  assert(report.files[0].path == missing);
  assert(report.files[0].status == UploadStatus::kUploadFailed);
  assert(report.files[1].status == UploadStatus::kUploadCompleted);
  assert(report.files[2].status == UploadStatus::kUploadFailed);
  assert(report.Failed() == 2);
  assert(fx.memory->GetObject(kBucket, "good.bin") == Fixture::ReadFile(good));
}

void TestCancellationFailsFilesAndKeepsCheckpoint() {
  Fixture fx("cancel");
  auto    path  = fx.WriteFile("cancel.bin", 6 * kPartSize);
  auto    store = std::make_shared<HookedObjectStore>(fx.memory);

  UploadEngine* running = nullptr;
  store->before_part    = [&running](int part) {
    if (part == 3) running->Cancel();
  };

  auto report = fx.Run(store, {Fixture::Request(path, "cancel.bin")}, 1, 3 * kPartSize,
                       [&running](UploadEngine& engine) { running = &engine; });

  assert(report.Failed() == 1);
  assert(report.files[0].error == upload::util::Cancelled().what());
  auto checkpoint = fx.Handle(path)->Load();
  assert(checkpoint.has_value());
  assert((checkpoint->PartNumbers() == std::set<int>{1, 2}));
  assert(!fx.memory->GetObject(kBucket, "cancel.bin").has_value());

  auto resumed = std::make_shared<HookedObjectStore>(fx.memory);
  auto again   = fx.Run(resumed, {Fixture::Request(path, "cancel.bin")});
  assert(again.AllSucceeded());
  assert(resumed->UploadedParts().count(1) == 0);
  assert(resumed->UploadedParts().count(2) == 0);
  assert(fx.memory->GetObject(kBucket, "cancel.bin") == Fixture::ReadFile(path));
}

void TestListingMissingRecordedPartStartsOver() {
  Fixture fx("listing_gap");
  auto    path      = fx.WriteFile("gap.bin", 4 * kPartSize);
  fx.Seed(path, "gap.bin", {1, 2});
  auto store             = std::make_shared<HookedObjectStore>(fx.memory);
  store->rewrite_listing = [](std::vector<RemotePart>& parts) {
    parts.erase(std::remove_if(parts.begin(), parts.end(), [](const RemotePart& part) { return part.part_number == 2; }), parts.end());
  };

  auto report = fx.Run(store, {Fixture::Request(path, "gap.bin")});

  assert(report.AllSucceeded());
  assert(fx.memory->InitiateCalls() == 2);
  assert((store->UploadedParts() == std::set<int>{1, 2, 3, 4}));
  assert(fx.memory->GetObject(kBucket, "gap.bin") == Fixture::ReadFile(path));
  assert(!fx.Handle(path)->Exists());
}

void TestListingWithDifferentEtagStartsOver() {
  Fixture fx("listing_etag");
  auto    path = fx.WriteFile("etag.bin", 3 * kPartSize);
  fx.Seed(path, "etag.bin", {1, 2});
  auto store             = std::make_shared<HookedObjectStore>(fx.memory);
  store->rewrite_listing = [](std::vector<RemotePart>& parts) {
    for (auto& part : parts) {
      if (part.part_number == 1) part.etag = "\"0123456789abcdef0123456789abcdef\"";
    }
  };

  auto report = fx.Run(store, {Fixture::Request(path, "etag.bin")});

  assert(report.AllSucceeded());
  assert(fx.memory->InitiateCalls() == 2);
  assert((store->UploadedParts() == std::set<int>{1, 2, 3}));
  assert(fx.memory->GetObject(kBucket, "etag.bin") == Fixture::ReadFile(path));
}

void TestFailedFileDropsItsQueuedParts() {
  Fixture fx("drop_queued");
  auto    path       = fx.WriteFile("drop.bin", 8 * kPartSize);
  auto    store      = std::make_shared<HookedObjectStore>(fx.memory);
  store->before_part = [](int part) {
    if (part == 1) throw upload::util::TransportError("InternalError: injected");
    if (part == 2) std::this_thread::sleep_for(std::chrono::milliseconds(200));
  };

  auto report = fx.Run(store, {Fixture::Request(path, "drop.bin")}, 1, 3 * kPartSize);

  assert(report.Failed() == 1);
  assert(report.files[0].error.find("injected") != std::string::npos);
  auto attempted = store->UploadedParts();
  assert(attempted.count(1) == 1);
  assert(attempted.count(3) == 0 && "queued parts of a failed file never reach the store");
  assert(*attempted.rbegin() <= 2);
}

// Many small files with a low descriptor limit; sources are only open while a file is active.
void TestManyFilesStayWithinDescriptorLimit() {
  constexpr int    kFiles = 600;
  constexpr rlim_t kLimit = 128;

  Fixture                    fx("many_files");
  std::vector<UploadRequest> requests;
  requests.reserve(kFiles);
  for (int i = 0; i < kFiles; ++i) {
    auto name     = "f" + std::to_string(i) + ".bin";
    auto path     = fx.WriteFile(name, 100 + i % 50);
    auto request  = Fixture::Request(path, name);
    request.local = upload::util::HashLocalFile(path);
    requests.push_back(std::move(request));
  }
  auto store       = std::make_shared<HookedObjectStore>(fx.memory);
  store->put_delay = std::chrono::milliseconds(2);

  rlimit previous{};
  int    rc = getrlimit(RLIMIT_NOFILE, &previous);
  assert(rc == 0);
  rlimit lowered = previous;
  if (lowered.rlim_cur == RLIM_INFINITY || lowered.rlim_cur > kLimit) lowered.rlim_cur = kLimit;
  rc = setrlimit(RLIMIT_NOFILE, &lowered);
  assert(rc == 0);

  auto report = fx.Run(store, requests, 4);

  rc = setrlimit(RLIMIT_NOFILE, &previous);
  assert(rc == 0);
  (void)rc;

  assert(report.files.size() == static_cast<std::size_t>(kFiles));
  assert(report.AllSucceeded());
  assert(fx.memory->PutObjectCalls() == static_cast<std::uint64_t>(kFiles));
  assert(fx.memory->GetObject(kBucket, "f599.bin") == Fixture::ReadFile(requests.back().path));
}

} // namespace

int main() {
  TestSmallFileIsSinglePut();
  TestMultipartUploadsEveryPartOnce();
  TestResumeUploadsOnlyMissingParts();
  TestExpiredUploadStartsOver();
  TestEmptyPartListingStartsOver();
  TestChangedPartSizeDiscardsCheckpoint();
  TestPreviouslyUploadedFileIsSkipped();
  TestFailedPartKeepsCheckpointForNextRun();
  TestSizeMismatchFailsAndKeepsCheckpoint();
  TestInFlightPartsStayWithinWindow();
  TestFailuresAreIsolatedPerFile();
  TestCancellationFailsFilesAndKeepsCheckpoint();
  TestListingMissingRecordedPartStartsOver();
  TestListingWithDifferentEtagStartsOver();
  TestFailedFileDropsItsQueuedParts();
  TestManyFilesStayWithinDescriptorLimit();

  std::cout << "upload_engine_integration_upload_engine: pass\n";
  return 0;
}
