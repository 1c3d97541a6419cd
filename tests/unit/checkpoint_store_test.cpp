#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace {

using upload::checkpoint::Checkpoint;
using upload::checkpoint::CheckpointStore;

std::filesystem::path FreshCacheDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() /
             ("upload_engine_checkpoint_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::remove_all(dir);
  return dir;
}

upload::storage::UploadedPart Part(int number, std::uint64_t size) {
  upload::storage::UploadedPart part;
  part.part_number      = number;
  part.etag             = "\"etag-" + std::to_string(number) + "\"";
  part.size             = size;
  part.checksums.sha256 = "sha-" + std::to_string(number);
  return part;
}

void TestDatabaseNameIsStablePerTriple() {
  auto a = CheckpointStore::DatabaseName("rec", "abc", "/data/x");
  assert(a == CheckpointStore::DatabaseName("rec", "abc", "/data/x"));
  assert(a != CheckpointStore::DatabaseName("rec", "abc", "/data/y"));
  assert(a != CheckpointStore::DatabaseName("rec2", "abc", "/data/x"));
  assert(a.size() == 64 + 3);
  assert(a.substr(64) == ".db");
}

void TestNothingIsCreatedUntilSave() {
  auto            dir = FreshCacheDir("lazy");
  CheckpointStore store(dir);
  auto            handle = store.Open("rec", "abc", "/data/x");

  assert(!handle->Load().has_value());
  assert(!handle->Exists());
  assert(!std::filesystem::exists(dir));

  std::filesystem::remove_all(dir);
}

void TestSaveLoadDelete() {
  auto            dir = FreshCacheDir("roundtrip");
  CheckpointStore store(dir);

  Checkpoint checkpoint;
  checkpoint.upload_id = "upload-7";
  checkpoint.part_size = 1024;
  checkpoint.parts     = {Part(2, 1024), Part(1, 1024)};
  checkpoint.uploaded_bytes = 2048;

  {
    auto handle = store.Open("rec", "abc", "/data/x");
    handle->Save(checkpoint);
    assert(handle->Exists());

    checkpoint.parts.push_back(Part(3, 100));
    checkpoint.uploaded_bytes += 100;
    handle->Save(checkpoint);
  }

  // a fresh handle sees exactly what the last save committed
  auto handle = store.Open("rec", "abc", "/data/x");
  auto loaded = handle->Load();
  assert(loaded.has_value());
  assert(loaded->upload_id == "upload-7");
  assert(loaded->part_size == 1024);
  assert(loaded->uploaded_bytes == 2148);
  assert(loaded->parts.size() == 3);
  assert(loaded->parts[0].part_number == 2 && "completion order is preserved");
  assert(loaded->parts[2].etag == "\"etag-3\"");
  assert(loaded->parts[2].checksums.sha256 == "sha-3");
  assert((loaded->PartNumbers() == std::set<int>{1, 2, 3}));

  handle->Delete();
  assert(!handle->Exists());
  assert(!std::filesystem::exists(handle->Path().string() + "-wal"));
  assert(!handle->Load().has_value());

  std::filesystem::remove_all(dir);
}

void TestInconsistentTotalsAreReported() {
  auto            dir = FreshCacheDir("corrupt");
  CheckpointStore store(dir);
  auto            path = store.Open("rec", "abc", "/data/x")->Path();

  {
    Checkpoint checkpoint;
    checkpoint.upload_id      = "upload-1";
    checkpoint.part_size      = 10;
    checkpoint.parts          = {Part(1, 10)};
    checkpoint.uploaded_bytes = 10;
    store.Open("rec", "abc", "/data/x")->Save(checkpoint);
  }
  {
    upload::db::sqlite::SqliteDB db(path.string());
    db.Exec("UPDATE multipart_uploads SET value = '11' WHERE key = 'uploaded_size';");
  }

  bool threw = false;
  try {
    (void)store.Open("rec", "abc", "/data/x")->Load();
  } catch (const upload::util::ConsistencyError&) {
    threw = true;
  }
  assert(threw && "uploaded size must equal the sum of part sizes");

  {
    upload::db::sqlite::SqliteDB db(path.string());
    db.Exec("UPDATE multipart_uploads SET value = 'not json' WHERE key = 'parts';");
  }
  threw = false;
  try {
    (void)store.Open("rec", "abc", "/data/x")->Load();
  } catch (const upload::util::ConsistencyError&) {
    threw = true;
  }
  assert(threw && "undecodable parts must be reported");

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestDatabaseNameIsStablePerTriple();
  TestNothingIsCreatedUntilSave();
  TestSaveLoadDelete();
  TestInconsistentTotalsAreReported();

  std::cout << "upload_engine_unit_checkpoint_store: pass\n";
  return 0;
}
