#include "checkpoint_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <map>
#include <system_error>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "upload/v1/checkpoint.pb.h"

namespace upload::checkpoint {
namespace {

constexpr char kSchema[] = "CREATE TABLE IF NOT EXISTS multipart_uploads(key TEXT PRIMARY KEY, value BLOB NOT NULL);";

constexpr char kUploadIdKey[]     = "upload_id";
constexpr char kUploadedSizeKey[] = "uploaded_size";
constexpr char kPartsKey[]        = "parts";
constexpr char kPartSizeKey[]     = "part_size";

std::string EncodeParts(const std::vector<storage::UploadedPart>& parts) {
  upload::v1::CompletedPartList list;
  for (const auto& part : parts) {
    auto* out = list.add_parts();
    out->set_part_number(part.part_number);
    out->set_etag(part.etag);
    out->set_size(part.size);
    auto* checksums = out->mutable_checksums();
    checksums->set_crc32(part.checksums.crc32);
    checksums->set_crc32c(part.checksums.crc32c);
    checksums->set_sha1(part.checksums.sha1);
    checksums->set_sha256(part.checksums.sha256);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode checkpoint parts: " + std::string(status.message()));
  }
  return json;
}

std::vector<storage::UploadedPart> DecodeParts(const std::string& json) {
  upload::v1::CompletedPartList list;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &list, options);
  if (!status.ok()) {
    throw util::ConsistencyError("corrupt checkpoint parts: " + std::string(status.message()));
  }

  std::vector<storage::UploadedPart> parts;
  parts.reserve(list.parts_size());
  for (const auto& in : list.parts()) {
    storage::UploadedPart part;
    part.part_number      = in.part_number();
    part.etag             = in.etag();
    part.size             = in.size();
    part.checksums.crc32  = in.checksums().crc32();
    part.checksums.crc32c = in.checksums().crc32c();
    part.checksums.sha1   = in.checksums().sha1();
    part.checksums.sha256 = in.checksums().sha256();
    parts.push_back(std::move(part));
  }
  return parts;
}

std::uint64_t DecodeUnsigned(const std::string& key, const std::string& value) {
  std::uint64_t out = 0;
  auto [ptr, ec]    = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw util::ConsistencyError("corrupt checkpoint value for " + key + ": '" + value + "'");
  }
  return out;
}

} // namespace

CheckpointHandle::CheckpointHandle(std::filesystem::path path) : path_(std::move(path)) {
}

CheckpointHandle::~CheckpointHandle() = default;

bool CheckpointHandle::Exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

db::sqlite::SqliteDB& CheckpointHandle::Database() {
  if (!db_) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("create checkpoint directory " + path_.parent_path().string() + ": " + ec.message());
    }
    db_ = std::make_shared<db::sqlite::SqliteDB>(path_.string());
    db_->Exec(kSchema);
  }
  return *db_;
}

void CheckpointHandle::Close() {
  db_.reset();
}

std::optional<Checkpoint> CheckpointHandle::Load() {
  if (!db_ && !Exists()) {
    return std::nullopt;
  }

  std::map<std::string, std::string> values;
  {
    db::sqlite::Statement select(Database(), "SELECT key, value FROM multipart_uploads;");
    while (select.Step()) {
      values[select.ColumnText(0)] = select.ColumnBlob(1);
    }
  }

  auto upload_id = values.find(kUploadIdKey);
  if (upload_id == values.end() || upload_id->second.empty()) {
    return std::nullopt;
  }

  Checkpoint checkpoint;
  checkpoint.upload_id = upload_id->second;
  if (auto it = values.find(kUploadedSizeKey); it != values.end()) {
    checkpoint.uploaded_bytes = DecodeUnsigned(kUploadedSizeKey, it->second);
  }
  if (auto it = values.find(kPartSizeKey); it != values.end()) {
    checkpoint.part_size = DecodeUnsigned(kPartSizeKey, it->second);
  }
  if (auto it = values.find(kPartsKey); it != values.end()) {
    checkpoint.parts = DecodeParts(it->second);
  }

  std::uint64_t sum = 0;
  for (const auto& part : checkpoint.parts) {
    sum += part.size;
  }
  if (sum != checkpoint.uploaded_bytes) {
    throw util::ConsistencyError("checkpoint " + path_.string() + " records " + std::to_string(checkpoint.uploaded_bytes) +
                                 " uploaded bytes but its parts sum to " + std::to_string(sum));
  }

  return checkpoint;
}

void CheckpointHandle::Save(const Checkpoint& checkpoint) {
  auto& database = Database();
  auto  parts    = EncodeParts(checkpoint.parts);

  db::sqlite::WriteTransaction tx(database);
  {
    db::sqlite::Statement upsert(database, "INSERT OR REPLACE INTO multipart_uploads(key, value) VALUES(?, ?);");
    auto                  put = [&](const char* key, const std::string& value) {
      upsert.BindText(1, key);
      upsert.BindBlob(2, value);
      upsert.Step();
      upsert.Reset();
    };

    put(kUploadIdKey, checkpoint.upload_id);
    put(kUploadedSizeKey, std::to_string(checkpoint.uploaded_bytes));
    put(kPartsKey, parts);
    put(kPartSizeKey, std::to_string(checkpoint.part_size));
  }
  tx.Commit();
}

void CheckpointHandle::Delete() {
  Close();

  for (const auto& suffix : {"", "-wal", "-shm", "-journal"}) {
    auto            file = path_.string() + suffix;
    std::error_code ec;
    std::filesystem::remove(file, ec);
    if (ec) {
      UPLOAD_LOG_WARN("checkpoint cleanup failed", {observability::StringField("path", file), observability::StringField("error", ec.message())});
    }
  }
}

CheckpointStore::CheckpointStore(std::filesystem::path cache_dir) : cache_dir_(std::move(cache_dir)) {
}

std::string CheckpointStore::DatabaseName(const std::string& record_id, const std::string& sha256, const std::string& file_path) {
  return util::Sha256Hex(record_id + sha256 + file_path) + ".db";
}

CheckpointHandlePtr CheckpointStore::Open(const std::string& record_id, const std::string& sha256, const std::string& file_path) const {
  return std::make_shared<CheckpointHandle>(cache_dir_ / DatabaseName(record_id, sha256, file_path));
}

} // namespace upload::checkpoint
