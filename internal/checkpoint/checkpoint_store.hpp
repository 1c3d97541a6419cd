#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/checkpoint/checkpoint.hpp"

namespace upload::db::sqlite {
class SqliteDB;
}

namespace upload::checkpoint {

/*
  One checkpoint database, i.e. one (record, content, path) triple.

  The database file is created lazily by the first Save(), so a file that
  never completes a part leaves nothing behind. Not thread-safe: the planner
  touches a handle before its parts are dispatched and the completion
  coordinator after, never both at once.
*/
class CheckpointHandle {
 public:
  explicit CheckpointHandle(std::filesystem::path path);
  ~CheckpointHandle();

  CheckpointHandle(const CheckpointHandle&)            = delete;
  CheckpointHandle& operator=(const CheckpointHandle&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  bool Exists() const;

  // nullopt when no database exists or it holds no upload id.
  // Throws util::ConsistencyError when the stored record cannot be decoded.
  std::optional<Checkpoint> Load();

  // Replaces every key in a single BEGIN IMMEDIATE transaction.
  void Save(const Checkpoint& checkpoint);

  // Closes and removes the database together with its WAL and shared-memory files.
  void Delete();

 private:
  db::sqlite::SqliteDB& Database();
  void                  Close();

  std::filesystem::path                 path_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

using CheckpointHandlePtr = std::shared_ptr<CheckpointHandle>;

class CheckpointStore {
 public:
  explicit CheckpointStore(std::filesystem::path cache_dir);

  const std::filesystem::path& CacheDir() const {
    return cache_dir_;
  }

  CheckpointHandlePtr Open(const std::string& record_id, const std::string& sha256, const std::string& file_path) const;

  // hex sha256(record_id + sha256 + file_path) + ".db"
  static std::string DatabaseName(const std::string& record_id, const std::string& sha256, const std::string& file_path);

 private:
  std::filesystem::path cache_dir_;
};

} // namespace upload::checkpoint
