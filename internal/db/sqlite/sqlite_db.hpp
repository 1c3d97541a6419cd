#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace upload::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize, or hold it in a Statement)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, busy timeout, synchronous=FULL
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Owns one prepared statement; finalizes on scope exit.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindBlob(int idx, const std::string& value);

  // true while a row is available; throws on error
  bool Step();

  std::string  ColumnBlob(int col) const;
  std::string  ColumnText(int col) const;

  void Reset();

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_;
};

} // namespace upload::db::sqlite
