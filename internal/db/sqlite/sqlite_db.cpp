#include "sqlite_db.hpp"

#include <memory>
#include <stdexcept>

namespace upload::db::sqlite {

namespace {

[[noreturn]] void Fail(sqlite3* db, const char* what) {
  const char* file = db ? sqlite3_db_filename(db, "main") : nullptr;
  throw std::runtime_error(std::string(what) + " (" + (file && *file ? file : ":memory:") + "): " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) Fail(db, what);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  // sqlite hands back a handle even when open fails; it still has to be closed
  std::unique_ptr<sqlite3, int (*)(sqlite3*)> guard(db_, sqlite3_close);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
  }
  Configure();
  guard.release();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec (" + path_ + "): " + msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");

  // a checkpoint that claims a part the store never saw must not survive a power cut
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

Statement::Statement(SqliteDB& db, const std::string& sql) : db_(db.Handle()), stmt_(db.Prepare(sql)) {
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
}

void Statement::BindBlob(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), db_, "sqlite bind");
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  Fail(db_, "sqlite step");
}

std::string Statement::ColumnBlob(int col) const {
  const void* data = sqlite3_column_blob(stmt_, col);
  int         size = sqlite3_column_bytes(stmt_, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

std::string Statement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

} // namespace upload::db::sqlite
