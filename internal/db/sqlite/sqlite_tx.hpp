#pragma once

#include "sqlite_db.hpp"

namespace upload::db::sqlite {

/*
  Scoped write transaction (BEGIN IMMEDIATE).

  The write lock is taken up front so a checkpoint row set is replaced as a
  unit. Leaving the scope without Commit() rolls back.
*/
class WriteTransaction {
 public:
  explicit WriteTransaction(SqliteDB& db);
  ~WriteTransaction();

  WriteTransaction(const WriteTransaction&)            = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      open_ = false;
};

} // namespace upload::db::sqlite
