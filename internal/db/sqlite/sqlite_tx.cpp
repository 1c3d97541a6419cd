#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace upload::db::sqlite {

WriteTransaction::WriteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

WriteTransaction::~WriteTransaction() {
  if (!open_) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("checkpoint rollback failed", {observability::StringField("db", db_.Path()), observability::StringField("error", e.what())});
  }
}

void WriteTransaction::Commit() {
  db_.Exec("COMMIT;");
  open_ = false;
}

} // namespace upload::db::sqlite
