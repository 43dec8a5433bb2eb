#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex(), std::defer_lock) {
  if (db_->TxOwner().load() == std::this_thread::get_id()) {
    throw util::InvalidState("nested transaction on sqlite connection " + db_->Path());
  }

  lock_.lock();
  db_->TxOwner().store(std::this_thread::get_id());
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (...) {
    Release();
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    FIELDSYNC_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
  Release();
}

void SqliteTransaction::Release() {
  finished_ = true;
  db_->TxOwner().store(std::thread::id{});
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  // on failure the transaction stays open; the destructor rolls it back
  db_->Exec("COMMIT;");
  committed_ = true;
  Release();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (...) {
    Release();
    throw;
  }
  Release();
}

} // namespace fieldsync::db::sqlite
