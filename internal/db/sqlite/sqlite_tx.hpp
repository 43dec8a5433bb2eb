#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fieldsync::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction lock until Commit/Rollback, and uses
  BEGIN IMMEDIATE to grab the file write lock early. A read-modify-write
  inside one SqliteTransaction is therefore atomic with respect to every
  other caller of the same store.

  Transactions do not nest: a second Begin on the thread that already holds
  one throws util::InvalidState.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void Release();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
