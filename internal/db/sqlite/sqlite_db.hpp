#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace fieldsync::db::sqlite {

struct SqliteOptions {
  std::string path;

  bool wal_mode = true;

  // OFF | NORMAL | FULL | EXTRA. FULL makes every COMMIT durable on return.
  std::string synchronous = "FULL";

  uint32_t busy_timeout_ms = 5000;

  // Largest TEXT/BLOB value accepted, in bytes. 0 keeps SQLite's compiled-in limit.
  uint32_t max_value_bytes = 0;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every caller; TxMutex() serializes
  transactions on it (see SqliteTransaction).
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Thread currently inside a transaction on this connection, if any.
  std::atomic<std::thread::id>& TxOwner() {
    return tx_owner_;
  }

  // Execute a SQL string (used for pragmas/migrations). Throws util::StorageError.
  void Exec(const std::string& sql);

  // Configure PRAGMAs (journal mode, synchronous, busy timeout)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;

  std::atomic<std::thread::id> tx_owner_{};
};

} // namespace fieldsync::db::sqlite
