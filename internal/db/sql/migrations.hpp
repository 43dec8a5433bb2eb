#pragma once

#include <string>
#include <vector>

namespace fieldsync::db::sql {

struct Migration {
  int         version = 0;
  std::string sql;
};

/*
  Backend-specific migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping;
  RunMigrations() only decides which steps are still missing.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 for a fresh database.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

// Applies every migration newer than CurrentVersion(), in version order.
// Returns the number of steps applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

// Schema history of the local store.
const std::vector<Migration>& StoreMigrations();

} // namespace fieldsync::db::sql
