#include "migrations.hpp"

#include <algorithm>

namespace fieldsync::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  std::vector<Migration> ordered = migrations;
  std::sort(ordered.begin(), ordered.end(), [](const Migration& a, const Migration& b) { return a.version < b.version; });

  const int current = executor.CurrentVersion();
  int       applied = 0;
  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;
    executor.ExecuteSQL(migration.sql);
    executor.RecordVersion(migration.version);
    ++applied;
  }
  return applied;
}

const std::vector<Migration>& StoreMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "CREATE TABLE IF NOT EXISTS inspections ("
       " id TEXT PRIMARY KEY,"
       " payload TEXT NOT NULL,"
       " property_id TEXT,"
       " status INTEGER NOT NULL,"
       " retry_count INTEGER NOT NULL DEFAULT 0,"
       " created_at_ms INTEGER NOT NULL,"
       " updated_at_ms INTEGER NOT NULL,"
       " error_message TEXT);"
       "CREATE INDEX IF NOT EXISTS idx_inspections_status ON inspections(status, created_at_ms);"
       "CREATE TABLE IF NOT EXISTS photos ("
       " id TEXT PRIMARY KEY,"
       " inspection_id TEXT NOT NULL,"
       " payload BLOB NOT NULL,"
       " classification INTEGER NOT NULL,"
       " latitude REAL,"
       " longitude REAL,"
       " accuracy_m REAL,"
       " captured_at_ms INTEGER,"
       " created_at_ms INTEGER NOT NULL);"
       "CREATE INDEX IF NOT EXISTS idx_photos_inspection ON photos(inspection_id, created_at_ms);"
       "CREATE TABLE IF NOT EXISTS sync_queue ("
       " id TEXT PRIMARY KEY,"
       " entity_type INTEGER NOT NULL,"
       " reference_id TEXT NOT NULL,"
       " priority INTEGER NOT NULL,"
       " enqueued_at_ms INTEGER NOT NULL,"
       " sequence INTEGER NOT NULL);"
       "CREATE INDEX IF NOT EXISTS idx_sync_queue_priority ON sync_queue(priority, enqueued_at_ms, sequence);"},
  };
  return kMigrations;
}

} // namespace fieldsync::db::sql
