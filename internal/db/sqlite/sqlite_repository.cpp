#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstddef>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fieldsync::db::sqlite {

using fieldsync::db::ErrorCode;
using fieldsync::db::Result;

namespace {

// Owns one prepared statement; finalized on every exit path.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  bool ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

// Explicit length: payloads are opaque and may carry NUL bytes.
int BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  return sqlite3_bind_text64(st, idx, s.data(), static_cast<sqlite3_uint64>(s.size()), SQLITE_TRANSIENT, SQLITE_UTF8);
}

int BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) return BindText(st, idx, *s);
  return sqlite3_bind_null(st, idx);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

// SQLITE_TOOBIG when the value exceeds the connection's length limit.
int BindBlob(sqlite3_stmt* st, int idx, const std::vector<uint8_t>& bytes) {
  // a zero-length blob would otherwise bind as NULL
  if (bytes.empty()) return sqlite3_bind_zeroblob(st, idx, 0);
  return sqlite3_bind_blob64(st, idx, bytes.data(), static_cast<sqlite3_uint64>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  if (!t) return {};
  return std::string(t, static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::vector<uint8_t> ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::vector<uint8_t>(data, data + size);
}

[[noreturn]] void ThrowStorage(sqlite3* db, const char* what) {
  throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
}

model::InspectionRecord ReadInspection(sqlite3_stmt* st) {
  model::InspectionRecord r;
  r.id            = ColText(st, 0);
  r.payload       = ColText(st, 1);
  r.property_id   = ColOptText(st, 2);
  r.status        = static_cast<fieldsync::model::InspectionStatus>(ColI32(st, 3));
  r.retry_count   = static_cast<uint32_t>(ColI32(st, 4));
  r.created_at_ms = ColU64(st, 5);
  r.updated_at_ms = ColU64(st, 6);
  r.error_message = ColOptText(st, 7);
  return r;
}

model::PhotoRecord ReadPhoto(sqlite3_stmt* st) {
  model::PhotoRecord r;
  r.id             = ColText(st, 0);
  r.inspection_id  = ColText(st, 1);
  r.binary_payload = ColBlob(st, 2);
  r.classification = static_cast<fieldsync::model::PhotoClassification>(ColI32(st, 3));
  if (sqlite3_column_type(st, 4) != SQLITE_NULL) {
    model::GeoTag tag;
    tag.latitude       = sqlite3_column_double(st, 4);
    tag.longitude      = sqlite3_column_double(st, 5);
    tag.accuracy_m     = sqlite3_column_double(st, 6);
    tag.captured_at_ms = ColU64(st, 7);
    r.geo_tag          = tag;
  }
  r.created_at_ms = ColU64(st, 8);
  return r;
}

model::QueueEntryRecord ReadQueueEntry(sqlite3_stmt* st) {
  model::QueueEntryRecord r;
  r.id             = ColText(st, 0);
  r.entity_type    = static_cast<fieldsync::model::EntityType>(ColI32(st, 1));
  r.reference_id   = ColText(st, 2);
  r.priority       = ColI32(st, 3);
  r.enqueued_at_ms = ColU64(st, 4);
  r.sequence       = ColU64(st, 5);
  return r;
}

uint64_t CountRows(sqlite3* db, const char* sql) {
  Statement st(db, sql);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");
  if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowStorage(db, "sqlite count");
  return ColU64(st.get(), 0);
}

/*
  Applies StoreMigrations() and tracks versions in schema_migrations.
  Runs inside the caller's BEGIN IMMEDIATE so a partial schema is never committed.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    db_.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
    return static_cast<int>(CountRows(db_.Handle(), "SELECT COALESCE(MAX(version),0) FROM schema_migrations;"));
  }

  void RecordVersion(int version) override {
    Statement st(db_.Handle(), "INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);");
    if (!st.ok()) ThrowStorage(db_.Handle(), "sqlite prepare");
    BindI32(st.get(), 1, version);
    BindU64(st.get(), 2, util::ToUnixMillis(util::Now()));
    if (sqlite3_step(st.get()) != SQLITE_DONE) ThrowStorage(db_.Handle(), "record migration");
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(SqliteOptions options)
    : options_(std::move(options)) {}

void SqliteRepository::Open() {
  std::lock_guard lock(open_mutex_);
  if (db_) return;

  auto db = std::make_shared<SqliteDB>(options_);
  {
    SqliteTransaction tx(db);
    SqliteMigrationExecutor executor(*db);
    const int applied = sql::RunMigrations(executor, sql::StoreMigrations());
    tx.Commit();
    if (applied > 0) {
      FIELDSYNC_LOG_INFO("sqlite schema migrated",
                         {observability::StringField("path", options_.path), observability::IntField("steps", applied)});
    }
  }

  db_ = std::move(db);
  FIELDSYNC_LOG_INFO("sqlite store opened", {observability::StringField("path", options_.path)});
}

void SqliteRepository::Close() {
  std::lock_guard lock(open_mutex_);
  if (!db_) return;
  // in-flight transactions keep the connection alive until they finish
  db_.reset();
  FIELDSYNC_LOG_INFO("sqlite store closed", {observability::StringField("path", options_.path)});
}

bool SqliteRepository::IsOpen() const {
  std::lock_guard lock(open_mutex_);
  return db_ != nullptr;
}

std::shared_ptr<SqliteDB> SqliteRepository::Db() const {
  std::lock_guard lock(open_mutex_);
  if (!db_) throw util::StorageError("sqlite store is not open: " + options_.path);
  return db_;
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(Db());
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_FULL:
    case SQLITE_TOOBIG:
      return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Inspections
// ------------------------------------------------------------------

Result SqliteRepository::PutInspection(Transaction& t, const model::InspectionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_INSPECTION);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  if (const int rc = BindText(st.get(), 2, r.payload); rc != SQLITE_OK) return Translate(db, rc);
  BindOptText(st.get(), 3, r.property_id);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindI32(st.get(), 5, static_cast<int>(r.retry_count));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.updated_at_ms);
  if (const int rc = BindOptText(st.get(), 8, r.error_message); rc != SQLITE_OK) return Translate(db, rc);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::InspectionRecord>
SqliteRepository::GetInspection(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_INSPECTION);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStorage(db, "get inspection");
  return ReadInspection(st.get());
}

std::vector<model::InspectionRecord>
SqliteRepository::ListInspectionsByStatus(Transaction& t, fieldsync::model::InspectionStatus status) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_INSPECTIONS_BY_STATUS);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  BindI32(st.get(), 1, static_cast<int>(status));

  std::vector<model::InspectionRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadInspection(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowStorage(db, "list inspections");
  return out;
}

Result SqliteRepository::DeleteInspection(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_INSPECTION);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountInspections(Transaction& t) {
  return CountRows(TX(t).Handle(), sql::COUNT_INSPECTIONS);
}

Result SqliteRepository::ClearInspections(Transaction& t) {
  auto* db = TX(t).Handle();
  return Translate(db, sqlite3_exec(db, sql::CLEAR_INSPECTIONS, nullptr, nullptr, nullptr));
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result SqliteRepository::PutPhoto(Transaction& t, const model::PhotoRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_PHOTO);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.inspection_id);
  if (const int rc = BindBlob(st.get(), 3, r.binary_payload); rc != SQLITE_OK) return Translate(db, rc);
  BindI32(st.get(), 4, static_cast<int>(r.classification));
  if (r.geo_tag) {
    sqlite3_bind_double(st.get(), 5, r.geo_tag->latitude);
    sqlite3_bind_double(st.get(), 6, r.geo_tag->longitude);
    sqlite3_bind_double(st.get(), 7, r.geo_tag->accuracy_m);
    BindU64(st.get(), 8, r.geo_tag->captured_at_ms);
  } else {
    for (int idx = 5; idx <= 8; ++idx) sqlite3_bind_null(st.get(), idx);
  }
  BindU64(st.get(), 9, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PhotoRecord>
SqliteRepository::GetPhoto(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_PHOTO);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStorage(db, "get photo");
  return ReadPhoto(st.get());
}

std::vector<model::PhotoRecord>
SqliteRepository::ListPhotosByInspection(Transaction& t, const std::string& inspection_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_PHOTOS_BY_INSPECTION);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  BindText(st.get(), 1, inspection_id);

  std::vector<model::PhotoRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadPhoto(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowStorage(db, "list photos");
  return out;
}

Result SqliteRepository::DeletePhoto(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_PHOTO);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountPhotos(Transaction& t) {
  return CountRows(TX(t).Handle(), sql::COUNT_PHOTOS);
}

Result SqliteRepository::ClearPhotos(Transaction& t) {
  auto* db = TX(t).Handle();
  return Translate(db, sqlite3_exec(db, sql::CLEAR_PHOTOS, nullptr, nullptr, nullptr));
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertQueueEntry(Transaction& t, model::QueueEntryRecord& entry) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_QUEUE_ENTRY);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, entry.id);
  BindI32(st.get(), 2, static_cast<int>(entry.entity_type));
  BindText(st.get(), 3, entry.reference_id);
  BindI32(st.get(), 4, entry.priority);
  BindU64(st.get(), 5, entry.enqueued_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    entry.sequence = ColU64(st.get(), 0);
    return Result::Ok();
  }
  // DO NOTHING path: no row returned
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::AlreadyExists, entry.id);
  return Translate(db, rc);
}

std::optional<model::QueueEntryRecord>
SqliteRepository::GetQueueEntry(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_QUEUE_ENTRY);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStorage(db, "get queue entry");
  return ReadQueueEntry(st.get());
}

std::vector<model::QueueEntryRecord> SqliteRepository::ListQueueEntries(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_QUEUE_ENTRIES);
  if (!st.ok()) ThrowStorage(db, "sqlite prepare");

  std::vector<model::QueueEntryRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadQueueEntry(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowStorage(db, "list queue");
  return out;
}

Result SqliteRepository::DeleteQueueEntry(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_QUEUE_ENTRY);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountQueueEntries(Transaction& t) {
  return CountRows(TX(t).Handle(), sql::COUNT_QUEUE_ENTRIES);
}

Result SqliteRepository::ClearQueueEntries(Transaction& t) {
  auto* db = TX(t).Handle();
  return Translate(db, sqlite3_exec(db, sql::CLEAR_QUEUE_ENTRIES, nullptr, nullptr, nullptr));
}

} // namespace fieldsync::db::sqlite
