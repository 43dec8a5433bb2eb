#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fieldsync::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(SqliteOptions options);

  void Open() override;
  void Close() override;
  bool IsOpen() const override;

  std::unique_ptr<Transaction> Begin() override;

  Result PutInspection(Transaction&, const model::InspectionRecord&) override;
  std::optional<model::InspectionRecord> GetInspection(Transaction&, const std::string&) override;
  std::vector<model::InspectionRecord> ListInspectionsByStatus(Transaction&, fieldsync::model::InspectionStatus) override;
  Result DeleteInspection(Transaction&, const std::string&) override;
  uint64_t CountInspections(Transaction&) override;
  Result ClearInspections(Transaction&) override;

  Result PutPhoto(Transaction&, const model::PhotoRecord&) override;
  std::optional<model::PhotoRecord> GetPhoto(Transaction&, const std::string&) override;
  std::vector<model::PhotoRecord> ListPhotosByInspection(Transaction&, const std::string&) override;
  Result DeletePhoto(Transaction&, const std::string&) override;
  uint64_t CountPhotos(Transaction&) override;
  Result ClearPhotos(Transaction&) override;

  Result InsertQueueEntry(Transaction&, model::QueueEntryRecord&) override;
  std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string&) override;
  std::vector<model::QueueEntryRecord> ListQueueEntries(Transaction&) override;
  Result DeleteQueueEntry(Transaction&, const std::string&) override;
  uint64_t CountQueueEntries(Transaction&) override;
  Result ClearQueueEntries(Transaction&) override;

private:
  SqliteOptions options_;

  mutable std::mutex open_mutex_;
  std::shared_ptr<SqliteDB> db_;

  std::shared_ptr<SqliteDB> Db() const;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
