#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/inspection_record.hpp"
#include "internal/db/model/photo_record.hpp"
#include "internal/db/model/queue_entry_record.hpp"

namespace fieldsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction either commits every write or none of them
  - A committed write is durable before Commit() returns

  The repository has no business logic. It owns three collections, each
  keyed by id with one secondary index:

    inspections  by status
    photos       by inspection_id
    sync_queue   by (priority, enqueued_at_ms, sequence)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  // Idempotent. Creates the schema when absent. Throws util::StorageError.
  virtual void Open() = 0;

  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Throws util::StorageError when the store is not open.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Inspections
  // ---------------------------------------------------------------------

  virtual Result PutInspection(Transaction&, const model::InspectionRecord&) = 0;

  virtual std::optional<model::InspectionRecord> GetInspection(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms.
  virtual std::vector<model::InspectionRecord> ListInspectionsByStatus(Transaction&, fieldsync::model::InspectionStatus status) = 0;

  // Deleting an absent id is not an error.
  virtual Result DeleteInspection(Transaction&, const std::string& id) = 0;

  virtual uint64_t CountInspections(Transaction&) = 0;

  virtual Result ClearInspections(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Photos
  // ---------------------------------------------------------------------

  virtual Result PutPhoto(Transaction&, const model::PhotoRecord&) = 0;

  virtual std::optional<model::PhotoRecord> GetPhoto(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms.
  virtual std::vector<model::PhotoRecord> ListPhotosByInspection(Transaction&, const std::string& inspection_id) = 0;

  virtual Result DeletePhoto(Transaction&, const std::string& id) = 0;

  virtual uint64_t CountPhotos(Transaction&) = 0;

  virtual Result ClearPhotos(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Sync queue
  // ---------------------------------------------------------------------

  // Inserts the entry and assigns entry.sequence. Returns AlreadyExists,
  // leaving the stored entry untouched, when the id is already queued.
  virtual Result InsertQueueEntry(Transaction&, model::QueueEntryRecord& entry) = 0;

  virtual std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string& id) = 0;

  // Ordered by (priority, enqueued_at_ms, sequence).
  virtual std::vector<model::QueueEntryRecord> ListQueueEntries(Transaction&) = 0;

  virtual Result DeleteQueueEntry(Transaction&, const std::string& id) = 0;

  virtual uint64_t CountQueueEntries(Transaction&) = 0;

  virtual Result ClearQueueEntries(Transaction&) = 0;
};

} // namespace fieldsync::db
