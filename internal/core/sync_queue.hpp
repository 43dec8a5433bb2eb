#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fieldsync::core {

/*
  Priority-ordered work list of outstanding deliveries.

  Entries carry no state of their own: they leave the queue together with
  the entity they name (InspectionManager::MarkSynced, Reset).
*/
class SyncQueue {
 public:
  SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock);

  static std::string EntryId(model::EntityType type, const std::string& reference_id);

  // Insert-if-absent. Returns false when the entity was already queued; the
  // existing entry keeps its enqueued_at_ms and priority.
  bool Enqueue(model::EntityType type, const std::string& reference_id, int priority);
  bool Enqueue(db::Transaction& tx, model::EntityType type, const std::string& reference_id, int priority);

  void Remove(db::Transaction& tx, model::EntityType type, const std::string& reference_id);

  // Snapshot in (priority, enqueued_at_ms, sequence) order. Does not remove.
  std::vector<db::model::QueueEntryRecord> Drain();

  uint64_t Count();

  // Clears inspections, photos and queue in one transaction.
  void Reset();

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace fieldsync::core
