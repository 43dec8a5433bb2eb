#include "sync_queue.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "store_ops.hpp"

namespace fieldsync::core {

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("SyncQueue requires a repository");
  if (!clock_) throw std::invalid_argument("SyncQueue requires a clock");
}

std::string SyncQueue::EntryId(model::EntityType type, const std::string& reference_id) {
  return std::string(model::QueueIdPrefix(type)) + reference_id;
}

bool SyncQueue::Enqueue(model::EntityType type, const std::string& reference_id, int priority) {
  const bool inserted =
      WithTransaction(*repository_, "enqueue", [&](db::Transaction& tx) { return Enqueue(tx, type, reference_id, priority); });

  if (inserted) {
    FIELDSYNC_LOG_INFO("sync entry enqueued", {observability::StringField("type", model::ToString(type)),
                                               observability::StringField("reference_id", reference_id),
                                               observability::IntField("priority", priority)});
  }
  return inserted;
}

bool SyncQueue::Enqueue(db::Transaction& tx, model::EntityType type, const std::string& reference_id, int priority) {
  if (reference_id.empty()) throw std::invalid_argument("queue reference id must not be empty");

  db::model::QueueEntryRecord entry;
  entry.id             = EntryId(type, reference_id);
  entry.entity_type    = type;
  entry.reference_id   = reference_id;
  entry.priority       = priority;
  entry.enqueued_at_ms = clock_->NowMs();

  const auto result = repository_->InsertQueueEntry(tx, entry);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfDbError(result, "enqueue " + entry.id);
  return true;
}

void SyncQueue::Remove(db::Transaction& tx, model::EntityType type, const std::string& reference_id) {
  ThrowIfDbError(repository_->DeleteQueueEntry(tx, EntryId(type, reference_id)), "dequeue " + reference_id);
}

std::vector<db::model::QueueEntryRecord> SyncQueue::Drain() {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListQueueEntries(*tx);
  tx->Commit();
  return entries;
}

uint64_t SyncQueue::Count() {
  auto       tx    = repository_->Begin();
  const auto count = repository_->CountQueueEntries(*tx);
  tx->Commit();
  return count;
}

void SyncQueue::Reset() {
  WithTransaction(*repository_, "reset", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->ClearQueueEntries(tx), "reset sync queue");
    ThrowIfDbError(repository_->ClearPhotos(tx), "reset photos");
    ThrowIfDbError(repository_->ClearInspections(tx), "reset inspections");
  });

  FIELDSYNC_LOG_WARN("local store reset");
}

} // namespace fieldsync::core
