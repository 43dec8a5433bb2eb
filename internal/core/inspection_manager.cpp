#include "inspection_manager.hpp"

#include <set>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"
#include "store_ops.hpp"
#include "sync_queue.hpp"

namespace fieldsync::core {

namespace {

constexpr const char* kStaleClaimMessage = "stale claim reclaimed";

void RequireId(const std::string& id) {
  if (id.empty()) throw std::invalid_argument("inspection id must not be empty");
}

} // namespace

InspectionManager::InspectionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncQueue> queue,
                                     std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), queue_(std::move(queue)), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("InspectionManager requires a repository");
  if (!queue_) throw std::invalid_argument("InspectionManager requires a sync queue");
  if (!clock_) throw std::invalid_argument("InspectionManager requires a clock");
}

std::string InspectionManager::NewInspectionId() {
  return util::GenerateId("insp-");
}

void InspectionManager::Save(const std::string& id, const std::string& payload, const std::optional<std::string>& property_id) {
  RequireId(id);

  const auto now     = clock_->NowMs();
  const bool created = WithTransaction(*repository_, "save inspection", [&](db::Transaction& tx) {
    auto existing = repository_->GetInspection(tx, id);

    db::model::InspectionRecord record;
    record.id            = id;
    record.payload       = payload;
    record.property_id   = property_id;
    record.status        = model::InspectionStatus::kPending;
    record.retry_count   = existing ? existing->retry_count : 0;
    record.created_at_ms = existing ? existing->created_at_ms : now;
    record.updated_at_ms = now;

    ThrowIfDbError(repository_->PutInspection(tx, record), "save inspection " + id);
    queue_->Enqueue(tx, model::EntityType::kInspection, id, model::kInspectionPriority);
    return !existing.has_value();
  });

  FIELDSYNC_LOG_INFO(created ? "inspection created" : "inspection updated",
                     {observability::StringField("inspection_id", id), observability::IntField("payload_bytes", static_cast<int64_t>(payload.size()))});
}

std::optional<db::model::InspectionRecord> InspectionManager::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetInspection(*tx, id);
  tx->Commit();
  return record;
}

std::vector<db::model::InspectionRecord> InspectionManager::ListPending() {
  return ListByStatus(model::InspectionStatus::kPending);
}

std::vector<db::model::InspectionRecord> InspectionManager::ListFailed() {
  return ListByStatus(model::InspectionStatus::kFailed);
}

std::vector<db::model::InspectionRecord> InspectionManager::ListByStatus(model::InspectionStatus status) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListInspectionsByStatus(*tx, status);
  tx->Commit();
  return records;
}

void InspectionManager::MarkSynced(const std::string& id) {
  RequireId(id);

  const auto removed = WithTransaction(*repository_, "mark synced", [&](db::Transaction& tx) -> std::optional<std::size_t> {
    const bool had_record = repository_->GetInspection(tx, id).has_value();
    const auto photos     = repository_->ListPhotosByInspection(tx, id);
    const bool had_entry  = repository_->GetQueueEntry(tx, SyncQueue::EntryId(model::EntityType::kInspection, id)).has_value();
    if (!had_record && photos.empty() && !had_entry) {
      return std::nullopt;
    }

    RemoveWithPhotos(tx, id, photos);
    return photos.size();
  });

  if (!removed) {
    FIELDSYNC_LOG_DEBUG("mark synced on absent inspection", {observability::StringField("inspection_id", id)});
    return;
  }
  FIELDSYNC_LOG_INFO("inspection synced",
                     {observability::StringField("inspection_id", id), observability::IntField("photos", static_cast<int64_t>(*removed))});
}

bool InspectionManager::CompleteSync(const std::string& id, uint64_t claimed_at_ms, const std::vector<std::string>& uploaded_photo_ids) {
  RequireId(id);

  enum class Completion { kRemoved, kSuperseded, kPhotoAdded, kAbsent };

  const auto uploaded = std::set<std::string>(uploaded_photo_ids.begin(), uploaded_photo_ids.end());
  const auto now      = clock_->NowMs();
  const auto outcome  = WithTransaction(*repository_, "complete sync", [&](db::Transaction& tx) {
    auto record = repository_->GetInspection(tx, id);
    if (!record) {
      return Completion::kAbsent;
    }
    if (record->status != model::InspectionStatus::kSyncing || record->updated_at_ms != claimed_at_ms) {
      return Completion::kSuperseded;
    }

    const auto photos = repository_->ListPhotosByInspection(tx, id);
    for (const auto& photo : photos) {
      if (uploaded.count(photo.id) == 0) {
        record->status = model::InspectionStatus::kPending;
        record->error_message.reset();
        record->updated_at_ms = now;
        ThrowIfDbError(repository_->PutInspection(tx, *record), "requeue " + id);
        queue_->Enqueue(tx, model::EntityType::kInspection, id, model::kInspectionPriority);
        return Completion::kPhotoAdded;
      }
    }

    RemoveWithPhotos(tx, id, photos);
    return Completion::kRemoved;
  });

  switch (outcome) {
    case Completion::kRemoved:
      FIELDSYNC_LOG_INFO("inspection synced", {observability::StringField("inspection_id", id),
                                               observability::IntField("photos", static_cast<int64_t>(uploaded.size()))});
      return true;
    case Completion::kSuperseded:
      FIELDSYNC_LOG_INFO("inspection changed during upload, kept for next pass", {observability::StringField("inspection_id", id)});
      return false;
    case Completion::kPhotoAdded:
      FIELDSYNC_LOG_INFO("photo added during upload, inspection requeued", {observability::StringField("inspection_id", id)});
      return false;
    case Completion::kAbsent:
      FIELDSYNC_LOG_DEBUG("complete sync on absent inspection", {observability::StringField("inspection_id", id)});
      return false;
  }
  return false;
}

void InspectionManager::RemoveWithPhotos(db::Transaction& tx, const std::string& id, const std::vector<db::model::PhotoRecord>& photos) {
  for (const auto& photo : photos) {
    ThrowIfDbError(repository_->DeletePhoto(tx, photo.id), "delete photo " + photo.id);
    queue_->Remove(tx, model::EntityType::kPhoto, photo.id);
  }
  queue_->Remove(tx, model::EntityType::kInspection, id);
  ThrowIfDbError(repository_->DeleteInspection(tx, id), "delete inspection " + id);
}

void InspectionManager::MarkFailed(const std::string& id, const std::string& error_message) {
  RequireId(id);

  const auto now     = clock_->NowMs();
  const auto retries = WithTransaction(*repository_, "mark failed", [&](db::Transaction& tx) -> std::optional<uint32_t> {
    auto record = repository_->GetInspection(tx, id);
    if (!record) {
      return std::nullopt;
    }

    record->status = model::InspectionStatus::kFailed;
    record->retry_count += 1;
    record->error_message = error_message;
    record->updated_at_ms = now;
    ThrowIfDbError(repository_->PutInspection(tx, *record), "mark failed " + id);
    return record->retry_count;
  });

  if (!retries) {
    FIELDSYNC_LOG_DEBUG("mark failed on absent inspection", {observability::StringField("inspection_id", id)});
    return;
  }
  FIELDSYNC_LOG_WARN("inspection sync failed", {observability::StringField("inspection_id", id),
                                                observability::IntField("retry_count", *retries),
                                                observability::StringField("error", error_message)});
}

bool InspectionManager::Claim(const std::string& id) {
  RequireId(id);

  const auto now     = clock_->NowMs();
  const bool claimed = WithTransaction(*repository_, "claim", [&](db::Transaction& tx) {
    auto record = repository_->GetInspection(tx, id);
    if (!record || !model::IsClaimable(record->status)) {
      return false;
    }

    record->status        = model::InspectionStatus::kSyncing;
    record->updated_at_ms = now;
    ThrowIfDbError(repository_->PutInspection(tx, *record), "claim " + id);
    return true;
  });

  if (claimed) {
    FIELDSYNC_LOG_INFO("inspection claimed", {observability::StringField("inspection_id", id)});
  } else {
    FIELDSYNC_LOG_DEBUG("inspection not claimable", {observability::StringField("inspection_id", id)});
  }
  return claimed;
}

std::size_t InspectionManager::ReclaimStale(std::chrono::milliseconds max_age) {
  if (max_age.count() < 0) throw std::invalid_argument("stale claim age must not be negative");

  const auto now     = clock_->NowMs();
  const auto age_ms  = static_cast<uint64_t>(max_age.count());
  const auto cutoff  = now > age_ms ? now - age_ms : 0;
  const auto reclaimed = WithTransaction(*repository_, "reclaim stale", [&](db::Transaction& tx) {
    std::size_t count = 0;
    for (auto record : repository_->ListInspectionsByStatus(tx, model::InspectionStatus::kSyncing)) {
      if (record.updated_at_ms > cutoff) {
        continue;
      }
      record.status = model::InspectionStatus::kFailed;
      record.retry_count += 1;
      record.error_message = kStaleClaimMessage;
      record.updated_at_ms = now;
      ThrowIfDbError(repository_->PutInspection(tx, record), "reclaim " + record.id);
      ++count;
    }
    return count;
  });

  if (reclaimed > 0) {
    FIELDSYNC_LOG_WARN("stale claims reclaimed", {observability::IntField("count", static_cast<int64_t>(reclaimed)),
                                                  observability::IntField("max_age_ms", max_age.count())});
  }
  return reclaimed;
}

} // namespace fieldsync::core
