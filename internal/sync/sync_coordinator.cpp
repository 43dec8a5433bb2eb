#include "sync_coordinator.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/core/attachment_manager.hpp"
#include "internal/core/inspection_manager.hpp"
#include "internal/core/sync_queue.hpp"
#include "internal/observability/logging.hpp"
#include "uploader.hpp"

namespace fieldsync::sync {

namespace {

// Clears the single-flight flag however RunOnce exits.
class RunningGuard {
 public:
  explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~RunningGuard() {
    flag_ = false;
  }

  RunningGuard(const RunningGuard&)            = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

} // namespace

SyncCoordinator::SyncCoordinator(std::shared_ptr<core::InspectionManager> inspections, std::shared_ptr<core::AttachmentManager> attachments,
                                 std::shared_ptr<core::SyncQueue> queue, std::shared_ptr<Uploader> uploader,
                                 std::shared_ptr<const util::Clock> clock, SyncCoordinatorOptions options)
    : inspections_(std::move(inspections)),
      attachments_(std::move(attachments)),
      queue_(std::move(queue)),
      uploader_(std::move(uploader)),
      clock_(std::move(clock)),
      stale_claim_after_(options.stale_claim_after),
      policy_(options.retry) {
  if (!inspections_ || !attachments_ || !queue_) throw std::invalid_argument("SyncCoordinator requires the store managers");
  if (!uploader_) throw std::invalid_argument("SyncCoordinator requires an uploader");
  if (!clock_) throw std::invalid_argument("SyncCoordinator requires a clock");
}

void SyncCoordinator::OnSynced(SyncedCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  on_synced_ = std::move(callback);
}

void SyncCoordinator::OnFailed(FailedCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  on_failed_ = std::move(callback);
}

SyncState SyncCoordinator::State() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  SyncState                   state;
  state.is_syncing      = running_.load();
  state.pending_count   = pending_count_;
  state.last_sync_at_ms = last_sync_at_ms_;
  state.last_error      = last_error_;
  return state;
}

SyncReport SyncCoordinator::RunOnce() {
  SyncReport report;

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    FIELDSYNC_LOG_DEBUG("sync pass already running");
    return report;
  }
  RunningGuard guard(running_);

  if (stale_claim_after_) {
    inspections_->ReclaimStale(*stale_claim_after_);
  }

  const auto now = clock_->NowMs();
  for (const auto& entry : queue_->Drain()) {
    if (entry.entity_type != model::EntityType::kInspection) {
      continue;
    }

    switch (Deliver(entry.reference_id, now)) {
      case Outcome::kSynced:
        ++report.attempted;
        ++report.synced;
        break;
      case Outcome::kFailed:
        ++report.attempted;
        ++report.failed;
        break;
      case Outcome::kSuperseded:
        ++report.attempted;
        ++report.superseded;
        break;
      case Outcome::kSkipped:
        ++report.skipped;
        break;
    }
  }

  const auto pending = queue_->Count();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_sync_at_ms_ = clock_->NowMs();
    pending_count_   = pending;
  }

  FIELDSYNC_LOG_INFO("sync pass finished", {observability::IntField("attempted", static_cast<int64_t>(report.attempted)),
                                            observability::IntField("synced", static_cast<int64_t>(report.synced)),
                                            observability::IntField("failed", static_cast<int64_t>(report.failed)),
                                            observability::IntField("superseded", static_cast<int64_t>(report.superseded)),
                                            observability::IntField("skipped", static_cast<int64_t>(report.skipped)),
                                            observability::IntField("queued", static_cast<int64_t>(pending))});
  return report;
}

SyncCoordinator::Outcome SyncCoordinator::Deliver(const std::string& inspection_id, uint64_t now_ms) {
  auto record = inspections_->Get(inspection_id);
  if (!record || !policy_.IsEligible(*record, now_ms)) {
    return Outcome::kSkipped;
  }
  if (!inspections_->Claim(inspection_id)) {
    return Outcome::kSkipped;
  }

  // Re-read so the uploader sees the claimed state.
  record = inspections_->Get(inspection_id);
  if (!record) {
    return Outcome::kSkipped;
  }
  const auto photos = attachments_->ListByInspection(inspection_id);

  std::string error;
  try {
    uploader_->UploadInspection(*record, photos);
  } catch (const std::exception& e) {
    error = e.what();
    if (error.empty()) error = "upload failed";
  }

  if (error.empty()) {
    std::vector<std::string> photo_ids;
    photo_ids.reserve(photos.size());
    for (const auto& photo : photos) photo_ids.push_back(photo.id);

    // a save during the upload keeps the newer data queued for the next pass
    if (!inspections_->CompleteSync(inspection_id, record->updated_at_ms, photo_ids)) {
      return Outcome::kSuperseded;
    }

    SyncedCallback callback;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      callback = on_synced_;
    }
    if (callback) callback(inspection_id);
    return Outcome::kSynced;
  }

  inspections_->MarkFailed(inspection_id, error);

  FailedCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = error;
    callback    = on_failed_;
  }
  if (callback) callback(inspection_id, error);
  return Outcome::kFailed;
}

} // namespace fieldsync::sync
