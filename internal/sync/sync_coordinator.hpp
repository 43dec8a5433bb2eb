#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "retry_policy.hpp"

namespace fieldsync::core {
class AttachmentManager;
class InspectionManager;
class SyncQueue;
} // namespace fieldsync::core

namespace fieldsync::sync {

class Uploader;

struct SyncCoordinatorOptions {
  RetryPolicyOptions retry;

  // Unset = never reclaim.
  std::optional<std::chrono::milliseconds> stale_claim_after;
};

struct SyncReport {
  std::size_t attempted = 0;
  std::size_t synced    = 0;
  std::size_t failed    = 0;
  std::size_t skipped   = 0;

  // Uploaded, but changed locally meanwhile; left queued for another pass.
  std::size_t superseded = 0;
};

struct SyncState {
  bool                       is_syncing    = false;
  uint64_t                   pending_count = 0;
  std::optional<uint64_t>    last_sync_at_ms;
  std::optional<std::string> last_error;
};

/*
  Drives one delivery pass over the sync queue.

  For each inspection entry in drain order: check back-off, Claim, load the
  photos, upload, then CompleteSync or MarkFailed. Photo entries ride along
  with their owner and are never uploaded alone. A record saved again (or
  given a new photo) while its upload was in flight stays in the store and
  is delivered again on a later pass.

  Single-flight: a RunOnce that overlaps another returns an empty report.
*/
class SyncCoordinator {
 public:
  using SyncedCallback = std::function<void(const std::string& inspection_id)>;
  using FailedCallback = std::function<void(const std::string& inspection_id, const std::string& error)>;

  SyncCoordinator(std::shared_ptr<core::InspectionManager> inspections, std::shared_ptr<core::AttachmentManager> attachments,
                  std::shared_ptr<core::SyncQueue> queue, std::shared_ptr<Uploader> uploader, std::shared_ptr<const util::Clock> clock,
                  SyncCoordinatorOptions options = {});

  SyncReport RunOnce();

  SyncState State() const;

  void OnSynced(SyncedCallback callback);
  void OnFailed(FailedCallback callback);

 private:
  enum class Outcome { kSynced, kFailed, kSuperseded, kSkipped };

  Outcome Deliver(const std::string& inspection_id, uint64_t now_ms);

  std::shared_ptr<core::InspectionManager> inspections_;
  std::shared_ptr<core::AttachmentManager> attachments_;
  std::shared_ptr<core::SyncQueue>         queue_;
  std::shared_ptr<Uploader>                uploader_;
  std::shared_ptr<const util::Clock>       clock_;
  std::optional<std::chrono::milliseconds> stale_claim_after_;
  RetryPolicy                              policy_;

  std::atomic<bool> running_{false};

  mutable std::mutex         state_mutex_;
  std::optional<uint64_t>    last_sync_at_ms_;
  std::optional<std::string> last_error_;
  uint64_t                   pending_count_ = 0;
  SyncedCallback             on_synced_;
  FailedCallback             on_failed_;
};

} // namespace fieldsync::sync
