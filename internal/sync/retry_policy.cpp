#include "retry_policy.hpp"

#include <algorithm>
#include <stdexcept>

namespace fieldsync::sync {

using fieldsync::model::InspectionStatus;

RetryPolicy::RetryPolicy(RetryPolicyOptions options) : options_(options) {
  if (options_.base_backoff.count() < 0 || options_.max_backoff.count() < 0)
    throw std::invalid_argument("retry back-off must not be negative");
  if (options_.max_backoff < options_.base_backoff) options_.max_backoff = options_.base_backoff;
}

std::chrono::milliseconds RetryPolicy::BackoffFor(uint32_t retry_count) const {
  if (retry_count == 0) return std::chrono::milliseconds::zero();

  auto delay = options_.base_backoff;
  for (uint32_t i = 1; i < retry_count && delay < options_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_backoff);
}

bool RetryPolicy::IsExhausted(const db::model::InspectionRecord& record) const {
  return options_.max_retries > 0 && record.retry_count >= options_.max_retries;
}

uint64_t RetryPolicy::NextAttemptAt(const db::model::InspectionRecord& record) const {
  if (record.status != InspectionStatus::kFailed) return 0;
  return record.updated_at_ms + static_cast<uint64_t>(BackoffFor(record.retry_count).count());
}

bool RetryPolicy::IsEligible(const db::model::InspectionRecord& record, uint64_t now_ms) const {
  switch (record.status) {
    case InspectionStatus::kPending:
      return true;
    case InspectionStatus::kSyncing:
      return false;
    case InspectionStatus::kFailed:
      return !IsExhausted(record) && now_ms >= NextAttemptAt(record);
  }
  return false;
}

} // namespace fieldsync::sync
