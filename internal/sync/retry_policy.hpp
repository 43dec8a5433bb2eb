#pragma once

#include <chrono>
#include <cstdint>

#include "internal/db/model/inspection_record.hpp"

namespace fieldsync::sync {

struct RetryPolicyOptions {
  // 0 = retry forever.
  uint32_t max_retries = 0;

  std::chrono::milliseconds base_backoff{std::chrono::seconds(5)};
  std::chrono::milliseconds max_backoff{std::chrono::minutes(10)};
};

/*
  Exponential back-off over retry_count / updated_at_ms.

    delay(n) = min(base * 2^(n-1), max)      n = retry_count >= 1

  pending records are always eligible, syncing records never are.
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryPolicyOptions options = {});

  std::chrono::milliseconds BackoffFor(uint32_t retry_count) const;

  bool IsExhausted(const db::model::InspectionRecord& record) const;

  bool IsEligible(const db::model::InspectionRecord& record, uint64_t now_ms) const;

  // Earliest time the record becomes eligible; 0 when it already is.
  uint64_t NextAttemptAt(const db::model::InspectionRecord& record) const;

  const RetryPolicyOptions& Options() const {
    return options_;
  }

 private:
  RetryPolicyOptions options_;
};

} // namespace fieldsync::sync
