#include "internal/sync/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using fieldsync::db::model::InspectionRecord;
using fieldsync::model::InspectionStatus;
using fieldsync::sync::RetryPolicy;
using fieldsync::sync::RetryPolicyOptions;

InspectionRecord Failed(uint32_t retry_count, uint64_t updated_at_ms) {
  InspectionRecord record;
  record.id            = "A";
  record.status        = InspectionStatus::kFailed;
  record.retry_count   = retry_count;
  record.updated_at_ms = updated_at_ms;
  return record;
}

void TestBackoffDoublesUpToCap() {
  RetryPolicy policy({.max_retries = 0, .base_backoff = 1s, .max_backoff = 10s});
  assert(policy.BackoffFor(0) == 0ms);
  assert(policy.BackoffFor(1) == 1s);
  assert(policy.BackoffFor(2) == 2s);
  assert(policy.BackoffFor(3) == 4s);
  assert(policy.BackoffFor(4) == 8s);
  assert(policy.BackoffFor(5) == 10s);
  assert(policy.BackoffFor(4'000'000'000u) == 10s);
}

void TestFailedEligibility() {
  RetryPolicy policy({.max_retries = 0, .base_backoff = 1s, .max_backoff = 1min});
  const auto  record = Failed(3, 10'000);

  assert(policy.NextAttemptAt(record) == 14'000);
  assert(!policy.IsEligible(record, 13'999));
  assert(policy.IsEligible(record, 14'000));
  assert(policy.IsEligible(record, 90'000));
}

void TestPendingAndSyncing() {
  RetryPolicy      policy;
  InspectionRecord record;
  record.status      = InspectionStatus::kPending;
  record.retry_count = 50;
  assert(policy.IsEligible(record, 0));
  assert(policy.NextAttemptAt(record) == 0);

  record.status = InspectionStatus::kSyncing;
  assert(!policy.IsEligible(record, UINT64_MAX));
}

void TestMaxRetriesExhausts() {
  RetryPolicy policy({.max_retries = 3, .base_backoff = 1ms, .max_backoff = 1ms});
  assert(!policy.IsExhausted(Failed(2, 0)));
  assert(policy.IsEligible(Failed(2, 0), 10));
  assert(policy.IsExhausted(Failed(3, 0)));
  assert(!policy.IsEligible(Failed(3, 0), UINT64_MAX));

  RetryPolicy forever({.max_retries = 0, .base_backoff = 1ms, .max_backoff = 1ms});
  assert(!forever.IsExhausted(Failed(1000, 0)));
}

void TestMisorderedCapIsRaised() {
  RetryPolicy policy({.max_retries = 0, .base_backoff = 5s, .max_backoff = 1s});
  assert(policy.Options().max_backoff == 5s);
  assert(policy.BackoffFor(3) == 5s);
}

} // namespace

int main() {
  TestBackoffDoublesUpToCap();
  TestFailedEligibility();
  TestPendingAndSyncing();
  TestMaxRetriesExhausts();
  TestMisorderedCapIsRaised();

  std::cout << "fieldsync_unit_retry_policy: pass\n";
  return 0;
}
