#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::core {

// Attempts per read-modify-write before a TransactionConflict escapes.
constexpr int kMaxConflictRetries = 32;

// Translates a repository Result into the util:: exception hierarchy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// Sleeps a little longer on every attempt so racing writers spread out.
void BackoffAfterConflict(const std::string& context, int attempt);

/*
  Runs fn(tx) in a fresh transaction and commits it.

  fn may run more than once: when a concurrent writer wins (memory backend),
  the whole body is replayed on a new snapshot. Keep side effects outside fn.
*/
template <typename Fn>
auto WithTransaction(db::Repository& repository, const std::string& context, Fn&& fn)
    -> std::invoke_result_t<Fn&, db::Transaction&> {
  using R = std::invoke_result_t<Fn&, db::Transaction&>;

  for (int attempt = 1;; ++attempt) {
    auto tx = repository.Begin();
    try {
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R out = fn(*tx);
        tx->Commit();
        return out;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= kMaxConflictRetries) throw;
      BackoffAfterConflict(context, attempt);
    }
  }
}

} // namespace fieldsync::core
