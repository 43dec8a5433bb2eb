#include "store_ops.hpp"

#include <chrono>
#include <thread>

#include "internal/observability/logging.hpp"

namespace fieldsync::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code)
                                              : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::TransactionConflict(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw util::StorageError(message);
  }
}

void BackoffAfterConflict(const std::string& context, int attempt) {
  FIELDSYNC_LOG_DEBUG("transaction conflict, retrying",
                      {observability::StringField("op", context), observability::IntField("attempt", attempt)});
  std::this_thread::sleep_for(std::chrono::microseconds(20 * attempt));
}

} // namespace fieldsync::core
