#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace fieldsync::db::memory {

MemoryRepository::MemoryRepository() = default;

void MemoryRepository::Open() {
  open_ = true;
}

void MemoryRepository::Close() {
  open_ = false;
}

bool MemoryRepository::IsOpen() const {
  return open_;
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  if (!open_) throw util::StorageError("memory store is not open");
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Inspections
// ------------------------------------------------------------------

Result MemoryRepository::PutInspection(Transaction& t, const model::InspectionRecord& r) {
  TX(t).Mutable().inspections[r.id] = r;
  return Result::Ok();
}

std::optional<model::InspectionRecord> MemoryRepository::GetInspection(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.inspections.find(id);
  if (it == s.inspections.end()) return std::nullopt;
  return it->second;
}

std::vector<model::InspectionRecord> MemoryRepository::ListInspectionsByStatus(Transaction& t, fieldsync::model::InspectionStatus status) {
  std::vector<model::InspectionRecord> out;
  for (const auto& [_, record] : TX(t).View().inspections)
    if (record.status == status) out.push_back(record);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
  return out;
}

Result MemoryRepository::DeleteInspection(Transaction& t, const std::string& id) {
  TX(t).Mutable().inspections.erase(id);
  return Result::Ok();
}

uint64_t MemoryRepository::CountInspections(Transaction& t) {
  return TX(t).View().inspections.size();
}

Result MemoryRepository::ClearInspections(Transaction& t) {
  TX(t).Mutable().inspections.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result MemoryRepository::PutPhoto(Transaction& t, const model::PhotoRecord& r) {
  TX(t).Mutable().photos[r.id] = r;
  return Result::Ok();
}

std::optional<model::PhotoRecord> MemoryRepository::GetPhoto(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.photos.find(id);
  if (it == s.photos.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PhotoRecord> MemoryRepository::ListPhotosByInspection(Transaction& t, const std::string& inspection_id) {
  std::vector<model::PhotoRecord> out;
  for (const auto& [_, record] : TX(t).View().photos)
    if (record.inspection_id == inspection_id) out.push_back(record);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
  return out;
}

Result MemoryRepository::DeletePhoto(Transaction& t, const std::string& id) {
  TX(t).Mutable().photos.erase(id);
  return Result::Ok();
}

uint64_t MemoryRepository::CountPhotos(Transaction& t) {
  return TX(t).View().photos.size();
}

Result MemoryRepository::ClearPhotos(Transaction& t) {
  TX(t).Mutable().photos.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertQueueEntry(Transaction& t, model::QueueEntryRecord& entry) {
  if (TX(t).View().queue.contains(entry.id)) return Result::Err(ErrorCode::AlreadyExists, entry.id);

  auto& s        = TX(t).Mutable();
  entry.sequence = s.next_sequence++;
  s.queue[entry.id] = entry;
  return Result::Ok();
}

std::optional<model::QueueEntryRecord> MemoryRepository::GetQueueEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.queue.find(id);
  if (it == s.queue.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QueueEntryRecord> MemoryRepository::ListQueueEntries(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::QueueEntryRecord> out;
  out.reserve(s.queue.size());
  for (const auto& [_, entry] : s.queue) out.push_back(entry);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.priority, a.enqueued_at_ms, a.sequence) < std::tie(b.priority, b.enqueued_at_ms, b.sequence);
  });
  return out;
}

Result MemoryRepository::DeleteQueueEntry(Transaction& t, const std::string& id) {
  TX(t).Mutable().queue.erase(id);
  return Result::Ok();
}

uint64_t MemoryRepository::CountQueueEntries(Transaction& t) {
  return TX(t).View().queue.size();
}

Result MemoryRepository::ClearQueueEntries(Transaction& t) {
  // sequence keeps counting so a reset never reorders later inserts
  TX(t).Mutable().queue.clear();
  return Result::Ok();
}

} // namespace fieldsync::db::memory
