#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldsync::db::ErrorCode;
using fieldsync::db::Repository;
using fieldsync::db::memory::MemoryRepository;
using fieldsync::db::model::GeoTag;
using fieldsync::db::model::InspectionRecord;
using fieldsync::db::model::PhotoRecord;
using fieldsync::db::model::QueueEntryRecord;
using fieldsync::model::EntityType;
using fieldsync::model::InspectionStatus;
using fieldsync::model::PhotoClassification;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

InspectionRecord MakeInspection(const std::string& id, InspectionStatus status, uint64_t created_at_ms) {
  InspectionRecord record;
  record.id            = id;
  record.payload       = R"({"unit":"boiler-1","readings":[1.5,2.25]})";
  record.status        = status;
  record.created_at_ms = created_at_ms;
  record.updated_at_ms = created_at_ms;
  return record;
}

QueueEntryRecord MakeEntry(EntityType type, const std::string& reference_id, int priority, uint64_t enqueued_at_ms) {
  QueueEntryRecord entry;
  entry.id             = std::string(fieldsync::model::QueueIdPrefix(type)) + reference_id;
  entry.entity_type    = type;
  entry.reference_id   = reference_id;
  entry.priority       = priority;
  entry.enqueued_at_ms = enqueued_at_ms;
  return entry;
}

void VerifyInspectionReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto record        = MakeInspection(prefix + "-a", InspectionStatus::kPending, 100);
  record.property_id = "prop-9";
  assert(repo.PutInspection(*tx, record));

  auto read = repo.GetInspection(*tx, record.id);
  assert(read.has_value());
  assert(read->payload == record.payload);
  assert(read->property_id == std::optional<std::string>("prop-9"));
  assert(!read->error_message.has_value());

  read->status        = InspectionStatus::kFailed;
  read->retry_count   = 3;
  read->error_message = "timeout";
  read->property_id.reset();
  assert(repo.PutInspection(*tx, *read));

  auto updated = repo.GetInspection(*tx, record.id);
  assert(updated.has_value());
  assert(updated->status == InspectionStatus::kFailed);
  assert(updated->retry_count == 3);
  assert(updated->error_message == std::optional<std::string>("timeout"));
  assert(!updated->property_id.has_value());

  assert(repo.DeleteInspection(*tx, record.id));
  assert(!repo.GetInspection(*tx, record.id).has_value());
  // deleting twice is not an error
  assert(repo.DeleteInspection(*tx, record.id));
  tx->Commit();
}

void VerifyEmbeddedNulSurvives(Repository& repo, const std::string& prefix) {
  const std::string payload("{\"a\":1}\0tail", 12);
  const std::string error("timeout\0detail", 14);

  {
    auto tx              = repo.Begin();
    auto record          = MakeInspection(prefix + "-nul", InspectionStatus::kFailed, 100);
    record.payload       = payload;
    record.error_message = error;
    assert(repo.PutInspection(*tx, record));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetInspection(*tx, prefix + "-nul");
  assert(read.has_value());
  assert(read->payload.size() == 12);
  assert(read->payload == payload);
  assert(read->error_message == std::optional<std::string>(error));

  auto empty    = MakeInspection(prefix + "-empty", InspectionStatus::kPending, 100);
  empty.payload = "";
  assert(repo.PutInspection(*tx, empty));
  assert(repo.GetInspection(*tx, empty.id)->payload.empty());
  tx->Commit();
}

void VerifyStatusIndex(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.PutInspection(*tx, MakeInspection(prefix + "-late", InspectionStatus::kPending, 300)));
  assert(repo.PutInspection(*tx, MakeInspection(prefix + "-early", InspectionStatus::kPending, 100)));
  assert(repo.PutInspection(*tx, MakeInspection(prefix + "-failed", InspectionStatus::kFailed, 200)));
  assert(repo.PutInspection(*tx, MakeInspection(prefix + "-syncing", InspectionStatus::kSyncing, 200)));

  const auto pending = repo.ListInspectionsByStatus(*tx, InspectionStatus::kPending);
  assert(pending.size() == 2);
  assert(pending[0].id == prefix + "-early");
  assert(pending[1].id == prefix + "-late");

  const auto failed = repo.ListInspectionsByStatus(*tx, InspectionStatus::kFailed);
  assert(failed.size() == 1);
  assert(failed[0].id == prefix + "-failed");

  assert(repo.CountInspections(*tx) == 4);
  assert(repo.ClearInspections(*tx));
  assert(repo.CountInspections(*tx) == 0);
  tx->Commit();
}

void VerifyPhotoReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  PhotoRecord tagged;
  tagged.id             = prefix + "-photo-1";
  tagged.inspection_id  = prefix + "-owner";
  tagged.binary_payload = {0xFF, 0xD8, 0x00, 0x10, 0xFF, 0xD9};
  tagged.classification = PhotoClassification::kDataplate;
  tagged.geo_tag        = GeoTag{.latitude = 51.5072, .longitude = -0.1276, .accuracy_m = 4.5, .captured_at_ms = 1234};
  tagged.created_at_ms  = 20;
  assert(repo.PutPhoto(*tx, tagged));

  PhotoRecord empty;
  empty.id             = prefix + "-photo-0";
  empty.inspection_id  = prefix + "-owner";
  empty.classification = PhotoClassification::kOther;
  empty.created_at_ms  = 10;
  assert(repo.PutPhoto(*tx, empty));

  PhotoRecord other_owner = empty;
  other_owner.id            = prefix + "-photo-x";
  other_owner.inspection_id = prefix + "-someone-else";
  assert(repo.PutPhoto(*tx, other_owner));

  auto read = repo.GetPhoto(*tx, tagged.id);
  assert(read.has_value());
  assert(read->binary_payload == tagged.binary_payload);
  assert(read->classification == PhotoClassification::kDataplate);
  assert(read->geo_tag.has_value());
  assert(read->geo_tag->latitude == 51.5072);
  assert(read->geo_tag->accuracy_m == 4.5);
  assert(read->geo_tag->captured_at_ms == 1234);

  auto read_empty = repo.GetPhoto(*tx, empty.id);
  assert(read_empty.has_value());
  assert(read_empty->binary_payload.empty());
  assert(!read_empty->geo_tag.has_value());

  const auto owned = repo.ListPhotosByInspection(*tx, prefix + "-owner");
  assert(owned.size() == 2);
  assert(owned[0].id == empty.id);
  assert(owned[1].id == tagged.id);

  assert(repo.DeletePhoto(*tx, tagged.id));
  assert(!repo.GetPhoto(*tx, tagged.id).has_value());
  assert(repo.CountPhotos(*tx) == 2);
  assert(repo.ClearPhotos(*tx));
  assert(repo.CountPhotos(*tx) == 0);
  tx->Commit();
}

void VerifyQueueOrdering(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto photo_late  = MakeEntry(EntityType::kPhoto, prefix + "-p2", 2, 300);
  auto photo_early = MakeEntry(EntityType::kPhoto, prefix + "-p1", 2, 200);
  auto inspection  = MakeEntry(EntityType::kInspection, prefix + "-i", 1, 400);
  auto photo_tie   = MakeEntry(EntityType::kPhoto, prefix + "-p3", 2, 300);

  assert(repo.InsertQueueEntry(*tx, photo_late));
  assert(repo.InsertQueueEntry(*tx, photo_early));
  assert(repo.InsertQueueEntry(*tx, inspection));
  assert(repo.InsertQueueEntry(*tx, photo_tie));
  assert(photo_late.sequence < photo_tie.sequence);

  const auto ordered = repo.ListQueueEntries(*tx);
  assert(ordered.size() == 4);
  assert(ordered[0].id == inspection.id);
  assert(ordered[1].id == photo_early.id);
  assert(ordered[2].id == photo_late.id);
  assert(ordered[3].id == photo_tie.id);

  // insert-if-absent keeps the original entry
  auto again           = MakeEntry(EntityType::kInspection, prefix + "-i", 1, 999);
  const auto duplicate = repo.InsertQueueEntry(*tx, again);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  auto stored = repo.GetQueueEntry(*tx, inspection.id);
  assert(stored.has_value());
  assert(stored->enqueued_at_ms == 400);
  assert(repo.CountQueueEntries(*tx) == 4);

  assert(repo.DeleteQueueEntry(*tx, photo_early.id));
  assert(repo.DeleteQueueEntry(*tx, photo_early.id));
  assert(repo.CountQueueEntries(*tx) == 3);
  assert(repo.ClearQueueEntries(*tx));
  assert(repo.ListQueueEntries(*tx).empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.PutInspection(*tx, MakeInspection(id, InspectionStatus::kPending, NowMs())));
    auto entry = MakeEntry(EntityType::kInspection, id, 1, NowMs());
    assert(repo.InsertQueueEntry(*tx, entry));
    tx->Rollback();
  }
  {
    // dropped without Commit
    auto tx = repo.Begin();
    assert(repo.PutInspection(*tx, MakeInspection(id, InspectionStatus::kPending, NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetInspection(*check_tx, id).has_value());
  assert(!repo.GetQueueEntry(*check_tx, "insp-" + id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.PutInspection(*tx, MakeInspection(id, InspectionStatus::kPending, 1)));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const fieldsync::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();

    // the connection is usable again once the first transaction is finished
    auto tx3 = repo.Begin();
    assert(repo.GetInspection(*tx3, id).has_value());
    tx3->Commit();
    return;
  }

  auto tx2 = repo.Begin();
  auto r1  = repo.GetInspection(*tx1, id);
  auto r2  = repo.GetInspection(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->status = InspectionStatus::kSyncing;
  r2->status = InspectionStatus::kSyncing;
  assert(repo.PutInspection(*tx1, *r1));
  tx1->Commit();

  assert(repo.PutInspection(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const fieldsync::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted && "second writer on a stale snapshot must not win");

  auto verify_tx = repo.Begin();
  auto final     = repo.GetInspection(*verify_tx, id);
  assert(final.has_value());
  assert(final->status == InspectionStatus::kSyncing);
  verify_tx->Commit();
}

void VerifyClosedStoreRejectsWork(BackendFactory& backend) {
  auto repo = backend.make_repository();
  assert(repo->IsOpen());
  repo->Close();
  assert(!repo->IsOpen());

  bool threw = false;
  try {
    (void)repo->Begin();
  } catch (const fieldsync::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  // reopen is allowed
  repo->Open();
  repo->Open();
  auto tx = repo->Begin();
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto record        = MakeInspection(id, InspectionStatus::kFailed, 77);
    record.retry_count = 2;
    record.error_message = "HTTP 503";
    assert(repo->PutInspection(*tx, record));

    PhotoRecord photo;
    photo.id             = id + "-photo";
    photo.inspection_id  = id;
    photo.binary_payload = {1, 2, 3, 4, 5};
    photo.classification = PhotoClassification::kPressure;
    photo.created_at_ms  = 78;
    assert(repo->PutPhoto(*tx, photo));

    auto entry = MakeEntry(EntityType::kInspection, id, 1, 77);
    assert(repo->InsertQueueEntry(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetInspection(*tx, id);
  assert(r.has_value());
  assert(r->status == InspectionStatus::kFailed);
  assert(r->retry_count == 2);
  assert(r->error_message == std::optional<std::string>("HTTP 503"));

  const auto photos = repo->ListPhotosByInspection(*tx, id);
  assert(photos.size() == 1);
  assert((photos[0].binary_payload == std::vector<uint8_t>{1, 2, 3, 4, 5}));

  const auto entries = repo->ListQueueEntries(*tx);
  assert(entries.size() == 1);
  assert(entries[0].reference_id == id);

  // sequence keeps increasing after a restart
  auto next = MakeEntry(EntityType::kPhoto, id + "-photo", 2, 78);
  assert(repo->InsertQueueEntry(*tx, next));
  assert(next.sequence > entries[0].sequence);
  tx->Commit();
}

void VerifyOversizeValuesRejected() {
  fieldsync::db::sqlite::SqliteOptions options;
  options.path            = ":memory:";
  options.max_value_bytes = 1024;
  fieldsync::db::sqlite::SqliteRepository repo(options);
  repo.Open();

  auto tx = repo.Begin();

  PhotoRecord photo;
  photo.id             = "oversize-photo";
  photo.inspection_id  = "oversize-owner";
  photo.binary_payload = std::vector<uint8_t>(2048, 0xAB);
  photo.created_at_ms  = 100;
  auto put             = repo.PutPhoto(*tx, photo);
  assert(!put);
  assert(put.code == ErrorCode::Full);
  assert(!repo.GetPhoto(*tx, photo.id).has_value());

  auto record    = MakeInspection("oversize-owner", InspectionStatus::kPending, 100);
  record.payload = std::string(2048, 'x');
  put            = repo.PutInspection(*tx, record);
  assert(put.code == ErrorCode::Full);

  photo.binary_payload.resize(512);
  assert(repo.PutPhoto(*tx, photo));
  tx->Commit();
  repo.Close();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name = "memory",
      .make_repository =
          []() {
            auto repo = std::make_shared<MemoryRepository>();
            repo->Open();
            return std::shared_ptr<Repository>(repo);
          },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("fieldsync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    fieldsync::db::sqlite::SqliteOptions options;
    options.path = db_path;
    auto repo    = std::make_shared<fieldsync::db::sqlite::SqliteRepository>(options);
    repo->Open();
    return std::shared_ptr<Repository>(repo);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo->Close();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInspectionReadWrite(*repo, backend.name + "-inspection");
  VerifyEmbeddedNulSurvives(*repo, backend.name + "-binary");
  VerifyStatusIndex(*repo, backend.name + "-status");
  VerifyPhotoReadWrite(*repo, backend.name + "-photo");
  VerifyQueueOrdering(*repo, backend.name + "-queue");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyConcurrentUpdates(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);
  repo->Close();

  VerifyClosedStoreRejectsWork(backend);
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyOversizeValuesRejected();

  std::cout << "fieldsync_integration_repository_parity: pass\n";
  return 0;
}
