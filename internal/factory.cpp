#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace fieldsync::factory {

namespace {

using google::protobuf::util::TimeUtil;

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

std::shared_ptr<db::Repository> BuildRepository(const fieldsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) throw std::invalid_argument("database.sqlite.path must be set");

    db::sqlite::SqliteOptions options;
    options.path     = sqlite.path();
    options.wal_mode = sqlite.wal_mode();
    if (!sqlite.synchronous().empty()) options.synchronous = sqlite.synchronous();
    if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = sqlite.busy_timeout_ms();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(options));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

sync::SyncCoordinatorOptions SyncOptionsFromConfig(const fieldsync::runtime::config::RuntimeConfig& config) {
  sync::SyncCoordinatorOptions options;
  if (!config.has_sync()) {
    return options;
  }

  const auto& sync          = config.sync();
  options.retry.max_retries = sync.max_retries();
  if (sync.has_base_backoff()) options.retry.base_backoff = ToMillis(sync.base_backoff());
  if (sync.has_max_backoff()) options.retry.max_backoff = ToMillis(sync.max_backoff());
  if (sync.has_stale_claim_after()) options.stale_claim_after = ToMillis(sync.stale_claim_after());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const fieldsync::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  if (!clock) throw std::invalid_argument("Build requires a clock");

  Application app;
  app.clock = std::move(clock);

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.repository->Open();

  // ------------------------------------------------------------------
  // Managers
  // ------------------------------------------------------------------
  app.queue        = std::make_shared<core::SyncQueue>(app.repository, app.clock);
  app.inspections  = std::make_shared<core::InspectionManager>(app.repository, app.queue, app.clock);
  app.attachments  = std::make_shared<core::AttachmentManager>(app.repository, app.queue, app.clock);
  app.sync_options = SyncOptionsFromConfig(config);

  FIELDSYNC_LOG_INFO("local store ready",
                     {observability::StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                      observability::IntField("queued", static_cast<int64_t>(app.queue->Count()))});
  return app;
}

std::shared_ptr<sync::SyncCoordinator> BuildCoordinator(const Application& app, std::shared_ptr<sync::Uploader> uploader) {
  return std::make_shared<sync::SyncCoordinator>(app.inspections, app.attachments, app.queue, std::move(uploader), app.clock,
                                                 app.sync_options);
}

} // namespace fieldsync::factory
