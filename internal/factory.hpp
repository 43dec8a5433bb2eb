#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/attachment_manager.hpp"
#include "internal/core/inspection_manager.hpp"
#include "internal/core/sync_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/sync/sync_coordinator.hpp"
#include "internal/util/time.hpp"

namespace fieldsync::sync {
class Uploader;
}

namespace fieldsync::factory {

/*
  Application

  Owns the long-lived objects of one local store. The repository is open
  when Build returns; it closes when the last owner releases it.
*/
struct Application {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<const util::Clock> clock;

  std::shared_ptr<core::SyncQueue>         queue;
  std::shared_ptr<core::InspectionManager> inspections;
  std::shared_ptr<core::AttachmentManager> attachments;

  sync::SyncCoordinatorOptions sync_options;
};

/*
  Build

  Composition root. It is the ONLY place allowed to know concrete
  repository types. Throws util::StorageError when the store cannot open.
*/
Application Build(const fieldsync::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<const util::Clock>               clock = std::make_shared<util::WallClock>());

sync::SyncCoordinatorOptions SyncOptionsFromConfig(const fieldsync::runtime::config::RuntimeConfig& config);

std::shared_ptr<sync::SyncCoordinator> BuildCoordinator(const Application& app, std::shared_ptr<sync::Uploader> uploader);

} // namespace fieldsync::factory
