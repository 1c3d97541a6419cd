#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "upload/v1/manifest.pb.h"

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/engine/upload_engine.hpp"
#include "internal/planner/upload_planner.hpp"
#include "internal/progress/progress_monitor.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/storage/s3/s3_object_store.hpp"

namespace upload::factory {

/*
  Application

  Owns everything one upload run needs.
*/
struct Application {
  storage::ObjectStorePtr                      store;
  std::shared_ptr<checkpoint::CheckpointStore> checkpoints;
  std::shared_ptr<progress::ProgressMonitor>   monitor;
  std::unique_ptr<engine::UploadEngine>        engine;
};

// Defaults applied, sizes parsed, limits checked. Throws util::InvalidArgument.
engine::EngineOptions         BuildEngineOptions(const upload::runtime::config::RuntimeConfig& config);
std::filesystem::path         ResolveCacheDir(const upload::runtime::config::RuntimeConfig& config);
progress::MonitorOptions      BuildMonitorOptions(const upload::runtime::config::RuntimeConfig& config);
storage::S3ObjectStoreOptions BuildObjectStoreOptions(const upload::runtime::config::RuntimeConfig& config);

std::vector<planner::UploadRequest> BuildRequests(const upload::v1::UploadManifest& manifest);

/*
  Build

  Composition root: the only place that knows concrete store types.
  A null store means "S3 per config.object_store".
*/
Application Build(const upload::runtime::config::RuntimeConfig& config, storage::ObjectStorePtr store = nullptr);

} // namespace upload::factory
