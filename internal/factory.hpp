#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/service/service_context.hpp"

namespace demonlist::factory {

/*
  Runtime

  Owns every long-lived object of the process. Members are declared in
  dependency order so the worker pool is stopped before the services it
  executes against are released.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<const service::ServiceContext> services;
  std::unique_ptr<executor::WorkerPool>          workers;
};

/*
  BuildRepository

  Picks the storage backend named in the config and bootstraps its tables.
  This is the only place that knows concrete repository types.
*/
std::shared_ptr<db::Repository> BuildRepository(const demonlist::runtime::config::RuntimeConfig& config);

// Repository, collaborators and a started worker pool.
Runtime BuildRuntime(const demonlist::runtime::config::RuntimeConfig& config);

} // namespace demonlist::factory
