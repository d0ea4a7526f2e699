#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/cache/cache_rebuild_task.hpp"
#include "internal/cache/snapshot_holder.hpp"
#include "internal/chain/contract_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/query_service.hpp"
#include "internal/tasks/recurrent_task.hpp"

#if MARKET_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace market::factory {

/*
  Application

  Owns all long-lived objects of the indexer process. Tasks are created
  stopped; the caller publishes the first snapshot, then starts them.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<cache::SnapshotHolder> snapshots;
  std::shared_ptr<chain::ContractReader> reader;

  std::shared_ptr<cache::CacheRebuildTask> cache_rebuild;
  std::shared_ptr<service::QueryService>   query_service;

  // Start order; stop in reverse.
  std::vector<std::shared_ptr<tasks::RecurrentTask>> tasks;

#if MARKET_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Build

  Composition root. Opens the store, runs migrations and the startup
  checks, and wires the tasks. It is the ONLY place allowed to know
  concrete DB and chain client types.
*/
Application Build(const market::runtime::config::RuntimeConfig& config);

// Exposed for tests.
std::shared_ptr<db::Repository> BuildRepository(const market::runtime::config::RuntimeConfig& config);

}
