#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/startup_checks.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/force_resync_task.hpp"
#include "internal/sync/sync_task.hpp"
#include "internal/util/errors.hpp"
#if MARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MARKET_GRPC
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/chain/gateway_contract_reader.hpp"
#include "internal/grpc/query_server.hpp"
#endif

namespace market::factory {

using namespace market;
using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<chain::ContractReader> BuildContractReader(const market::runtime::config::RuntimeConfig& config,
                                                           const market::config::TaskSettings&          settings) {
  const auto& chain_config = config.chain();
  if (chain_config.gateway_address().empty()) {
    throw util::InvalidArgument("chain.gateway_address is not set");
  }
#if MARKET_GRPC
  auto channel = ::grpc::CreateChannel(chain_config.gateway_address(), ::grpc::InsecureChannelCredentials());
  MARKET_LOG_INFO("Chain gateway configured", {StringField("address", chain_config.gateway_address()),
                                               DurationField("request_timeout", settings.request_timeout)});
  return std::make_shared<chain::GatewayContractReader>(std::move(channel), chain_config.use_mainnet(), settings.request_timeout);
#else
  (void)settings;
  throw util::InvalidState("chain gateway client requires gRPC support at build time");
#endif
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const market::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MARKET_DB_SQLITE
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    const auto applied   = db::sql::RunMigrations(*sqlite_db, db::sql::SchemaMigrations());
    MARKET_LOG_INFO("SQLite store opened", {StringField("path", database.sqlite().path()), IntField("migrations_applied", static_cast<int64_t>(applied)),
                                            IntField("schema_version", sqlite_db->SchemaVersion())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  MARKET_LOG_WARN("Using in-memory store, nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const market::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto  settings = market::config::ConfigLoader::Resolve(config);

  // ------------------------------------------------------------------
  // Store and safety rails
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  runtime::RunStartupChecks(*app.repository, config.chain().master_address(), config.chain().use_mainnet());

  // ------------------------------------------------------------------
  // Read model
  // ------------------------------------------------------------------
  app.snapshots     = std::make_shared<cache::SnapshotHolder>();
  app.cache_rebuild = std::make_shared<cache::CacheRebuildTask>(app.repository, app.snapshots);
  auto rebuild_task = std::make_shared<tasks::RecurrentTask>(app.cache_rebuild, settings.rebuild_interval, settings.rebuild_interval);

  // ------------------------------------------------------------------
  // Sync scheduler
  // ------------------------------------------------------------------
  app.reader = BuildContractReader(config, settings);

  sync::SyncSettings sync_settings;
  sync_settings.interval            = settings.sync_interval;
  sync_settings.fast_retry_interval = settings.fast_retry_interval;
  sync_settings.batch_cap           = settings.batch_cap;

  auto sync_runnable = std::make_shared<sync::SyncTask>(app.repository, app.reader, rebuild_task, sync_settings);
  auto sync_task     = std::make_shared<tasks::RecurrentTask>(sync_runnable, util::Duration::zero(), settings.sync_interval);

  app.tasks.push_back(rebuild_task);
  app.tasks.push_back(sync_task);

  // ------------------------------------------------------------------
  // Force-resync producer
  // ------------------------------------------------------------------
  sync::ForceResyncSettings force_settings;
  force_settings.admin_max_age = settings.admin_max_age;
  force_settings.user_max_age  = settings.user_max_age;
  force_settings.order_max_age = settings.order_max_age;

  if (force_settings.admin_max_age || force_settings.user_max_age || force_settings.order_max_age) {
    auto force_runnable = std::make_shared<sync::ForceResyncTask>(app.repository, force_settings);
    app.tasks.push_back(std::make_shared<tasks::RecurrentTask>(force_runnable, settings.force_resync_interval, settings.force_resync_interval));
  } else {
    MARKET_LOG_INFO("Force-resync disabled, no max age configured");
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.snapshots  = app.snapshots;
  ctx.repository = app.repository;

  app.query_service = std::make_shared<service::QueryService>(ctx);

#if MARKET_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::QueryServer>(app.query_service));
#endif

  MARKET_LOG_INFO("Runtime built", {DurationField("sync_interval", settings.sync_interval),
                                    DurationField("rebuild_interval", settings.rebuild_interval),
                                    IntField("batch_cap", settings.batch_cap), BoolField("mainnet", config.chain().use_mainnet())});
  return app;
}

}
