#include "internal/sync/force_resync_task.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/sync/sync_queue.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using market::db::Repository;
using market::db::Transaction;
using market::db::memory::MemoryRepository;
using market::model::EntityType;
using market::sync::ForceResyncSettings;
using market::sync::ForceResyncTask;
using market::sync::SyncQueue;
using market::testing::MakeOrder;
using market::testing::MakeUser;
using market::testing::Seed;
using market::util::Now;

void TestOnlyStaleEntitiesOfConfiguredTypesAreQueued() {
  auto       repo = std::make_shared<MemoryRepository>();
  const auto now  = Now();

  Seed(*repo, [&](Repository& r, Transaction& tx) {
    auto fresh_user      = MakeUser(1, "U1");
    fresh_user.last_sync = now - 10min;
    auto stale_user      = MakeUser(2, "U2");
    stale_user.last_sync = now - 2h;
    auto stale_order     = MakeOrder(1, "O1", "U1");
    stale_order.last_sync = now - 2h;
    assert(r.UpsertUser(tx, fresh_user));
    assert(r.UpsertUser(tx, stale_user));
    assert(r.UpsertOrder(tx, stale_order));
  });

  ForceResyncSettings settings;
  settings.user_max_age = 1h;
  ForceResyncTask task(repo, settings);

  assert(task.EnqueueStale(now) == 1);

  auto tx   = repo->BeginRead();
  auto rows = repo->ListSyncItems(*tx);
  assert(rows.size() == 1);
  assert(rows[0].entity_type == EntityType::User);
  assert(rows[0].index == 2);
  assert(rows[0].sync_at == now);
  assert(rows[0].min_last_sync == now);
}

void TestAlreadyQueuedEntitiesAreSkipped() {
  auto       repo = std::make_shared<MemoryRepository>();
  const auto now  = Now();

  Seed(*repo, [&](Repository& r, Transaction& tx) {
    auto order      = MakeOrder(4, "O4", "U1");
    order.last_sync = now - 1h;
    assert(r.UpsertOrder(tx, order));
  });
  SyncQueue(repo).Enqueue(EntityType::Order, 4);

  ForceResyncSettings settings;
  settings.order_max_age = 1min;
  ForceResyncTask task(repo, settings);

  assert(task.EnqueueStale(now) == 0);
  assert(SyncQueue(repo).Pending() == 1);
}

void TestMasterPlaceholderIsIncluded() {
  auto       repo = std::make_shared<MemoryRepository>();
  const auto now  = Now();

  Seed(*repo, [&](Repository& r, Transaction& tx) {
    market::model::Admin master;
    master.index   = 0;
    master.address = "MASTER";
    assert(r.UpsertAdmin(tx, master));
  });

  ForceResyncSettings settings;
  settings.admin_max_age = 1h;
  ForceResyncTask task(repo, settings);
  assert(task.EnqueueStale(now) == 1);
}

} // namespace

int main() {
  TestOnlyStaleEntitiesOfConfiguredTypesAreQueued();
  TestAlreadyQueuedEntitiesAreSkipped();
  TestMasterPlaceholderIsIncluded();

  std::cout << "market_indexer_unit_force_resync: pass\n";
  return 0;
}
