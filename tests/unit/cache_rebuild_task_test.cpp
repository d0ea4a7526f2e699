#include "internal/cache/cache_rebuild_task.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "support/fakes.hpp"

namespace {

using market::cache::CacheRebuildTask;
using market::cache::SnapshotHolder;
using market::db::Repository;
using market::db::Transaction;
using market::db::memory::MemoryRepository;
using market::testing::FaultyRepository;
using market::testing::MakeUser;
using market::testing::Seed;

struct Fixture {
  std::shared_ptr<MemoryRepository> store  = std::make_shared<MemoryRepository>();
  std::shared_ptr<FaultyRepository> repo   = std::make_shared<FaultyRepository>(store);
  std::shared_ptr<SnapshotHolder>   holder = std::make_shared<SnapshotHolder>();
  CacheRebuildTask                  task{repo, holder};
};

void TestRebuildPublishesStoreContents() {
  Fixture f;
  Seed(*f.store, [](Repository& r, Transaction& tx) { assert(r.UpsertUser(tx, MakeUser(1, "U1"))); });

  assert(f.task.RebuildNow());
  assert(f.holder->Version() == 1);
  assert(f.holder->Current()->FindUser(1));
}

void TestFailedBuildKeepsPreviousSnapshot() {
  Fixture f;
  Seed(*f.store, [](Repository& r, Transaction& tx) { assert(r.UpsertUser(tx, MakeUser(1, "U1"))); });
  assert(f.task.RebuildNow());
  auto before = f.holder->Current();

  Seed(*f.store, [](Repository& r, Transaction& tx) { assert(r.UpsertUser(tx, MakeUser(2, "U2"))); });
  f.repo->begin_error = FaultyRepository::Failure::Storage;

  assert(!f.task.RebuildNow());
  assert(f.holder->Current() == before);
  assert(f.holder->Version() == 1);

  f.repo->begin_error = FaultyRepository::Failure::None;
  assert(f.task.RebuildNow());
  assert(f.holder->Current()->FindUser(2));
}

void TestFatalStorageErrorPropagates() {
  Fixture f;
  f.repo->begin_error = FaultyRepository::Failure::Fatal;

  bool threw = false;
  try {
    f.task.RebuildNow();
  } catch (const market::util::StorageFatal&) {
    threw = true;
  }
  assert(threw);
  assert(f.holder->Version() == 0);
}

void TestRunRebuilds() {
  Fixture                             f;
  market::testing::ManualTaskContext ctx(std::chrono::minutes(1));
  f.task.Run(ctx);
  f.task.Run(ctx);
  assert(f.holder->Version() == 2);
}

} // namespace

int main() {
  TestRebuildPublishesStoreContents();
  TestFailedBuildKeepsPreviousSnapshot();
  TestFatalStorageErrorPropagates();
  TestRunRebuilds();

  std::cout << "market_indexer_unit_cache_rebuild_task: pass\n";
  return 0;
}
