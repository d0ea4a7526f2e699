#include "internal/cache/snapshot_holder.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using market::cache::Snapshot;
using market::cache::SnapshotHolder;

void TestStartsEmpty() {
  SnapshotHolder holder;
  auto           snap = holder.Current();
  assert(snap);
  assert(snap->orders.empty());
  assert(holder.Version() == 0);
}

void TestPublishingNullIsRejected() {
  SnapshotHolder holder;
  bool           threw = false;
  try {
    holder.Publish(nullptr);
  } catch (const market::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(holder.Version() == 0);
}

void TestReadersKeepTheSnapshotTheyTook() {
  SnapshotHolder holder;

  auto first        = std::make_shared<Snapshot>();
  first->last_seqno = 1;
  holder.Publish(first);
  auto held = holder.Current();

  auto second        = std::make_shared<Snapshot>();
  second->last_seqno = 2;
  holder.Publish(second);

  assert(held->last_seqno == 1);
  assert(holder.Current()->last_seqno == 2);
  assert(holder.Version() == 2);
}

void TestConcurrentReadersSeeWholeSnapshots() {
  SnapshotHolder    holder;
  std::atomic<bool> stop{false};
  std::atomic<int>  torn{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        auto snap = holder.Current();
        if (snap->last_seqno != static_cast<int64_t>(snap->admins.size())) {
          ++torn;
        }
      }
    });
  }

  for (int64_t n = 1; n <= 200; ++n) {
    auto snap        = std::make_shared<Snapshot>();
    snap->last_seqno = n;
    snap->admins.resize(static_cast<std::size_t>(n));
    holder.Publish(snap);
  }
  stop = true;
  for (auto& t : readers) t.join();

  assert(torn == 0);
  assert(holder.Version() == 200);
}

} // namespace

int main() {
  TestStartsEmpty();
  TestPublishingNullIsRejected();
  TestReadersKeepTheSnapshotTheyTook();
  TestConcurrentReadersSeeWholeSnapshots();

  std::cout << "market_indexer_unit_snapshot_holder: pass\n";
  return 0;
}
