#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"

namespace market::sync {

/*
  Producer side of the sync queue, used by discovery and force-resync.
*/
class SyncQueue {
 public:
  explicit SyncQueue(std::shared_ptr<db::Repository> repository);

  // Due now, requiring freshness of at least now. Returns the row id.
  int64_t Enqueue(model::EntityType type, int64_t index);

  int64_t EnqueueAt(model::EntityType type, int64_t index, util::TimePoint sync_at, util::TimePoint min_last_sync);

  // Same as EnqueueAt, inside a caller-owned transaction.
  static int64_t EnqueueIn(db::Repository& repository, db::Transaction& tx, model::EntityType type, int64_t index,
                           util::TimePoint sync_at, util::TimePoint min_last_sync);

  std::size_t Pending();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace market::sync
