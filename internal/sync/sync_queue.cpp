#include "sync_queue.hpp"

namespace market::sync {

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

int64_t SyncQueue::Enqueue(model::EntityType type, int64_t index) {
  const auto now = util::Now();
  return EnqueueAt(type, index, now, now);
}

int64_t SyncQueue::EnqueueAt(model::EntityType type, int64_t index, util::TimePoint sync_at, util::TimePoint min_last_sync) {
  auto       tx = repository_->Begin();
  const auto id = EnqueueIn(*repository_, *tx, type, index, sync_at, min_last_sync);
  tx->Commit();
  return id;
}

int64_t SyncQueue::EnqueueIn(db::Repository& repository, db::Transaction& tx, model::EntityType type, int64_t index,
                             util::TimePoint sync_at, util::TimePoint min_last_sync) {
  model::SyncQueueItem item;
  item.entity_type   = type;
  item.index         = index;
  item.sync_at       = sync_at;
  item.min_last_sync = min_last_sync;
  item.retry_count   = 0;
  db::ThrowIfDbError(repository.EnqueueSync(tx, item), "enqueue sync");
  return item.id;
}

std::size_t SyncQueue::Pending() {
  auto tx    = repository_->BeginRead();
  auto items = repository_->ListSyncItems(*tx);
  tx->Commit();
  return items.size();
}

} // namespace market::sync
