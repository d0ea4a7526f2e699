#include "force_resync_task.hpp"

#include <set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "sync_queue.hpp"

namespace market::sync {

namespace {

using QueuedKeys = std::set<std::pair<model::EntityType, int64_t>>;

template <typename Entity>
std::size_t EnqueueOlderThan(db::Repository& repo, db::Transaction& tx, model::EntityType type, const std::vector<Entity>& entities,
                             util::TimePoint threshold, util::TimePoint now, const QueuedKeys& queued) {
  std::size_t count = 0;
  for (const auto& entity : entities) {
    if (entity.last_sync >= threshold || queued.contains({type, entity.index})) {
      continue;
    }
    SyncQueue::EnqueueIn(repo, tx, type, entity.index, now, now);
    ++count;
  }
  return count;
}

} // namespace

ForceResyncTask::ForceResyncTask(std::shared_ptr<db::Repository> repository, ForceResyncSettings settings)
    : repository_(std::move(repository)), settings_(settings) {
}

void ForceResyncTask::Run(tasks::TaskContext& context) {
  if (context.IsCancelled()) {
    return;
  }
  const auto count = EnqueueStale(util::Now());
  if (count > 0) {
    MARKET_LOG_INFO("Force resync queued stale entities", {observability::IntField("count", static_cast<int64_t>(count))});
  } else {
    MARKET_LOG_DEBUG("Force resync found nothing stale");
  }
}

std::size_t ForceResyncTask::EnqueueStale(util::TimePoint now) {
  auto tx = repository_->Begin();

  QueuedKeys queued;
  for (const auto& item : repository_->ListSyncItems(*tx)) {
    queued.emplace(item.entity_type, item.index);
  }

  std::size_t count = 0;
  if (settings_.admin_max_age) {
    count += EnqueueOlderThan(*repository_, *tx, model::EntityType::Admin, repository_->ListAdmins(*tx),
                              now - *settings_.admin_max_age, now, queued);
  }
  if (settings_.user_max_age) {
    count += EnqueueOlderThan(*repository_, *tx, model::EntityType::User, repository_->ListUsers(*tx),
                              now - *settings_.user_max_age, now, queued);
  }
  if (settings_.order_max_age) {
    count += EnqueueOlderThan(*repository_, *tx, model::EntityType::Order, repository_->ListOrders(*tx),
                              now - *settings_.order_max_age, now, queued);
  }

  tx->Commit();
  return count;
}

} // namespace market::sync
