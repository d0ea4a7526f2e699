#include "sync_task.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "retry_backoff.hpp"

namespace market::sync {

using observability::DurationField;
using observability::IntField;
using observability::StringField;
using observability::TimeField;

SyncTask::SyncTask(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ContractReader> reader,
                   std::shared_ptr<tasks::Trigger> rebuild_trigger, SyncSettings settings)
    : repository_(std::move(repository)),
      reader_(std::move(reader)),
      rebuild_trigger_(std::move(rebuild_trigger)),
      settings_(settings),
      refresher_(repository_, reader_) {
}

void SyncTask::Run(tasks::TaskContext& context) {
  RunBatch(context);
}

BatchReport SyncTask::RunBatch(tasks::TaskContext& context) {
  BatchReport report;

  // Fast retry until the remote client is usable.
  context.SetInterval(settings_.fast_retry_interval);
  try {
    reader_->InitIfNeeded();
  } catch (const util::RemoteFailure& e) {
    MARKET_LOG_WARN("Chain client not ready, will retry", {StringField("error", e.what()),
                                                            DurationField("retry_in", settings_.fast_retry_interval)});
    return report;
  }

  int32_t counter = 0;
  while (counter < settings_.batch_cap && !context.IsCancelled()) {
    std::optional<model::SyncQueueItem> next;
    {
      auto tx = repository_->BeginRead();
      next    = repository_->NextSyncItem(*tx);
      tx->Commit();
    }

    if (!next) {
      MARKET_LOG_DEBUG("No [more] data to sync");
      context.SetInterval(settings_.interval);
      break;
    }

    const auto wait = std::chrono::duration_cast<util::Duration>(next->sync_at - util::Now());
    if (next->sync_at > util::Now()) {
      MARKET_LOG_DEBUG("Next sync is not due yet, will wait",
                       {StringField("type", model::ToString(next->entity_type)), IntField("index", next->index),
                        DurationField("wait", wait), TimeField("at", next->sync_at)});
      context.SetInterval(std::clamp(wait, util::Duration::zero(), settings_.interval));
      break;
    }

    ++counter;
    Process(*next, counter, report);
  }

  report.processed = counter;
  if (counter > 0 && rebuild_trigger_) {
    rebuild_trigger_->TryRunImmediately();
  }
  return report;
}

void SyncTask::Process(const model::SyncQueueItem& item, int32_t counter, BatchReport& report) {
  const auto type = model::ToString(item.entity_type);

  try {
    MARKET_LOG_DEBUG("Sync started", {IntField("n", counter), StringField("type", type), IntField("index", item.index)});

    const auto result    = refresher_.Refresh(item.entity_type, item.index);
    const auto last_sync = result.last_sync;

    if (result.regressed) {
      const auto delay = RetryDelay(item.retry_count);
      MARKET_LOG_WARN("Sync returned older data than stored, will retry",
                      {IntField("n", counter), StringField("type", type), IntField("index", item.index),
                       TimeField("stored", last_sync), DurationField("retry_in", delay)});
      RescheduleAndStore(item);
      ++report.rescheduled;
      return;
    }

    std::size_t deleted = 0;
    {
      auto tx = repository_->Begin();
      deleted = repository_->DeleteSyncItems(*tx, item.entity_type, item.index, last_sync);
      tx->Commit();
    }

    if (result.Vanished()) {
      MARKET_LOG_WARN("Sync SKIPPED, entity no longer exists", {IntField("n", counter), StringField("type", type),
                                                                IntField("index", item.index),
                                                                IntField("deleted", static_cast<int64_t>(deleted))});
      ++report.skipped;
      return;
    }

    MARKET_LOG_DEBUG("Sync done", {IntField("n", counter), StringField("type", type), IntField("index", item.index),
                                   TimeField("last_sync", last_sync), IntField("deleted", static_cast<int64_t>(deleted))});

    if (last_sync < item.min_last_sync) {
      const auto delay = RetryDelay(item.retry_count);
      MARKET_LOG_WARN("Sync less than required, will retry",
                      {IntField("n", counter), StringField("type", type), IntField("index", item.index),
                       TimeField("required", item.min_last_sync), TimeField("achieved", last_sync), DurationField("retry_in", delay)});
      RescheduleAndStore(item);
      ++report.rescheduled;
      return;
    }

    ++report.succeeded;
  } catch (const util::StorageFatal&) {
    throw;
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("Sync failed, will retry", {IntField("n", counter), StringField("type", type), IntField("index", item.index),
                                                 StringField("error", e.what()), DurationField("retry_in", RetryDelay(item.retry_count))});
    ++report.failed;

    auto retry = item;
    Reschedule(retry);
    try {
      auto tx     = repository_->Begin();
      auto result = repository_->UpdateSyncItem(*tx, retry);
      if (result.code == db::ErrorCode::NotFound) {
        MARKET_LOG_WARN("Sync item removed while syncing", {StringField("type", type), IntField("index", item.index)});
        return;
      }
      db::ThrowIfDbError(result, "reschedule sync item");
      tx->Commit();
    } catch (const util::StorageFatal&) {
      throw;
    } catch (const std::exception& reschedule_error) {
      MARKET_LOG_ERROR("Could not reschedule sync item", {StringField("type", type), IntField("index", item.index),
                                                          StringField("error", reschedule_error.what())});
    }
  }
}

void SyncTask::Reschedule(model::SyncQueueItem& item) {
  item.sync_at = util::Now() + RetryDelay(item.retry_count);
  item.retry_count += 1;
}

void SyncTask::RescheduleAndStore(const model::SyncQueueItem& item) {
  auto retry = item;
  Reschedule(retry);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertSyncItem(*tx, retry), "reschedule sync item");
  tx->Commit();
}

} // namespace market::sync
