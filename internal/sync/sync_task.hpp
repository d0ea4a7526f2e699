#pragma once

#include <memory>

#include "entity_refresher.hpp"
#include "internal/tasks/runnable.hpp"

namespace market::sync {

struct SyncSettings {
  util::Duration interval            = std::chrono::minutes(5);
  util::Duration fast_retry_interval = std::chrono::seconds(3);
  int32_t        batch_cap           = 100;
};

// Outcome of one scheduler invocation.
struct BatchReport {
  int32_t processed   = 0;
  int32_t succeeded   = 0;
  int32_t skipped     = 0; // entity vanished
  int32_t rescheduled = 0; // freshness below the required threshold, or older than stored
  int32_t failed      = 0; // refresh threw
};

/*
  Drains the sync queue in SyncAt order.

  Each run handles at most batch_cap due items. The run re-arms the task
  interval: normal cadence when the queue is empty, the time until the
  next item is due when that is sooner, and the fast-retry interval while
  the remote client is not ready or more due items remain.

  Per-item failures become reschedules with RetryDelay() backoff. Only
  util::StorageFatal escapes a run.
*/
class SyncTask final : public tasks::Runnable {
 public:
  SyncTask(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ContractReader> reader,
           std::shared_ptr<tasks::Trigger> rebuild_trigger, SyncSettings settings);

  std::string_view Name() const override {
    return "sync";
  }

  void Run(tasks::TaskContext& context) override;

  BatchReport RunBatch(tasks::TaskContext& context);

 private:
  void Process(const model::SyncQueueItem& item, int32_t counter, BatchReport& report);
  void Reschedule(model::SyncQueueItem& item);
  void RescheduleAndStore(const model::SyncQueueItem& item);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<chain::ContractReader> reader_;
  std::shared_ptr<tasks::Trigger>        rebuild_trigger_;
  SyncSettings                           settings_;
  EntityRefresher                        refresher_;
};

} // namespace market::sync
