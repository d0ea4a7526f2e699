#include "cache_rebuild_task.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::cache {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

CacheRebuildTask::CacheRebuildTask(std::shared_ptr<db::Repository> repository, std::shared_ptr<SnapshotHolder> holder)
    : builder_(std::move(repository)), holder_(std::move(holder)) {
}

void CacheRebuildTask::Run(tasks::TaskContext&) {
  RebuildNow();
}

bool CacheRebuildTask::RebuildNow() {
  const auto started = std::chrono::steady_clock::now();

  std::shared_ptr<const Snapshot> snapshot;
  try {
    snapshot = builder_.Build();
  } catch (const util::StorageFatal&) {
    throw;
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("Cache rebuild failed, keeping previous snapshot", {StringField("error", e.what())});
    return false;
  }

  holder_->Publish(std::move(snapshot));

  const auto took = std::chrono::duration_cast<util::Duration>(std::chrono::steady_clock::now() - started);
  MARKET_LOG_INFO("Cache rebuilt", {IntField("version", static_cast<int64_t>(holder_->Version())), DurationField("took", took)});
  return true;
}

} // namespace market::cache
