#pragma once

#include <memory>

#include "internal/tasks/runnable.hpp"
#include "snapshot_builder.hpp"
#include "snapshot_holder.hpp"

namespace market::cache {

/*
  Periodically rebuilds the snapshot and publishes it. A failed build
  keeps the previously published snapshot in place.
*/
class CacheRebuildTask final : public tasks::Runnable {
 public:
  CacheRebuildTask(std::shared_ptr<db::Repository> repository, std::shared_ptr<SnapshotHolder> holder);

  std::string_view Name() const override {
    return "cache-rebuild";
  }

  void Run(tasks::TaskContext& context) override;

  // One build-and-publish pass. False if the build failed.
  bool RebuildNow();

 private:
  SnapshotBuilder                 builder_;
  std::shared_ptr<SnapshotHolder> holder_;
};

} // namespace market::cache
