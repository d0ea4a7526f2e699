#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/tasks/runnable.hpp"

namespace market::sync {

// Unset age disables force-resync for that entity type.
struct ForceResyncSettings {
  std::optional<util::Duration> admin_max_age;
  std::optional<util::Duration> user_max_age;
  std::optional<util::Duration> order_max_age;
};

/*
  Periodically queues entities whose last_sync is older than the
  configured age, so slow-changing contracts still get re-read.
  Entities that already have a queue row are left alone.
*/
class ForceResyncTask final : public tasks::Runnable {
 public:
  ForceResyncTask(std::shared_ptr<db::Repository> repository, ForceResyncSettings settings);

  std::string_view Name() const override {
    return "force-resync";
  }

  void Run(tasks::TaskContext& context) override;

  // Returns the number of rows enqueued.
  std::size_t EnqueueStale(util::TimePoint now);

 private:
  std::shared_ptr<db::Repository> repository_;
  ForceResyncSettings             settings_;
};

} // namespace market::sync
