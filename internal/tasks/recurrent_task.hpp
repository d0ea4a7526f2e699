#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "runnable.hpp"

namespace market::tasks {

/*
  Runs one Runnable on a dedicated thread: first after `initial_delay`,
  then every Interval() measured from the end of the previous run.

  Runs never overlap. An exception escaping a run is logged and the
  schedule continues.
*/
class RecurrentTask final : public Trigger, private TaskContext {
 public:
  RecurrentTask(std::shared_ptr<Runnable> runnable, util::Duration initial_delay, util::Duration interval);
  ~RecurrentTask() override;

  RecurrentTask(const RecurrentTask&)            = delete;
  RecurrentTask& operator=(const RecurrentTask&) = delete;

  // No-op while the thread is running.
  void Start();

  // Cancels, wakes the thread and joins it. Safe to call twice.
  void Stop();

  void TryRunImmediately() override;

  // Runs on the calling thread, serialized with scheduled runs.
  void RunNow();

  util::Duration Interval() const override;

 private:
  void SetInterval(util::Duration interval) override;
  bool IsCancelled() const override;

  void Loop();
  void Execute();

  std::shared_ptr<Runnable> runnable_;
  util::Duration            initial_delay_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  util::Duration          interval_;
  bool                    pending_  = false;
  bool                    stopping_ = false;

  std::mutex  run_mutex_;
  std::thread thread_;
};

} // namespace market::tasks
