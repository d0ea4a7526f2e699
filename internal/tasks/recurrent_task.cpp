#include "recurrent_task.hpp"

#include "internal/observability/logging.hpp"

namespace market::tasks {

RecurrentTask::RecurrentTask(std::shared_ptr<Runnable> runnable, util::Duration initial_delay, util::Duration interval)
    : runnable_(std::move(runnable)), initial_delay_(initial_delay), interval_(interval) {
}

RecurrentTask::~RecurrentTask() {
  Stop();
}

void RecurrentTask::Start() {
  if (thread_.joinable()) {
    return; // already running
  }
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&RecurrentTask::Loop, this);
}

void RecurrentTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void RecurrentTask::TryRunImmediately() {
  {
    std::lock_guard lock(mutex_);
    if (pending_) {
      return;
    }
    pending_ = true;
  }
  cv_.notify_all();
}

void RecurrentTask::RunNow() {
  Execute();
}

util::Duration RecurrentTask::Interval() const {
  std::lock_guard lock(mutex_);
  return interval_;
}

void RecurrentTask::SetInterval(util::Duration interval) {
  std::lock_guard lock(mutex_);
  interval_ = interval;
}

bool RecurrentTask::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return stopping_;
}

void RecurrentTask::Loop() {
  auto next = std::chrono::steady_clock::now() + initial_delay_;

  std::unique_lock lock(mutex_);
  while (!stopping_) {
    cv_.wait_until(lock, next, [&] { return stopping_ || pending_; });
    if (stopping_) {
      break;
    }
    pending_ = false;

    lock.unlock();
    Execute();
    lock.lock();

    next = std::chrono::steady_clock::now() + interval_;
  }
}

void RecurrentTask::Execute() {
  std::lock_guard run_lock(run_mutex_);
  try {
    runnable_->Run(*this);
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("Task run failed",
                     {observability::StringField("task", runnable_->Name()), observability::StringField("error", e.what())});
  }
}

} // namespace market::tasks
