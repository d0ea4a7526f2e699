#include "internal/tasks/recurrent_task.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;
using market::tasks::RecurrentTask;
using market::tasks::Runnable;
using market::tasks::TaskContext;

class ScriptedRunnable final : public Runnable {
 public:
  explicit ScriptedRunnable(std::function<void(TaskContext&)> body) : body_(std::move(body)) {
  }

  std::string_view Name() const override {
    return "scripted";
  }

  void Run(TaskContext& context) override {
    ++started;
    body_(context);
    ++finished;
  }

  std::atomic<int> started{0};
  std::atomic<int> finished{0};

 private:
  std::function<void(TaskContext&)> body_;
};

bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return condition();
}

void TestTriggersDuringRunCollapseIntoOne() {
  std::atomic<bool> release{false};
  auto runnable = std::make_shared<ScriptedRunnable>([&](TaskContext&) {
    while (!release) std::this_thread::sleep_for(1ms);
  });

  RecurrentTask task(runnable, 1h, 1h);
  task.Start();

  task.TryRunImmediately();
  assert(WaitFor([&] { return runnable->started == 1; }));

  for (int i = 0; i < 10; ++i) {
    task.TryRunImmediately();
  }
  release = true;

  assert(WaitFor([&] { return runnable->finished == 2; }));
  std::this_thread::sleep_for(50ms);
  assert(runnable->started == 2);

  task.Stop();
}

void TestRunnableCanShortenInterval() {
  auto runnable = std::make_shared<ScriptedRunnable>([](TaskContext& context) { context.SetInterval(5ms); });

  RecurrentTask task(runnable, 0ms, 1h);
  task.Start();
  assert(WaitFor([&] { return runnable->finished >= 3; }));
  task.Stop();
  assert(task.Interval() == 5ms);
}

void TestThrowingRunKeepsSchedule() {
  auto runnable = std::make_shared<ScriptedRunnable>([](TaskContext& context) {
    context.SetInterval(5ms);
    throw std::runtime_error("boom");
  });

  RecurrentTask task(runnable, 0ms, 5ms);
  task.Start();
  assert(WaitFor([&] { return runnable->started >= 3; }));
  task.Stop();
}

void TestStopCancelsInFlightRun() {
  std::atomic<bool> saw_cancel{false};
  auto runnable = std::make_shared<ScriptedRunnable>([&](TaskContext& context) {
    while (!context.IsCancelled()) std::this_thread::sleep_for(1ms);
    saw_cancel = true;
  });

  RecurrentTask task(runnable, 0ms, 1h);
  task.Start();
  assert(WaitFor([&] { return runnable->started == 1; }));
  task.Stop();
  assert(saw_cancel);
  assert(runnable->finished == 1);
}

void TestRunNowRunsOnCallingThread() {
  const auto caller = std::this_thread::get_id();
  std::thread::id ran_on;
  auto runnable = std::make_shared<ScriptedRunnable>([&](TaskContext&) { ran_on = std::this_thread::get_id(); });

  RecurrentTask task(runnable, 1h, 1h);
  task.RunNow();
  assert(runnable->finished == 1);
  assert(ran_on == caller);
}

void TestStartWhileRunningIsIgnored() {
  auto runnable = std::make_shared<ScriptedRunnable>([](TaskContext&) {});

  RecurrentTask task(runnable, 0ms, 5ms);
  task.Start();
  task.Start();
  assert(WaitFor([&] { return runnable->finished >= 2; }));
  task.Stop();

  // Restart after Stop spins up a fresh thread.
  const int before = runnable->finished;
  task.Start();
  assert(WaitFor([&] { return runnable->finished > before; }));
  task.Stop();
}

} // namespace

int main() {
  TestTriggersDuringRunCollapseIntoOne();
  TestRunnableCanShortenInterval();
  TestThrowingRunKeepsSchedule();
  TestStopCancelsInFlightRun();
  TestRunNowRunsOnCallingThread();
  TestStartWhileRunningIsIgnored();

  std::cout << "market_indexer_unit_recurrent_task: pass\n";
  return 0;
}
