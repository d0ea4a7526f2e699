#pragma once

#include <string_view>

#include "internal/util/time.hpp"

namespace market::tasks {

/*
  View of the owning task handed to a Runnable during one run.
*/
class TaskContext {
 public:
  virtual ~TaskContext() = default;

  virtual util::Duration Interval() const = 0;

  // Delay before the next periodic run, measured from the end of this one.
  virtual void SetInterval(util::Duration interval) = 0;

  virtual bool IsCancelled() const = 0;
};

class Runnable {
 public:
  virtual ~Runnable() = default;

  virtual std::string_view Name() const = 0;

  virtual void Run(TaskContext& context) = 0;
};

/*
  Out-of-band run request. Requests that arrive while a run is pending or
  in flight collapse into one subsequent run.
*/
class Trigger {
 public:
  virtual ~Trigger() = default;

  virtual void TryRunImmediately() = 0;
};

} // namespace market::tasks
