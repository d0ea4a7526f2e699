#pragma once

#include <cstdint>

#include "internal/util/time.hpp"

namespace market::sync {

/*
  Delay before retrying a failed or insufficient sync.

  Deterministic, non-decreasing in retry_count and saturating at 13h.
  Negative counts are treated as 0.
*/
util::Duration RetryDelay(int32_t retry_count);

} // namespace market::sync
