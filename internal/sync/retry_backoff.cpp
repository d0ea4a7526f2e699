#include "retry_backoff.hpp"

#include <algorithm>
#include <array>

namespace market::sync {

namespace {

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

const std::array<util::Duration, 14> kRetryDelays = {
    seconds(5),  seconds(5),  seconds(5),  seconds(10), seconds(15), seconds(30), seconds(60),
    minutes(2),  minutes(5),  minutes(10), minutes(30), hours(1),    hours(4),    hours(13),
};

} // namespace

util::Duration RetryDelay(int32_t retry_count) {
  const auto last  = static_cast<int32_t>(kRetryDelays.size()) - 1;
  const auto index = std::clamp(retry_count, 0, last);
  return kRetryDelays[static_cast<std::size_t>(index)];
}

} // namespace market::sync
