#pragma once

#include <cstdint>

#include "internal/model/entity_type.hpp"
#include "internal/util/time.hpp"

namespace market::model {

/*
  One pending refresh of (entity_type, index).

  Several rows for the same key may coexist (e.g. a discovery enqueue
  racing a force-resync). A sync that reaches freshness F removes every row
  of that key whose min_last_sync <= F.

  - sync_at:       earliest time the row may be processed (delayed retry)
  - min_last_sync: freshness the refresh must reach to count as done
  - retry_count:   failed or insufficient attempts so far, drives backoff
*/
struct SyncQueueItem {
  int64_t         id = 0; // row id, assigned by the store
  EntityType      entity_type = EntityType::Admin;
  int64_t         index       = 0;
  util::TimePoint sync_at{};
  util::TimePoint min_last_sync{};
  int32_t         retry_count = 0;
};

} // namespace market::model
