#pragma once

#include <cstdint>
#include <memory>

#include "internal/chain/contract_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/entity_type.hpp"

namespace market::sync {

// Freshness returned when the entity row no longer exists.
inline constexpr util::TimePoint kEntityVanished = util::TimePoint::max();

// Outcome of one refresh. `regressed` is set when the chain returned data
// older than the stored row; nothing was written and last_sync is the
// stored value.
struct RefreshResult {
  util::TimePoint last_sync{};
  bool            regressed = false;

  bool Vanished() const {
    return last_sync == kEntityVanished;
  }
};

/*
  Refreshes one stored entity from the chain.

  The stored row is read, handed to the contract reader, and written back
  only when the read succeeded and did not move last_sync backwards.
*/
class EntityRefresher {
 public:
  EntityRefresher(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ContractReader> reader);

  RefreshResult Refresh(model::EntityType type, int64_t index);

 private:
  template <typename Traits>
  RefreshResult RefreshWith(int64_t index);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<chain::ContractReader> reader_;
};

} // namespace market::sync
