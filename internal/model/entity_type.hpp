#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace market::model {

/*
  Kinds of on-chain contracts mirrored by the indexer.

  Values are persisted in the sync queue; do not renumber.
*/
enum class EntityType : int32_t {
  Admin = 0,
  User  = 1,
  Order = 2,
};

inline constexpr EntityType kAllEntityTypes[] = {EntityType::Admin, EntityType::User, EntityType::Order};

std::string_view ToString(EntityType type);

std::optional<EntityType> EntityTypeFromInt(int32_t value);

} // namespace market::model
