#include "entity_type.hpp"

namespace market::model {

std::string_view ToString(EntityType type) {
  switch (type) {
    case EntityType::Admin:
      return "Admin";
    case EntityType::User:
      return "User";
    case EntityType::Order:
      return "Order";
  }
  return "Unknown";
}

std::optional<EntityType> EntityTypeFromInt(int32_t value) {
  switch (value) {
    case static_cast<int32_t>(EntityType::Admin):
      return EntityType::Admin;
    case static_cast<int32_t>(EntityType::User):
      return EntityType::User;
    case static_cast<int32_t>(EntityType::Order):
      return EntityType::Order;
    default:
      return std::nullopt;
  }
}

} // namespace market::model
