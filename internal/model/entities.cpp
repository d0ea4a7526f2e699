#include "entities.hpp"

namespace market::model {

std::string_view ToString(UserStatus status) {
  switch (status) {
    case UserStatus::Moderation:
      return "moderation";
    case UserStatus::Active:
      return "active";
    case UserStatus::Banned:
      return "banned";
  }
  return "unknown";
}

std::optional<UserStatus> UserStatusFromInt(int32_t value) {
  switch (value) {
    case static_cast<int32_t>(UserStatus::Moderation):
      return UserStatus::Moderation;
    case static_cast<int32_t>(UserStatus::Active):
      return UserStatus::Active;
    case static_cast<int32_t>(UserStatus::Banned):
      return UserStatus::Banned;
    default:
      return std::nullopt;
  }
}

} // namespace market::model
