#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace market::model {

/*
  Mirrors of on-chain contracts plus the records derived from them.

  Index and address are assigned when an entity is first discovered and
  never change. last_sync only moves forward; it is written exclusively by
  the sync scheduler.

  Entities are plain values. Copying one is a shallow copy: linked objects
  (Order::customer / Order::freelancer) are shared, so translated or
  display variants are made by copying first and then setting fields on
  the copy. Anything referenced from a published snapshot is const.
*/

using Hash = std::string; // raw content hash bytes

struct Admin {
  int64_t         index = 0;
  std::string     address;
  util::TimePoint last_sync{};

  std::string category;
  std::string nickname;
  std::string about;
  bool        can_approve_user = false;
  bool        can_revoke_user  = false;
  bool        revoked          = false;
};

enum class UserStatus : int32_t {
  Moderation = 0,
  Active     = 1,
  Banned     = 2,
};

std::string_view         ToString(UserStatus status);
std::optional<UserStatus> UserStatusFromInt(int32_t value);

struct User {
  int64_t         index = 0;
  std::string     address;
  util::TimePoint last_sync{};

  UserStatus          status = UserStatus::Moderation;
  std::string         nickname;
  std::string         language;
  std::string         specialization;
  std::string         telegram;
  std::string         portfolio;
  std::string         resume;
  std::string         about;
  std::optional<Hash> about_hash;
  util::TimePoint     created_at{};

  // Not persisted; filled on translated copies only.
  std::optional<std::string> about_translated;
};

struct Order {
  static constexpr int32_t kStatusModeration        = 0;
  static constexpr int32_t kStatusActive            = 1;
  static constexpr int32_t kStatusOffer             = 2;
  static constexpr int32_t kStatusInProgress        = 3;
  static constexpr int32_t kStatusPendingPayment    = 4;
  static constexpr int32_t kStatusRefunded          = 5;
  static constexpr int32_t kStatusCompleted         = 6;
  static constexpr int32_t kStatusPaymentForced     = 7;
  static constexpr int32_t kStatusPreArbitration    = 8;
  static constexpr int32_t kStatusOnArbitration     = 9;
  static constexpr int32_t kStatusArbitrationSolved = 10;

  int64_t         index = 0;
  std::string     address;
  util::TimePoint last_sync{};

  int32_t     status = kStatusModeration;
  std::string category;
  std::string language;
  std::string customer_address;
  std::string freelancer_address;

  std::string         name;
  std::optional<Hash> name_hash;
  std::string         description;
  std::optional<Hash> description_hash;
  std::string         technical_task;
  std::optional<Hash> technical_task_hash;

  int64_t         price = 0; // nanotons
  util::TimePoint deadline{};
  util::TimePoint created_at{};
  int32_t         responses_count             = 0;
  int32_t         arbitration_freelancer_part = 0;

  // Below: derived while building a snapshot, never persisted.
  std::string                 text_to_search;
  std::shared_ptr<const User> customer;
  std::shared_ptr<const User> freelancer;
  std::optional<std::string>  name_translated;
  std::optional<std::string>  description_translated;
  std::optional<std::string>  technical_task_translated;
};

struct Category {
  std::string hash;
  std::string name;
  bool        is_active = true;
};

// `hash` is the stable key, `name` the display name / code.
struct Language {
  std::string hash;
  std::string name;
  bool        is_active = true;
};

struct Translation {
  Hash                       hash;
  std::string                language; // Language::name
  std::optional<std::string> translated_text;
  util::TimePoint            timestamp{};
};

struct OrderResponse {
  int64_t         order_index = 0;
  std::string     freelancer_address;
  std::string     text;
  int64_t         price = 0;
  util::TimePoint timestamp{};
};

struct OrderActivity {
  int64_t         id          = 0; // assigned by the store
  int64_t         order_index = 0;
  std::string     sender_address;
  int32_t         op_code = 0;
  int64_t         amount  = 0;
  std::string     tx_hash;
  util::TimePoint timestamp{};
};

} // namespace market::model
