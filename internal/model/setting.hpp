#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace market::model {

/*
  Key/value row of the settings table. Values are stored as text and
  interpreted by the typed accessors.
*/
struct Setting {
  static constexpr std::string_view kMasterAddress             = "master_address";
  static constexpr std::string_view kInMainnet                 = "in_mainnet";
  static constexpr std::string_view kLastSeqno                 = "last_seqno";
  static constexpr std::string_view kIgnoreNotificationsBefore = "ignore_notifications_before";

  std::string key;
  std::string value;

  static Setting FromString(std::string_view key, std::string_view value);
  static Setting FromBool(std::string_view key, bool value);
  static Setting FromInt(std::string_view key, int64_t value);
  static Setting FromTime(std::string_view key, util::TimePoint value);

  std::optional<bool>            AsBool() const;
  std::optional<int64_t>         AsInt() const;
  std::optional<util::TimePoint> AsTime() const;
};

} // namespace market::model
