#include "setting.hpp"

#include <charconv>

namespace market::model {

Setting Setting::FromString(std::string_view key, std::string_view value) {
  return Setting{std::string(key), std::string(value)};
}

Setting Setting::FromBool(std::string_view key, bool value) {
  return Setting{std::string(key), value ? "true" : "false"};
}

Setting Setting::FromInt(std::string_view key, int64_t value) {
  return Setting{std::string(key), std::to_string(value)};
}

Setting Setting::FromTime(std::string_view key, util::TimePoint value) {
  return FromInt(key, util::ToUnixMicros(value));
}

std::optional<bool> Setting::AsBool() const {
  if (value == "true") return true;
  if (value == "false") return false;
  return std::nullopt;
}

std::optional<int64_t> Setting::AsInt() const {
  int64_t     parsed = 0;
  const auto* end    = value.data() + value.size();
  auto [ptr, ec]     = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<util::TimePoint> Setting::AsTime() const {
  auto micros = AsInt();
  if (!micros) {
    return std::nullopt;
  }
  return util::FromUnixMicros(*micros);
}

} // namespace market::model
