#include "snapshot.hpp"

#include <algorithm>
#include <cctype>

namespace market::cache {

std::string LowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const OrderList* Snapshot::FindTranslated(std::string_view language) const {
  const auto it = active_orders_translated.find(LowerAscii(language));
  return it == active_orders_translated.end() ? nullptr : it->second.get();
}

const model::Language* Snapshot::FindLanguage(std::string_view hash_or_name) const {
  for (const auto& language : languages) {
    if (language.hash == hash_or_name || language.name == hash_or_name) {
      return &language;
    }
  }
  return nullptr;
}

template <typename Map, typename Key>
static typename Map::mapped_type Lookup(const Map& map, const Key& key) {
  const auto it = map.find(key);
  return it == map.end() ? nullptr : it->second;
}

UserPtr Snapshot::FindUser(int64_t index) const {
  return Lookup(user_by_index, index);
}

UserPtr Snapshot::FindUserByAddress(const std::string& address) const {
  return Lookup(user_by_address, address);
}

OrderPtr Snapshot::FindOrder(int64_t index) const {
  return Lookup(order_by_index, index);
}

OrderPtr Snapshot::FindOrderByAddress(const std::string& address) const {
  return Lookup(order_by_address, address);
}

bool Snapshot::HasResponded(int64_t order_index, const std::string& address) const {
  const auto it = active_order_responders.find(order_index);
  return it != active_order_responders.end() && it->second.contains(address);
}

} // namespace market::cache
