#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/entities.hpp"

namespace market::cache {

using UserPtr   = std::shared_ptr<const model::User>;
using OrderPtr  = std::shared_ptr<const model::Order>;
using OrderList = std::vector<OrderPtr>;

/*
  Immutable read model, rebuilt wholesale from the store.

  Never modified after publication. Entity lists exclude the placeholder
  rows that mirror the master contract itself. Every Order::customer /
  Order::freelancer points into `users` of the same snapshot.
*/
struct Snapshot {
  util::TimePoint built_at{};

  std::string master_address;
  bool        in_mainnet = false;
  int64_t     last_seqno = 0;

  std::vector<model::Admin> admins;
  std::vector<UserPtr>      users;
  OrderList                 orders;
  OrderList                 active_orders;

  std::vector<model::Category> categories;
  std::vector<model::Language> languages;

  // Keyed by lower-cased language hash and name; both keys share one list.
  std::unordered_map<std::string, std::shared_ptr<const OrderList>> active_orders_translated;

  std::map<int32_t, int32_t>           order_count_by_status;
  std::map<std::string, int32_t>       order_count_by_category;
  std::map<std::string, int32_t>       order_count_by_language;
  std::map<model::UserStatus, int32_t> user_count_by_status;
  std::map<std::string, int32_t>       user_count_by_language;

  // Active order index -> addresses that responded to it.
  std::unordered_map<int64_t, std::unordered_set<std::string>> active_order_responders;

  std::unordered_map<int64_t, UserPtr>      user_by_index;
  std::unordered_map<std::string, UserPtr>  user_by_address;
  std::unordered_map<int64_t, OrderPtr>     order_by_index;
  std::unordered_map<std::string, OrderPtr> order_by_address;

  // Accepts a language hash or name, case-insensitive. nullptr if unknown.
  const OrderList*       FindTranslated(std::string_view language) const;
  const model::Language* FindLanguage(std::string_view hash_or_name) const;

  UserPtr  FindUser(int64_t index) const;
  UserPtr  FindUserByAddress(const std::string& address) const;
  OrderPtr FindOrder(int64_t index) const;
  OrderPtr FindOrderByAddress(const std::string& address) const;

  bool HasResponded(int64_t order_index, const std::string& address) const;
};

std::string LowerAscii(std::string_view value);

} // namespace market::cache
