#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "memory_tx.hpp"

namespace market::db::memory {

namespace {

template <typename Map>
auto Values(const Map& map) {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto& [_, value] : map) {
    out.push_back(value);
  }
  return out;
}

template <typename Map, typename Key>
auto Find(const Map& map, const Key& key) -> std::optional<typename Map::mapped_type> {
  const auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

bool SyncOrder(const model::SyncQueueItem& a, const model::SyncQueueItem& b) {
  if (a.sync_at != b.sync_at) return a.sync_at < b.sync_at;
  return a.id < b.id;
}

std::vector<model::OrderActivity> NewestFirstPage(std::vector<model::OrderActivity> rows, const Pagination& page) {
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.id > b.id;
  });
  if (page.offset >= rows.size()) {
    return {};
  }
  const auto end = std::min(rows.size(), page.offset + page.limit);
  return {rows.begin() + static_cast<std::ptrdiff_t>(page.offset), rows.begin() + static_cast<std::ptrdiff_t>(end)};
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::Setting> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  return Find(TX(t).View().settings, key);
}

Result MemoryRepository::UpsertSetting(Transaction& t, const model::Setting& s) {
  TX(t).Mutable().settings[s.key] = s;
  return Result::Ok();
}

std::optional<model::Admin> MemoryRepository::GetAdmin(Transaction& t, int64_t index) {
  return Find(TX(t).View().admins, index);
}

Result MemoryRepository::UpsertAdmin(Transaction& t, const model::Admin& a) {
  TX(t).Mutable().admins[a.index] = a;
  return Result::Ok();
}

std::vector<model::Admin> MemoryRepository::ListAdmins(Transaction& t) {
  return Values(TX(t).View().admins);
}

std::optional<model::User> MemoryRepository::GetUser(Transaction& t, int64_t index) {
  return Find(TX(t).View().users, index);
}

Result MemoryRepository::UpsertUser(Transaction& t, const model::User& u) {
  auto stored             = u;
  stored.about_translated = std::nullopt;
  TX(t).Mutable().users[u.index] = std::move(stored);
  return Result::Ok();
}

std::vector<model::User> MemoryRepository::ListUsers(Transaction& t) {
  return Values(TX(t).View().users);
}

std::optional<model::Order> MemoryRepository::GetOrder(Transaction& t, int64_t index) {
  return Find(TX(t).View().orders, index);
}

Result MemoryRepository::UpsertOrder(Transaction& t, const model::Order& o) {
  // Only persisted columns survive, like the SQL backends.
  auto stored = o;
  stored.text_to_search.clear();
  stored.customer.reset();
  stored.freelancer.reset();
  stored.name_translated.reset();
  stored.description_translated.reset();
  stored.technical_task_translated.reset();
  TX(t).Mutable().orders[o.index] = std::move(stored);
  return Result::Ok();
}

std::vector<model::Order> MemoryRepository::ListOrders(Transaction& t) {
  return Values(TX(t).View().orders);
}

std::vector<model::Category> MemoryRepository::ListCategories(Transaction& t) {
  return Values(TX(t).View().categories);
}

Result MemoryRepository::UpsertCategory(Transaction& t, const model::Category& c) {
  TX(t).Mutable().categories[c.hash] = c;
  return Result::Ok();
}

std::vector<model::Language> MemoryRepository::ListLanguages(Transaction& t) {
  return Values(TX(t).View().languages);
}

Result MemoryRepository::UpsertLanguage(Transaction& t, const model::Language& l) {
  TX(t).Mutable().languages[l.hash] = l;
  return Result::Ok();
}

std::optional<model::Translation> MemoryRepository::GetTranslation(Transaction& t, const model::Hash& hash, const std::string& language) {
  return Find(TX(t).View().translations, std::make_pair(hash, language));
}

std::vector<model::Translation> MemoryRepository::ListTranslations(Transaction& t, const std::string& language,
                                                                   const std::vector<model::Hash>& hashes) {
  const auto&                     s = TX(t).View();
  std::unordered_set<std::string> seen;
  std::vector<model::Translation> out;
  for (const auto& hash : hashes) {
    if (!seen.insert(hash).second) continue;
    if (auto it = s.translations.find({hash, language}); it != s.translations.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

Result MemoryRepository::UpsertTranslation(Transaction& t, const model::Translation& tr) {
  TX(t).Mutable().translations[{tr.hash, tr.language}] = tr;
  return Result::Ok();
}

std::vector<model::OrderResponse> MemoryRepository::ListOrderResponses(Transaction& t, int64_t order_index) {
  std::vector<model::OrderResponse> out;
  for (const auto& [key, r] : TX(t).View().responses) {
    if (key.first == order_index) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
  return out;
}

std::optional<model::OrderResponse> MemoryRepository::GetOrderResponse(Transaction& t, int64_t order_index,
                                                                       const std::string& freelancer_address) {
  return Find(TX(t).View().responses, std::make_pair(order_index, freelancer_address));
}

Result MemoryRepository::UpsertOrderResponse(Transaction& t, const model::OrderResponse& r) {
  TX(t).Mutable().responses[{r.order_index, r.freelancer_address}] = r;
  return Result::Ok();
}

std::vector<model::OrderActivity> MemoryRepository::ListOrderActivitiesByOrder(Transaction& t, int64_t order_index, const Pagination& page) {
  std::vector<model::OrderActivity> rows;
  for (const auto& [_, a] : TX(t).View().activities) {
    if (a.order_index == order_index) rows.push_back(a);
  }
  return NewestFirstPage(std::move(rows), page);
}

std::vector<model::OrderActivity> MemoryRepository::ListOrderActivitiesBySender(Transaction& t, const std::string& sender_address,
                                                                                const Pagination& page) {
  std::vector<model::OrderActivity> rows;
  for (const auto& [_, a] : TX(t).View().activities) {
    if (a.sender_address == sender_address) rows.push_back(a);
  }
  return NewestFirstPage(std::move(rows), page);
}

Result MemoryRepository::InsertOrderActivity(Transaction& t, model::OrderActivity& a) {
  auto& s = TX(t).Mutable();
  a.id               = s.next_activity_id++;
  s.activities[a.id] = a;
  return Result::Ok();
}

Result MemoryRepository::EnqueueSync(Transaction& t, model::SyncQueueItem& item) {
  auto& s = TX(t).Mutable();
  item.id = s.next_sync_id++;
  s.sync_queue[item.id] = item;
  return Result::Ok();
}

std::optional<model::SyncQueueItem> MemoryRepository::NextSyncItem(Transaction& t) {
  const auto& q = TX(t).View().sync_queue;
  const auto  it =
      std::min_element(q.begin(), q.end(), [](const auto& a, const auto& b) { return SyncOrder(a.second, b.second); });
  if (it == q.end()) return std::nullopt;
  return it->second;
}

std::size_t MemoryRepository::DeleteSyncItems(Transaction& t, model::EntityType type, int64_t index, util::TimePoint max_min_last_sync) {
  auto&       q       = TX(t).Mutable().sync_queue;
  std::size_t deleted = 0;
  for (auto it = q.begin(); it != q.end();) {
    const auto& item = it->second;
    if (item.entity_type == type && item.index == index && item.min_last_sync <= max_min_last_sync) {
      it = q.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return deleted;
}

Result MemoryRepository::UpsertSyncItem(Transaction& t, const model::SyncQueueItem& item) {
  auto& s = TX(t).Mutable();
  if (item.id == 0) {
    return Result::Err(ErrorCode::InternalError, "sync item without id");
  }
  s.sync_queue[item.id] = item;
  s.next_sync_id        = std::max(s.next_sync_id, item.id + 1);
  return Result::Ok();
}

Result MemoryRepository::UpdateSyncItem(Transaction& t, const model::SyncQueueItem& item) {
  auto& q  = TX(t).Mutable().sync_queue;
  auto  it = q.find(item.id);
  if (it == q.end()) {
    return Result::Err(ErrorCode::NotFound, "sync item " + std::to_string(item.id));
  }
  it->second = item;
  return Result::Ok();
}

std::vector<model::SyncQueueItem> MemoryRepository::ListSyncItems(Transaction& t) {
  auto items = Values(TX(t).View().sync_queue);
  std::sort(items.begin(), items.end(), SyncOrder);
  return items;
}

} // namespace market::db::memory
