#include "snapshot_builder.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace market::cache {

namespace {

using observability::IntField;

std::string UpperAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

bool SameLanguage(const std::string& order_language, const model::Language& language) {
  const auto lowered = LowerAscii(order_language);
  return !lowered.empty() && (lowered == LowerAscii(language.hash) || lowered == LowerAscii(language.name));
}

std::optional<std::string> TranslatedText(const std::unordered_map<model::Hash, const model::Translation*>& by_hash,
                                          const std::optional<model::Hash>& hash) {
  if (!hash) {
    return std::nullopt;
  }
  const auto it = by_hash.find(*hash);
  if (it == by_hash.end()) {
    return std::nullopt;
  }
  return it->second->translated_text;
}

std::optional<std::string> ReadString(db::Repository& repo, db::Transaction& tx, std::string_view key) {
  auto setting = repo.GetSetting(tx, std::string(key));
  if (!setting) return std::nullopt;
  return setting->value;
}

} // namespace

std::string BuildSearchText(const model::Order& order) {
  return UpperAscii(order.name + '\n' + order.description + '\n' + order.technical_task);
}

SnapshotBuilder::SnapshotBuilder(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::shared_ptr<const Snapshot> SnapshotBuilder::Build() {
  auto& repo = *repository_;
  auto  tx   = repo.BeginRead();
  auto  snap = std::make_shared<Snapshot>();

  snap->built_at = util::Now();

  // ------------------------------------------------------------------
  // Settings
  // ------------------------------------------------------------------

  snap->master_address = ReadString(repo, *tx, model::Setting::kMasterAddress).value_or("");
  if (auto s = repo.GetSetting(*tx, std::string(model::Setting::kInMainnet))) {
    snap->in_mainnet = s->AsBool().value_or(false);
  }
  if (auto s = repo.GetSetting(*tx, std::string(model::Setting::kLastSeqno))) {
    snap->last_seqno = s->AsInt().value_or(0);
  }
  const auto& master = snap->master_address;

  // ------------------------------------------------------------------
  // Entities, without the master contract placeholders
  // ------------------------------------------------------------------

  const auto admins = repo.ListAdmins(*tx);
  for (const auto& admin : admins) {
    if (admin.address != master) snap->admins.push_back(admin);
  }

  auto users = repo.ListUsers(*tx);
  for (auto& user : users) {
    if (user.address == master) continue;
    auto ptr = std::make_shared<const model::User>(std::move(user));
    snap->user_by_index.emplace(ptr->index, ptr);
    snap->user_by_address.emplace(ptr->address, ptr);
    snap->users.push_back(std::move(ptr));
  }

  auto orders = repo.ListOrders(*tx);
  for (auto& order : orders) {
    if (order.customer_address == master) continue;

    order.customer       = snap->FindUserByAddress(order.customer_address);
    order.freelancer     = snap->FindUserByAddress(order.freelancer_address);
    order.text_to_search = BuildSearchText(order);

    auto ptr = std::make_shared<const model::Order>(std::move(order));
    snap->order_by_index.emplace(ptr->index, ptr);
    snap->order_by_address.emplace(ptr->address, ptr);
    if (ptr->status == model::Order::kStatusActive) {
      snap->active_orders.push_back(ptr);
    }
    snap->orders.push_back(std::move(ptr));
  }

  snap->categories = repo.ListCategories(*tx);
  snap->languages  = repo.ListLanguages(*tx);

  // ------------------------------------------------------------------
  // Translated copies of active orders, one list per language
  // ------------------------------------------------------------------

  std::vector<model::Hash>        hashes;
  std::unordered_set<model::Hash> seen;
  for (const auto& order : snap->active_orders) {
    for (const auto* hash : {&order->name_hash, &order->description_hash, &order->technical_task_hash}) {
      if (*hash && seen.insert(**hash).second) hashes.push_back(**hash);
    }
  }

  for (const auto& language : snap->languages) {
    const auto translations = repo.ListTranslations(*tx, language.name, hashes);

    std::unordered_map<model::Hash, const model::Translation*> by_hash;
    for (const auto& translation : translations) {
      by_hash.emplace(translation.hash, &translation);
    }

    auto copies = std::make_shared<OrderList>();
    copies->reserve(snap->active_orders.size());
    for (const auto& order : snap->active_orders) {
      auto copy = std::make_shared<model::Order>(*order);
      if (!SameLanguage(order->language, language)) {
        copy->name_translated           = TranslatedText(by_hash, order->name_hash);
        copy->description_translated    = TranslatedText(by_hash, order->description_hash);
        copy->technical_task_translated = TranslatedText(by_hash, order->technical_task_hash);
      }
      copies->push_back(std::move(copy));
    }

    std::shared_ptr<const OrderList> shared = std::move(copies);
    snap->active_orders_translated[LowerAscii(language.hash)] = shared;
    snap->active_orders_translated[LowerAscii(language.name)] = shared;
  }

  // ------------------------------------------------------------------
  // Responders per active order
  // ------------------------------------------------------------------

  for (const auto& order : snap->active_orders) {
    auto& responders = snap->active_order_responders[order->index];
    for (const auto& response : repo.ListOrderResponses(*tx, order->index)) {
      responders.insert(response.freelancer_address);
    }
  }

  // ------------------------------------------------------------------
  // Aggregates
  // ------------------------------------------------------------------

  for (const auto& order : snap->orders) {
    ++snap->order_count_by_status[order->status];
    if (!order->category.empty()) ++snap->order_count_by_category[order->category];
    if (!order->language.empty()) ++snap->order_count_by_language[order->language];
  }
  for (const auto& user : snap->users) {
    ++snap->user_count_by_status[user->status];
    if (!user->language.empty()) ++snap->user_count_by_language[user->language];
  }

  tx->Commit();

  MARKET_LOG_DEBUG("Snapshot built", {IntField("seqno", snap->last_seqno), IntField("admins", static_cast<int64_t>(snap->admins.size())),
                                      IntField("admins_total", static_cast<int64_t>(admins.size())),
                                      IntField("users", static_cast<int64_t>(snap->users.size())),
                                      IntField("users_total", static_cast<int64_t>(users.size())),
                                      IntField("orders", static_cast<int64_t>(snap->orders.size())),
                                      IntField("orders_total", static_cast<int64_t>(orders.size())),
                                      IntField("active", static_cast<int64_t>(snap->active_orders.size())),
                                      IntField("categories", static_cast<int64_t>(snap->categories.size())),
                                      IntField("languages", static_cast<int64_t>(snap->languages.size()))});
  return snap;
}

} // namespace market::cache
