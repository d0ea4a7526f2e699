#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/chain/contract_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/tasks/runnable.hpp"
#include "internal/util/errors.hpp"

namespace market::testing {

/*
  Contract reader answering from per-index scripts. Unscripted reads
  succeed with `default_last_sync` and leave contract fields untouched.
*/
class StubContractReader final : public chain::ContractReader {
 public:
  using AdminScript = std::function<void(model::Admin&)>;
  using UserScript  = std::function<void(model::User&)>;
  using OrderScript = std::function<void(model::Order&)>;

  void InitIfNeeded() override {
    ++init_calls;
    if (!ready) {
      throw util::RemoteFailure("stub reader not ready");
    }
  }

  void ReadAdmin(model::Admin& admin) override {
    ++reads;
    if (auto it = admins.find(admin.index); it != admins.end()) {
      it->second(admin);
      return;
    }
    admin.last_sync = default_last_sync;
  }

  void ReadUser(model::User& user) override {
    ++reads;
    if (auto it = users.find(user.index); it != users.end()) {
      it->second(user);
      return;
    }
    user.last_sync = default_last_sync;
  }

  void ReadOrder(model::Order& order) override {
    ++reads;
    if (auto it = orders.find(order.index); it != orders.end()) {
      it->second(order);
      return;
    }
    order.last_sync = default_last_sync;
  }

  bool                         ready = true;
  util::TimePoint              default_last_sync = util::Now();
  std::map<int64_t, AdminScript> admins;
  std::map<int64_t, UserScript>  users;
  std::map<int64_t, OrderScript> orders;

  std::atomic<int> init_calls{0};
  std::atomic<int> reads{0};
};

class SpyTrigger final : public tasks::Trigger {
 public:
  void TryRunImmediately() override {
    ++calls;
  }

  std::atomic<int> calls{0};
};

class ManualTaskContext final : public tasks::TaskContext {
 public:
  explicit ManualTaskContext(util::Duration interval) : interval_(interval) {
  }

  util::Duration Interval() const override {
    return interval_;
  }

  void SetInterval(util::Duration interval) override {
    interval_ = interval;
  }

  bool IsCancelled() const override {
    return cancelled;
  }

  bool cancelled = false;

 private:
  util::Duration interval_;
};

/*
  Forwards to another repository. Opening a transaction throws
  `begin_error` while it is set.
*/
class FaultyRepository final : public db::Repository {
 public:
  explicit FaultyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    MaybeFail();
    return inner_->Begin();
  }
  std::unique_ptr<db::Transaction> BeginRead() override {
    MaybeFail();
    return inner_->BeginRead();
  }

  std::optional<model::Setting> GetSetting(db::Transaction& tx, const std::string& key) override {
    return inner_->GetSetting(tx, key);
  }
  db::Result UpsertSetting(db::Transaction& tx, const model::Setting& s) override {
    return inner_->UpsertSetting(tx, s);
  }

  std::optional<model::Admin> GetAdmin(db::Transaction& tx, int64_t index) override {
    return inner_->GetAdmin(tx, index);
  }
  db::Result UpsertAdmin(db::Transaction& tx, const model::Admin& a) override {
    return inner_->UpsertAdmin(tx, a);
  }
  std::vector<model::Admin> ListAdmins(db::Transaction& tx) override {
    return inner_->ListAdmins(tx);
  }

  std::optional<model::User> GetUser(db::Transaction& tx, int64_t index) override {
    return inner_->GetUser(tx, index);
  }
  db::Result UpsertUser(db::Transaction& tx, const model::User& u) override {
    return inner_->UpsertUser(tx, u);
  }
  std::vector<model::User> ListUsers(db::Transaction& tx) override {
    return inner_->ListUsers(tx);
  }

  std::optional<model::Order> GetOrder(db::Transaction& tx, int64_t index) override {
    return inner_->GetOrder(tx, index);
  }
  db::Result UpsertOrder(db::Transaction& tx, const model::Order& o) override {
    return inner_->UpsertOrder(tx, o);
  }
  std::vector<model::Order> ListOrders(db::Transaction& tx) override {
    return inner_->ListOrders(tx);
  }

  std::vector<model::Category> ListCategories(db::Transaction& tx) override {
    return inner_->ListCategories(tx);
  }
  db::Result UpsertCategory(db::Transaction& tx, const model::Category& c) override {
    return inner_->UpsertCategory(tx, c);
  }

  std::vector<model::Language> ListLanguages(db::Transaction& tx) override {
    return inner_->ListLanguages(tx);
  }
  db::Result UpsertLanguage(db::Transaction& tx, const model::Language& l) override {
    return inner_->UpsertLanguage(tx, l);
  }

  std::optional<model::Translation> GetTranslation(db::Transaction& tx, const model::Hash& hash, const std::string& language) override {
    return inner_->GetTranslation(tx, hash, language);
  }
  std::vector<model::Translation> ListTranslations(db::Transaction& tx, const std::string& language,
                                                   const std::vector<model::Hash>& hashes) override {
    return inner_->ListTranslations(tx, language, hashes);
  }
  db::Result UpsertTranslation(db::Transaction& tx, const model::Translation& t) override {
    return inner_->UpsertTranslation(tx, t);
  }

  std::vector<model::OrderResponse> ListOrderResponses(db::Transaction& tx, int64_t order_index) override {
    return inner_->ListOrderResponses(tx, order_index);
  }
  std::optional<model::OrderResponse> GetOrderResponse(db::Transaction& tx, int64_t order_index,
                                                       const std::string& freelancer_address) override {
    return inner_->GetOrderResponse(tx, order_index, freelancer_address);
  }
  db::Result UpsertOrderResponse(db::Transaction& tx, const model::OrderResponse& r) override {
    return inner_->UpsertOrderResponse(tx, r);
  }

  std::vector<model::OrderActivity> ListOrderActivitiesByOrder(db::Transaction& tx, int64_t order_index,
                                                               const db::Pagination& page) override {
    return inner_->ListOrderActivitiesByOrder(tx, order_index, page);
  }
  std::vector<model::OrderActivity> ListOrderActivitiesBySender(db::Transaction& tx, const std::string& sender_address,
                                                                const db::Pagination& page) override {
    return inner_->ListOrderActivitiesBySender(tx, sender_address, page);
  }
  db::Result InsertOrderActivity(db::Transaction& tx, model::OrderActivity& a) override {
    return inner_->InsertOrderActivity(tx, a);
  }

  db::Result EnqueueSync(db::Transaction& tx, model::SyncQueueItem& item) override {
    return inner_->EnqueueSync(tx, item);
  }
  std::optional<model::SyncQueueItem> NextSyncItem(db::Transaction& tx) override {
    return inner_->NextSyncItem(tx);
  }
  std::size_t DeleteSyncItems(db::Transaction& tx, model::EntityType type, int64_t index, util::TimePoint max_min_last_sync) override {
    return inner_->DeleteSyncItems(tx, type, index, max_min_last_sync);
  }
  db::Result UpsertSyncItem(db::Transaction& tx, const model::SyncQueueItem& item) override {
    return inner_->UpsertSyncItem(tx, item);
  }
  db::Result UpdateSyncItem(db::Transaction& tx, const model::SyncQueueItem& item) override {
    return inner_->UpdateSyncItem(tx, item);
  }
  std::vector<model::SyncQueueItem> ListSyncItems(db::Transaction& tx) override {
    return inner_->ListSyncItems(tx);
  }

  enum class Failure { None, Storage, Fatal };
  Failure begin_error = Failure::None;

 private:
  void MaybeFail() const {
    switch (begin_error) {
      case Failure::None:
        return;
      case Failure::Storage:
        throw util::StorageFailure("injected storage failure");
      case Failure::Fatal:
        throw util::StorageFatal("injected storage corruption");
    }
  }

  std::shared_ptr<db::Repository> inner_;
};

// ---------------------------------------------------------------------------
// Seeding helpers
// ---------------------------------------------------------------------------

inline void Seed(db::Repository& repo, const std::function<void(db::Repository&, db::Transaction&)>& fn) {
  auto tx = repo.Begin();
  fn(repo, *tx);
  tx->Commit();
}

inline model::User MakeUser(int64_t index, std::string address, model::UserStatus status = model::UserStatus::Active) {
  model::User user;
  user.index    = index;
  user.address  = std::move(address);
  user.status   = status;
  user.nickname = "user-" + std::to_string(index);
  return user;
}

inline model::Order MakeOrder(int64_t index, std::string address, std::string customer, int32_t status = model::Order::kStatusActive) {
  model::Order order;
  order.index            = index;
  order.address          = std::move(address);
  order.customer_address = std::move(customer);
  order.status           = status;
  order.name             = "order " + std::to_string(index);
  return order;
}

} // namespace market::testing
