#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace market::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::optional<model::Setting> GetSetting(Transaction&, const std::string& key) override;
  Result UpsertSetting(Transaction&, const model::Setting&) override;

  std::optional<model::Admin> GetAdmin(Transaction&, int64_t index) override;
  Result UpsertAdmin(Transaction&, const model::Admin&) override;
  std::vector<model::Admin> ListAdmins(Transaction&) override;

  std::optional<model::User> GetUser(Transaction&, int64_t index) override;
  Result UpsertUser(Transaction&, const model::User&) override;
  std::vector<model::User> ListUsers(Transaction&) override;

  std::optional<model::Order> GetOrder(Transaction&, int64_t index) override;
  Result UpsertOrder(Transaction&, const model::Order&) override;
  std::vector<model::Order> ListOrders(Transaction&) override;

  std::vector<model::Category> ListCategories(Transaction&) override;
  Result UpsertCategory(Transaction&, const model::Category&) override;

  std::vector<model::Language> ListLanguages(Transaction&) override;
  Result UpsertLanguage(Transaction&, const model::Language&) override;

  std::optional<model::Translation> GetTranslation(Transaction&, const model::Hash& hash, const std::string& language) override;
  std::vector<model::Translation> ListTranslations(Transaction&, const std::string& language,
                                                   const std::vector<model::Hash>& hashes) override;
  Result UpsertTranslation(Transaction&, const model::Translation&) override;

  std::vector<model::OrderResponse> ListOrderResponses(Transaction&, int64_t order_index) override;
  std::optional<model::OrderResponse> GetOrderResponse(Transaction&, int64_t order_index,
                                                       const std::string& freelancer_address) override;
  Result UpsertOrderResponse(Transaction&, const model::OrderResponse&) override;

  std::vector<model::OrderActivity> ListOrderActivitiesByOrder(Transaction&, int64_t order_index, const Pagination&) override;
  std::vector<model::OrderActivity> ListOrderActivitiesBySender(Transaction&, const std::string& sender_address,
                                                                const Pagination&) override;
  Result InsertOrderActivity(Transaction&, model::OrderActivity&) override;

  Result EnqueueSync(Transaction&, model::SyncQueueItem& item) override;
  std::optional<model::SyncQueueItem> NextSyncItem(Transaction&) override;
  std::size_t DeleteSyncItems(Transaction&, model::EntityType type, int64_t index, util::TimePoint max_min_last_sync) override;
  Result UpsertSyncItem(Transaction&, const model::SyncQueueItem&) override;
  Result UpdateSyncItem(Transaction&, const model::SyncQueueItem&) override;
  std::vector<model::SyncQueueItem> ListSyncItems(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
