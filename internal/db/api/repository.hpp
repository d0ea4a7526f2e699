#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/entities.hpp"
#include "internal/model/setting.hpp"
#include "internal/model/sync_queue_item.hpp"

namespace market::db {

/*
  Repository abstraction over the entity store.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Single-row writes are atomic; nothing is visible before Commit()
  - A read transaction sees one point-in-time state (the cache rebuild
    scan depends on this)

  The store is the source of truth for:
    tracked entities (admins, users, orders)
    derived records (translations, responses, activity)
    the sync queue
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual std::optional<model::Setting> GetSetting(Transaction&, const std::string& key) = 0;

  virtual Result UpsertSetting(Transaction&, const model::Setting&) = 0;

  // ---------------------------------------------------------------------
  // Tracked entities (insert-or-replace, never deleted)
  // ---------------------------------------------------------------------

  virtual std::optional<model::Admin> GetAdmin(Transaction&, int64_t index) = 0;
  virtual Result                      UpsertAdmin(Transaction&, const model::Admin&) = 0;
  virtual std::vector<model::Admin>   ListAdmins(Transaction&) = 0;

  virtual std::optional<model::User> GetUser(Transaction&, int64_t index) = 0;
  virtual Result                     UpsertUser(Transaction&, const model::User&) = 0;
  virtual std::vector<model::User>   ListUsers(Transaction&) = 0;

  virtual std::optional<model::Order> GetOrder(Transaction&, int64_t index) = 0;
  virtual Result                      UpsertOrder(Transaction&, const model::Order&) = 0;
  virtual std::vector<model::Order>   ListOrders(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Reference data
  // ---------------------------------------------------------------------

  virtual std::vector<model::Category> ListCategories(Transaction&) = 0;
  virtual Result                       UpsertCategory(Transaction&, const model::Category&) = 0;

  virtual std::vector<model::Language> ListLanguages(Transaction&) = 0;
  virtual Result                       UpsertLanguage(Transaction&, const model::Language&) = 0;

  // ---------------------------------------------------------------------
  // Translations, keyed by (hash, language name)
  // ---------------------------------------------------------------------

  virtual std::optional<model::Translation> GetTranslation(Transaction&, const model::Hash& hash, const std::string& language) = 0;

  virtual std::vector<model::Translation> ListTranslations(Transaction&, const std::string& language,
                                                           const std::vector<model::Hash>& hashes) = 0;

  virtual Result UpsertTranslation(Transaction&, const model::Translation&) = 0;

  // ---------------------------------------------------------------------
  // Order responses and activity
  // ---------------------------------------------------------------------

  virtual std::vector<model::OrderResponse> ListOrderResponses(Transaction&, int64_t order_index) = 0;

  virtual std::optional<model::OrderResponse> GetOrderResponse(Transaction&, int64_t order_index,
                                                               const std::string& freelancer_address) = 0;

  virtual Result UpsertOrderResponse(Transaction&, const model::OrderResponse&) = 0;

  // Newest first.
  virtual std::vector<model::OrderActivity> ListOrderActivitiesByOrder(Transaction&, int64_t order_index, const Pagination&) = 0;

  // Newest first.
  virtual std::vector<model::OrderActivity> ListOrderActivitiesBySender(Transaction&, const std::string& sender_address,
                                                                        const Pagination&) = 0;

  // Assigns activity.id.
  virtual Result InsertOrderActivity(Transaction&, model::OrderActivity&) = 0;

  // ---------------------------------------------------------------------
  // Sync queue
  // ---------------------------------------------------------------------

  // Appends a new row and assigns item.id.
  virtual Result EnqueueSync(Transaction&, model::SyncQueueItem& item) = 0;

  // Row with the earliest sync_at (ties: lowest id).
  virtual std::optional<model::SyncQueueItem> NextSyncItem(Transaction&) = 0;

  // Deletes rows of (type, index) with min_last_sync <= max_min_last_sync.
  // Returns the number of deleted rows.
  virtual std::size_t DeleteSyncItems(Transaction&, model::EntityType type, int64_t index, util::TimePoint max_min_last_sync) = 0;

  // Insert-or-replace by item.id.
  virtual Result UpsertSyncItem(Transaction&, const model::SyncQueueItem&) = 0;

  // Update by item.id; NotFound when the row no longer exists.
  virtual Result UpdateSyncItem(Transaction&, const model::SyncQueueItem&) = 0;

  // Ordered like NextSyncItem.
  virtual std::vector<model::SyncQueueItem> ListSyncItems(Transaction&) = 0;
};

} // namespace market::db
