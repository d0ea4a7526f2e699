#include "entity_refresher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::sync {

namespace {

struct AdminTraits {
  using Entity                      = model::Admin;
  static constexpr const char* kName = "Admin";

  static std::optional<Entity> Get(db::Repository& repo, db::Transaction& tx, int64_t index) {
    return repo.GetAdmin(tx, index);
  }
  static void Read(chain::ContractReader& reader, Entity& entity) {
    reader.ReadAdmin(entity);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, const Entity& entity) {
    return repo.UpsertAdmin(tx, entity);
  }
};

struct UserTraits {
  using Entity                      = model::User;
  static constexpr const char* kName = "User";

  static std::optional<Entity> Get(db::Repository& repo, db::Transaction& tx, int64_t index) {
    return repo.GetUser(tx, index);
  }
  static void Read(chain::ContractReader& reader, Entity& entity) {
    reader.ReadUser(entity);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, const Entity& entity) {
    return repo.UpsertUser(tx, entity);
  }
};

struct OrderTraits {
  using Entity                      = model::Order;
  static constexpr const char* kName = "Order";

  static std::optional<Entity> Get(db::Repository& repo, db::Transaction& tx, int64_t index) {
    return repo.GetOrder(tx, index);
  }
  static void Read(chain::ContractReader& reader, Entity& entity) {
    reader.ReadOrder(entity);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, const Entity& entity) {
    return repo.UpsertOrder(tx, entity);
  }
};

} // namespace

EntityRefresher::EntityRefresher(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ContractReader> reader)
    : repository_(std::move(repository)), reader_(std::move(reader)) {
}

RefreshResult EntityRefresher::Refresh(model::EntityType type, int64_t index) {
  switch (type) {
    case model::EntityType::Admin:
      return RefreshWith<AdminTraits>(index);
    case model::EntityType::User:
      return RefreshWith<UserTraits>(index);
    case model::EntityType::Order:
      return RefreshWith<OrderTraits>(index);
  }
  return RefreshResult{kEntityVanished};
}

template <typename Traits>
RefreshResult EntityRefresher::RefreshWith(int64_t index) {
  std::optional<typename Traits::Entity> entity;
  {
    auto tx = repository_->BeginRead();
    entity  = Traits::Get(*repository_, *tx, index);
    tx->Commit();
  }

  if (!entity) {
    MARKET_LOG_WARN("Entity not found, nothing to sync",
                    {observability::StringField("type", Traits::kName), observability::IntField("index", index)});
    return RefreshResult{kEntityVanished};
  }

  const auto stored_last_sync = entity->last_sync;
  const auto address          = entity->address;

  // Remote call happens outside any store transaction.
  Traits::Read(*reader_, *entity);

  if (entity->index != index || entity->address != address) {
    throw util::InvalidState(std::string(Traits::kName) + " #" + std::to_string(index) + " changed identity during refresh");
  }

  if (entity->last_sync < stored_last_sync) {
    MARKET_LOG_WARN("Refresh returned older data than stored, not persisted",
                    {observability::StringField("type", Traits::kName), observability::IntField("index", index),
                     observability::TimeField("stored", stored_last_sync), observability::TimeField("received", entity->last_sync)});
    return RefreshResult{stored_last_sync, true};
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(Traits::Upsert(*repository_, *tx, *entity), std::string("upsert ") + Traits::kName);
  tx->Commit();
  return RefreshResult{entity->last_sync};
}

} // namespace market::sync
