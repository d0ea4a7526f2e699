#include "internal/cache/snapshot_builder.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "support/fakes.hpp"

namespace {

using market::cache::BuildSearchText;
using market::cache::SnapshotBuilder;
using market::db::Repository;
using market::db::Transaction;
using market::db::memory::MemoryRepository;
using market::model::Language;
using market::model::Order;
using market::model::Setting;
using market::model::Translation;
using market::model::UserStatus;
using market::testing::MakeOrder;
using market::testing::MakeUser;
using market::testing::Seed;

constexpr const char* kMaster = "MASTER";

Translation MakeTranslation(std::string hash, std::string language, std::string text) {
  Translation t;
  t.hash            = std::move(hash);
  t.language        = std::move(language);
  t.translated_text = std::move(text);
  return t;
}

// Two languages, one order written in each, with cross translations stored.
std::shared_ptr<MemoryRepository> MakeTranslatedStore() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, [](Repository& r, Transaction& tx) {
    assert(r.UpsertSetting(tx, Setting::FromString(Setting::kMasterAddress, kMaster)));
    assert(r.UpsertLanguage(tx, Language{"H-EN", "EN", true}));
    assert(r.UpsertLanguage(tx, Language{"H-RU", "RU", true}));

    assert(r.UpsertUser(tx, MakeUser(1, "U1")));

    auto english      = MakeOrder(1, "O1", "U1");
    english.language  = "EN";
    english.name_hash = "n1";
    auto russian      = MakeOrder(2, "O2", "U1");
    russian.language  = "H-RU";
    russian.name_hash = "n2";
    assert(r.UpsertOrder(tx, english));
    assert(r.UpsertOrder(tx, russian));

    assert(r.UpsertTranslation(tx, MakeTranslation("n1", "EN", "english original")));
    assert(r.UpsertTranslation(tx, MakeTranslation("n1", "RU", "order one in ru")));
    assert(r.UpsertTranslation(tx, MakeTranslation("n2", "EN", "order two in en")));
    assert(r.UpsertTranslation(tx, MakeTranslation("n2", "RU", "russian original")));
  });
  return repo;
}

const Order& ByIndex(const market::cache::OrderList& list, int64_t index) {
  for (const auto& order : list) {
    if (order->index == index) return *order;
  }
  assert(false && "order missing from list");
  return *list.front();
}

void TestTranslatedListsSkipTheSourceLanguage() {
  auto snap = SnapshotBuilder(MakeTranslatedStore()).Build();

  const auto* en = snap->FindTranslated("EN");
  const auto* ru = snap->FindTranslated("RU");
  assert(en && ru);
  assert(en->size() == 2 && ru->size() == 2);

  assert(!ByIndex(*en, 1).name_translated);
  assert(ByIndex(*en, 2).name_translated == "order two in en");
  assert(ByIndex(*ru, 1).name_translated == "order one in ru");
  assert(!ByIndex(*ru, 2).name_translated);
}

void TestTranslatedCopiesLeaveBaseOrdersUntouched() {
  auto snap = SnapshotBuilder(MakeTranslatedStore()).Build();

  for (const auto& order : snap->active_orders) {
    assert(!order->name_translated);
  }
  const auto* ru = snap->FindTranslated("RU");
  assert(ByIndex(*ru, 1).customer == snap->FindOrder(1)->customer);
}

void TestLanguageLookupByHashAndNameIsCaseInsensitive() {
  auto snap = SnapshotBuilder(MakeTranslatedStore()).Build();

  assert(snap->FindTranslated("h-ru") == snap->FindTranslated("Ru"));
  assert(snap->FindTranslated("H-EN") == snap->FindTranslated("en"));
  assert(snap->FindTranslated("DE") == nullptr);

  assert(snap->FindLanguage("H-RU") != nullptr);
  assert(snap->FindLanguage("RU") != nullptr);
  assert(snap->FindLanguage("DE") == nullptr);
}

void TestMasterPlaceholdersAreExcluded() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, [](Repository& r, Transaction& tx) {
    assert(r.UpsertSetting(tx, Setting::FromString(Setting::kMasterAddress, kMaster)));

    market::model::Admin admin_placeholder;
    admin_placeholder.index   = 0;
    admin_placeholder.address = kMaster;
    market::model::Admin admin;
    admin.index   = 1;
    admin.address = "A1";
    assert(r.UpsertAdmin(tx, admin_placeholder));
    assert(r.UpsertAdmin(tx, admin));

    assert(r.UpsertUser(tx, MakeUser(0, kMaster)));
    assert(r.UpsertUser(tx, MakeUser(1, "U1")));
    assert(r.UpsertOrder(tx, MakeOrder(0, "O0", kMaster)));
    assert(r.UpsertOrder(tx, MakeOrder(1, "O1", "U1")));
  });

  auto snap = SnapshotBuilder(repo).Build();
  assert(snap->master_address == kMaster);
  assert(snap->admins.size() == 1 && snap->admins[0].address == "A1");
  assert(snap->users.size() == 1 && snap->users[0]->address == "U1");
  assert(snap->orders.size() == 1 && snap->orders[0]->index == 1);
  assert(!snap->FindUserByAddress(kMaster));
  assert(!snap->FindOrder(0));
}

void TestOrdersLinkToUsersOfTheSameSnapshot() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, [](Repository& r, Transaction& tx) {
    assert(r.UpsertUser(tx, MakeUser(1, "U1")));
    assert(r.UpsertUser(tx, MakeUser(2, "U2")));
    auto order               = MakeOrder(1, "O1", "U1", Order::kStatusInProgress);
    order.freelancer_address = "U2";
    assert(r.UpsertOrder(tx, order));
    assert(r.UpsertOrder(tx, MakeOrder(2, "O2", "U-missing")));
  });

  auto snap = SnapshotBuilder(repo).Build();
  const auto linked = snap->FindOrder(1);
  assert(linked->customer == snap->FindUser(1));
  assert(linked->freelancer == snap->FindUser(2));
  assert(snap->FindOrderByAddress("O1") == linked);

  const auto orphan = snap->FindOrder(2);
  assert(!orphan->customer && !orphan->freelancer);

  assert(snap->active_orders.size() == 1);
  assert(snap->active_orders[0]->index == 2);
}

void TestCountsAndResponders() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, [](Repository& r, Transaction& tx) {
    auto u1     = MakeUser(1, "U1");
    u1.language = "EN";
    auto u2     = MakeUser(2, "U2", UserStatus::Banned);
    assert(r.UpsertUser(tx, u1));
    assert(r.UpsertUser(tx, u2));

    auto a     = MakeOrder(1, "O1", "U1");
    a.category = "dev";
    a.language = "EN";
    auto b     = MakeOrder(2, "O2", "U1", Order::kStatusCompleted);
    b.category = "dev";
    assert(r.UpsertOrder(tx, a));
    assert(r.UpsertOrder(tx, b));

    market::model::OrderResponse response;
    response.order_index        = 1;
    response.freelancer_address = "U2";
    response.price              = 10;
    assert(r.UpsertOrderResponse(tx, response));
  });

  auto snap = SnapshotBuilder(repo).Build();
  assert(snap->order_count_by_status.at(Order::kStatusActive) == 1);
  assert(snap->order_count_by_status.at(Order::kStatusCompleted) == 1);
  assert(snap->order_count_by_category.at("dev") == 2);
  assert(snap->order_count_by_language.size() == 1);
  assert(snap->user_count_by_status.at(UserStatus::Active) == 1);
  assert(snap->user_count_by_status.at(UserStatus::Banned) == 1);
  assert(snap->user_count_by_language.at("EN") == 1);

  assert(snap->HasResponded(1, "U2"));
  assert(!snap->HasResponded(1, "U1"));
  assert(!snap->HasResponded(2, "U2"));
}

void TestSearchTextIsUpperCasedFields() {
  Order order;
  order.name           = "Logo";
  order.description    = "vector art";
  order.technical_task = "svg";
  assert(BuildSearchText(order) == "LOGO\nVECTOR ART\nSVG");
}

} // namespace

int main() {
  TestTranslatedListsSkipTheSourceLanguage();
  TestTranslatedCopiesLeaveBaseOrdersUntouched();
  TestLanguageLookupByHashAndNameIsCaseInsensitive();
  TestMasterPlaceholdersAreExcluded();
  TestOrdersLinkToUsersOfTheSameSnapshot();
  TestCountsAndResponders();
  TestSearchTextIsUpperCasedFields();

  std::cout << "market_indexer_unit_snapshot_builder: pass\n";
  return 0;
}
