#include "internal/service/query_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/cache/snapshot_builder.hpp"
#include "internal/cache/snapshot_holder.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace market::indexer::v1;
using namespace std::chrono_literals;
using market::db::Repository;
using market::db::Transaction;
using market::db::memory::MemoryRepository;
using market::model::Order;
using market::service::QueryService;
using market::service::ServiceContext;
using market::testing::MakeOrder;
using market::testing::MakeUser;
using market::testing::Seed;

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

struct Fixture {
  std::shared_ptr<MemoryRepository>              repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<market::cache::SnapshotHolder> snapshots = std::make_shared<market::cache::SnapshotHolder>();
  QueryService                                   service{ServiceContext{snapshots, repo}};

  void Publish() {
    snapshots->Publish(market::cache::SnapshotBuilder(repo).Build());
  }
};

// Customer U1 (#1), freelancers U2 (#2) and U3 (#3).
// Active orders #1..#12 priced 100*i, created i minutes after t0.
// #13 completed by U2, #14 refunded for U2, #15 offered to U3 after U2 responded.
Fixture MakeMarket() {
  Fixture    f;
  const auto t0 = market::util::TimePoint{} + std::chrono::hours(24 * 365 * 50);

  Seed(*f.repo, [&](Repository& r, Transaction& tx) {
    assert(r.UpsertLanguage(tx, {"H-EN", "EN", true}));
    assert(r.UpsertCategory(tx, {"H-DEV", "dev", true}));
    assert(r.UpsertUser(tx, MakeUser(1, "U1")));
    assert(r.UpsertUser(tx, MakeUser(2, "U2")));
    assert(r.UpsertUser(tx, MakeUser(3, "U3")));

    for (int64_t i = 1; i <= 12; ++i) {
      auto order        = MakeOrder(i, "O" + std::to_string(i), "U1");
      order.price       = 100 * i;
      order.created_at  = t0 + std::chrono::minutes(i);
      order.deadline    = t0 + std::chrono::hours(100 - i);
      order.category    = i % 2 == 0 ? "dev" : "design";
      order.language    = "EN";
      order.description = i == 7 ? "Rust compiler work" : "plain job";
      assert(r.UpsertOrder(tx, order));
    }

    auto completed               = MakeOrder(13, "O13", "U1", Order::kStatusCompleted);
    completed.freelancer_address = "U2";
    auto refunded                = MakeOrder(14, "O14", "U1", Order::kStatusRefunded);
    refunded.freelancer_address  = "U2";
    auto offered                 = MakeOrder(15, "O15", "U1", Order::kStatusOffer);
    offered.freelancer_address   = "U3";
    assert(r.UpsertOrder(tx, completed));
    assert(r.UpsertOrder(tx, refunded));
    assert(r.UpsertOrder(tx, offered));

    market::model::OrderResponse cheap;
    cheap.order_index        = 1;
    cheap.freelancer_address = "U2";
    cheap.price              = 50;
    market::model::OrderResponse dear = cheap;
    dear.freelancer_address           = "U3";
    dear.price                        = 90;
    assert(r.UpsertOrderResponse(tx, cheap));
    assert(r.UpsertOrderResponse(tx, dear));
  });
  f.Publish();
  return f;
}

void TestSearchPagesAndSorts() {
  auto f = MakeMarket();

  SearchOrdersRequest req;
  req.set_sort(SORT_DIRECTION_DESC);
  auto first = f.service.SearchOrders(req);
  assert(first.orders_size() == 10);
  assert(first.orders(0).index() == 12);

  req.set_page(1);
  auto second = f.service.SearchOrders(req);
  assert(second.orders_size() == 2);
  assert(second.orders(1).index() == 1);

  SearchOrdersRequest by_deadline;
  by_deadline.set_order_by(ORDER_BY_DEADLINE);
  assert(f.service.SearchOrders(by_deadline).orders(0).index() == 12);
}

void TestSearchFilters() {
  auto f = MakeMarket();

  SearchOrdersRequest req;
  req.mutable_filter()->set_category("DEV");
  req.mutable_filter()->set_min_price(800);
  auto resp = f.service.SearchOrders(req);
  assert(resp.orders_size() == 3); // 8, 10, 12

  CountOrdersRequest count;
  count.mutable_filter()->set_query("rust   COMPILER");
  assert(f.service.CountOrders(count).count() == 1);
  count.mutable_filter()->set_query("rust python");
  assert(f.service.CountOrders(count).count() == 0);
}

void TestSearchRejectsBadPagingAndLanguage() {
  auto f = MakeMarket();

  SearchOrdersRequest small;
  small.set_page_size(5);
  ExpectThrows<market::util::InvalidArgument>([&] { f.service.SearchOrders(small); });

  SearchOrdersRequest negative;
  negative.set_page(-1);
  ExpectThrows<market::util::InvalidArgument>([&] { f.service.SearchOrders(negative); });

  SearchOrdersRequest unknown;
  unknown.set_translate_to("klingon");
  ExpectThrows<market::util::InvalidArgument>([&] { f.service.SearchOrders(unknown); });

  SearchOrdersRequest known;
  known.set_translate_to("h-en");
  assert(f.service.SearchOrders(known).orders_size() == 10);
}

void TestMissingEntitiesAreNotFound() {
  auto f = MakeMarket();

  GetUserRequest user;
  user.set_index(99);
  ExpectThrows<market::util::NotFound>([&] { f.service.GetUser(user); });

  GetOrderRequest order;
  order.set_index(1);
  order.set_current_user_index(99);
  ExpectThrows<market::util::NotFound>([&] { f.service.GetOrder(order); });

  FindUserRequest find;
  find.set_address("nobody");
  assert(!f.service.FindUser(find).found());
}

void TestGetOrderCarriesCurrentUserResponse() {
  auto f = MakeMarket();

  GetOrderRequest req;
  req.set_index(1);
  req.set_current_user_index(3);
  auto order = f.service.GetOrder(req);
  assert(order.customer().address() == "U1");
  assert(order.has_current_user_response());
  assert(order.current_user_response().price() == 90);
}

void TestUserOrdersByRole() {
  auto f = MakeMarket();

  GetUserOrdersRequest no_role;
  no_role.set_index(1);
  ExpectThrows<market::util::InvalidArgument>([&] { f.service.GetUserOrders(no_role); });

  GetUserOrdersRequest with_responses;
  with_responses.set_index(1);
  with_responses.set_customer_status(CUSTOMER_IN_ORDER_STATUS_NO_RESPONSES);
  auto customer = f.service.GetUserOrders(with_responses);
  assert(customer.orders_size() == 12);
  assert(customer.orders(0).index() == 12);

  GetUserOrdersRequest sent;
  sent.set_index(2);
  sent.set_freelancer_status(FREELANCER_IN_ORDER_STATUS_RESPONSE_SENT);
  auto responded = f.service.GetUserOrders(sent);
  assert(responded.orders_size() == 1 && responded.orders(0).index() == 1);

  GetUserOrdersRequest terminated;
  terminated.set_index(2);
  terminated.set_freelancer_status(FREELANCER_IN_ORDER_STATUS_TERMINATED);
  assert(f.service.GetUserOrders(terminated).orders_size() == 2);
}

void TestUserOrderStatsTotals() {
  auto f = MakeMarket();

  GetUserOrderStatsRequest req;
  req.set_index(2);
  auto stats      = f.service.GetUserOrderStats(req);
  const auto& fl  = stats.as_freelancer_by_status();
  assert(fl.at("completed_total") == 1);
  assert(fl.at("failed_total") == 1);
  assert(fl.at("response_sent") == 1);
  assert(fl.at("terminated") == 2);

  req.set_index(1);
  auto customer_stats  = f.service.GetUserOrderStats(req);
  const auto& customer = customer_stats.as_customer_by_status();
  assert(customer.at("no_responses") == 12);
  assert(customer.at("offer_made") == 1);
  assert(customer.at("completed") == 2);

  GetUserStatsRequest totals;
  totals.set_index(1);
  assert(f.service.GetUserStats(totals).as_customer_total() == 15);
}

void TestResponsesAreSortedByPriceDescending() {
  auto f = MakeMarket();

  GetOrderResponsesRequest req;
  req.set_index(1);
  auto resp = f.service.GetOrderResponses(req);
  assert(resp.responses_size() == 2);
  assert(resp.responses(0).price() == 90);
  assert(resp.responses(0).freelancer().address() == "U3");
  assert(resp.responses(1).price() == 50);
}

void TestListingsFilterAndStripLinks() {
  auto f = MakeMarket();

  ListOrdersRequest orders;
  orders.set_status(Order::kStatusActive);
  orders.set_category("dev");
  auto listed = f.service.ListOrders(orders);
  assert(listed.orders_size() == 6);
  assert(listed.orders(0).index() == 2);
  for (const auto& order : listed.orders()) {
    assert(!order.has_customer());
  }

  ListUsersRequest users;
  users.set_sort(SORT_DIRECTION_DESC);
  auto all = f.service.ListUsers(users);
  assert(all.users_size() == 3 && all.users(0).index() == 3);
}

void TestConfigAndStatistics() {
  auto f = MakeMarket();

  auto config = f.service.GetConfig({});
  assert(config.languages_size() == 1 && config.categories_size() == 1);

  auto stats = f.service.GetStatistics({});
  assert(stats.order_count() == 15);
  assert(stats.order_count_by_status().at(Order::kStatusActive) == 12);
  assert(stats.user_count() == 3);
}

void TestActivityIsPagedNewestFirst() {
  auto f = MakeMarket();
  Seed(*f.repo, [](Repository& r, Transaction& tx) {
    for (int i = 0; i < 12; ++i) {
      market::model::OrderActivity activity;
      activity.order_index    = 1;
      activity.sender_address = "U2";
      activity.op_code        = i;
      activity.timestamp      = market::util::TimePoint{} + std::chrono::seconds(i);
      assert(r.InsertOrderActivity(tx, activity));
    }
  });

  GetOrderActivityRequest req;
  req.set_index(1);
  auto page = f.service.GetOrderActivity(req);
  assert(page.activities_size() == 10);
  assert(page.activities(0).op_code() == 11);
  assert(page.activities(0).sender().address() == "U2");

  GetUserActivityRequest by_user;
  by_user.set_index(2);
  by_user.set_page(1);
  auto rest = f.service.GetUserActivity(by_user);
  assert(rest.activities_size() == 2);
  assert(rest.activities(0).order().index() == 1);
}

} // namespace

int main() {
  TestSearchPagesAndSorts();
  TestSearchFilters();
  TestSearchRejectsBadPagingAndLanguage();
  TestMissingEntitiesAreNotFound();
  TestGetOrderCarriesCurrentUserResponse();
  TestUserOrdersByRole();
  TestUserOrderStatsTotals();
  TestResponsesAreSortedByPriceDescending();
  TestListingsFilterAndStripLinks();
  TestConfigAndStatistics();
  TestActivityIsPagedNewestFirst();

  std::cout << "market_indexer_unit_query_service: pass\n";
  return 0;
}
