#include "query_service.hpp"

#include <google/protobuf/descriptor.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>
#include <vector>

#include "internal/cache/snapshot_holder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/proto_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::service {

using namespace market::indexer::v1;
using cache::OrderPtr;
using cache::Snapshot;
using cache::UserPtr;

namespace {

constexpr int32_t kMinPageSize = 10;
constexpr int32_t kMaxPageSize = 100;

struct Page {
  std::size_t offset = 0;
  std::size_t size   = kMinPageSize;
};

Page ResolvePage(int32_t page, bool has_page_size, int32_t page_size) {
  if (page < 0) {
    throw util::InvalidArgument("page must not be negative");
  }
  const int32_t size = has_page_size ? page_size : kMinPageSize;
  if (size < kMinPageSize || size > kMaxPageSize) {
    throw util::InvalidArgument("page_size must be between " + std::to_string(kMinPageSize) + " and " + std::to_string(kMaxPageSize));
  }
  return {static_cast<std::size_t>(page) * static_cast<std::size_t>(size), static_cast<std::size_t>(size)};
}

template <typename T>
std::vector<T> Slice(const std::vector<T>& items, const Page& page) {
  if (page.offset >= items.size()) {
    return {};
  }
  const auto last = std::min(items.size(), page.offset + page.size);
  return std::vector<T>(items.begin() + static_cast<std::ptrdiff_t>(page.offset), items.begin() + static_cast<std::ptrdiff_t>(last));
}

bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string UpperAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

bool SearchMatches(const model::Order& order, const OrderSearchFilter& filter, const std::vector<std::string>& words) {
  if (!IsBlank(filter.category()) && cache::LowerAscii(order.category) != cache::LowerAscii(filter.category())) {
    return false;
  }
  if (!IsBlank(filter.language()) && cache::LowerAscii(order.language) != cache::LowerAscii(filter.language())) {
    return false;
  }
  if (filter.has_min_price() && order.price < filter.min_price()) {
    return false;
  }
  return std::all_of(words.begin(), words.end(), [&](const std::string& word) { return order.text_to_search.find(word) != std::string::npos; });
}

std::vector<OrderPtr> SearchActiveOrders(const cache::OrderList& source, const OrderSearchFilter& filter) {
  std::vector<std::string> words;
  std::istringstream       in(UpperAscii(filter.query()));
  for (std::string word; std::getline(in, word, ' ');) {
    if (!word.empty()) words.push_back(word);
  }

  std::vector<OrderPtr> out;
  for (const auto& order : source) {
    if (SearchMatches(*order, filter, words)) out.push_back(order);
  }
  return out;
}

const model::Language* ResolveLanguage(const Snapshot& snapshot, const std::string& translate_to) {
  if (translate_to.empty()) {
    return nullptr;
  }
  const auto* language = snapshot.FindLanguage(translate_to);
  if (!language) {
    throw util::InvalidArgument("Unknown (unsupported) language: " + translate_to);
  }
  return language;
}

std::optional<std::string> LoadTranslation(db::Repository& repo, db::Transaction& tx, const std::optional<model::Hash>& hash,
                                           const model::Language& language) {
  if (!hash) {
    return std::nullopt;
  }
  auto translation = repo.GetTranslation(tx, *hash, language.name);
  return translation ? translation->translated_text : std::nullopt;
}

void TranslateOrder(db::Repository& repo, db::Transaction& tx, model::Order& order, const model::Language& language) {
  order.name_translated           = LoadTranslation(repo, tx, order.name_hash, language);
  order.description_translated    = LoadTranslation(repo, tx, order.description_hash, language);
  order.technical_task_translated = LoadTranslation(repo, tx, order.technical_task_hash, language);
}

User UserToProto(db::Repository& repo, const model::User& user, const model::Language* language) {
  if (!language || !user.about_hash) {
    return model::ToProto(user);
  }
  auto copy = user;
  auto tx   = repo.BeginRead();
  copy.about_translated = LoadTranslation(repo, *tx, copy.about_hash, *language);
  tx->Commit();
  return model::ToProto(copy);
}

Order OrderToProto(db::Repository& repo, const model::Order& order, const model::Language* language) {
  if (!language) {
    return model::ToProto(order);
  }
  auto copy = order;
  auto tx   = repo.BeginRead();
  TranslateOrder(repo, *tx, copy, *language);
  tx->Commit();
  return model::ToProto(copy);
}

UserPtr RequireUser(const Snapshot& snapshot, int64_t index) {
  auto user = snapshot.FindUser(index);
  if (!user) {
    throw util::NotFound("user #" + std::to_string(index) + " does not exist");
  }
  return user;
}

OrderPtr RequireOrder(const Snapshot& snapshot, int64_t index) {
  auto order = snapshot.FindOrder(index);
  if (!order) {
    throw util::NotFound("order #" + std::to_string(index) + " does not exist");
  }
  return order;
}

// ---------------------------------------------------------------------------
// Position of a user in an order
// ---------------------------------------------------------------------------

bool IsFinished(int32_t status) {
  return status == model::Order::kStatusRefunded || status == model::Order::kStatusCompleted ||
         status == model::Order::kStatusPaymentForced || status == model::Order::kStatusArbitrationSolved;
}

bool IsArbitration(int32_t status) {
  return status == model::Order::kStatusPreArbitration || status == model::Order::kStatusOnArbitration;
}

bool MatchesCustomer(const model::Order& order, const std::string& address, CustomerInOrderStatus status) {
  if (order.customer_address != address) {
    return false;
  }
  switch (status) {
    case CUSTOMER_IN_ORDER_STATUS_ON_MODERATION:
      return order.status == model::Order::kStatusModeration;
    case CUSTOMER_IN_ORDER_STATUS_NO_RESPONSES:
      return order.status == model::Order::kStatusActive && order.responses_count == 0;
    case CUSTOMER_IN_ORDER_STATUS_HAVE_RESPONSES:
      return order.status == model::Order::kStatusActive && order.responses_count > 0;
    case CUSTOMER_IN_ORDER_STATUS_OFFER_MADE:
      return order.status == model::Order::kStatusOffer;
    case CUSTOMER_IN_ORDER_STATUS_IN_THE_WORK:
      return order.status == model::Order::kStatusInProgress;
    case CUSTOMER_IN_ORDER_STATUS_PENDING_PAYMENT:
      return order.status == model::Order::kStatusPendingPayment;
    case CUSTOMER_IN_ORDER_STATUS_ARBITRATION:
      return IsArbitration(order.status);
    case CUSTOMER_IN_ORDER_STATUS_COMPLETED:
      return IsFinished(order.status);
    default:
      return false;
  }
}

bool MatchesFreelancer(const Snapshot& snapshot, const model::Order& order, const std::string& address, FreelancerInOrderStatus status) {
  // These two look at every order the user responded to.
  if (status == FREELANCER_IN_ORDER_STATUS_RESPONSE_SENT) {
    return order.status == model::Order::kStatusActive && snapshot.HasResponded(order.index, address);
  }
  if (status == FREELANCER_IN_ORDER_STATUS_RESPONSE_DENIED) {
    return order.status == model::Order::kStatusOffer && order.freelancer_address != address && snapshot.HasResponded(order.index, address);
  }

  if (order.freelancer_address != address) {
    return false;
  }
  switch (status) {
    case FREELANCER_IN_ORDER_STATUS_AN_OFFER_CAME_IN:
      return order.status == model::Order::kStatusOffer;
    case FREELANCER_IN_ORDER_STATUS_IN_THE_WORK:
      return order.status == model::Order::kStatusInProgress;
    case FREELANCER_IN_ORDER_STATUS_ON_INSPECTION:
      return order.status == model::Order::kStatusPendingPayment;
    case FREELANCER_IN_ORDER_STATUS_ARBITRATION:
      return IsArbitration(order.status);
    case FREELANCER_IN_ORDER_STATUS_TERMINATED:
      return IsFinished(order.status);
    default:
      return false;
  }
}

// "CUSTOMER_IN_ORDER_STATUS_NO_RESPONSES" -> "no_responses"
std::string StatusKey(const std::string& enum_name, std::string_view prefix) {
  return cache::LowerAscii(std::string_view(enum_name).substr(prefix.size()));
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  try {
    return fn();
  } catch (const util::NotFound& ex) {
    MARKET_LOG_DEBUG("RPC rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  } catch (const util::InvalidArgument& ex) {
    MARKET_LOG_DEBUG("RPC rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    MARKET_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetConfigResponse QueryService::GetConfig(const GetConfigRequest&) {
  return ObserveRpc("QueryService.GetConfig", [&] {
    const auto snapshot = ctx_.snapshots->Current();

    GetConfigResponse resp;
    resp.set_master_address(snapshot->master_address);
    resp.set_mainnet(snapshot->in_mainnet);
    for (const auto& category : snapshot->categories) {
      *resp.add_categories() = model::ToProto(category);
    }
    for (const auto& language : snapshot->languages) {
      *resp.add_languages() = model::ToProto(language);
    }
    return resp;
  });
}

GetStatisticsResponse QueryService::GetStatistics(const GetStatisticsRequest&) {
  return ObserveRpc("QueryService.GetStatistics", [&] {
    const auto snapshot = ctx_.snapshots->Current();

    GetStatisticsResponse resp;
    resp.set_order_count(static_cast<int32_t>(snapshot->orders.size()));
    for (const auto& [status, count] : snapshot->order_count_by_status) {
      (*resp.mutable_order_count_by_status())[status] = count;
    }
    for (const auto& [category, count] : snapshot->order_count_by_category) {
      (*resp.mutable_order_count_by_category())[category] = count;
    }
    for (const auto& [language, count] : snapshot->order_count_by_language) {
      (*resp.mutable_order_count_by_language())[language] = count;
    }

    resp.set_user_count(static_cast<int32_t>(snapshot->users.size()));
    for (const auto& [status, count] : snapshot->user_count_by_status) {
      (*resp.mutable_user_count_by_status())[static_cast<int32_t>(status)] = count;
    }
    for (const auto& [language, count] : snapshot->user_count_by_language) {
      (*resp.mutable_user_count_by_language())[language] = count;
    }
    return resp;
  });
}

OrderList QueryService::SearchOrders(const SearchOrdersRequest& req) {
  return ObserveRpc("QueryService.SearchOrders", [&] {
    const auto page     = ResolvePage(req.page(), req.has_page_size(), req.page_size());
    const auto snapshot = ctx_.snapshots->Current();

    const cache::OrderList* source = &snapshot->active_orders;
    if (!req.translate_to().empty()) {
      source = snapshot->FindTranslated(req.translate_to());
      if (!source) {
        throw util::InvalidArgument("Unknown (unsupported) language: " + req.translate_to());
      }
    }

    auto matched = SearchActiveOrders(*source, req.filter());

    const bool by_deadline = req.order_by() == ORDER_BY_DEADLINE;
    const bool descending  = req.sort() == SORT_DIRECTION_DESC;
    std::stable_sort(matched.begin(), matched.end(), [&](const OrderPtr& a, const OrderPtr& b) {
      const auto& ka = by_deadline ? a->deadline : a->created_at;
      const auto& kb = by_deadline ? b->deadline : b->created_at;
      return descending ? kb < ka : ka < kb;
    });

    OrderList resp;
    for (const auto& order : Slice(matched, page)) {
      *resp.add_orders() = model::ToProto(*order);
    }
    return resp;
  });
}

CountOrdersResponse QueryService::CountOrders(const CountOrdersRequest& req) {
  return ObserveRpc("QueryService.CountOrders", [&] {
    const auto snapshot = ctx_.snapshots->Current();

    CountOrdersResponse resp;
    resp.set_count(static_cast<int32_t>(SearchActiveOrders(snapshot->active_orders, req.filter()).size()));
    return resp;
  });
}

User QueryService::GetUser(const GetUserRequest& req) {
  return ObserveRpc("QueryService.GetUser", [&] {
    const auto snapshot = ctx_.snapshots->Current();
    const auto user     = RequireUser(*snapshot, req.index());
    const auto* language = ResolveLanguage(*snapshot, req.translate_to());
    return UserToProto(*ctx_.repository, *user, language);
  });
}

FindUserResponse QueryService::FindUser(const FindUserRequest& req) {
  return ObserveRpc("QueryService.FindUser", [&] {
    if (req.address().empty()) {
      throw util::InvalidArgument("address is required");
    }
    const auto  snapshot = ctx_.snapshots->Current();
    const auto* language = ResolveLanguage(*snapshot, req.translate_to());

    FindUserResponse resp;
    if (const auto user = snapshot->FindUserByAddress(req.address())) {
      resp.set_found(true);
      *resp.mutable_user() = UserToProto(*ctx_.repository, *user, language);
    }
    return resp;
  });
}

Order QueryService::GetOrder(const GetOrderRequest& req) {
  return ObserveRpc("QueryService.GetOrder", [&] {
    const auto snapshot = ctx_.snapshots->Current();
    const auto order    = RequireOrder(*snapshot, req.index());

    UserPtr current_user;
    if (req.has_current_user_index()) {
      current_user = RequireUser(*snapshot, req.current_user_index());
    }
    const auto* language = ResolveLanguage(*snapshot, req.translate_to());

    auto resp = OrderToProto(*ctx_.repository, *order, language);
    if (current_user) {
      auto tx       = ctx_.repository->BeginRead();
      auto response = ctx_.repository->GetOrderResponse(*tx, order->index, current_user->address);
      tx->Commit();
      if (response) {
        *resp.mutable_current_user_response() = model::ToProto(*response);
      }
    }
    return resp;
  });
}

FindOrderResponse QueryService::FindOrder(const FindOrderRequest& req) {
  return ObserveRpc("QueryService.FindOrder", [&] {
    if (req.address().empty()) {
      throw util::InvalidArgument("address is required");
    }
    const auto  snapshot = ctx_.snapshots->Current();
    const auto* language = ResolveLanguage(*snapshot, req.translate_to());

    FindOrderResponse resp;
    if (const auto order = snapshot->FindOrderByAddress(req.address())) {
      resp.set_found(true);
      *resp.mutable_order() = OrderToProto(*ctx_.repository, *order, language);
    }
    return resp;
  });
}

GetUserStatsResponse QueryService::GetUserStats(const GetUserStatsRequest& req) {
  return ObserveRpc("QueryService.GetUserStats", [&] {
    const auto snapshot = ctx_.snapshots->Current();
    const auto user     = RequireUser(*snapshot, req.index());

    GetUserStatsResponse resp;
    int32_t              as_customer   = 0;
    int32_t              as_freelancer = 0;
    for (const auto& order : snapshot->orders) {
      if (order->customer_address == user->address) {
        ++(*resp.mutable_as_customer_by_status())[order->status];
        ++as_customer;
      }
      if (order->freelancer_address == user->address) {
        ++(*resp.mutable_as_freelancer_by_status())[order->status];
        ++as_freelancer;
      }
    }
    resp.set_as_customer_total(as_customer);
    resp.set_as_freelancer_total(as_freelancer);
    return resp;
  });
}

GetUserOrderStatsResponse QueryService::GetUserOrderStats(const GetUserOrderStatsRequest& req) {
  return ObserveRpc("QueryService.GetUserOrderStats", [&] {
    const auto snapshot = ctx_.snapshots->Current();
    const auto user     = RequireUser(*snapshot, req.index());

    GetUserOrderStatsResponse resp;

    const auto* customer_enum = CustomerInOrderStatus_descriptor();
    for (int i = 0; i < customer_enum->value_count(); ++i) {
      const auto status = static_cast<CustomerInOrderStatus>(customer_enum->value(i)->number());
      if (status == CUSTOMER_IN_ORDER_STATUS_UNSPECIFIED) continue;
      const auto count = std::count_if(snapshot->orders.begin(), snapshot->orders.end(),
                                       [&](const OrderPtr& o) { return MatchesCustomer(*o, user->address, status); });
      (*resp.mutable_as_customer_by_status())[StatusKey(customer_enum->value(i)->name(), "CUSTOMER_IN_ORDER_STATUS_")] =
          static_cast<int32_t>(count);
    }

    const auto* freelancer_enum = FreelancerInOrderStatus_descriptor();
    for (int i = 0; i < freelancer_enum->value_count(); ++i) {
      const auto status = static_cast<FreelancerInOrderStatus>(freelancer_enum->value(i)->number());
      if (status == FREELANCER_IN_ORDER_STATUS_UNSPECIFIED) continue;
      const auto count = std::count_if(snapshot->orders.begin(), snapshot->orders.end(),
                                       [&](const OrderPtr& o) { return MatchesFreelancer(*snapshot, *o, user->address, status); });
      (*resp.mutable_as_freelancer_by_status())[StatusKey(freelancer_enum->value(i)->name(), "FREELANCER_IN_ORDER_STATUS_")] =
          static_cast<int32_t>(count);
    }

    int32_t completed = 0;
    int32_t failed    = 0;
    for (const auto& order : snapshot->orders) {
      if (order->freelancer_address != user->address) continue;
      const bool solved = order->status == model::Order::kStatusArbitrationSolved;
      if (order->status == model::Order::kStatusCompleted || order->status == model::Order::kStatusPaymentForced ||
          (solved && order->arbitration_freelancer_part >= 100)) {
        ++completed;
      } else if (order->status == model::Order::kStatusRefunded || (solved && order->arbitration_freelancer_part < 100)) {
        ++failed;
      }
    }
    (*resp.mutable_as_freelancer_by_status())["completed_total"] = completed;
    (*resp.mutable_as_freelancer_by_status())["failed_total"]    = failed;
    return resp;
  });
}

OrderList QueryService::GetUserOrders(const GetUserOrdersRequest& req) {
  return ObserveRpc("QueryService.GetUserOrders", [&] {
    if (req.role_case() == GetUserOrdersRequest::ROLE_NOT_SET) {
      throw util::InvalidArgument("exactly one of customer_status and freelancer_status must be set");
    }
    const auto  snapshot = ctx_.snapshots->Current();
    const auto* language = ResolveLanguage(*snapshot, req.translate_to());
    const auto  user     = RequireUser(*snapshot, req.index());

    std::vector<OrderPtr> matched;
    for (const auto& order : snapshot->orders) {
      const bool hit = req.role_case() == GetUserOrdersRequest::kCustomerStatus
                           ? MatchesCustomer(*order, user->address, req.customer_status())
                           : MatchesFreelancer(*snapshot, *order, user->address, req.freelancer_status());
      if (hit) matched.push_back(order);
    }
    std::sort(matched.begin(), matched.end(), [](const OrderPtr& a, const OrderPtr& b) { return a->index > b->index; });

    OrderList resp;
    if (!language) {
      for (const auto& order : matched) {
        *resp.add_orders() = model::ToProto(*order);
      }
      return resp;
    }

    auto tx = ctx_.repository->BeginRead();
    for (const auto& order : matched) {
      auto copy = *order;
      TranslateOrder(*ctx_.repository, *tx, copy, *language);
      *resp.add_orders() = model::ToProto(copy);
    }
    tx->Commit();
    return resp;
  });
}

ActivityList QueryService::GetUserActivity(const GetUserActivityRequest& req) {
  return ObserveRpc("QueryService.GetUserActivity", [&] {
    const auto page     = ResolvePage(req.page(), req.has_page_size(), req.page_size());
    const auto snapshot = ctx_.snapshots->Current();
    const auto user     = RequireUser(*snapshot, req.index());

    auto tx         = ctx_.repository->BeginRead();
    auto activities = ctx_.repository->ListOrderActivitiesBySender(*tx, user->address, {page.size, page.offset});
    tx->Commit();

    ActivityList resp;
    for (const auto& activity : activities) {
      auto* item = resp.add_activities();
      *item      = model::ToProto(activity);
      if (const auto order = snapshot->FindOrder(activity.order_index)) {
        *item->mutable_order() = model::ToProto(*order);
      }
    }
    return resp;
  });
}

ActivityList QueryService::GetOrderActivity(const GetOrderActivityRequest& req) {
  return ObserveRpc("QueryService.GetOrderActivity", [&] {
    const auto page     = ResolvePage(req.page(), req.has_page_size(), req.page_size());
    const auto snapshot = ctx_.snapshots->Current();
    const auto order    = RequireOrder(*snapshot, req.index());

    auto tx         = ctx_.repository->BeginRead();
    auto activities = ctx_.repository->ListOrderActivitiesByOrder(*tx, order->index, {page.size, page.offset});
    tx->Commit();

    ActivityList resp;
    for (const auto& activity : activities) {
      auto* item = resp.add_activities();
      *item      = model::ToProto(activity);
      if (const auto sender = snapshot->FindUserByAddress(activity.sender_address)) {
        *item->mutable_sender() = model::ToProto(*sender);
      }
    }
    return resp;
  });
}

OrderResponseList QueryService::GetOrderResponses(const GetOrderResponsesRequest& req) {
  return ObserveRpc("QueryService.GetOrderResponses", [&] {
    const auto snapshot = ctx_.snapshots->Current();
    const auto order    = RequireOrder(*snapshot, req.index());

    auto tx        = ctx_.repository->BeginRead();
    auto responses = ctx_.repository->ListOrderResponses(*tx, order->index);
    tx->Commit();

    std::stable_sort(responses.begin(), responses.end(), [](const auto& a, const auto& b) { return a.price > b.price; });

    OrderResponseList resp;
    for (const auto& response : responses) {
      auto* item = resp.add_responses();
      *item      = model::ToProto(response);
      if (const auto freelancer = snapshot->FindUserByAddress(response.freelancer_address)) {
        *item->mutable_freelancer() = model::ToProto(*freelancer);
      }
    }
    return resp;
  });
}

OrderList QueryService::ListOrders(const ListOrdersRequest& req) {
  return ObserveRpc("QueryService.ListOrders", [&] {
    const auto page     = ResolvePage(req.page(), req.has_page_size(), req.page_size());
    const auto snapshot = ctx_.snapshots->Current();

    std::vector<OrderPtr> matched;
    for (const auto& order : snapshot->orders) {
      if (req.has_status() && order->status != req.status()) continue;
      if (!req.category().empty() && order->category != req.category()) continue;
      if (!req.language().empty() && order->language != req.language()) continue;
      matched.push_back(order);
    }
    const bool descending = req.sort() == SORT_DIRECTION_DESC;
    std::sort(matched.begin(), matched.end(),
              [&](const OrderPtr& a, const OrderPtr& b) { return descending ? a->index > b->index : a->index < b->index; });

    OrderList resp;
    for (const auto& order : Slice(matched, page)) {
      auto* item = resp.add_orders();
      *item      = model::ToProto(*order);
      item->clear_customer();
      item->clear_freelancer();
    }
    return resp;
  });
}

UserList QueryService::ListUsers(const ListUsersRequest& req) {
  return ObserveRpc("QueryService.ListUsers", [&] {
    const auto page     = ResolvePage(req.page(), req.has_page_size(), req.page_size());
    const auto snapshot = ctx_.snapshots->Current();

    std::vector<UserPtr> matched;
    for (const auto& user : snapshot->users) {
      if (req.has_status() && model::ToProto(user->status) != req.status()) continue;
      if (!req.language().empty() && user->language != req.language()) continue;
      matched.push_back(user);
    }
    const bool descending = req.sort() == SORT_DIRECTION_DESC;
    std::sort(matched.begin(), matched.end(),
              [&](const UserPtr& a, const UserPtr& b) { return descending ? a->index > b->index : a->index < b->index; });

    UserList resp;
    for (const auto& user : Slice(matched, page)) {
      *resp.add_users() = model::ToProto(*user);
    }
    return resp;
  });
}

}
