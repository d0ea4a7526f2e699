#pragma once

#include "market/indexer/v1.hpp"
#include "service_context.hpp"

namespace market::service {

/*
  Read-side API over the published snapshot.

  Each call takes the current snapshot once and answers from it. The store
  is read only for detail records the snapshot does not carry: activity,
  responses, translations of a single entity and the current user's
  response.
*/
class QueryService {
public:
  explicit QueryService(ServiceContext ctx);

  market::indexer::v1::GetConfigResponse
  GetConfig(const market::indexer::v1::GetConfigRequest& req);

  market::indexer::v1::GetStatisticsResponse
  GetStatistics(const market::indexer::v1::GetStatisticsRequest& req);

  market::indexer::v1::OrderList
  SearchOrders(const market::indexer::v1::SearchOrdersRequest& req);

  market::indexer::v1::CountOrdersResponse
  CountOrders(const market::indexer::v1::CountOrdersRequest& req);

  market::indexer::v1::User
  GetUser(const market::indexer::v1::GetUserRequest& req);

  market::indexer::v1::FindUserResponse
  FindUser(const market::indexer::v1::FindUserRequest& req);

  market::indexer::v1::Order
  GetOrder(const market::indexer::v1::GetOrderRequest& req);

  market::indexer::v1::FindOrderResponse
  FindOrder(const market::indexer::v1::FindOrderRequest& req);

  market::indexer::v1::GetUserStatsResponse
  GetUserStats(const market::indexer::v1::GetUserStatsRequest& req);

  market::indexer::v1::GetUserOrderStatsResponse
  GetUserOrderStats(const market::indexer::v1::GetUserOrderStatsRequest& req);

  market::indexer::v1::OrderList
  GetUserOrders(const market::indexer::v1::GetUserOrdersRequest& req);

  market::indexer::v1::ActivityList
  GetUserActivity(const market::indexer::v1::GetUserActivityRequest& req);

  market::indexer::v1::ActivityList
  GetOrderActivity(const market::indexer::v1::GetOrderActivityRequest& req);

  market::indexer::v1::OrderResponseList
  GetOrderResponses(const market::indexer::v1::GetOrderResponsesRequest& req);

  market::indexer::v1::OrderList
  ListOrders(const market::indexer::v1::ListOrdersRequest& req);

  market::indexer::v1::UserList
  ListUsers(const market::indexer::v1::ListUsersRequest& req);

private:
  ServiceContext ctx_;
};

}
