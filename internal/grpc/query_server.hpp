#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/query_service.hpp"
#include "market/indexer/v1.hpp"

namespace market::grpc {

class QueryServer final : public market::indexer::v1::MarketQueryService::Service {
public:
  explicit QueryServer(std::shared_ptr<market::service::QueryService> svc);

  ::grpc::Status GetConfig(::grpc::ServerContext*,
                           const market::indexer::v1::GetConfigRequest*,
                           market::indexer::v1::GetConfigResponse*) override;

  ::grpc::Status GetStatistics(::grpc::ServerContext*,
                               const market::indexer::v1::GetStatisticsRequest*,
                               market::indexer::v1::GetStatisticsResponse*) override;

  ::grpc::Status SearchOrders(::grpc::ServerContext*,
                              const market::indexer::v1::SearchOrdersRequest*,
                              market::indexer::v1::OrderList*) override;

  ::grpc::Status CountOrders(::grpc::ServerContext*,
                             const market::indexer::v1::CountOrdersRequest*,
                             market::indexer::v1::CountOrdersResponse*) override;

  ::grpc::Status GetUser(::grpc::ServerContext*,
                         const market::indexer::v1::GetUserRequest*,
                         market::indexer::v1::User*) override;

  ::grpc::Status FindUser(::grpc::ServerContext*,
                          const market::indexer::v1::FindUserRequest*,
                          market::indexer::v1::FindUserResponse*) override;

  ::grpc::Status GetOrder(::grpc::ServerContext*,
                          const market::indexer::v1::GetOrderRequest*,
                          market::indexer::v1::Order*) override;

  ::grpc::Status FindOrder(::grpc::ServerContext*,
                           const market::indexer::v1::FindOrderRequest*,
                           market::indexer::v1::FindOrderResponse*) override;

  ::grpc::Status GetUserStats(::grpc::ServerContext*,
                              const market::indexer::v1::GetUserStatsRequest*,
                              market::indexer::v1::GetUserStatsResponse*) override;

  ::grpc::Status GetUserOrderStats(::grpc::ServerContext*,
                                   const market::indexer::v1::GetUserOrderStatsRequest*,
                                   market::indexer::v1::GetUserOrderStatsResponse*) override;

  ::grpc::Status GetUserOrders(::grpc::ServerContext*,
                               const market::indexer::v1::GetUserOrdersRequest*,
                               market::indexer::v1::OrderList*) override;

  ::grpc::Status GetUserActivity(::grpc::ServerContext*,
                                 const market::indexer::v1::GetUserActivityRequest*,
                                 market::indexer::v1::ActivityList*) override;

  ::grpc::Status GetOrderActivity(::grpc::ServerContext*,
                                  const market::indexer::v1::GetOrderActivityRequest*,
                                  market::indexer::v1::ActivityList*) override;

  ::grpc::Status GetOrderResponses(::grpc::ServerContext*,
                                   const market::indexer::v1::GetOrderResponsesRequest*,
                                   market::indexer::v1::OrderResponseList*) override;

  ::grpc::Status ListOrders(::grpc::ServerContext*,
                            const market::indexer::v1::ListOrdersRequest*,
                            market::indexer::v1::OrderList*) override;

  ::grpc::Status ListUsers(::grpc::ServerContext*,
                           const market::indexer::v1::ListUsersRequest*,
                           market::indexer::v1::UserList*) override;

private:
  std::shared_ptr<market::service::QueryService> service_;
};

}
