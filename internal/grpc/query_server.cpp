#include "query_server.hpp"
#include "grpc_error.hpp"

namespace market::grpc {

QueryServer::QueryServer(std::shared_ptr<market::service::QueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status QueryServer::GetConfig(::grpc::ServerContext*,
                                      const market::indexer::v1::GetConfigRequest* req,
                                      market::indexer::v1::GetConfigResponse* resp) {
  try {
    *resp = service_->GetConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetStatistics(::grpc::ServerContext*,
                                          const market::indexer::v1::GetStatisticsRequest* req,
                                          market::indexer::v1::GetStatisticsResponse* resp) {
  try {
    *resp = service_->GetStatistics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::SearchOrders(::grpc::ServerContext*,
                                         const market::indexer::v1::SearchOrdersRequest* req,
                                         market::indexer::v1::OrderList* resp) {
  try {
    *resp = service_->SearchOrders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::CountOrders(::grpc::ServerContext*,
                                        const market::indexer::v1::CountOrdersRequest* req,
                                        market::indexer::v1::CountOrdersResponse* resp) {
  try {
    *resp = service_->CountOrders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetUser(::grpc::ServerContext*,
                                    const market::indexer::v1::GetUserRequest* req,
                                    market::indexer::v1::User* resp) {
  try {
    *resp = service_->GetUser(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::FindUser(::grpc::ServerContext*,
                                     const market::indexer::v1::FindUserRequest* req,
                                     market::indexer::v1::FindUserResponse* resp) {
  try {
    *resp = service_->FindUser(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetOrder(::grpc::ServerContext*,
                                     const market::indexer::v1::GetOrderRequest* req,
                                     market::indexer::v1::Order* resp) {
  try {
    *resp = service_->GetOrder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::FindOrder(::grpc::ServerContext*,
                                      const market::indexer::v1::FindOrderRequest* req,
                                      market::indexer::v1::FindOrderResponse* resp) {
  try {
    *resp = service_->FindOrder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetUserStats(::grpc::ServerContext*,
                                         const market::indexer::v1::GetUserStatsRequest* req,
                                         market::indexer::v1::GetUserStatsResponse* resp) {
  try {
    *resp = service_->GetUserStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetUserOrderStats(::grpc::ServerContext*,
                                              const market::indexer::v1::GetUserOrderStatsRequest* req,
                                              market::indexer::v1::GetUserOrderStatsResponse* resp) {
  try {
    *resp = service_->GetUserOrderStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetUserOrders(::grpc::ServerContext*,
                                          const market::indexer::v1::GetUserOrdersRequest* req,
                                          market::indexer::v1::OrderList* resp) {
  try {
    *resp = service_->GetUserOrders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetUserActivity(::grpc::ServerContext*,
                                            const market::indexer::v1::GetUserActivityRequest* req,
                                            market::indexer::v1::ActivityList* resp) {
  try {
    *resp = service_->GetUserActivity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetOrderActivity(::grpc::ServerContext*,
                                             const market::indexer::v1::GetOrderActivityRequest* req,
                                             market::indexer::v1::ActivityList* resp) {
  try {
    *resp = service_->GetOrderActivity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetOrderResponses(::grpc::ServerContext*,
                                              const market::indexer::v1::GetOrderResponsesRequest* req,
                                              market::indexer::v1::OrderResponseList* resp) {
  try {
    *resp = service_->GetOrderResponses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::ListOrders(::grpc::ServerContext*,
                                       const market::indexer::v1::ListOrdersRequest* req,
                                       market::indexer::v1::OrderList* resp) {
  try {
    *resp = service_->ListOrders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::ListUsers(::grpc::ServerContext*,
                                      const market::indexer::v1::ListUsersRequest* req,
                                      market::indexer::v1::UserList* resp) {
  try {
    *resp = service_->ListUsers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
