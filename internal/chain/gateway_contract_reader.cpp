#include "gateway_contract_reader.hpp"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/model/proto_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::chain {

namespace pb = market::indexer::v1;

namespace {

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action, int64_t index) {
  if (status.ok()) {
    return;
  }
  throw util::RemoteFailure(std::string(action) + " #" + std::to_string(index) + " failed: " + status.error_message());
}

void SetDeadline(::grpc::ClientContext& ctx, util::Duration timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

GatewayContractReader::GatewayContractReader(std::shared_ptr<::grpc::Channel> channel, bool use_mainnet, util::Duration request_timeout)
    : stub_(pb::ChainGateway::NewStub(std::move(channel))), use_mainnet_(use_mainnet), request_timeout_(request_timeout) {
}

void GatewayContractReader::InitIfNeeded() {
  if (ready_.load()) {
    return;
  }

  ::grpc::ClientContext ctx;
  SetDeadline(ctx, request_timeout_);
  pb::GetStatusResponse status;
  const auto            rpc = stub_->GetStatus(&ctx, pb::GetStatusRequest{}, &status);
  if (!rpc.ok()) {
    throw util::RemoteFailure("Chain gateway unavailable: " + rpc.error_message());
  }
  if (!status.ready()) {
    throw util::RemoteFailure("Chain gateway is not ready");
  }
  if (status.mainnet() != use_mainnet_) {
    throw util::RemoteFailure(std::string("Chain gateway serves ") + (status.mainnet() ? "mainnet" : "testnet"));
  }

  ready_.store(true);
  MARKET_LOG_INFO("Chain gateway ready", {observability::IntField("last_seqno", status.last_seqno())});
}

pb::ReadEntityRequest GatewayContractReader::Request(int64_t index, const std::string& address) const {
  pb::ReadEntityRequest req;
  req.set_index(index);
  req.set_address(address);
  return req;
}

void GatewayContractReader::ReadAdmin(model::Admin& admin) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, request_timeout_);
  pb::Admin msg;
  ThrowIfFailed(stub_->ReadAdmin(&ctx, Request(admin.index, admin.address), &msg), "ReadAdmin", admin.index);
  model::FromProto(msg, admin);
}

void GatewayContractReader::ReadUser(model::User& user) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, request_timeout_);
  pb::User msg;
  ThrowIfFailed(stub_->ReadUser(&ctx, Request(user.index, user.address), &msg), "ReadUser", user.index);
  model::FromProto(msg, user);
}

void GatewayContractReader::ReadOrder(model::Order& order) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, request_timeout_);
  pb::Order msg;
  ThrowIfFailed(stub_->ReadOrder(&ctx, Request(order.index, order.address), &msg), "ReadOrder", order.index);
  model::FromProto(msg, order);
}

} // namespace market::chain
