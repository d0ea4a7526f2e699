#pragma once

#include <grpcpp/channel.h>

#include <atomic>
#include <memory>

#include "internal/chain/contract_reader.hpp"
#include "market/indexer/v1.hpp"

namespace market::chain {

/*
  ContractReader backed by the ChainGateway gRPC service.

  Every call carries a deadline of `request_timeout`. A non-OK status
  becomes util::RemoteFailure. The reader turns ready once the gateway
  reports ready on the configured network; it never goes back.
*/
class GatewayContractReader final : public ContractReader {
 public:
  GatewayContractReader(std::shared_ptr<::grpc::Channel> channel, bool use_mainnet, util::Duration request_timeout);

  void InitIfNeeded() override;

  void ReadAdmin(model::Admin& admin) override;
  void ReadUser(model::User& user) override;
  void ReadOrder(model::Order& order) override;

 private:
  market::indexer::v1::ReadEntityRequest Request(int64_t index, const std::string& address) const;

  std::unique_ptr<market::indexer::v1::ChainGateway::Stub> stub_;
  bool                                                     use_mainnet_;
  util::Duration                                           request_timeout_;
  std::atomic<bool>                                        ready_{false};
};

} // namespace market::chain
