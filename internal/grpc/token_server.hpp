#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "acp/ledger/v1_grpc.hpp"
#include "internal/service/token_service.hpp"

namespace acp::grpc {

class TokenServer final : public acp::ledger::v1::TokenService::Service {
public:
  explicit TokenServer(std::shared_ptr<acp::service::TokenService> svc);

  ::grpc::Status Approve(::grpc::ServerContext*,
                   const acp::ledger::v1::ApproveRequest*,
                   acp::ledger::v1::ApproveResponse*) override;

  ::grpc::Status Faucet(::grpc::ServerContext*,
                   const acp::ledger::v1::FaucetRequest*,
                   acp::ledger::v1::FaucetResponse*) override;

  ::grpc::Status GetTokenInfo(::grpc::ServerContext*,
                   const acp::ledger::v1::GetTokenInfoRequest*,
                   acp::ledger::v1::GetTokenInfoResponse*) override;

private:
  std::shared_ptr<acp::service::TokenService> service_;
};

}
