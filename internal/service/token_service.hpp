#pragma once

#include "acp/ledger/v1.hpp"
#include "service_context.hpp"

namespace acp::service {

class TokenService {
public:
  explicit TokenService(ServiceContext ctx);

  acp::ledger::v1::ApproveResponse
  Approve(const acp::ledger::v1::ApproveRequest& req);

  acp::ledger::v1::FaucetResponse
  Faucet(const acp::ledger::v1::FaucetRequest& req);

  acp::ledger::v1::GetTokenInfoResponse
  GetTokenInfo(const acp::ledger::v1::GetTokenInfoRequest& req);

private:
  ServiceContext ctx_;
};

}
