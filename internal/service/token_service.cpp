#include "token_service.hpp"

#include "internal/core/token_manager.hpp"
#include "observe_rpc.hpp"

namespace acp::service {

using namespace acp::ledger::v1;

TokenService::TokenService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ApproveResponse TokenService::Approve(const ApproveRequest& req) {
  return ObserveRpc("TokenService.Approve", req.caller(), [&] {
    ctx_.token->Approve(req.caller(), req.spender(), req.amount());
    return ApproveResponse{};
  });
}

FaucetResponse TokenService::Faucet(const FaucetRequest& req) {
  return ObserveRpc("TokenService.Faucet", req.caller(), [&] {
    FaucetResponse resp;
    resp.set_minted(ctx_.token->Faucet(req.caller(), req.whole_tokens()));
    resp.set_balance(ctx_.token->BalanceOf(req.caller()));
    return resp;
  });
}

GetTokenInfoResponse TokenService::GetTokenInfo(const GetTokenInfoRequest&) {
  return ObserveRpc("TokenService.GetTokenInfo", "", [&] {
    GetTokenInfoResponse resp;
    *resp.mutable_info() = ctx_.token->Info();
    return resp;
  });
}

}
