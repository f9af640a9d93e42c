#include "token_server.hpp"
#include "grpc_error.hpp"

namespace acp::grpc {

using namespace acp::ledger::v1;

TokenServer::TokenServer(std::shared_ptr<acp::service::TokenService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TokenServer::Approve(::grpc::ServerContext*, const ApproveRequest* req, ApproveResponse* resp) {
  return Dispatch([&] { *resp = service_->Approve(*req); });
}

::grpc::Status TokenServer::Faucet(::grpc::ServerContext*, const FaucetRequest* req, FaucetResponse* resp) {
  return Dispatch([&] { *resp = service_->Faucet(*req); });
}

::grpc::Status TokenServer::GetTokenInfo(::grpc::ServerContext*, const GetTokenInfoRequest* req, GetTokenInfoResponse* resp) {
  return Dispatch([&] { *resp = service_->GetTokenInfo(*req); });
}

}
