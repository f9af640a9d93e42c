#include "tip_server.hpp"
#include "grpc_error.hpp"

namespace acp::grpc {

using namespace acp::ledger::v1;

TipServer::TipServer(std::shared_ptr<acp::service::TipService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TipServer::Tip(::grpc::ServerContext*, const TipRequest* req, TipResponse* resp) {
  return Dispatch([&] { *resp = service_->Tip(*req); });
}

::grpc::Status TipServer::BatchTip(::grpc::ServerContext*, const BatchTipRequest* req, BatchTipResponse* resp) {
  return Dispatch([&] { *resp = service_->BatchTip(*req); });
}

::grpc::Status TipServer::GetTipStats(::grpc::ServerContext*, const GetTipStatsRequest* req, GetTipStatsResponse* resp) {
  return Dispatch([&] { *resp = service_->GetTipStats(*req); });
}

}
