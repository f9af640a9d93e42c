#include "registry_server.hpp"
#include "grpc_error.hpp"

namespace acp::grpc {

using namespace acp::ledger::v1;

RegistryServer::RegistryServer(std::shared_ptr<acp::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::RegisterAgent(::grpc::ServerContext*, const RegisterAgentRequest* req, RegisterAgentResponse* resp) {
  return Dispatch([&] { *resp = service_->RegisterAgent(*req); });
}

::grpc::Status RegistryServer::GetAgentProfile(::grpc::ServerContext*, const GetAgentProfileRequest* req, GetAgentProfileResponse* resp) {
  return Dispatch([&] { *resp = service_->GetAgentProfile(*req); });
}

::grpc::Status RegistryServer::GetBalance(::grpc::ServerContext*, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  return Dispatch([&] { *resp = service_->GetBalance(*req); });
}

::grpc::Status RegistryServer::GetAllowances(::grpc::ServerContext*, const GetAllowancesRequest* req, GetAllowancesResponse* resp) {
  return Dispatch([&] { *resp = service_->GetAllowances(*req); });
}

::grpc::Status RegistryServer::ReadEvents(::grpc::ServerContext*, const ReadEventsRequest* req, ReadEventsResponse* resp) {
  return Dispatch([&] { *resp = service_->ReadEvents(*req); });
}

}
