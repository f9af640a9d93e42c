#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "acp/ledger/v1_grpc.hpp"
#include "internal/service/registry_service.hpp"

namespace acp::grpc {

class RegistryServer final : public acp::ledger::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<acp::service::RegistryService> svc);

  ::grpc::Status RegisterAgent(::grpc::ServerContext*,
                   const acp::ledger::v1::RegisterAgentRequest*,
                   acp::ledger::v1::RegisterAgentResponse*) override;

  ::grpc::Status GetAgentProfile(::grpc::ServerContext*,
                   const acp::ledger::v1::GetAgentProfileRequest*,
                   acp::ledger::v1::GetAgentProfileResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                   const acp::ledger::v1::GetBalanceRequest*,
                   acp::ledger::v1::GetBalanceResponse*) override;

  ::grpc::Status GetAllowances(::grpc::ServerContext*,
                   const acp::ledger::v1::GetAllowancesRequest*,
                   acp::ledger::v1::GetAllowancesResponse*) override;

  ::grpc::Status ReadEvents(::grpc::ServerContext*,
                   const acp::ledger::v1::ReadEventsRequest*,
                   acp::ledger::v1::ReadEventsResponse*) override;

private:
  std::shared_ptr<acp::service::RegistryService> service_;
};

}
