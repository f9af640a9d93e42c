#pragma once

#include "acp/ledger/v1.hpp"
#include "service_context.hpp"

namespace acp::service {

inline constexpr uint64_t kDefaultEventPageSize = 100;
inline constexpr uint64_t kMaxEventPageSize     = 1000;

class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  acp::ledger::v1::RegisterAgentResponse
  RegisterAgent(const acp::ledger::v1::RegisterAgentRequest& req);

  acp::ledger::v1::GetAgentProfileResponse
  GetAgentProfile(const acp::ledger::v1::GetAgentProfileRequest& req);

  acp::ledger::v1::GetBalanceResponse
  GetBalance(const acp::ledger::v1::GetBalanceRequest& req);

  acp::ledger::v1::GetAllowancesResponse
  GetAllowances(const acp::ledger::v1::GetAllowancesRequest& req);

  acp::ledger::v1::ReadEventsResponse
  ReadEvents(const acp::ledger::v1::ReadEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
