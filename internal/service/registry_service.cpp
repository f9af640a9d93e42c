#include "registry_service.hpp"

#include <algorithm>

#include "internal/core/registry.hpp"
#include "observe_rpc.hpp"

namespace acp::service {

using namespace acp::ledger::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterAgentResponse RegistryService::RegisterAgent(const RegisterAgentRequest& req) {
  return ObserveRpc("RegistryService.RegisterAgent", req.caller(), [&] {
    ctx_.registry->RegisterAgent(req.caller(), req.name(), req.profile());
    return RegisterAgentResponse{};
  });
}

GetAgentProfileResponse RegistryService::GetAgentProfile(const GetAgentProfileRequest& req) {
  return ObserveRpc("RegistryService.GetAgentProfile", "", [&] {
    GetAgentProfileResponse resp;
    *resp.mutable_profile() = ctx_.registry->GetFullAgentStats(req.identity());
    return resp;
  });
}

GetBalanceResponse RegistryService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("RegistryService.GetBalance", "", [&] {
    GetBalanceResponse resp;
    resp.set_balance(ctx_.registry->GetBalance(req.identity()));
    return resp;
  });
}

GetAllowancesResponse RegistryService::GetAllowances(const GetAllowancesRequest& req) {
  return ObserveRpc("RegistryService.GetAllowances", "", [&] {
    GetAllowancesResponse resp;
    resp.set_tips_allowance(ctx_.registry->GetTipsAllowance(req.identity()));
    resp.set_bounties_allowance(ctx_.registry->GetBountiesAllowance(req.identity()));
    return resp;
  });
}

ReadEventsResponse RegistryService::ReadEvents(const ReadEventsRequest& req) {
  return ObserveRpc("RegistryService.ReadEvents", "", [&] {
    const uint64_t max_entries = req.max_entries() == 0 ? kDefaultEventPageSize : std::min(req.max_entries(), kMaxEventPageSize);

    events::EventFilter filter;
    filter.type     = req.type();
    filter.identity = req.identity();

    auto page = ctx_.registry->ReadEvents(req.start_sequence(), max_entries, filter);

    ReadEventsResponse resp;
    for (auto& event : page.events) {
      *resp.add_events() = std::move(event);
    }
    resp.set_next_sequence(page.next_sequence);
    return resp;
  });
}

}
