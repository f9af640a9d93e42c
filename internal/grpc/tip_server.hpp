#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "acp/ledger/v1_grpc.hpp"
#include "internal/service/tip_service.hpp"

namespace acp::grpc {

class TipServer final : public acp::ledger::v1::TipService::Service {
public:
  explicit TipServer(std::shared_ptr<acp::service::TipService> svc);

  ::grpc::Status Tip(::grpc::ServerContext*,
                   const acp::ledger::v1::TipRequest*,
                   acp::ledger::v1::TipResponse*) override;

  ::grpc::Status BatchTip(::grpc::ServerContext*,
                   const acp::ledger::v1::BatchTipRequest*,
                   acp::ledger::v1::BatchTipResponse*) override;

  ::grpc::Status GetTipStats(::grpc::ServerContext*,
                   const acp::ledger::v1::GetTipStatsRequest*,
                   acp::ledger::v1::GetTipStatsResponse*) override;

private:
  std::shared_ptr<acp::service::TipService> service_;
};

}
