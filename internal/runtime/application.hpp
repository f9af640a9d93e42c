#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace acp::runtime {

/*
  Application

  The ledger plus the gRPC transport adapters serving it.
*/
struct Application {
  factory::Ledger ledger;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application BuildApplication(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock);

} // namespace acp::runtime
