#include "application.hpp"

#include "internal/grpc/bounty_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/grpc/tip_server.hpp"
#include "internal/grpc/token_server.hpp"
#include "internal/service/bounty_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/tip_service.hpp"
#include "internal/service/token_service.hpp"

namespace acp::runtime {

Application BuildApplication(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Application app;
  app.ledger = factory::BuildLedger(config, std::move(clock));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  const auto ctx = app.ledger.Services();

  auto tip_service      = std::make_shared<service::TipService>(ctx);
  auto bounty_service   = std::make_shared<service::BountyService>(ctx);
  auto registry_service = std::make_shared<service::RegistryService>(ctx);
  auto token_service    = std::make_shared<service::TokenService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TipServer>(tip_service));
  app.grpc_services.push_back(std::make_unique<grpc::BountyServer>(bounty_service));
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::TokenServer>(token_service));

  return app;
}

} // namespace acp::runtime
