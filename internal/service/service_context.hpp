#pragma once

#include <memory>

namespace acp::core {
class TipLedger;
class BountyEscrow;
class Registry;
class TokenManager;
}

namespace acp::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<acp::core::TipLedger> tips;
  std::shared_ptr<acp::core::BountyEscrow> bounties;
  std::shared_ptr<acp::core::Registry> registry;
  std::shared_ptr<acp::core::TokenManager> token;
};

}
