#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/guards.hpp"
#include "internal/grpc/bounty_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/tip_server.hpp"
#include "internal/grpc/token_server.hpp"
#include "internal/service/bounty_service.hpp"
#include "internal/service/tip_service.hpp"
#include "internal/service/token_service.hpp"
#include "internal/util/errors.hpp"
#include "support/ledger_fixture.hpp"

namespace {

using namespace acp::ledger::v1;
using acp::testing::LedgerFixture;

void TestEveryErrorKindHasItsOwnCode() {
  using acp::grpc::ToStatus;
  assert(ToStatus(acp::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(acp::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(acp::util::Unauthorized("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(acp::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(acp::util::PreconditionFailed("x")).error_code() == ::grpc::StatusCode::OUT_OF_RANGE);
  assert(ToStatus(acp::util::CustodyTransferFailed("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::runtime_error("disk on fire")).error_code() == ::grpc::StatusCode::INTERNAL);

  try {
    acp::core::ThrowIfDbError(acp::db::Result::Err(acp::db::ErrorCode::Conflict, "version changed"), "update bounty 1");
    assert(false);
  } catch (const std::exception& e) {
    assert(ToStatus(e).error_code() == ::grpc::StatusCode::INTERNAL);
  }

  auto status = ToStatus(acp::util::NotFound("bounty 9 does not exist"));
  assert(status.error_message() == "bounty 9 does not exist");
}

void TestGetMissingBountyReturnsNotFound() {
  LedgerFixture f;
  acp::grpc::BountyServer server(std::make_shared<acp::service::BountyService>(f.ledger.Services()));

  GetBountyRequest  req;
  GetBountyResponse resp;
  req.set_bounty_id(12);
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetBounty(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestTipWithoutAllowanceReturnsResourceExhausted() {
  LedgerFixture f;
  f.Fund("alice", 100);
  acp::grpc::TipServer server(std::make_shared<acp::service::TipService>(f.ledger.Services()));

  TipRequest req;
  req.set_caller("alice");
  req.set_recipient("bob");
  req.set_amount(10);
  TipResponse           resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Tip(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(f.Balance("alice") == 100);
}

void TestCancelByStrangerReturnsPermissionDenied() {
  LedgerFixture f;
  f.Prepare("paula", 100);
  const auto id = f.ledger.bounties->CreateBounty("paula", 50, 0, "x", "");
  acp::grpc::BountyServer server(std::make_shared<acp::service::BountyService>(f.ledger.Services()));

  CancelBountyRequest req;
  req.set_caller("mallory");
  req.set_bounty_id(id);
  CancelBountyResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.CancelBounty(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  req.set_caller("paula");
  ::grpc::ServerContext second_ctx;
  assert(server.CancelBounty(&second_ctx, &req, &resp).ok());
  assert(resp.bounty().status() == BOUNTY_STATUS_CANCELLED);
}

void TestDisabledFaucetReturnsOutOfRange() {
  auto config = acp::testing::DefaultConfig();
  config.mutable_token()->set_faucet_enabled(false);
  LedgerFixture f(std::make_shared<acp::db::memory::MemoryRepository>(), config);
  acp::grpc::TokenServer server(std::make_shared<acp::service::TokenService>(f.ledger.Services()));

  FaucetRequest req;
  req.set_caller("alice");
  req.set_whole_tokens(1);
  FaucetResponse        resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.Faucet(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::OUT_OF_RANGE);
}

} // namespace

int main() {
  TestEveryErrorKindHasItsOwnCode();
  TestGetMissingBountyReturnsNotFound();
  TestTipWithoutAllowanceReturnsResourceExhausted();
  TestCancelByStrangerReturnsPermissionDenied();
  TestDisabledFaucetReturnsOutOfRange();

  std::cout << "acp_unit_grpc_status: pass\n";
  return 0;
}
