#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/ledger_client.h"
#include "internal/util/amount.hpp"

namespace {

bool Check(const ::grpc::Status& status, const char* what) {
  if (!status.ok()) {
    std::cerr << what << " failed: " << status.error_message() << '\n';
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  auto channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
  acp::client::LedgerClient poster(channel, "example-poster");
  acp::client::LedgerClient worker(channel, "example-worker");

  acp::ledger::v1::TokenInfo info;
  if (!Check(poster.GetTokenInfo(&info), "GetTokenInfo")) return 1;
  const auto fmt = [&](uint64_t units) { return acp::util::FormatUnits(units, info.decimals()) + " " + info.symbol(); };

  // Needs a ledger with the faucet enabled.
  acp::ledger::v1::FaucetResponse minted;
  if (!Check(poster.Faucet(100, &minted), "Faucet")) return 1;
  std::cout << "poster funded with " << fmt(minted.minted()) << '\n';

  const uint64_t reward   = acp::util::ParseUnits("25", info.decimals());
  const auto     now      = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
  const uint64_t deadline = static_cast<uint64_t>(now.count()) + 24 * 3600;

  // The client approves the escrow account for the reward before posting.
  uint64_t bounty_id = 0;
  if (!Check(poster.CreateBounty(reward, deadline, "Write a summary of the design thread", "thread-1", &bounty_id), "CreateBounty")) {
    return 1;
  }
  std::cout << "posted bounty #" << bounty_id << " for " << fmt(reward) << '\n';

  acp::ledger::v1::ApproveClaimResponse settled;
  if (!Check(poster.ApproveClaim(bounty_id, worker.Identity(), "https://example.org/summary", &settled), "ApproveClaim")) return 1;
  std::cout << "bounty #" << bounty_id << " settled as " << acp::ledger::v1::BountyStatus_Name(settled.status()) << '\n';

  acp::ledger::v1::TipResponse tip;
  if (!Check(worker.Tip(poster.Identity(), acp::util::ParseUnits("1.5", info.decimals()), "thread-1", "thanks for the bounty", &tip),
             "Tip")) {
    return 1;
  }

  uint64_t poster_balance = 0, worker_balance = 0;
  if (!Check(poster.Balance(poster.Identity(), &poster_balance), "Balance")) return 1;
  if (!Check(worker.Balance(worker.Identity(), &worker_balance), "Balance")) return 1;

  std::cout << "poster balance: " << fmt(poster_balance) << '\n';
  std::cout << "worker balance: " << fmt(worker_balance) << '\n';
  return 0;
}
