#include <grpcpp/grpcpp.h>

#include <cctype>
#include <chrono>
#include <map>
#include <stdexcept>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "client/cpp/ledger_client.h"
#include "internal/model/bounty_state.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

using namespace acp::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  acpctl <addr> --as <identity> balance [identity]\n"
            << "  acpctl <addr> --as <identity> faucet [whole_tokens=1000]\n"
            << "  acpctl <addr> --as <identity> tip <recipient> <amount> [post_ref] [-m message]\n"
            << "  acpctl <addr> --as <identity> batch-tip <recipient:amount> [...]\n"
            << "  acpctl <addr> --as <identity> bounty create <amount> <description> [-d hours] [-p post_ref]\n"
            << "  acpctl <addr> --as <identity> bounty list [-l limit] [-o offset]\n"
            << "  acpctl <addr> --as <identity> bounty view <id>\n"
            << "  acpctl <addr> --as <identity> bounty award <id> <claimer> [-p proof]\n"
            << "  acpctl <addr> --as <identity> bounty cancel <id>\n"
            << "  acpctl <addr> --as <identity> bounty reclaim <id>\n"
            << "  acpctl <addr> --as <identity> stats [identity]\n"
            << "  acpctl <addr> --as <identity> register <name> <profile>\n"
            << "  acpctl <addr> --as <identity> events [-s start] [-l limit]\n"
            << "\n"
            << "Amounts are decimal token strings, e.g. 12.5\n";
}

// Positional arguments plus single-letter options that each take a value.
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  std::string Option(const std::string& name, const std::string& fallback = "") const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
  }

  std::string At(size_t i, const std::string& fallback = "") const {
    return i < positional.size() ? positional[i] : fallback;
  }
};

static Args ParseArgs(char** begin, char** end) {
  Args out;
  for (char** it = begin; it != end; ++it) {
    std::string arg = *it;
    if (arg.size() == 2 && arg[0] == '-' && std::isalpha(static_cast<unsigned char>(arg[1]))) {
      if (it + 1 == end) {
        throw std::invalid_argument("option " + arg + " needs a value");
      }
      out.options[arg.substr(1)] = *++it;
      continue;
    }
    out.positional.push_back(arg);
  }
  return out;
}

static int Fail(const ::grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintBounty(const Bounty& b, uint32_t decimals) {
  std::cout << "id=" << b.id() << "\n";
  std::cout << "status=" << acp::model::StatusName(b.status()) << "\n";
  std::cout << "poster=" << b.poster() << "\n";
  std::cout << "amount=" << acp::util::FormatUnits(b.amount(), decimals) << "\n";
  std::cout << "deadline=" << b.deadline() << "\n";
  std::cout << "description=" << b.description() << "\n";
  if (!b.external_ref().empty()) std::cout << "external_ref=" << b.external_ref() << "\n";
  if (!b.claimed_by().empty()) std::cout << "claimed_by=" << b.claimed_by() << "\n";
}

static std::string DescribeEvent(const LedgerEvent& e, uint32_t decimals) {
  auto fmt = [decimals](uint64_t amount) { return acp::util::FormatUnits(amount, decimals); };

  switch (e.body_case()) {
    case LedgerEvent::kTipSent:
      return "tip " + e.tip_sent().from() + " -> " + e.tip_sent().to() + " " + fmt(e.tip_sent().amount());
    case LedgerEvent::kBatchTipSent:
      return "batch-tip " + e.batch_tip_sent().from() + " total " + fmt(e.batch_tip_sent().total_amount());
    case LedgerEvent::kBountyCreated:
      return "bounty-created #" + std::to_string(e.bounty_created().bounty_id()) + " by " + e.bounty_created().poster() + " " +
             fmt(e.bounty_created().amount());
    case LedgerEvent::kBountyClaimed:
      return "bounty-claimed #" + std::to_string(e.bounty_claimed().bounty_id()) + " by " + e.bounty_claimed().claimer() + " " +
             fmt(e.bounty_claimed().amount());
    case LedgerEvent::kBountyCancelled:
      return "bounty-cancelled #" + std::to_string(e.bounty_cancelled().bounty_id()) + " refund " +
             fmt(e.bounty_cancelled().amount_returned());
    case LedgerEvent::kBountyExpired:
      return "bounty-expired #" + std::to_string(e.bounty_expired().bounty_id()) + " refund " +
             fmt(e.bounty_expired().amount_returned());
    case LedgerEvent::kAgentRegistered:
      return "agent-registered " + e.agent_registered().agent() + " " + e.agent_registered().name();
    case LedgerEvent::BODY_NOT_SET:
      break;
  }
  return "unknown";
}

static uint64_t DeadlineFromHours(uint64_t hours) {
  if (hours == 0) {
    return 0;
  }
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  return static_cast<uint64_t>(now) + hours * 3600;
}

static int BountyCommand(acp::client::LedgerClient& client, uint32_t decimals, const Args& args) {
  const auto sub = args.At(0);

  if (sub == "create") {
    if (args.positional.size() < 3) return 1;
    uint64_t amount   = acp::util::ParseUnits(args.At(1), decimals);
    uint64_t deadline = DeadlineFromHours(std::stoull(args.Option("d", "0")));
    uint64_t id       = 0;
    auto     status   = client.CreateBounty(amount, deadline, args.At(2), args.Option("p"), &id);
    if (!status.ok()) return Fail(status);
    std::cout << "bounty=" << id << "\n";
    return 0;
  }

  if (sub == "list") {
    std::vector<Bounty> bounties;
    auto status = client.ListActiveBounties(std::stoull(args.Option("o", "0")), std::stoull(args.Option("l", "10")), &bounties);
    if (!status.ok()) return Fail(status);
    for (const auto& b : bounties) {
      std::cout << b.id() << " " << acp::util::FormatUnits(b.amount(), decimals) << " " << b.poster() << " " << b.description()
                << "\n";
    }
    return 0;
  }

  if (args.positional.size() < 2) {
    Usage();
    return 1;
  }
  uint64_t id = std::stoull(args.At(1));

  if (sub == "view") {
    Bounty b;
    auto   status = client.GetBounty(id, &b);
    if (!status.ok()) return Fail(status);
    PrintBounty(b, decimals);
    return 0;
  }

  if (sub == "award") {
    if (args.positional.size() < 3) return 1;
    ApproveClaimResponse resp;
    auto                 status = client.ApproveClaim(id, args.At(2), args.Option("p"), &resp);
    if (!status.ok()) return Fail(status);
    // An expired bounty is refunded instead of paid.
    std::cout << "status=" << acp::model::StatusName(resp.status()) << "\n";
    return 0;
  }

  if (sub == "cancel" || sub == "reclaim") {
    Bounty b;
    auto   status = sub == "cancel" ? client.CancelBounty(id, &b) : client.ClaimExpired(id, &b);
    if (!status.ok()) return Fail(status);
    std::cout << "status=" << acp::model::StatusName(b.status()) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[2]) != "--as") {
    Usage();
    return 1;
  }

  std::string addr     = argv[1];
  std::string identity = argv[3];
  std::string cmd      = argv[4];

  acp::client::LedgerClient client(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()), identity);

  TokenInfo info;
  if (auto status = client.GetTokenInfo(&info); !status.ok()) {
    return Fail(status);
  }
  const uint32_t decimals = info.decimals();

  try {
    const auto args = ParseArgs(argv + 5, argv + argc);

    // ------------------------------------------------------------

    if (cmd == "balance") {
      uint64_t balance = 0;
      auto     status  = client.Balance(args.At(0, identity), &balance);
      if (!status.ok()) return Fail(status);
      std::cout << acp::util::FormatUnits(balance, decimals) << " " << info.symbol() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "faucet") {
      FaucetResponse resp;
      auto           status = client.Faucet(std::stoull(args.At(0, "1000")), &resp);
      if (!status.ok()) return Fail(status);
      std::cout << "minted=" << acp::util::FormatUnits(resp.minted(), decimals) << "\n";
      std::cout << "balance=" << acp::util::FormatUnits(resp.balance(), decimals) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "tip") {
      if (args.positional.size() < 2) return 1;
      TipResponse resp;
      auto status = client.Tip(args.At(0), acp::util::ParseUnits(args.At(1), decimals), args.At(2), args.Option("m"), &resp);
      if (!status.ok()) return Fail(status);
      std::cout << "event=" << resp.event_sequence() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "batch-tip") {
      if (args.positional.empty()) return 1;
      std::vector<std::pair<std::string, uint64_t>> entries;
      for (const auto& arg : args.positional) {
        // identities may contain ':' themselves, the amount never does
        auto sep = arg.rfind(':');
        if (sep == std::string::npos || sep == 0) {
          std::cerr << "expected <recipient>:<amount>, got '" << arg << "'\n";
          return 1;
        }
        entries.emplace_back(arg.substr(0, sep), acp::util::ParseUnits(arg.substr(sep + 1), decimals));
      }
      BatchTipResponse resp;
      auto             status = client.BatchTip(entries, &resp);
      if (!status.ok()) return Fail(status);
      std::cout << "total=" << acp::util::FormatUnits(resp.total_amount(), decimals) << "\n";
      std::cout << "event=" << resp.event_sequence() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "bounty") {
      return BountyCommand(client, decimals, args);
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      AgentProfile profile;
      auto         status = client.GetAgentProfile(args.At(0, identity), &profile);
      if (!status.ok()) return Fail(status);
      if (!profile.name().empty()) std::cout << "name=" << profile.name() << "\n";
      if (!profile.profile().empty()) std::cout << "profile=" << profile.profile() << "\n";
      std::cout << "tips_sent=" << acp::util::FormatUnits(profile.tips().total_sent(), decimals) << "\n";
      std::cout << "tips_received=" << acp::util::FormatUnits(profile.tips().total_received(), decimals) << "\n";
      std::cout << "tips_received_count=" << profile.tips().received_count() << "\n";
      std::cout << "bounties_posted=" << profile.bounties().posted_count() << "\n";
      std::cout << "bounties_claimed=" << profile.bounties().claimed_count() << "\n";
      std::cout << "amount_posted=" << acp::util::FormatUnits(profile.bounties().amount_posted(), decimals) << "\n";
      std::cout << "amount_earned=" << acp::util::FormatUnits(profile.bounties().amount_earned(), decimals) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "register") {
      if (args.positional.size() < 2) return 1;
      auto status = client.RegisterAgent(args.At(0), args.At(1));
      if (!status.ok()) return Fail(status);
      std::cout << "registered\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "events") {
      ReadEventsRequest req;
      req.set_start_sequence(std::stoull(args.Option("s", "1")));
      req.set_max_entries(std::stoull(args.Option("l", "0")));
      ReadEventsResponse resp;
      auto               status = client.ReadEvents(req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& e : resp.events()) {
        std::cout << e.sequence() << " " << e.timestamp() << " " << DescribeEvent(e, decimals) << "\n";
      }
      std::cout << "next=" << resp.next_sequence() << "\n";
      return 0;
    }
  } catch (const acp::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::logic_error& e) {
    // std::stoull and option parsing
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
