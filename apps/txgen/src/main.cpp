// Writes a random but well-formed transaction CSV to stdout for load testing.

#include <charconv>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

#include "txengine/common/types.hpp"
#include "txengine/ledger/transaction_record.hpp"

namespace {

constexpr std::uint64_t kDefaultCount = 1'000'000;
constexpr double kNewClientProbability = 0.75;
constexpr double kDisputeProbability = 0.1;
constexpr double kResolveProbability = 0.1;
constexpr double kChargebackProbability = 0.1;

struct OpenDispute {
  txengine::common::ClientId client;
  txengine::common::TransactionId tx;
};

std::optional<std::uint64_t> parse_arg(std::string_view text) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txengine;

  std::uint64_t count = kDefaultCount;
  std::uint64_t seed = std::random_device{}();

  if (argc > 3) {
    std::cerr << "Usage: " << argv[0] << " [count] [seed]\n";
    return 1;
  }
  if (argc > 1) {
    auto parsed = parse_arg(argv[1]);
    if (!parsed || *parsed > std::numeric_limits<common::TransactionId>::max()) {
      std::cerr << "Invalid count: " << argv[1] << "\n";
      return 1;
    }
    count = *parsed;
  }
  if (argc > 2) {
    auto parsed = parse_arg(argv[2]);
    if (!parsed) {
      std::cerr << "Invalid seed: " << argv[2] << "\n";
      return 1;
    }
    seed = *parsed;
  }

  std::mt19937_64 rng{seed};
  std::uniform_real_distribution<double> unit{0.0, 1.0};
  std::uniform_int_distribution<std::int64_t> amount_units{100 * common::Amount::kScale,
                                                           200 * common::Amount::kScale};

  std::uint32_t max_client = 0;
  common::ClientId client = 0;
  std::vector<OpenDispute> open_disputes;

  auto take_dispute = [&]() {
    std::uniform_int_distribution<std::size_t> pick{0, open_disputes.size() - 1};
    const auto idx = pick(rng);
    const auto dispute = open_disputes[idx];
    open_disputes[idx] = open_disputes.back();
    open_disputes.pop_back();
    return dispute;
  };

  std::ostream& out = std::cout;
  out << "type,client,tx,amount\n";

  for (std::uint64_t i = 0; i < count; ++i) {
    const auto tx = static_cast<common::TransactionId>(i);

    if (unit(rng) < kNewClientProbability && max_client < std::numeric_limits<common::ClientId>::max()) {
      client = static_cast<common::ClientId>(++max_client);
    } else {
      std::uniform_int_distribution<std::uint32_t> pick{0, max_client};
      client = static_cast<common::ClientId>(pick(rng));
    }

    const auto type = unit(rng) < 0.5 ? ledger::TransactionType::kDeposit : ledger::TransactionType::kWithdraw;
    const auto amount = common::Amount::from_units(amount_units(rng));
    out << ledger::to_string(type) << ',' << client << ',' << tx << ',' << amount.to_string() << '\n';

    if (unit(rng) < kDisputeProbability) {
      out << "dispute," << client << ',' << tx << ",\n";
      open_disputes.push_back({client, tx});
    }

    if (!open_disputes.empty() && unit(rng) < kResolveProbability) {
      const auto dispute = take_dispute();
      out << "resolve," << dispute.client << ',' << dispute.tx << ",\n";
    }

    if (!open_disputes.empty() && unit(rng) < kChargebackProbability) {
      const auto dispute = take_dispute();
      out << "chargeback," << dispute.client << ',' << dispute.tx << ",\n";
    }
  }

  out.flush();
  return out ? 0 : 1;
}
