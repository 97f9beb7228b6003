#pragma once

#include <unordered_map>

#include "txengine/common/types.hpp"

namespace txengine {
namespace ledger {

// A deposit or withdrawal kept for later dispute lookups.
struct TransactionDetails {
  common::Amount amount{};
  bool disputed{false};

  TransactionDetails() = default;
  explicit TransactionDetails(common::Amount value) : amount(value) {}
};

struct Account {
  common::ClientId client_id{0};
  common::Amount available{};
  common::Amount held{};  // sum of amounts under open dispute
  bool locked{false};     // set by chargeback, never cleared
  std::unordered_map<common::TransactionId, TransactionDetails> transactions{};

  Account() = default;
  explicit Account(common::ClientId id) : client_id(id) {}

  [[nodiscard]] common::Amount total() const { return available + held; }
};

}  // namespace ledger
}  // namespace txengine
