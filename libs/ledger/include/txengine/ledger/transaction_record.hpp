#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "txengine/common/types.hpp"

namespace txengine {
namespace ledger {

enum class TransactionType : std::uint8_t {
  kDeposit,
  kWithdraw,
  kDispute,
  kResolve,
  kChargeback,
};

// Wire names: deposit, withdrawal, dispute, resolve, chargeback.
[[nodiscard]] std::optional<TransactionType> parse_transaction_type(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(TransactionType type) noexcept;

struct TransactionRecord {
  TransactionType type{TransactionType::kDeposit};
  common::ClientId client_id{0};
  common::TransactionId transaction_id{0};
  std::optional<common::Amount> amount{};

  // Deposit and Withdraw must carry an amount; Dispute, Resolve and Chargeback must not.
  [[nodiscard]] bool is_valid() const noexcept;
};

// Throws StructuralError naming the record when is_valid() is false.
void require_valid(const TransactionRecord& record);

}  // namespace ledger
}  // namespace txengine
