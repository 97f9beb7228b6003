#include "txengine/ledger/transaction_record.hpp"

#include <string>

#include "txengine/ledger/errors.hpp"

namespace txengine {
namespace ledger {

std::optional<TransactionType> parse_transaction_type(std::string_view name) noexcept {
  if (name == "deposit") {
    return TransactionType::kDeposit;
  }
  if (name == "withdrawal") {
    return TransactionType::kWithdraw;
  }
  if (name == "dispute") {
    return TransactionType::kDispute;
  }
  if (name == "resolve") {
    return TransactionType::kResolve;
  }
  if (name == "chargeback") {
    return TransactionType::kChargeback;
  }
  return std::nullopt;
}

std::string_view to_string(TransactionType type) noexcept {
  switch (type) {
    case TransactionType::kDeposit:
      return "deposit";
    case TransactionType::kWithdraw:
      return "withdrawal";
    case TransactionType::kDispute:
      return "dispute";
    case TransactionType::kResolve:
      return "resolve";
    case TransactionType::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

bool TransactionRecord::is_valid() const noexcept {
  switch (type) {
    case TransactionType::kDeposit:
    case TransactionType::kWithdraw:
      return amount.has_value();
    case TransactionType::kDispute:
    case TransactionType::kResolve:
    case TransactionType::kChargeback:
      return !amount.has_value();
  }
  return false;
}

void require_valid(const TransactionRecord& record) {
  if (record.is_valid()) {
    return;
  }
  const char* problem = record.amount ? " record must not carry an amount" : " record is missing its amount";
  throw StructuralError(std::string(to_string(record.type)) + problem + " (client " +
                        std::to_string(record.client_id) + ", tx " +
                        std::to_string(record.transaction_id) + ")");
}

}  // namespace ledger
}  // namespace txengine
