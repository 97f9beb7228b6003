#include "txengine/ledger/transaction_engine.hpp"

#include <stdexcept>
#include <string>

#include "txengine/common/time_utils.hpp"
#include "txengine/ledger/errors.hpp"

namespace txengine {
namespace ledger {

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kIgnoredAccountLocked:
      return "ignored_account_locked";
    case Outcome::kIgnoredInsufficientFunds:
      return "ignored_insufficient_funds";
    case Outcome::kIgnoredUnknownTransaction:
      return "ignored_unknown_transaction";
    case Outcome::kIgnoredAlreadyDisputed:
      return "ignored_already_disputed";
    case Outcome::kIgnoredNotDisputed:
      return "ignored_not_disputed";
  }
  return "unknown";
}

TransactionEngine::TransactionEngine(telemetry::TelemetrySink* telemetry)
    : telemetry_(telemetry) {}

Outcome TransactionEngine::apply(const TransactionRecord& record) {
  require_valid(record);

  const auto started = common::now_steady();
  const auto handle = registry_.get_or_create(record.client_id);

  Outcome outcome = Outcome::kApplied;
  try {
    auto account = handle.lock();
    outcome = transition(*account, record);
    // The report prints available + held, so the total must stay representable too.
    static_cast<void>(account->total());
  } catch (const std::overflow_error&) {
    throw StructuralError("balance out of range (client " + std::to_string(record.client_id) + ", tx " +
                          std::to_string(record.transaction_id) + ")");
  }

  if (telemetry_) {
    telemetry_->record_latency(metrics::kApplyLatency, common::elapsed_since(started));
    telemetry_->increment(metrics::kRecordsProcessed);
    telemetry_->increment(metrics::outcome_counter(outcome));
  }
  return outcome;
}

std::uint64_t TransactionEngine::process_records(const RecordSource& source) {
  std::uint64_t processed = 0;
  TransactionRecord record;
  while (source(record)) {
    apply(record);
    ++processed;
  }
  return processed;
}

std::vector<Account> TransactionEngine::accounts() const {
  return registry_.snapshot_all();
}

Outcome TransactionEngine::transition(Account& account, const TransactionRecord& record) {
  if (account.locked) {
    return Outcome::kIgnoredAccountLocked;
  }

  // Deposits and withdrawals stay disputable even if the withdrawal is refused below.
  if (record.amount) {
    account.transactions.insert_or_assign(record.transaction_id, TransactionDetails{*record.amount});
  }

  switch (record.type) {
    case TransactionType::kDeposit:
      if (!record.amount) {
        throw LookupError("deposit without amount passed validation");
      }
      account.available += *record.amount;
      return Outcome::kApplied;
    case TransactionType::kWithdraw:
      if (!record.amount) {
        throw LookupError("withdrawal without amount passed validation");
      }
      return withdraw(account, *record.amount);
    case TransactionType::kDispute:
      return dispute(account, record.transaction_id);
    case TransactionType::kResolve:
      return resolve(account, record.transaction_id);
    case TransactionType::kChargeback:
      return chargeback(account, record.transaction_id);
  }
  throw LookupError("unhandled transaction type");
}

Outcome TransactionEngine::withdraw(Account& account, common::Amount amount) {
  if ((account.available - amount).is_negative()) {
    return Outcome::kIgnoredInsufficientFunds;
  }
  account.available -= amount;
  return Outcome::kApplied;
}

Outcome TransactionEngine::dispute(Account& account, common::TransactionId transaction_id) {
  auto it = account.transactions.find(transaction_id);
  if (it == account.transactions.end()) {
    return Outcome::kIgnoredUnknownTransaction;
  }
  auto& details = it->second;
  if (details.disputed) {
    return Outcome::kIgnoredAlreadyDisputed;
  }

  // Same direction for disputed deposits and withdrawals.
  const auto available = account.available - details.amount;
  const auto held = account.held + details.amount;
  details.disputed = true;
  account.available = available;
  account.held = held;
  return Outcome::kApplied;
}

Outcome TransactionEngine::resolve(Account& account, common::TransactionId transaction_id) {
  auto it = account.transactions.find(transaction_id);
  if (it == account.transactions.end()) {
    return Outcome::kIgnoredUnknownTransaction;
  }
  auto& details = it->second;
  if (!details.disputed) {
    return Outcome::kIgnoredNotDisputed;
  }

  const auto available = account.available + details.amount;
  const auto held = account.held - details.amount;
  details.disputed = false;
  account.available = available;
  account.held = held;
  return Outcome::kApplied;
}

Outcome TransactionEngine::chargeback(Account& account, common::TransactionId transaction_id) {
  auto it = account.transactions.find(transaction_id);
  if (it == account.transactions.end()) {
    return Outcome::kIgnoredUnknownTransaction;
  }
  auto& details = it->second;
  if (!details.disputed) {
    return Outcome::kIgnoredNotDisputed;
  }

  account.held -= details.amount;
  details.disputed = false;
  account.locked = true;
  return Outcome::kApplied;
}

}  // namespace ledger
}  // namespace txengine
