#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "txengine/ledger/account.hpp"
#include "txengine/ledger/account_registry.hpp"
#include "txengine/ledger/transaction_record.hpp"
#include "txengine/telemetry/telemetry_sink.hpp"

namespace txengine {
namespace ledger {

// What apply() did with a record. Everything but kApplied is a silent no-op.
enum class Outcome : std::uint8_t {
  kApplied,
  kIgnoredAccountLocked,
  kIgnoredInsufficientFunds,
  kIgnoredUnknownTransaction,
  kIgnoredAlreadyDisputed,
  kIgnoredNotDisputed,
};

inline constexpr std::size_t kOutcomeCount = 6;

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

namespace metrics {
inline constexpr telemetry::MetricId kApplyLatency = 0;
inline constexpr telemetry::MetricId kRecordsProcessed = 1;

// One counter per Outcome, starting after the fixed ids above.
[[nodiscard]] constexpr telemetry::MetricId outcome_counter(Outcome outcome) noexcept {
  return static_cast<telemetry::MetricId>(2 + static_cast<std::size_t>(outcome));
}
}  // namespace metrics

class TransactionEngine {
 public:
  // Fills `out` and returns true, or returns false once the input is exhausted.
  // Decode failures are thrown by the source and abort processing.
  using RecordSource = std::function<bool(TransactionRecord& out)>;

  explicit TransactionEngine(telemetry::TelemetrySink* telemetry = nullptr);

  TransactionEngine(const TransactionEngine&) = delete;
  TransactionEngine& operator=(const TransactionEngine&) = delete;

  // Throws StructuralError for an invalid record. Safe to call from several threads
  // as long as records of one client are not applied concurrently.
  Outcome apply(const TransactionRecord& record);

  // Applies records until the source is exhausted. Returns the number applied.
  std::uint64_t process_records(const RecordSource& source);

  // Snapshot of every account. Only meaningful after all input has been applied.
  [[nodiscard]] std::vector<Account> accounts() const;
  [[nodiscard]] std::size_t account_count() const { return registry_.size(); }

 private:
  AccountRegistry registry_;
  telemetry::TelemetrySink* telemetry_;

  static Outcome transition(Account& account, const TransactionRecord& record);
  static Outcome withdraw(Account& account, common::Amount amount);
  static Outcome dispute(Account& account, common::TransactionId transaction_id);
  static Outcome resolve(Account& account, common::TransactionId transaction_id);
  static Outcome chargeback(Account& account, common::TransactionId transaction_id);
};

}  // namespace ledger
}  // namespace txengine
