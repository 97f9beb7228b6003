#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "txengine/common/spsc_ring.hpp"
#include "txengine/ledger/transaction_engine.hpp"
#include "txengine/ledger/transaction_record.hpp"

namespace txengine {
namespace dispatch {

// Fans records out to worker threads by client id. Every record of a client lands on
// the same worker's ring, so per-client order is the submission order.
class ShardedDispatcher {
 public:
  struct Config {
    std::size_t workers{4};
    std::size_t queue_depth{1 << 12};
  };

  struct Stats {
    std::uint64_t submitted{0};
    std::uint64_t producer_stalls{0};
  };

  ShardedDispatcher(ledger::TransactionEngine& engine, Config config);
  ShardedDispatcher(const ShardedDispatcher&) = delete;
  ShardedDispatcher& operator=(const ShardedDispatcher&) = delete;
  ~ShardedDispatcher();

  // Drains `source` through the workers and blocks until all of them are done.
  // The first error raised by the source or by any worker is rethrown here.
  std::uint64_t run(const ledger::TransactionEngine::RecordSource& source);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::size_t worker_count() const noexcept { return config_.workers; }

 private:
  using Ring = common::SpscRing<ledger::TransactionRecord>;

  ledger::TransactionEngine& engine_;
  Config config_;
  Stats stats_{};

  std::vector<std::unique_ptr<Ring>> rings_;
  std::vector<std::thread> threads_;
  std::atomic<bool> input_done_{false};
  std::atomic<bool> failed_{false};
  std::atomic<std::uint64_t> applied_{0};

  std::mutex error_mutex_;
  std::exception_ptr first_error_{};

  void worker_loop(Ring& ring);
  void enqueue(ledger::TransactionRecord& record);
  void record_failure(std::exception_ptr error);
  void join_workers();
};

}  // namespace dispatch
}  // namespace txengine
