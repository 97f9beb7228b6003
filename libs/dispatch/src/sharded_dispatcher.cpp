#include "txengine/dispatch/sharded_dispatcher.hpp"

#include <stdexcept>
#include <utility>

namespace txengine {
namespace dispatch {

ShardedDispatcher::ShardedDispatcher(ledger::TransactionEngine& engine, Config config)
    : engine_(engine), config_(config) {
  if (config_.workers == 0) {
    throw std::invalid_argument("ShardedDispatcher needs at least one worker");
  }
  rings_.reserve(config_.workers);
  for (std::size_t i = 0; i < config_.workers; ++i) {
    rings_.push_back(std::make_unique<Ring>(config_.queue_depth));
  }
}

ShardedDispatcher::~ShardedDispatcher() {
  failed_.store(true, std::memory_order_release);
  input_done_.store(true, std::memory_order_release);
  join_workers();
}

std::uint64_t ShardedDispatcher::run(const ledger::TransactionEngine::RecordSource& source) {
  if (!threads_.empty()) {
    throw std::logic_error("ShardedDispatcher::run called twice");
  }

  threads_.reserve(rings_.size());
  for (auto& ring : rings_) {
    threads_.emplace_back([this, &ring] { worker_loop(*ring); });
  }

  try {
    ledger::TransactionRecord record;
    while (!failed_.load(std::memory_order_acquire) && source(record)) {
      // Reject at the boundary so nothing after a bad record reaches any shard.
      ledger::require_valid(record);
      enqueue(record);
    }
  } catch (...) {
    record_failure(std::current_exception());
  }

  input_done_.store(true, std::memory_order_release);
  join_workers();

  if (first_error_) {
    std::rethrow_exception(first_error_);
  }
  return applied_.load(std::memory_order_relaxed);
}

void ShardedDispatcher::enqueue(ledger::TransactionRecord& record) {
  auto& ring = *rings_[record.client_id % rings_.size()];
  ++stats_.submitted;
  while (!ring.try_push(record)) {
    if (failed_.load(std::memory_order_acquire)) {
      return;
    }
    ++stats_.producer_stalls;
    std::this_thread::yield();
  }
}

void ShardedDispatcher::worker_loop(Ring& ring) {
  try {
    while (!failed_.load(std::memory_order_acquire)) {
      if (auto record = ring.try_pop()) {
        engine_.apply(*record);
        applied_.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      // Re-check after seeing input_done_ so a record pushed just before it is not lost.
      if (input_done_.load(std::memory_order_acquire) && ring.empty()) {
        return;
      }
      std::this_thread::yield();
    }
  } catch (...) {
    record_failure(std::current_exception());
  }
}

void ShardedDispatcher::record_failure(std::exception_ptr error) {
  {
    std::scoped_lock lock(error_mutex_);
    if (!first_error_) {
      first_error_ = std::move(error);
    }
  }
  failed_.store(true, std::memory_order_release);
}

void ShardedDispatcher::join_workers() {
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace dispatch
}  // namespace txengine
