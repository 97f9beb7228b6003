#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace txengine {
namespace common {

// Bounded lock-free queue for exactly one producer thread and one consumer thread.
// One slot is kept free to tell "full" from "empty", so usable capacity is capacity() - 1.
template <typename T>
class SpscRing {
 public:
  explicit SpscRing(std::size_t capacity_power_of_two)
      : slots_(capacity_power_of_two), mask_(capacity_power_of_two - 1) {
    if (capacity_power_of_two < 2 || (capacity_power_of_two & mask_) != 0) {
      throw std::invalid_argument("SpscRing capacity must be a power of two >= 2");
    }
  }

  SpscRing(const SpscRing&) = delete;
  SpscRing& operator=(const SpscRing&) = delete;

  [[nodiscard]] bool try_push(T& value) {
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t next = (head + 1) & mask_;
    if (next == tail_.load(std::memory_order_acquire)) {
      return false;
    }
    slots_[head].emplace(std::move(value));
    head_.store(next, std::memory_order_release);
    return true;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_acquire)) {
      return std::nullopt;
    }
    std::optional<T> out = std::move(slots_[tail]);
    slots_[tail].reset();
    tail_.store((tail + 1) & mask_, std::memory_order_release);
    return out;
  }

  [[nodiscard]] bool empty() const noexcept {
    return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

 private:
  static constexpr std::size_t kCacheLine = 64;

  std::vector<std::optional<T>> slots_;
  const std::size_t mask_;
  alignas(kCacheLine) std::atomic<std::size_t> head_{0};
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0};
};

}  // namespace common
}  // namespace txengine
