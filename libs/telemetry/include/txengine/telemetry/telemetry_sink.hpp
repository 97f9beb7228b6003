#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace txengine {
namespace telemetry {

using MetricId = std::uint16_t;

// Log2-bucketed latency histogram; bucket i holds samples in [2^(i-1), 2^i) ns and
// the last bucket absorbs everything from ~0.5s up.
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  // Upper estimate for quantile q in [0, 1], never above the largest sample.
  [[nodiscard]] double percentile(double q) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};
};

// Counters are lock-free so worker threads can bump them without contention;
// latency histograms share one mutex.
class TelemetrySink {
 public:
  static constexpr std::size_t kMaxMetricId = 64;

  struct LatencySummary {
    MetricId id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p50_ns{0.0};
    double p99_ns{0.0};
    std::int64_t max_ns{0};
  };

  void increment(MetricId id, std::uint64_t delta = 1) noexcept;
  void record_latency(MetricId id, std::chrono::nanoseconds latency);

  [[nodiscard]] std::uint64_t counter(MetricId id) const noexcept;
  [[nodiscard]] std::vector<LatencySummary> latency_summaries() const;

 private:
  std::array<std::atomic<std::uint64_t>, kMaxMetricId> counters_{};
  mutable std::mutex mutex_;
  std::array<StreamingHistogram, kMaxMetricId> histograms_{};
};

}  // namespace telemetry
}  // namespace txengine
