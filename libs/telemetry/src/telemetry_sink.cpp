#include "txengine/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <cmath>

namespace txengine {
namespace telemetry {

namespace {

std::size_t bucket_for(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  const auto width = static_cast<std::size_t>(std::bit_width(static_cast<std::uint64_t>(value_ns)));
  return std::min(width, StreamingHistogram::kNumBuckets - 1);
}

// Exclusive upper edge of a bucket.
std::int64_t bucket_ceiling(std::size_t bucket) noexcept {
  return std::int64_t{1} << bucket;
}

}  // namespace

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  const auto sample = std::max<std::int64_t>(value_ns, 0);
  ++buckets_[bucket_for(sample)];
  ++count_;
  sum_ += sample;
  max_ = std::max(max_, sample);
}

double StreamingHistogram::mean() const noexcept {
  return count_ == 0 ? 0.0 : static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double q) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  const auto rank = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::ceil(q * static_cast<double>(count_))));
  std::uint64_t seen = 0;
  for (std::size_t bucket = 0; bucket < kNumBuckets; ++bucket) {
    seen += buckets_[bucket];
    if (seen >= rank) {
      return static_cast<double>(std::min(bucket_ceiling(bucket) - 1, max_));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::increment(MetricId id, std::uint64_t delta) noexcept {
  counters_[id % kMaxMetricId].fetch_add(delta, std::memory_order_relaxed);
}

void TelemetrySink::record_latency(MetricId id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[id % kMaxMetricId].record(latency.count());
}

std::uint64_t TelemetrySink::counter(MetricId id) const noexcept {
  return counters_[id % kMaxMetricId].load(std::memory_order_relaxed);
}

std::vector<TelemetrySink::LatencySummary> TelemetrySink::latency_summaries() const {
  std::scoped_lock lock(mutex_);
  std::vector<LatencySummary> summaries;
  for (std::size_t idx = 0; idx < kMaxMetricId; ++idx) {
    const auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(LatencySummary{
        .id = static_cast<MetricId>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p50_ns = hist.percentile(0.50),
        .p99_ns = hist.percentile(0.99),
        .max_ns = hist.max(),
    });
  }
  return summaries;
}

}  // namespace telemetry
}  // namespace txengine
