/**
 * @file metrics_collector.hpp
 * @brief Engine-wide latency histograms and event counters
 *
 * Lock-free recording on the update path; percentiles and counters are read
 * by the monitoring side at any time.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>

namespace aggbook {

/**
 * @brief Lock-free log-bucketed histogram
 *
 * **Bucketing:**
 * - bucket = floor(log2(value) * BUCKETS_PER_OCTAVE), value 0 in bucket 0
 * - Values past the last bucket are counted in the last bucket
 * - Percentiles report the lower bound of the bucket reaching the target,
 *   so they are approximate (within one bucket width, ~7%)
 *
 * @tparam NUM_BUCKETS Number of buckets (640 covers the full uint64 range)
 *
 * @code
 * LockFreeHistogram<> hist;
 * hist.record(850);
 * hist.record(1200);
 * uint64_t p99 = hist.get_percentile(99.0);
 * @endcode
 *
 * @note record() is safe from any number of threads
 * @warning reset() must not race with record()
 */
template<size_t NUM_BUCKETS = 640>
class LockFreeHistogram {
public:
    static constexpr double BUCKETS_PER_OCTAVE = 10.0;

    LockFreeHistogram() {
        reset();
    }

    void record(uint64_t value) {
        buckets_[value_to_bucket(value)].fetch_add(1, std::memory_order_relaxed);

        uint64_t seen_min = min_value_.load(std::memory_order_relaxed);
        while (value < seen_min &&
               !min_value_.compare_exchange_weak(seen_min, value, std::memory_order_relaxed)) {}

        uint64_t seen_max = max_value_.load(std::memory_order_relaxed);
        while (value > seen_max &&
               !max_value_.compare_exchange_weak(seen_max, value, std::memory_order_relaxed)) {}

        count_.fetch_add(1, std::memory_order_relaxed);
        sum_.fetch_add(value, std::memory_order_relaxed);
    }

    /**
     * @brief Get approximate percentile
     *
     * @param percentile In [0, 100]
     * @return uint64_t Approximate value, clamped to [min, max]; 0 if empty
     */
    uint64_t get_percentile(double percentile) const {
        uint64_t count = count_.load(std::memory_order_acquire);
        if (count == 0) {
            return 0;
        }

        double clamped = std::min(std::max(percentile, 0.0), 100.0);
        uint64_t target = static_cast<uint64_t>(
            std::ceil(static_cast<double>(count) * clamped / 100.0));
        target = std::max<uint64_t>(target, 1);

        uint64_t cumulative = 0;
        for (size_t i = 0; i < NUM_BUCKETS; ++i) {
            cumulative += buckets_[i].load(std::memory_order_acquire);
            if (cumulative >= target) {
                uint64_t value = bucket_to_value(i);
                return std::min(std::max(value, get_min()), get_max());
            }
        }

        return get_max();
    }

    double get_average() const {
        uint64_t count = count_.load(std::memory_order_acquire);
        if (count == 0) {
            return 0.0;
        }
        return static_cast<double>(sum_.load(std::memory_order_acquire)) /
               static_cast<double>(count);
    }

    uint64_t get_min() const {
        uint64_t min = min_value_.load(std::memory_order_acquire);
        return min == std::numeric_limits<uint64_t>::max() ? 0 : min;
    }

    uint64_t get_max() const { return max_value_.load(std::memory_order_acquire); }
    uint64_t get_count() const { return count_.load(std::memory_order_acquire); }

    void reset() {
        for (auto& bucket : buckets_) {
            bucket.store(0, std::memory_order_relaxed);
        }
        min_value_.store(std::numeric_limits<uint64_t>::max(), std::memory_order_relaxed);
        max_value_.store(0, std::memory_order_relaxed);
        count_.store(0, std::memory_order_relaxed);
        sum_.store(0, std::memory_order_relaxed);
    }

private:
    static size_t value_to_bucket(uint64_t value) {
        if (value <= 1) {
            return 0;
        }
        double index = std::log2(static_cast<double>(value)) * BUCKETS_PER_OCTAVE;
        return std::min(static_cast<size_t>(index), NUM_BUCKETS - 1);
    }

    static uint64_t bucket_to_value(size_t bucket) {
        return static_cast<uint64_t>(
            std::pow(2.0, static_cast<double>(bucket) / BUCKETS_PER_OCTAVE));
    }

    std::array<std::atomic<uint64_t>, NUM_BUCKETS> buckets_;  ///< Sample counts
    alignas(64) std::atomic<uint64_t> min_value_;             ///< Smallest sample
    alignas(64) std::atomic<uint64_t> max_value_;             ///< Largest sample
    alignas(64) std::atomic<uint64_t> count_;                 ///< Number of samples
    alignas(64) std::atomic<uint64_t> sum_;                   ///< Sum of samples
};

/**
 * @brief Engine-wide metrics for the book manager
 *
 * **Tracked:**
 * - Streaming update latency distribution
 * - Snapshot install latency distribution
 * - Counters: updates, snapshots, rejections, stale rates, crossed books,
 *   resyncs
 *
 * @code
 * MetricsCollector metrics;
 * metrics.record_update_latency_ns(900);
 * metrics.increment_updates();
 *
 * auto summary = metrics.get_summary();
 * spdlog::info("updates={} p99={}ns", summary.updates, summary.update_p99_ns);
 * @endcode
 *
 * @note All methods are thread-safe except reset()
 */
class MetricsCollector {
public:
    void record_update_latency_ns(uint64_t latency_ns) { update_latency_ns_.record(latency_ns); }
    void record_snapshot_latency_ns(uint64_t latency_ns) { snapshot_latency_ns_.record(latency_ns); }

    void increment_updates() { updates_.fetch_add(1, std::memory_order_relaxed); }
    void increment_snapshots() { snapshots_.fetch_add(1, std::memory_order_relaxed); }
    void increment_rejections() { rejections_.fetch_add(1, std::memory_order_relaxed); }
    void increment_stale_rates() { stale_rates_.fetch_add(1, std::memory_order_relaxed); }
    void increment_crossed() { crossed_.fetch_add(1, std::memory_order_relaxed); }
    void increment_resyncs() { resyncs_.fetch_add(1, std::memory_order_relaxed); }

    uint64_t get_updates() const { return updates_.load(std::memory_order_acquire); }
    uint64_t get_snapshots() const { return snapshots_.load(std::memory_order_acquire); }
    uint64_t get_rejections() const { return rejections_.load(std::memory_order_acquire); }
    uint64_t get_stale_rates() const { return stale_rates_.load(std::memory_order_acquire); }
    uint64_t get_crossed() const { return crossed_.load(std::memory_order_acquire); }
    uint64_t get_resyncs() const { return resyncs_.load(std::memory_order_acquire); }

    const LockFreeHistogram<>& update_latency() const { return update_latency_ns_; }
    const LockFreeHistogram<>& snapshot_latency() const { return snapshot_latency_ns_; }

    /**
     * @brief Point-in-time view for logging and dashboards
     */
    struct Summary {
        uint64_t updates{0};
        uint64_t snapshots{0};
        uint64_t rejections{0};
        uint64_t stale_rates{0};
        uint64_t crossed_events{0};
        uint64_t resyncs{0};
        uint64_t update_p50_ns{0};
        uint64_t update_p99_ns{0};
        uint64_t update_max_ns{0};
        double update_avg_ns{0.0};
        uint64_t snapshot_p50_ns{0};
        uint64_t snapshot_p99_ns{0};
    };

    Summary get_summary() const {
        Summary summary;
        summary.updates = get_updates();
        summary.snapshots = get_snapshots();
        summary.rejections = get_rejections();
        summary.stale_rates = get_stale_rates();
        summary.crossed_events = get_crossed();
        summary.resyncs = get_resyncs();
        summary.update_p50_ns = update_latency_ns_.get_percentile(50.0);
        summary.update_p99_ns = update_latency_ns_.get_percentile(99.0);
        summary.update_max_ns = update_latency_ns_.get_max();
        summary.update_avg_ns = update_latency_ns_.get_average();
        summary.snapshot_p50_ns = snapshot_latency_ns_.get_percentile(50.0);
        summary.snapshot_p99_ns = snapshot_latency_ns_.get_percentile(99.0);
        return summary;
    }

    /**
     * @brief Reset histograms and counters
     *
     * @warning Not safe while other threads record
     */
    void reset() {
        update_latency_ns_.reset();
        snapshot_latency_ns_.reset();
        updates_.store(0, std::memory_order_release);
        snapshots_.store(0, std::memory_order_release);
        rejections_.store(0, std::memory_order_release);
        stale_rates_.store(0, std::memory_order_release);
        crossed_.store(0, std::memory_order_release);
        resyncs_.store(0, std::memory_order_release);
    }

private:
    LockFreeHistogram<> update_latency_ns_;    ///< Streaming update latency
    LockFreeHistogram<> snapshot_latency_ns_;  ///< Snapshot install latency

    alignas(64) std::atomic<uint64_t> updates_{0};      ///< Updates applied
    alignas(64) std::atomic<uint64_t> snapshots_{0};    ///< Snapshots installed
    alignas(64) std::atomic<uint64_t> rejections_{0};   ///< Refused inputs
    alignas(64) std::atomic<uint64_t> stale_rates_{0};  ///< RATE_STALE results
    alignas(64) std::atomic<uint64_t> crossed_{0};      ///< Crossed book observations
    alignas(64) std::atomic<uint64_t> resyncs_{0};      ///< Venue resyncs
};

} // namespace aggbook
