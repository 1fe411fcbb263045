#pragma once

#include "types.hpp"
#include <array>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace perp {

/**
 * Operations whose latency is tracked
 */
enum class LatencyType : uint8_t {
    ORDER_SUBMISSION = 0,     // Validation + matching + event fan-out
    ORDER_CANCELLATION = 1,   // Cancel including book cleanup
    ORDERBOOK_SNAPSHOT = 2,   // Depth aggregation
    TRADE_PERSISTENCE = 3,    // One trade through the persistence bridge
    COUNT = 4
};

enum class SpikeSeverity : uint8_t {
    WARNING = 1,
    CRITICAL = 2
};

struct LatencyStatistics {
    uint64_t count;
    double mean_us;
    double median_us;
    double p95_us;
    double p99_us;
    double min_us;
    double max_us;
    double std_dev_us;

    LatencyStatistics() : count(0), mean_us(0.0), median_us(0.0),
                          p95_us(0.0), p99_us(0.0), min_us(0.0),
                          max_us(0.0), std_dev_us(0.0) {}
};

/**
 * Rolling-window latency statistics per operation type.
 * Thread-safe: the engine records from caller threads while the
 * persistence workers record from their own.
 */
class LatencyTracker {
public:
    static constexpr size_t DEFAULT_WINDOW_SIZE = 1024;

    static constexpr double SUBMISSION_WARNING_US = 100.0;
    static constexpr double SUBMISSION_CRITICAL_US = 1000.0;
    static constexpr double CANCELLATION_WARNING_US = 50.0;
    static constexpr double CANCELLATION_CRITICAL_US = 500.0;
    static constexpr double SNAPSHOT_WARNING_US = 200.0;
    static constexpr double SNAPSHOT_CRITICAL_US = 2000.0;
    static constexpr double PERSISTENCE_WARNING_US = 5000.0;
    static constexpr double PERSISTENCE_CRITICAL_US = 50000.0;

    explicit LatencyTracker(size_t window_size = DEFAULT_WINDOW_SIZE);
    ~LatencyTracker() = default;

    LatencyTracker(const LatencyTracker&) = delete;
    LatencyTracker& operator=(const LatencyTracker&) = delete;
    LatencyTracker(LatencyTracker&&) = delete;
    LatencyTracker& operator=(LatencyTracker&&) = delete;

    void add_latency(LatencyType type, double latency_us);
    void add_latency(LatencyType type, const duration_us_t& duration);

    LatencyStatistics get_statistics(LatencyType type) const;

    size_t get_measurement_count(LatencyType type) const;
    size_t get_total_measurements() const;
    size_t get_spike_count() const;
    double get_uptime_seconds() const;

    void print_latency_report() const;

    void reset_statistics();

    static std::string latency_type_to_string(LatencyType type);
    static double get_threshold(LatencyType type, SpikeSeverity severity);
    static std::string assess_performance(const LatencyStatistics& stats, LatencyType type);

private:
    static LatencyStatistics calculate_statistics(std::vector<double> data);
    static double percentile(const std::vector<double>& sorted, double pct);

    size_t window_size_;
    timestamp_t session_start_;

    mutable std::mutex mutex_;
    std::array<std::deque<double>, static_cast<size_t>(LatencyType::COUNT)> windows_;
    std::array<uint64_t, static_cast<size_t>(LatencyType::COUNT)> totals_;
    size_t spike_count_;
};

/**
 * RAII measurement: records elapsed time on scope exit
 */
class ScopedLatencyMeasurement {
public:
    explicit ScopedLatencyMeasurement(LatencyTracker& tracker, LatencyType type)
        : tracker_(tracker), type_(type), start_time_(now()) {}

    ~ScopedLatencyMeasurement() {
        tracker_.add_latency(type_, time_diff_us(start_time_, now()));
    }

    ScopedLatencyMeasurement(const ScopedLatencyMeasurement&) = delete;
    ScopedLatencyMeasurement& operator=(const ScopedLatencyMeasurement&) = delete;

private:
    LatencyTracker& tracker_;
    LatencyType type_;
    timestamp_t start_time_;
};

#define PERP_MEASURE_LATENCY(tracker, type) \
    ::perp::ScopedLatencyMeasurement _latency_measurement(tracker, type)

} // namespace perp
