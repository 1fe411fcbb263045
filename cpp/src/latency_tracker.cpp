#include "latency_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace perp {

LatencyTracker::LatencyTracker(size_t window_size)
    : window_size_(window_size == 0 ? 1 : window_size)
    , session_start_(now())
    , totals_{}
    , spike_count_(0) {}

// =============================================================================
// RECORDING
// =============================================================================

void LatencyTracker::add_latency(LatencyType type, double latency_us) {
    const size_t index = static_cast<size_t>(type);
    std::lock_guard<std::mutex> lock(mutex_);

    auto& window = windows_[index];
    window.push_back(latency_us);
    while (window.size() > window_size_) {
        window.pop_front();
    }
    ++totals_[index];

    if (latency_us >= get_threshold(type, SpikeSeverity::WARNING)) {
        ++spike_count_;
    }
}

void LatencyTracker::add_latency(LatencyType type, const duration_us_t& duration) {
    add_latency(type, to_microseconds(duration));
}

// =============================================================================
// STATISTICS
// =============================================================================

LatencyStatistics LatencyTracker::get_statistics(LatencyType type) const {
    std::vector<double> data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& window = windows_[static_cast<size_t>(type)];
        data.assign(window.begin(), window.end());
    }
    if (data.empty()) {
        return LatencyStatistics{};
    }
    return calculate_statistics(std::move(data));
}

LatencyStatistics LatencyTracker::calculate_statistics(std::vector<double> data) {
    LatencyStatistics stats;
    std::sort(data.begin(), data.end());

    stats.count = data.size();
    stats.min_us = data.front();
    stats.max_us = data.back();
    stats.mean_us = std::accumulate(data.begin(), data.end(), 0.0) / data.size();
    stats.median_us = percentile(data, 50.0);
    stats.p95_us = percentile(data, 95.0);
    stats.p99_us = percentile(data, 99.0);

    double variance = 0.0;
    for (double value : data) {
        variance += (value - stats.mean_us) * (value - stats.mean_us);
    }
    stats.std_dev_us = std::sqrt(variance / data.size());
    return stats;
}

// Linear interpolation between closest ranks
double LatencyTracker::percentile(const std::vector<double>& sorted, double pct) {
    if (sorted.size() == 1) {
        return sorted.front();
    }
    double index = (pct / 100.0) * (sorted.size() - 1);
    size_t lower = static_cast<size_t>(index);
    if (lower >= sorted.size() - 1) {
        return sorted.back();
    }
    double fraction = index - lower;
    return sorted[lower] + fraction * (sorted[lower + 1] - sorted[lower]);
}

size_t LatencyTracker::get_measurement_count(LatencyType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_[static_cast<size_t>(type)].size();
}

size_t LatencyTracker::get_total_measurements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::accumulate(totals_.begin(), totals_.end(), static_cast<size_t>(0));
}

size_t LatencyTracker::get_spike_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spike_count_;
}

double LatencyTracker::get_uptime_seconds() const {
    return to_microseconds(time_diff_us(session_start_, now())) / 1000000.0;
}

void LatencyTracker::reset_statistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& window : windows_) {
        window.clear();
    }
    totals_.fill(0);
    spike_count_ = 0;
    session_start_ = now();
}

// =============================================================================
// THRESHOLDS AND REPORTING
// =============================================================================

std::string LatencyTracker::latency_type_to_string(LatencyType type) {
    switch (type) {
        case LatencyType::ORDER_SUBMISSION:   return "Order Submission";
        case LatencyType::ORDER_CANCELLATION: return "Order Cancellation";
        case LatencyType::ORDERBOOK_SNAPSHOT: return "Orderbook Snapshot";
        case LatencyType::TRADE_PERSISTENCE:  return "Trade Persistence";
        default: return "Unknown";
    }
}

double LatencyTracker::get_threshold(LatencyType type, SpikeSeverity severity) {
    const bool critical = (severity == SpikeSeverity::CRITICAL);
    switch (type) {
        case LatencyType::ORDER_SUBMISSION:
            return critical ? SUBMISSION_CRITICAL_US : SUBMISSION_WARNING_US;
        case LatencyType::ORDER_CANCELLATION:
            return critical ? CANCELLATION_CRITICAL_US : CANCELLATION_WARNING_US;
        case LatencyType::ORDERBOOK_SNAPSHOT:
            return critical ? SNAPSHOT_CRITICAL_US : SNAPSHOT_WARNING_US;
        case LatencyType::TRADE_PERSISTENCE:
            return critical ? PERSISTENCE_CRITICAL_US : PERSISTENCE_WARNING_US;
        default:
            return critical ? SUBMISSION_CRITICAL_US : SUBMISSION_WARNING_US;
    }
}

std::string LatencyTracker::assess_performance(const LatencyStatistics& stats, LatencyType type) {
    if (stats.p95_us < get_threshold(type, SpikeSeverity::WARNING) * 0.5) {
        return "Excellent";
    } else if (stats.p95_us < get_threshold(type, SpikeSeverity::WARNING)) {
        return "Good";
    } else if (stats.p95_us < get_threshold(type, SpikeSeverity::CRITICAL)) {
        return "Acceptable";
    }
    return "Poor";
}

void LatencyTracker::print_latency_report() const {
    std::cout << "\n=== LATENCY SUMMARY REPORT ===" << std::endl;
    std::cout << std::fixed << std::setprecision(2);

    std::cout << std::setw(22) << "Metric"
              << std::setw(10) << "Count"
              << std::setw(12) << "Mean"
              << std::setw(12) << "P95"
              << std::setw(12) << "P99"
              << std::setw(12) << "Grade" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    for (size_t i = 0; i < static_cast<size_t>(LatencyType::COUNT); ++i) {
        LatencyType type = static_cast<LatencyType>(i);
        LatencyStatistics stats = get_statistics(type);
        if (stats.count == 0) {
            continue;
        }
        std::cout << std::setw(22) << latency_type_to_string(type)
                  << std::setw(10) << stats.count
                  << std::setw(12) << stats.mean_us
                  << std::setw(12) << stats.p95_us
                  << std::setw(12) << stats.p99_us
                  << std::setw(12) << assess_performance(stats, type) << std::endl;
    }

    std::cout << std::string(80, '=') << std::endl;
    std::cout << "Session uptime: " << get_uptime_seconds() << " s" << std::endl;
    std::cout << "Total measurements: " << get_total_measurements() << std::endl;
    std::cout << "Latency spikes: " << get_spike_count() << std::endl;
    std::cout << std::defaultfloat << std::endl;
}

} // namespace perp
