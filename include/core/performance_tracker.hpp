#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace codegate {

struct PerformanceSample {
    std::chrono::microseconds elapsed{0};
    uint64_t memory_bytes = 0;
    int complexity_score = 1;
    BackendKind backend = BackendKind::NONE;
    bool success = false;
    std::string language;
    std::chrono::system_clock::time_point timestamp;

    PerformanceSample() : timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief Bounded rolling history of execution samples with trend analysis
 *
 * record() appends (evicting the oldest past capacity) and returns
 * insights for the new sample:
 *   - deltas vs the mean of the last 5 samples, new sample included
 *   - significant change: |time delta| > 50% or |memory delta| > 30%
 *   - trend: earlier vs later half of the last 10 samples
 *
 * With a history file configured, the history is loaded at construction and
 * rewritten after every sample. A corrupt file is logged and ignored.
 */
class PerformanceTracker {
public:
    struct Config {
        size_t capacity = 1000;
        std::string history_file;       // empty = in-memory only
    };

    static constexpr size_t kDeltaWindow = 5;
    static constexpr size_t kTrendWindow = 10;
    static constexpr double kTimeChangeThreshold = 0.5;
    static constexpr double kMemoryChangeThreshold = 0.3;

    PerformanceTracker() : PerformanceTracker(Config{}) {}
    explicit PerformanceTracker(const Config& config);

    PerformanceInsights record(const PerformanceSample& sample);

    /// Most recent samples, oldest first (limit 0 = all)
    [[nodiscard]] std::vector<PerformanceSample> recent(size_t limit = 0) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return config_.capacity; }

    [[nodiscard]] PerformanceTrend trend() const;

    struct Summary {
        size_t samples = 0;
        size_t successful = 0;
        std::chrono::microseconds mean_elapsed{0};
        uint64_t mean_memory_bytes = 0;
        PerformanceTrend trend = PerformanceTrend::INSUFFICIENT_DATA;
        std::map<std::string, size_t> by_backend;
    };

    [[nodiscard]] Summary summary() const;

    /// Rewrite the history file; false (and counted) on failure
    bool save() const;

    [[nodiscard]] uint64_t persistence_failures() const {
        return persistence_failures_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static nlohmann::json to_json(const PerformanceSample& sample);
    [[nodiscard]] static PerformanceSample sample_from_json(const nlohmann::json& j);

private:
    void load();
    [[nodiscard]] PerformanceInsights analyze_locked() const;
    [[nodiscard]] PerformanceTrend trend_locked() const;

    Config config_;
    mutable std::mutex mutex_;
    std::deque<PerformanceSample> history_;

    mutable std::mutex file_mutex_;
    mutable std::atomic<uint64_t> persistence_failures_{0};
};

} // namespace codegate
