#include "core/performance_tracker.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>

namespace codegate {

PerformanceTracker::PerformanceTracker(const Config& config)
    : config_(config) {
    if (config_.capacity == 0) config_.capacity = 1;
    if (!config_.history_file.empty()) load();
}

PerformanceInsights PerformanceTracker::record(const PerformanceSample& sample) {
    PerformanceInsights insights;
    {
        std::lock_guard lock(mutex_);
        history_.push_back(sample);
        while (history_.size() > config_.capacity) {
            history_.pop_front();
        }
        insights = analyze_locked();
    }

    if (!config_.history_file.empty()) {
        (void)save();
    }
    return insights;
}

std::vector<PerformanceSample> PerformanceTracker::recent(size_t limit) const {
    std::lock_guard lock(mutex_);

    if (limit == 0 || limit >= history_.size()) {
        return {history_.begin(), history_.end()};
    }

    const auto start = history_.end() - static_cast<std::ptrdiff_t>(limit);
    return {start, history_.end()};
}

size_t PerformanceTracker::size() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

PerformanceTrend PerformanceTracker::trend() const {
    std::lock_guard lock(mutex_);
    return trend_locked();
}

// ============================================================================
// Analysis
// ============================================================================

PerformanceInsights PerformanceTracker::analyze_locked() const {
    PerformanceInsights insights;
    insights.trend = trend_locked();

    if (history_.size() < kDeltaWindow) {
        insights.message = std::format("Collecting baseline ({}/{} samples)",
                                       history_.size(), kDeltaWindow);
        return insights;
    }

    const auto& current = history_.back();
    double time_sum = 0.0;
    double memory_sum = 0.0;
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(kDeltaWindow); it != history_.end(); ++it) {
        time_sum += static_cast<double>(it->elapsed.count());
        memory_sum += static_cast<double>(it->memory_bytes);
    }
    const double avg_time = time_sum / kDeltaWindow;
    const double avg_memory = memory_sum / kDeltaWindow;

    const double time_change = avg_time > 0.0
        ? (static_cast<double>(current.elapsed.count()) - avg_time) / avg_time : 0.0;
    const double memory_change = avg_memory > 0.0
        ? (static_cast<double>(current.memory_bytes) - avg_memory) / avg_memory : 0.0;

    insights.delta_analyzed = true;
    insights.time_change_percent = time_change * 100.0;
    insights.memory_change_percent = memory_change * 100.0;

    const bool time_significant = std::abs(time_change) > kTimeChangeThreshold;
    const bool memory_significant = std::abs(memory_change) > kMemoryChangeThreshold;
    insights.significant_change = time_significant || memory_significant;

    if (time_significant) {
        insights.message = std::format("Execution time {} by {:.1f}%",
                                       time_change > 0 ? "increased" : "decreased",
                                       std::abs(insights.time_change_percent));
    } else if (memory_significant) {
        insights.message = std::format("Memory usage {} by {:.1f}%",
                                       memory_change > 0 ? "increased" : "decreased",
                                       std::abs(insights.memory_change_percent));
    } else {
        insights.message = "No significant change";
    }
    return insights;
}

PerformanceTrend PerformanceTracker::trend_locked() const {
    if (history_.size() < kTrendWindow) {
        return PerformanceTrend::INSUFFICIENT_DATA;
    }

    constexpr size_t half = kTrendWindow / 2;
    const auto window = history_.end() - static_cast<std::ptrdiff_t>(kTrendWindow);
    double early = 0.0;
    double late = 0.0;
    for (size_t i = 0; i < half; ++i) {
        early += static_cast<double>(window[static_cast<std::ptrdiff_t>(i)].elapsed.count());
        late += static_cast<double>(window[static_cast<std::ptrdiff_t>(i + half)].elapsed.count());
    }
    early /= half;
    late /= half;

    if (early <= 0.0) return PerformanceTrend::STABLE;
    if (late <= early * 0.9) return PerformanceTrend::IMPROVING;
    if (late >= early * 1.1) return PerformanceTrend::DEGRADING;
    return PerformanceTrend::STABLE;
}

PerformanceTracker::Summary PerformanceTracker::summary() const {
    std::lock_guard lock(mutex_);

    Summary s;
    s.samples = history_.size();
    s.trend = trend_locked();
    if (history_.empty()) return s;

    int64_t elapsed_sum = 0;
    uint64_t memory_sum = 0;
    for (const auto& sample : history_) {
        if (sample.success) ++s.successful;
        elapsed_sum += sample.elapsed.count();
        memory_sum += sample.memory_bytes;
        ++s.by_backend[backend_to_string(sample.backend)];
    }
    s.mean_elapsed = std::chrono::microseconds(elapsed_sum / static_cast<int64_t>(s.samples));
    s.mean_memory_bytes = memory_sum / s.samples;
    return s;
}

// ============================================================================
// Persistence
// ============================================================================

nlohmann::json PerformanceTracker::to_json(const PerformanceSample& sample) {
    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        sample.timestamp.time_since_epoch()).count();
    return {
        {"elapsed_us", sample.elapsed.count()},
        {"memory_bytes", sample.memory_bytes},
        {"complexity", sample.complexity_score},
        {"backend", backend_to_string(sample.backend)},
        {"success", sample.success},
        {"language", sample.language},
        {"timestamp_ms", ts},
    };
}

PerformanceSample PerformanceTracker::sample_from_json(const nlohmann::json& j) {
    PerformanceSample sample;
    sample.elapsed = std::chrono::microseconds(j.at("elapsed_us").get<int64_t>());
    sample.memory_bytes = j.at("memory_bytes").get<uint64_t>();
    sample.complexity_score = j.value("complexity", 1);
    sample.backend = parse_backend(j.value("backend", std::string("none"))).value_or(BackendKind::NONE);
    sample.success = j.value("success", false);
    sample.language = j.value("language", std::string{});
    sample.timestamp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("timestamp_ms", int64_t{0})));
    return sample;
}

void PerformanceTracker::load() {
    std::ifstream in(config_.history_file);
    if (!in.is_open()) {
        utils::log::debug(std::format("No performance history at {}", config_.history_file));
        return;
    }

    try {
        const auto doc = nlohmann::json::parse(in);
        std::deque<PerformanceSample> loaded;
        for (const auto& item : doc.at("samples")) {
            loaded.push_back(sample_from_json(item));
        }
        while (loaded.size() > config_.capacity) loaded.pop_front();

        std::lock_guard lock(mutex_);
        history_ = std::move(loaded);
        utils::log::info(std::format("Loaded {} performance samples from {}",
                                     history_.size(), config_.history_file));
    } catch (const nlohmann::json::exception& e) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Ignoring corrupt performance history {}: {}",
                                     config_.history_file, e.what()));
    }
}

bool PerformanceTracker::save() const {
    if (config_.history_file.empty()) return false;

    // Snapshot under the file lock so writers land in history order
    std::lock_guard file_lock(file_mutex_);
    nlohmann::json doc;
    doc["version"] = 1;
    doc["samples"] = nlohmann::json::array();
    {
        std::lock_guard lock(mutex_);
        for (const auto& sample : history_) {
            doc["samples"].push_back(to_json(sample));
        }
    }

    const std::string tmp = config_.history_file + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << doc.dump();
        if (!out) {
            persistence_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Failed to write performance history {}", tmp));
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, config_.history_file, ec);
    if (ec) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Failed to replace performance history {}: {}",
                                      config_.history_file, ec.message()));
        return false;
    }
    return true;
}

} // namespace codegate
