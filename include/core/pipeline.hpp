#pragma once

#include "core/pipeline_builder.hpp"
#include "core/types.hpp"
#include "executor/execution_router.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace codegate {

/**
 * @brief Orchestrates one submission end to end
 *
 * Flow:
 * 1. Reserve audit sequence number
 * 2. Analyze (skipped for control directives)
 * 3. Route (policy, risk, backend availability)
 * 4. Alert on high/critical risk (non-blocking)
 * 5. Execute; container unavailable -> notify + subprocess fallback
 * 6. Benchmark repeats, if requested
 * 7. Performance sample + insights
 * 8. Audit
 *
 * Steps 7-8 never fail the request. execute() is safe to call concurrently.
 */
class ExecutionPipeline {
public:
    static constexpr uint32_t kMaxBenchmarkIterations = 100;

    explicit ExecutionPipeline(PipelineComponents components);

    [[nodiscard]] ExecutionResponse execute(const CodeSubmission& submission);

    /// Analysis only; nothing runs, nothing is recorded
    [[nodiscard]] RiskAssessment scan(const CodeSubmission& submission) const;

    [[nodiscard]] BackendAvailability availability() const;

    [[nodiscard]] const PipelineComponents& components() const { return c_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_denied;
        uint64_t fallbacks;
        uint64_t alerts;
        uint64_t instrumentation_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_denied = requests_denied_.load(std::memory_order_relaxed),
            .fallbacks = fallbacks_.load(std::memory_order_relaxed),
            .alerts = alerts_.load(std::memory_order_relaxed),
            .instrumentation_failures = instrumentation_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] ExecutionBackendResult run_backend(const CodeSubmission& submission,
                                                     const RouteDecision& decision);
    [[nodiscard]] ExecutionBackendResult run_directive(const CodeSubmission& submission);
    [[nodiscard]] BenchmarkStats benchmark(const CodeSubmission& submission,
                                           const RouteDecision& decision,
                                           const ExecutionBackendResult& first);

    void send_alert(const ExecutionResponse& response, const RouteDecision& decision);
    void note_fallback(std::string_view reason);
    void record_performance(const CodeSubmission& submission, ExecutionResponse& response);
    void record_audit(const CodeSubmission& submission, const ExecutionResponse& response,
                      const RouteDecision& decision,
                      std::chrono::system_clock::time_point received_at);

    PipelineComponents c_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_denied_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> alerts_{0};
    std::atomic<uint64_t> instrumentation_failures_{0};
};

} // namespace codegate
