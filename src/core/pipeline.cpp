#include "core/pipeline.hpp"
#include "alerting/notifier.hpp"
#include "analyzer/security_analyzer.hpp"
#include "audit/audit_recorder.hpp"
#include "core/digest.hpp"
#include "core/performance_tracker.hpp"
#include "core/utils.hpp"
#include "executor/command_interpreter.hpp"
#include "executor/container_sandbox_backend.hpp"
#include "executor/execution_backend.hpp"
#include "policy/execution_policy.hpp"
#include "transport/contract.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace codegate {

ExecutionPipeline::ExecutionPipeline(PipelineComponents components)
    : c_(std::move(components)) {}

BackendAvailability ExecutionPipeline::availability() const {
    BackendAvailability a;
    a.container = c_.container && c_.container->is_available();
    a.subprocess = c_.subprocess && c_.subprocess->is_available();
    return a;
}

RiskAssessment ExecutionPipeline::scan(const CodeSubmission& submission) const {
    return c_.analyzer->analyze(submission.code, submission.language);
}

ExecutionResponse ExecutionPipeline::execute(const CodeSubmission& submission) {
    const auto received_at = utils::now();
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    ExecutionResponse response;
    response.sequence_num = c_.audit->reserve_sequence();
    response.execution_id = utils::generate_uuid();

    // Layer 1: Analyze (directives never reach the analyzer)
    const bool directive = ExecutionRouter::is_directive(submission);
    if (!directive) {
        response.assessment = scan(submission);
    }

    // Layer 2: Route
    const auto decision = ExecutionRouter::route(submission, response.assessment,
                                                 *c_.policy, availability());
    response.routing_rule = std::string(decision.rule);

    // Layer 3: Execute
    if (decision.denied()) {
        requests_denied_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Execution {} denied: {}", response.execution_id,
                                     decision.denial_reason));
        response.result = ExecutionBackendResult::failure(
            BackendKind::NONE, IsolationLevel::DENIED, decision.denial_code, decision.denial_reason);
    } else if (decision.backend == BackendKind::COMMAND) {
        response.result = run_directive(submission);
    } else {
        if (decision.alert) send_alert(response, decision);

        // Sandbox level wanted, but routing found the runtime down
        if (decision.rule == "subprocess_fallback" && c_.container &&
            (decision.effective_level == SecurityLevel::MAXIMUM ||
             decision.effective_level == SecurityLevel::BALANCED)) {
            note_fallback("runtime probe failed");
        }

        response.result = run_backend(submission, decision);

        if (submission.benchmark_iterations > 1) {
            response.benchmark = benchmark(submission, decision, response.result);
        }
    }

    // Layer 4: Instrumentation (never fails the request)
    if (response.result.backend == BackendKind::CONTAINER ||
        response.result.backend == BackendKind::SUBPROCESS) {
        record_performance(submission, response);
    }
    record_audit(submission, response, decision, received_at);

    return response;
}

// ============================================================================
// Execution
// ============================================================================

ExecutionBackendResult ExecutionPipeline::run_backend(const CodeSubmission& submission,
                                                      const RouteDecision& decision) {
    if (decision.backend == BackendKind::CONTAINER && c_.container) {
        auto result = c_.container->execute(submission, decision.effective_level);
        if (!result.unavailable()) return result;

        // Fallback is visible in the result: isolation becomes "subprocess"
        note_fallback(utils::trim(result.stderr_data));
        if (!c_.subprocess) return result;
    }

    if (!c_.subprocess) {
        return ExecutionBackendResult::failure(BackendKind::NONE, IsolationLevel::DENIED,
            ErrorCode::BACKEND_UNAVAILABLE, "No execution backend is available");
    }
    return c_.subprocess->execute(submission, decision.effective_level);
}

void ExecutionPipeline::note_fallback(std::string_view reason) {
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Container backend unavailable ({}); falling back to subprocess",
                                 reason));
    if (c_.notifier) {
        c_.notifier->notify(Notification(NotificationKind::BACKEND_EVENT, "warning",
            "Sandbox unavailable",
            std::format("{} is unavailable; running with subprocess isolation",
                        c_.container->name())));
    }
}

ExecutionBackendResult ExecutionPipeline::run_directive(const CodeSubmission& submission) {
    CommandInterpreter::Context ctx;
    ctx.policy = c_.policy.get();
    ctx.container = c_.container_admin.get();
    ctx.performance = c_.performance.get();
    ctx.audit = c_.audit.get();
    return CommandInterpreter(ctx).execute(submission);
}

BenchmarkStats ExecutionPipeline::benchmark(const CodeSubmission& submission,
                                            const RouteDecision& decision,
                                            const ExecutionBackendResult& first) {
    const uint32_t iterations = std::min(submission.benchmark_iterations, kMaxBenchmarkIterations);

    // Repeat on the backend that actually ran the first iteration
    IExecutionBackend* backend = first.backend == BackendKind::CONTAINER
        ? c_.container.get() : c_.subprocess.get();

    std::vector<std::chrono::microseconds> samples{first.elapsed};
    BenchmarkStats stats;
    stats.successful = first.success ? 1 : 0;

    for (uint32_t i = 1; i < iterations && backend != nullptr; ++i) {
        const auto run = backend->execute(submission, decision.effective_level);
        if (run.unavailable()) break;
        samples.push_back(run.elapsed);
        if (run.success) ++stats.successful;
    }

    stats.iterations = static_cast<uint32_t>(samples.size());
    const auto [min_it, max_it] = std::minmax_element(samples.begin(), samples.end());
    stats.min = *min_it;
    stats.max = *max_it;

    double sum = 0.0;
    for (const auto& s : samples) sum += static_cast<double>(s.count());
    const double mean = sum / static_cast<double>(samples.size());
    stats.mean = std::chrono::microseconds(static_cast<int64_t>(mean));

    double sq = 0.0;
    for (const auto& s : samples) {
        const double d = static_cast<double>(s.count()) - mean;
        sq += d * d;
    }
    stats.stddev_us = std::sqrt(sq / static_cast<double>(samples.size()));
    return stats;
}

// ============================================================================
// Alerts / Instrumentation
// ============================================================================

void ExecutionPipeline::send_alert(const ExecutionResponse& response, const RouteDecision& decision) {
    alerts_.fetch_add(1, std::memory_order_relaxed);
    const auto& a = response.assessment;
    utils::log::warn(std::format("Execution {} flagged {} risk ({} violations), running on {}",
                                 response.execution_id, risk_level_to_string(a.risk_level),
                                 a.violations.size(), backend_to_string(decision.backend)));
    if (!c_.notifier) return;

    Notification n(NotificationKind::SECURITY_ALERT,
                   a.risk_level == RiskLevel::CRITICAL ? "critical" : "warning",
                   std::format("{} risk code submitted", risk_level_to_string(a.risk_level)),
                   std::format("{} violation(s); isolation {}", a.violations.size(),
                               isolation_to_string(decision.isolation)));
    n.execution_id = response.execution_id;
    c_.notifier->notify(std::move(n));
}

void ExecutionPipeline::record_performance(const CodeSubmission& submission,
                                           ExecutionResponse& response) {
    if (!c_.performance) return;

    try {
        PerformanceSample sample;
        sample.elapsed = response.result.elapsed;
        sample.memory_bytes = response.result.memory_used_bytes;
        sample.complexity_score = response.assessment.complexity_score;
        sample.backend = response.result.backend;
        sample.success = response.result.success;
        sample.language = submission.language;

        response.performance = c_.performance->record(sample);

        if (response.performance->significant_change && c_.notifier) {
            Notification n(NotificationKind::PERFORMANCE_INSIGHT, "info",
                           "Performance insight", response.performance->message);
            n.execution_id = response.execution_id;
            c_.notifier->notify(std::move(n));
        }
    } catch (const std::exception& e) {
        instrumentation_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Performance recording failed: {}", e.what()));
    }
}

void ExecutionPipeline::record_audit(const CodeSubmission& submission,
                                     const ExecutionResponse& response,
                                     const RouteDecision& decision,
                                     std::chrono::system_clock::time_point received_at) {
    AuditEntry entry;
    try {
        entry.execution_id = response.execution_id;
        entry.sequence_num = response.sequence_num;
        entry.received_at = received_at;
        entry.completed_at = utils::now();

        entry.language = submission.language;
        entry.code_sha256 = digest::sha256_hex(submission.code);
        entry.code_length = submission.code.size();
        entry.requested_level = decision.effective_level;
        entry.quantum = submission.quantum;

        const auto& a = response.assessment;
        entry.risk_level = a.risk_level;
        entry.risk_score = a.risk_score;
        entry.complexity_score = a.complexity_score;
        entry.violation_count = a.violations.size();
        entry.failed_frameworks = a.failed_frameworks();
        entry.alerted = decision.alert;

        const auto& r = response.result;
        entry.routing_rule = response.routing_rule;
        entry.backend = r.backend;
        entry.isolation = r.isolation;
        entry.sandbox_id = r.sandbox_id;
        entry.success = r.success;
        entry.error_code = r.error_code;
        entry.exit_code = r.exit_code;
        entry.elapsed = r.elapsed;
        entry.memory_used_bytes = r.memory_used_bytes;

        if (c_.policy->enterprise_mode()) {
            entry.source = submission.code;
            nlohmann::json detail = contract::to_json(response);
            detail.erase("stdout");
            detail["stdout_bytes"] = r.stdout_data.size();
            entry.detail = std::move(detail);
        }
    } catch (const std::exception& e) {
        instrumentation_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Audit entry construction failed: {}", e.what()));
    }

    c_.audit->record(std::move(entry));
}

} // namespace codegate
