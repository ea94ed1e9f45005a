#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class SecurityLevel {
    MAXIMUM,
    BALANCED,
    DEVELOPMENT
};

// Backend variants known to the router
enum class BackendKind {
    NONE,
    COMMAND,
    CONTAINER,
    SUBPROCESS
};

// Isolation actually applied to a run. SUBPROCESS, COMMAND and DENIED can
// never be mistaken for a sandboxed level.
enum class IsolationLevel {
    SANDBOX_MAXIMUM,
    SANDBOX_BALANCED,
    SUBPROCESS,
    COMMAND,
    DENIED
};

enum class ErrorCode {
    NONE,
    CONFIGURATION_DENIED,
    BACKEND_UNAVAILABLE,
    EXECUTION_TIMEOUT,
    EXECUTION_FAILURE,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

// ============================================================================
// Enum <-> string
// ============================================================================

[[nodiscard]] const char* severity_to_string(Severity severity);
[[nodiscard]] const char* risk_level_to_string(RiskLevel level);
[[nodiscard]] const char* security_level_to_string(SecurityLevel level);
[[nodiscard]] const char* backend_to_string(BackendKind backend);
[[nodiscard]] const char* isolation_to_string(IsolationLevel level);
[[nodiscard]] const char* error_code_to_string(ErrorCode code);

[[nodiscard]] std::optional<SecurityLevel> parse_security_level(std::string_view name);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view name);
[[nodiscard]] std::optional<BackendKind> parse_backend(std::string_view name);

[[nodiscard]] int severity_weight(Severity severity);

// Lower-cases and resolves aliases ("js" -> "javascript", "sh" -> "bash")
[[nodiscard]] std::string normalize_language(std::string_view language);

[[nodiscard]] inline bool is_sandboxed(IsolationLevel level) {
    return level == IsolationLevel::SANDBOX_MAXIMUM ||
           level == IsolationLevel::SANDBOX_BALANCED;
}

// ============================================================================
// Code Submission
// ============================================================================

struct CodeSubmission {
    std::string language;
    std::string code;
    std::optional<SecurityLevel> requested_level;
    bool quantum = false;                       // recorded in audit only
    uint32_t benchmark_iterations = 0;          // 0 = single run

    CodeSubmission() = default;
    CodeSubmission(std::string lang, std::string src,
                   std::optional<SecurityLevel> level = std::nullopt)
        : language(normalize_language(lang)),
          code(std::move(src)),
          requested_level(level) {}
};

// ============================================================================
// Risk Assessment
// ============================================================================

struct Violation {
    Severity severity = Severity::LOW;
    std::string category;
    std::string description;
    int line = 0;                   // 1-based, 0 = not tied to a line
    std::string suggestion;
    std::string rule;               // originating rule id

    bool operator==(const Violation&) const = default;
};

struct ComplianceStatus {
    std::string framework;
    bool passed = true;
    size_t violation_count = 0;
    std::vector<std::string> categories;    // categories that caused the failure

    bool operator==(const ComplianceStatus&) const = default;
};

struct RiskAssessment {
    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<Violation> violations;
    int complexity_score = 1;
    int risk_score = 0;                     // weighted severity sum
    std::vector<ComplianceStatus> compliance;
    std::vector<std::string> recommendations;
    bool structural_analysis_failed = false;

    [[nodiscard]] size_t count(Severity severity) const {
        size_t n = 0;
        for (const auto& v : violations) {
            if (v.severity == severity) ++n;
        }
        return n;
    }

    [[nodiscard]] std::vector<std::string> failed_frameworks() const {
        std::vector<std::string> out;
        for (const auto& c : compliance) {
            if (!c.passed) out.push_back(c.framework);
        }
        return out;
    }
};

// ============================================================================
// Backend Result
// ============================================================================

struct ExecutionBackendResult {
    bool success = false;
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::microseconds elapsed{0};
    uint64_t memory_used_bytes = 0;
    BackendKind backend = BackendKind::NONE;
    IsolationLevel isolation = IsolationLevel::DENIED;
    std::optional<std::string> sandbox_id;
    ErrorCode error_code = ErrorCode::NONE;
    int exit_code = -1;

    [[nodiscard]] bool timed_out() const { return error_code == ErrorCode::EXECUTION_TIMEOUT; }
    [[nodiscard]] bool unavailable() const { return error_code == ErrorCode::BACKEND_UNAVAILABLE; }

    static ExecutionBackendResult failure(BackendKind backend, IsolationLevel isolation,
                                          ErrorCode code, std::string message) {
        ExecutionBackendResult r;
        r.success = false;
        r.backend = backend;
        r.isolation = isolation;
        r.error_code = code;
        r.stderr_data = std::move(message);
        return r;
    }
};

// ============================================================================
// Performance
// ============================================================================

enum class PerformanceTrend {
    INSUFFICIENT_DATA,
    IMPROVING,
    STABLE,
    DEGRADING
};

[[nodiscard]] const char* trend_to_string(PerformanceTrend trend);

struct PerformanceInsights {
    bool delta_analyzed = false;
    bool significant_change = false;
    double time_change_percent = 0.0;
    double memory_change_percent = 0.0;
    PerformanceTrend trend = PerformanceTrend::INSUFFICIENT_DATA;
    std::string message;
};

struct BenchmarkStats {
    uint32_t iterations = 0;
    uint32_t successful = 0;
    std::chrono::microseconds mean{0};
    std::chrono::microseconds min{0};
    std::chrono::microseconds max{0};
    double stddev_us = 0.0;
};

// ============================================================================
// Composite Response
// ============================================================================

struct ExecutionResponse {
    std::string execution_id;
    uint64_t sequence_num = 0;
    ExecutionBackendResult result;
    RiskAssessment assessment;
    std::optional<PerformanceInsights> performance;
    std::optional<BenchmarkStats> benchmark;
    std::string routing_rule;

    [[nodiscard]] bool success() const { return result.success; }
};

} // namespace codegate
