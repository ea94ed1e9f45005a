#include "core/types.hpp"
#include "core/utils.hpp"

namespace codegate {

const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
        case RiskLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

const char* security_level_to_string(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::MAXIMUM: return "maximum";
        case SecurityLevel::BALANCED: return "balanced";
        case SecurityLevel::DEVELOPMENT: return "development";
        default: return "unknown";
    }
}

const char* backend_to_string(BackendKind backend) {
    switch (backend) {
        case BackendKind::NONE: return "none";
        case BackendKind::COMMAND: return "command";
        case BackendKind::CONTAINER: return "container";
        case BackendKind::SUBPROCESS: return "subprocess";
        default: return "unknown";
    }
}

const char* isolation_to_string(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::SANDBOX_MAXIMUM: return "maximum";
        case IsolationLevel::SANDBOX_BALANCED: return "balanced";
        case IsolationLevel::SUBPROCESS: return "subprocess";
        case IsolationLevel::COMMAND: return "command";
        case IsolationLevel::DENIED: return "denied";
        default: return "unknown";
    }
}

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::CONFIGURATION_DENIED: return "CONFIGURATION_DENIED";
        case ErrorCode::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorCode::EXECUTION_TIMEOUT: return "EXECUTION_TIMEOUT";
        case ErrorCode::EXECUTION_FAILURE: return "EXECUTION_FAILURE";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

const char* trend_to_string(PerformanceTrend trend) {
    switch (trend) {
        case PerformanceTrend::INSUFFICIENT_DATA: return "insufficient_data";
        case PerformanceTrend::IMPROVING: return "improving";
        case PerformanceTrend::STABLE: return "stable";
        case PerformanceTrend::DEGRADING: return "degrading";
        default: return "unknown";
    }
}

std::optional<SecurityLevel> parse_security_level(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "maximum") return SecurityLevel::MAXIMUM;
    if (lower == "balanced") return SecurityLevel::BALANCED;
    if (lower == "development") return SecurityLevel::DEVELOPMENT;
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "low") return Severity::LOW;
    if (lower == "medium") return Severity::MEDIUM;
    if (lower == "high") return Severity::HIGH;
    if (lower == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

std::optional<BackendKind> parse_backend(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "none") return BackendKind::NONE;
    if (lower == "command") return BackendKind::COMMAND;
    if (lower == "container") return BackendKind::CONTAINER;
    if (lower == "subprocess") return BackendKind::SUBPROCESS;
    return std::nullopt;
}

int severity_weight(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return 10;
        case Severity::HIGH: return 5;
        case Severity::MEDIUM: return 2;
        case Severity::LOW: return 1;
        default: return 0;
    }
}

std::string normalize_language(std::string_view language) {
    std::string lower = utils::to_lower(utils::trim(language));
    if (lower == "js" || lower == "node") return "javascript";
    if (lower == "sh" || lower == "shell") return "bash";
    if (lower == "py" || lower == "python3") return "python";
    return lower;
}

} // namespace codegate
