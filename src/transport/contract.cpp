#include "transport/contract.hpp"

#include <algorithm>
#include <format>

namespace codegate::contract {

namespace {

constexpr uint32_t kMaxBenchmarkIterations = 100;

double to_seconds(std::chrono::microseconds us) {
    return static_cast<double>(us.count()) / 1e6;
}

} // anonymous namespace

// ============================================================================
// Request
// ============================================================================

RequestParseResult parse_request(const nlohmann::json& j) {
    if (!j.is_object()) {
        return RequestParseResult::error("Request must be a JSON object");
    }

    const auto lang = j.find("language");
    if (lang == j.end() || !lang->is_string() || lang->get<std::string>().empty()) {
        return RequestParseResult::error("Field 'language' is required and must be a string");
    }
    const auto code = j.find("code");
    if (code == j.end() || !code->is_string()) {
        return RequestParseResult::error("Field 'code' is required and must be a string");
    }

    std::optional<SecurityLevel> level;
    if (const auto it = j.find("security_level"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return RequestParseResult::error("Field 'security_level' must be a string");
        }
        level = parse_security_level(it->get<std::string>());
        if (!level) {
            return RequestParseResult::error(std::format(
                "Invalid security_level '{}' (expected maximum, balanced or development)",
                it->get<std::string>()));
        }
    }

    CodeSubmission submission(lang->get<std::string>(), code->get<std::string>(), level);

    if (const auto it = j.find("enable_quantum"); it != j.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            return RequestParseResult::error("Field 'enable_quantum' must be a boolean");
        }
        submission.quantum = it->get<bool>();
    }

    if (const auto it = j.find("benchmark_iterations"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<int64_t>() < 0) {
            return RequestParseResult::error("Field 'benchmark_iterations' must be a non-negative integer");
        }
        const auto n = it->get<int64_t>();
        submission.benchmark_iterations = static_cast<uint32_t>(
            std::min<int64_t>(n, kMaxBenchmarkIterations));
    }

    return RequestParseResult::ok(std::move(submission));
}

RequestParseResult parse_request(std::string_view text) {
    const auto j = nlohmann::json::parse(std::string(text), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return RequestParseResult::error("Request is not valid JSON");
    }
    return parse_request(j);
}

// ============================================================================
// Response
// ============================================================================

nlohmann::json to_json(const Violation& v) {
    return {
        {"severity", severity_to_string(v.severity)},
        {"category", v.category},
        {"description", v.description},
        {"line", v.line},
        {"suggestion", v.suggestion},
        {"rule", v.rule},
    };
}

nlohmann::json to_json(const RiskAssessment& a) {
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& v : a.violations) violations.push_back(to_json(v));

    nlohmann::json compliance = nlohmann::json::object();
    for (const auto& c : a.compliance) {
        compliance[c.framework] = {
            {"passed", c.passed},
            {"violations", c.violation_count},
            {"categories", c.categories},
        };
    }

    return {
        {"risk_level", risk_level_to_string(a.risk_level)},
        {"risk_score", a.risk_score},
        {"complexity_score", a.complexity_score},
        {"violations", std::move(violations)},
        {"compliance", std::move(compliance)},
        {"recommendations", a.recommendations},
        {"structural_analysis_failed", a.structural_analysis_failed},
    };
}

nlohmann::json to_json(const PerformanceInsights& p) {
    nlohmann::json j = {
        {"delta_analyzed", p.delta_analyzed},
        {"significant_change", p.significant_change},
        {"trend", trend_to_string(p.trend)},
        {"message", p.message},
    };
    if (p.delta_analyzed) {
        j["time_change_percent"] = p.time_change_percent;
        j["memory_change_percent"] = p.memory_change_percent;
    }
    return j;
}

nlohmann::json to_json(const BenchmarkStats& b) {
    return {
        {"iterations", b.iterations},
        {"successful", b.successful},
        {"mean_time", to_seconds(b.mean)},
        {"min_time", to_seconds(b.min)},
        {"max_time", to_seconds(b.max)},
        {"stddev_time", b.stddev_us / 1e6},
    };
}

nlohmann::json to_json(const ExecutionResponse& r) {
    nlohmann::json j = {
        {"execution_id", r.execution_id},
        {"sequence_num", r.sequence_num},
        {"success", r.result.success},
        {"stdout", r.result.stdout_data},
        {"stderr", r.result.stderr_data},
        {"elapsed_time", to_seconds(r.result.elapsed)},
        {"memory_used", r.result.memory_used_bytes},
        {"backend", backend_to_string(r.result.backend)},
        {"security_level", isolation_to_string(r.result.isolation)},
        {"error_code", error_code_to_string(r.result.error_code)},
        {"exit_code", r.result.exit_code},
        {"routing_rule", r.routing_rule},
        {"risk_assessment", to_json(r.assessment)},
    };
    if (r.result.sandbox_id) j["sandbox_id"] = *r.result.sandbox_id;
    if (r.performance) j["performance"] = to_json(*r.performance);
    if (r.benchmark) j["benchmark"] = to_json(*r.benchmark);
    return j;
}

nlohmann::json error_response(ErrorCode code, std::string_view message) {
    return {
        {"success", false},
        {"error_code", error_code_to_string(code)},
        {"stderr", std::string(message)},
        {"backend", backend_to_string(BackendKind::NONE)},
        {"security_level", isolation_to_string(IsolationLevel::DENIED)},
    };
}

} // namespace codegate::contract
