#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace codegate::contract {

// Request:  {language, code, security_level?, enable_quantum?, benchmark_iterations?}
// Response: {execution_id, success, stdout, stderr, elapsed_time, memory_used, backend,
//            security_level, sandbox_id?, error_code, risk_assessment, performance?,
//            benchmark?}
//
// JSON only; framing belongs to the transport.

struct RequestParseResult {
    bool success = false;
    std::string error_message;
    CodeSubmission submission;

    static RequestParseResult ok(CodeSubmission s) {
        RequestParseResult r;
        r.success = true;
        r.submission = std::move(s);
        return r;
    }

    static RequestParseResult error(std::string msg) {
        RequestParseResult r;
        r.error_message = std::move(msg);
        return r;
    }
};

[[nodiscard]] RequestParseResult parse_request(const nlohmann::json& j);
[[nodiscard]] RequestParseResult parse_request(std::string_view text);

[[nodiscard]] nlohmann::json to_json(const Violation& v);
[[nodiscard]] nlohmann::json to_json(const RiskAssessment& a);
[[nodiscard]] nlohmann::json to_json(const PerformanceInsights& p);
[[nodiscard]] nlohmann::json to_json(const BenchmarkStats& b);
[[nodiscard]] nlohmann::json to_json(const ExecutionResponse& r);

/// Error response for requests that never reached the pipeline
[[nodiscard]] nlohmann::json error_response(ErrorCode code, std::string_view message);

} // namespace codegate::contract
