#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "transport/contract.hpp"

using namespace codegate;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Request parsing
// ============================================================================

TEST_CASE("Contract: minimal request", "[contract]") {
    const auto r = contract::parse_request(R"({"language":"Python","code":"print(1)"})");
    REQUIRE(r.success);
    CHECK(r.submission.language == "python");
    CHECK(r.submission.code == "print(1)");
    CHECK_FALSE(r.submission.requested_level.has_value());
    CHECK_FALSE(r.submission.quantum);
    CHECK(r.submission.benchmark_iterations == 0);
}

TEST_CASE("Contract: optional fields", "[contract]") {
    const auto r = contract::parse_request(R"({
        "language": "js",
        "code": "console.log(1)",
        "security_level": "development",
        "enable_quantum": true,
        "benchmark_iterations": 5
    })");
    REQUIRE(r.success);
    CHECK(r.submission.language == "javascript");
    CHECK(r.submission.requested_level == SecurityLevel::DEVELOPMENT);
    CHECK(r.submission.quantum);
    CHECK(r.submission.benchmark_iterations == 5);
}

TEST_CASE("Contract: null optionals are ignored", "[contract]") {
    const auto r = contract::parse_request(
        R"({"language":"bash","code":"ls","security_level":null,"benchmark_iterations":null})");
    REQUIRE(r.success);
    CHECK_FALSE(r.submission.requested_level.has_value());
}

TEST_CASE("Contract: benchmark iterations are capped", "[contract]") {
    const auto r = contract::parse_request(R"({"language":"bash","code":"ls","benchmark_iterations":100000})");
    REQUIRE(r.success);
    CHECK(r.submission.benchmark_iterations == 100);
}

TEST_CASE("Contract: malformed requests", "[contract]") {
    SECTION("not JSON") {
        const auto r = contract::parse_request("{language:");
        CHECK_FALSE(r.success);
        CHECK(r.error_message == "Request is not valid JSON");
    }

    SECTION("not an object") {
        const auto r = contract::parse_request("[1,2]");
        CHECK(r.error_message == "Request must be a JSON object");
    }

    SECTION("missing language") {
        const auto r = contract::parse_request(R"({"code":"x"})");
        CHECK(r.error_message == "Field 'language' is required and must be a string");
    }

    SECTION("empty language") {
        const auto r = contract::parse_request(R"({"language":"","code":"x"})");
        CHECK_FALSE(r.success);
    }

    SECTION("code is not a string") {
        const auto r = contract::parse_request(R"({"language":"python","code":42})");
        CHECK(r.error_message == "Field 'code' is required and must be a string");
    }

    SECTION("unknown security level") {
        const auto r = contract::parse_request(R"({"language":"python","code":"x","security_level":"paranoid"})");
        CHECK(r.error_message ==
              "Invalid security_level 'paranoid' (expected maximum, balanced or development)");
    }

    SECTION("quantum flag is not a boolean") {
        const auto r = contract::parse_request(R"({"language":"python","code":"x","enable_quantum":"yes"})");
        CHECK(r.error_message == "Field 'enable_quantum' must be a boolean");
    }

    SECTION("negative iterations") {
        const auto r = contract::parse_request(R"({"language":"python","code":"x","benchmark_iterations":-1})");
        CHECK(r.error_message == "Field 'benchmark_iterations' must be a non-negative integer");
    }
}

// ============================================================================
// Response serialization
// ============================================================================

TEST_CASE("Contract: execution response", "[contract]") {
    ExecutionResponse resp;
    resp.execution_id = "exec-1";
    resp.sequence_num = 7;
    resp.routing_rule = "container_sandbox";
    resp.result.success = true;
    resp.result.stdout_data = "hi\n";
    resp.result.elapsed = std::chrono::microseconds(1'500'000);
    resp.result.memory_used_bytes = 4096;
    resp.result.backend = BackendKind::CONTAINER;
    resp.result.isolation = IsolationLevel::SANDBOX_MAXIMUM;
    resp.result.sandbox_id = "codegate-python-0000aaaa";
    resp.result.exit_code = 0;

    Violation v;
    v.severity = Severity::CRITICAL;
    v.category = "dangerous_function";
    v.description = "Use of dangerous function: eval";
    v.line = 2;
    v.rule = "eval-call";
    resp.assessment.violations.push_back(v);
    resp.assessment.risk_level = RiskLevel::HIGH;
    resp.assessment.risk_score = 10;
    resp.assessment.compliance.push_back({"SOC2", false, 1, {"dangerous_function"}});

    const auto j = contract::to_json(resp);
    CHECK(j["execution_id"] == "exec-1");
    CHECK(j["sequence_num"] == 7);
    CHECK(j["success"] == true);
    CHECK(j["stdout"] == "hi\n");
    CHECK_THAT(j["elapsed_time"].get<double>(), WithinAbs(1.5, 1e-9));
    CHECK(j["memory_used"] == 4096);
    CHECK(j["backend"] == "container");
    CHECK(j["security_level"] == "maximum");
    CHECK(j["sandbox_id"] == "codegate-python-0000aaaa");
    CHECK(j["error_code"] == "NONE");
    CHECK_FALSE(j.contains("performance"));
    CHECK_FALSE(j.contains("benchmark"));

    const auto& risk = j["risk_assessment"];
    CHECK(risk["risk_level"] == "high");
    CHECK(risk["risk_score"] == 10);
    REQUIRE(risk["violations"].size() == 1);
    CHECK(risk["violations"][0]["severity"] == "critical");
    CHECK(risk["violations"][0]["line"] == 2);
    CHECK(risk["compliance"]["SOC2"]["passed"] == false);
    CHECK(risk["compliance"]["SOC2"]["violations"] == 1);
}

TEST_CASE("Contract: performance and benchmark blocks", "[contract]") {
    ExecutionResponse resp;
    PerformanceInsights p;
    p.delta_analyzed = true;
    p.significant_change = true;
    p.time_change_percent = 62.5;
    p.trend = PerformanceTrend::DEGRADING;
    p.message = "Execution time increased by 62.5%";
    resp.performance = p;

    BenchmarkStats b;
    b.iterations = 3;
    b.successful = 3;
    b.mean = std::chrono::microseconds(2000);
    b.min = std::chrono::microseconds(1000);
    b.max = std::chrono::microseconds(3000);
    b.stddev_us = 816.5;
    resp.benchmark = b;

    const auto j = contract::to_json(resp);
    CHECK(j["performance"]["trend"] == "degrading");
    CHECK(j["performance"]["time_change_percent"] == 62.5);
    CHECK(j["benchmark"]["iterations"] == 3);
    CHECK_THAT(j["benchmark"]["mean_time"].get<double>(), WithinAbs(0.002, 1e-12));
    CHECK_THAT(j["benchmark"]["stddev_time"].get<double>(), WithinAbs(0.0008165, 1e-12));
}

TEST_CASE("Contract: baseline insights omit deltas", "[contract]") {
    PerformanceInsights p;
    p.message = "Collecting baseline (2/5 samples)";
    const auto j = contract::to_json(p);
    CHECK(j["delta_analyzed"] == false);
    CHECK(j["trend"] == "insufficient_data");
    CHECK_FALSE(j.contains("time_change_percent"));
}

TEST_CASE("Contract: error response", "[contract]") {
    const auto j = contract::error_response(ErrorCode::INVALID_REQUEST, "bad input");
    CHECK(j["success"] == false);
    CHECK(j["error_code"] == "INVALID_REQUEST");
    CHECK(j["stderr"] == "bad input");
    CHECK(j["backend"] == "none");
    CHECK(j["security_level"] == "denied");
}
