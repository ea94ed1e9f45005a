#include <catch2/catch_test_macros.hpp>
#include "analyzer/security_analyzer.hpp"

#include <algorithm>
#include <string>

using namespace codegate;

namespace {

bool has_rule(const RiskAssessment& a, std::string_view rule) {
    return std::any_of(a.violations.begin(), a.violations.end(),
                       [&](const Violation& v) { return v.rule == rule; });
}

const ComplianceStatus& framework(const RiskAssessment& a, std::string_view name) {
    for (const auto& c : a.compliance) {
        if (c.framework == name) return c;
    }
    FAIL("missing framework " << name);
    return a.compliance.front();
}

} // anonymous namespace

// ============================================================================
// Risk levels
// ============================================================================

TEST_CASE("SecurityAnalyzer: benign code is low risk", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("print('hello')\n", "python");

    CHECK(a.risk_level == RiskLevel::LOW);
    CHECK(a.risk_score == 0);
    CHECK(a.violations.empty());
    CHECK(a.recommendations.empty());
    CHECK_FALSE(a.structural_analysis_failed);
    CHECK(a.complexity_score == 1);

    REQUIRE(a.compliance.size() == 3);
    for (const auto& c : a.compliance) {
        CHECK(c.passed);
        CHECK(c.violation_count == 0);
    }
}

TEST_CASE("SecurityAnalyzer: system call plus eval is critical", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("os.system('ls')\neval('1')\n", "python");

    // os-system (10) + eval-call (10) + dangerous eval (10)
    CHECK(a.risk_score == 30);
    CHECK(a.risk_level == RiskLevel::CRITICAL);
    CHECK(has_rule(a, "os-system"));
    CHECK(has_rule(a, "eval-call"));
    CHECK(has_rule(a, "dangerous_functions"));
    CHECK(a.count(Severity::CRITICAL) == 3);

    CHECK_FALSE(framework(a, "OWASP").passed);
    CHECK_FALSE(framework(a, "SOC2").passed);
    CHECK_FALSE(framework(a, "ISO27001").passed);
}

TEST_CASE("SecurityAnalyzer: violations carry source lines", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("x = 1\n\ndata = input()\n", "python");

    REQUIRE(a.violations.size() == 1);
    const auto& v = a.violations[0];
    CHECK(v.rule == "input-call");
    CHECK(v.category == "input");
    CHECK(v.severity == Severity::LOW);
    CHECK(v.line == 3);
    CHECK(a.risk_level == RiskLevel::LOW);
}

TEST_CASE("SecurityAnalyzer: sensitive import found by both passes", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("import os\n", "python");

    REQUIRE(a.violations.size() == 2);
    CHECK(has_rule(a, "import-os"));
    CHECK(has_rule(a, "sensitive_imports"));
    CHECK(a.risk_score == 4);
    CHECK(a.risk_level == RiskLevel::LOW);

    CHECK(framework(a, "OWASP").passed);
    const auto& soc2 = framework(a, "SOC2");
    CHECK_FALSE(soc2.passed);
    CHECK(soc2.violation_count == 2);
    CHECK(soc2.categories == std::vector<std::string>{"system", "suspicious_import"});
}

TEST_CASE("SecurityAnalyzer: structural checks", "[analyzer][structural]") {
    SecurityAnalyzer analyzer;

    SECTION("ctypes import is high") {
        const auto a = analyzer.analyze("import ctypes\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].severity == Severity::HIGH);
        CHECK(a.violations[0].description == "Import of potentially dangerous module: ctypes");
    }

    SECTION("from-import of a submodule flags the top-level package") {
        const auto a = analyzer.analyze("from urllib.request import urlopen\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].category == "suspicious_import");
        CHECK(a.violations[0].description == "Import of potentially dangerous module: urllib");
    }

    SECTION("reflective calls are medium") {
        const auto a = analyzer.analyze("getattr(obj, name)\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].category == "dangerous_function");
        CHECK(a.violations[0].severity == Severity::MEDIUM);
    }

    SECTION("method named like a builtin is not a dangerous call") {
        const auto a = analyzer.analyze("model.compile_graph()\nparser.getattr_safe(x)\n", "python");
        CHECK(a.violations.empty());
    }

    SECTION("string formatting") {
        const auto a = analyzer.analyze("msg = 'hi {}'.format(name)\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].category == "string_injection");
        CHECK(a.violations[0].severity == Severity::LOW);
    }

    SECTION("absolute path open") {
        const auto a = analyzer.analyze("f = open('/etc/shadow')\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].category == "path_traversal");
        CHECK(a.violations[0].rule == "file_access");
        CHECK(a.violations[0].severity == Severity::HIGH);
    }

    SECTION("relative traversal open hits both passes") {
        const auto a = analyzer.analyze("open('../secret')\n", "python");
        CHECK(has_rule(a, "open-traversal"));
        CHECK(has_rule(a, "file_access"));
        CHECK(a.risk_score == 10);
        CHECK(a.risk_level == RiskLevel::HIGH);
    }

    SECTION("network client construction") {
        const auto a = analyzer.analyze("conn = socket.socket()\n", "python");
        REQUIRE(a.violations.size() == 1);
        CHECK(a.violations[0].category == "network");
        CHECK(a.violations[0].description == "Network client constructed: socket.socket");
    }
}

TEST_CASE("SecurityAnalyzer: parse failure degrades to pattern results", "[analyzer][structural]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("eval(data\n", "python");

    CHECK(a.structural_analysis_failed);
    CHECK(has_rule(a, "eval-call"));
    CHECK_FALSE(has_rule(a, "dangerous_functions"));

    const auto syntax = std::find_if(a.violations.begin(), a.violations.end(),
                                     [](const Violation& v) { return v.category == "syntax"; });
    REQUIRE(syntax != a.violations.end());
    CHECK(syntax->severity == Severity::MEDIUM);
    CHECK(syntax->rule == "parse");
    CHECK(syntax->description ==
          "Syntax error may indicate obfuscated code: '(' was never closed");

    CHECK(a.risk_score == 12);
    CHECK(a.risk_level == RiskLevel::HIGH);
    CHECK_FALSE(framework(a, "ISO27001").passed);
}

TEST_CASE("SecurityAnalyzer: other languages get pattern pass only", "[analyzer]") {
    SecurityAnalyzer analyzer;

    const auto js = analyzer.analyze("eval(\"1 + 1\")", "javascript");
    REQUIRE(js.violations.size() == 1);
    CHECK(js.violations[0].rule == "eval-call");
    CHECK(js.risk_level == RiskLevel::HIGH);
    CHECK_FALSE(js.structural_analysis_failed);

    // Not Python: a syntax error here is not a finding
    const auto bash = analyzer.analyze("echo $((1 + 2)", "bash");
    CHECK(bash.violations.empty());
    CHECK_FALSE(bash.structural_analysis_failed);
}

TEST_CASE("SecurityAnalyzer: structural pass can be disabled", "[analyzer]") {
    SecurityAnalyzer::Config cfg;
    cfg.structural_analysis = false;
    SecurityAnalyzer analyzer(cfg);

    const auto a = analyzer.analyze("import ctypes\n", "python");
    CHECK(a.violations.empty());
}

// ============================================================================
// Complexity
// ============================================================================

TEST_CASE("SecurityAnalyzer: complexity counts branches, definitions and depth", "[analyzer][complexity]") {
    const std::string code =
        "def f(x):\n"
        "    if x:\n"
        "        for i in x:\n"
        "            pass\n"
        "    else:\n"
        "        return 0\n";
    // 1 + (if, for, else) + def + depth 3
    CHECK(SecurityAnalyzer::complexity(code) == 8);

    // Brace depth counts for brace languages
    CHECK(SecurityAnalyzer::complexity("function f() { if (a) { while (b) { } } }") == 7);

    // Whole words only
    CHECK(SecurityAnalyzer::complexity("iffy = elsewhere") == 1);
}

TEST_CASE("SecurityAnalyzer: complexity above threshold adds a finding", "[analyzer][complexity]") {
    std::string code;
    for (int i = 0; i < 60; ++i) code += "if x then y fi\n";

    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze(code, "bash");

    CHECK(a.complexity_score == 61);
    REQUIRE(a.violations.size() == 1);
    CHECK(a.violations[0].category == "complexity");
    CHECK(a.violations[0].line == 0);
    CHECK(a.risk_level == RiskLevel::LOW);
    CHECK_FALSE(framework(a, "ISO27001").passed);
    CHECK(framework(a, "OWASP").passed);
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("SecurityAnalyzer: analysis is deterministic", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const std::string code =
        "import os, socket\n"
        "eval(input())\n"
        "open('../x').read()\n"
        "'{}'.format(1)\n";

    const auto first = analyzer.analyze(code, "python");
    const auto second = analyzer.analyze(code, "python");

    CHECK(first.violations == second.violations);
    CHECK(first.compliance == second.compliance);
    CHECK(first.recommendations == second.recommendations);
    CHECK(first.risk_score == second.risk_score);
    CHECK(first.complexity_score == second.complexity_score);
}

TEST_CASE("SecurityAnalyzer: adding a dangerous line never lowers risk", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const std::string base = "import socket\nx = input()\n";
    const auto before = analyzer.analyze(base, "python");
    const auto after = analyzer.analyze(base + "os.system('id')\n", "python");

    CHECK(after.risk_score > before.risk_score);
    CHECK(static_cast<int>(after.risk_level) >= static_cast<int>(before.risk_level));
}

TEST_CASE("SecurityAnalyzer: recommendations are unique per category", "[analyzer]") {
    SecurityAnalyzer analyzer;
    const auto a = analyzer.analyze("eval(a)\neval(b)\nexec(c)\n", "python");

    // eval-call x2, exec-call, dangerous eval x2, dangerous exec
    CHECK(a.violations.size() == 6);
    REQUIRE(a.recommendations.size() == 2);
    CHECK(a.recommendations[0] == "Implement input validation and avoid dynamic code evaluation");
    CHECK(a.recommendations[1] ==
          "Replace reflective and dynamic-evaluation calls with explicit logic");
}

TEST_CASE("SecurityAnalyzer: risk level thresholds", "[analyzer]") {
    CHECK(SecurityAnalyzer::risk_level_for(0) == RiskLevel::LOW);
    CHECK(SecurityAnalyzer::risk_level_for(4) == RiskLevel::LOW);
    CHECK(SecurityAnalyzer::risk_level_for(5) == RiskLevel::MEDIUM);
    CHECK(SecurityAnalyzer::risk_level_for(9) == RiskLevel::MEDIUM);
    CHECK(SecurityAnalyzer::risk_level_for(10) == RiskLevel::HIGH);
    CHECK(SecurityAnalyzer::risk_level_for(19) == RiskLevel::HIGH);
    CHECK(SecurityAnalyzer::risk_level_for(20) == RiskLevel::CRITICAL);
}
