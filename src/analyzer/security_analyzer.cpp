#include "analyzer/security_analyzer.hpp"
#include "analyzer/security_rules.hpp"
#include "analyzer/structural_checks.hpp"
#include "parser/python_parser.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <span>

namespace codegate {

namespace {

constexpr std::string_view kControlKeywords[] = {
    "if", "elif", "else", "for", "while", "try", "except", "finally", "with"};
constexpr std::string_view kDefinitionKeywords[] = {"def", "class", "function"};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whole-word occurrences of any of `words`
int count_words(std::string_view code, std::span<const std::string_view> words) {
    int count = 0;
    size_t i = 0;
    while (i < code.size()) {
        if (!is_word_char(code[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < code.size() && is_word_char(code[i])) ++i;
        const std::string_view word = code.substr(start, i - start);
        if (std::find(words.begin(), words.end(), word) != words.end()) ++count;
    }
    return count;
}

int indentation_depth(std::string_view code) {
    std::vector<size_t> stack{0};
    int max_depth = 0;
    size_t pos = 0;
    while (pos <= code.size()) {
        size_t end = code.find('\n', pos);
        if (end == std::string_view::npos) end = code.size();
        const std::string_view line = code.substr(pos, end - pos);

        const size_t width = line.find_first_not_of(" \t");
        if (width != std::string_view::npos && line[width] != '\r') {
            while (stack.size() > 1 && width < stack.back()) stack.pop_back();
            if (width > stack.back()) stack.push_back(width);
            max_depth = std::max(max_depth, static_cast<int>(stack.size()) - 1);
        }
        pos = end + 1;
    }
    return max_depth;
}

int brace_depth(std::string_view code) {
    int depth = 0;
    int max_depth = 0;
    for (char c : code) {
        if (c == '{') {
            max_depth = std::max(max_depth, ++depth);
        } else if (c == '}' && depth > 0) {
            --depth;
        }
    }
    return max_depth;
}

} // anonymous namespace

SecurityAnalyzer::SecurityAnalyzer(const Config& config)
    : config_(config) {}

bool SecurityAnalyzer::has_grammar(std::string_view language) {
    return language == "python";
}

RiskAssessment SecurityAnalyzer::analyze(std::string_view code, std::string_view language) const {
    RiskAssessment assessment;
    assessment.violations = pattern_pass(code);

    if (config_.structural_analysis && has_grammar(language)) {
        assessment.structural_analysis_failed = !structural_pass(code, assessment.violations);
    }

    assessment.complexity_score = complexity(code);
    if (assessment.complexity_score > config_.complexity_threshold) {
        assessment.violations.push_back(Violation{
            Severity::LOW, "complexity",
            std::format("High code complexity ({}) may hide security issues",
                        assessment.complexity_score),
            0,
            "Break down complex code for easier review",
            "complexity"});
    }

    assessment.risk_score = risk_score(assessment.violations);
    assessment.risk_level = risk_level_for(assessment.risk_score);
    assessment.compliance = evaluate_compliance(assessment.violations);
    assessment.recommendations = recommendations(assessment.violations);
    return assessment;
}

// ============================================================================
// Passes
// ============================================================================

std::vector<Violation> SecurityAnalyzer::pattern_pass(std::string_view code) {
    // Line starts for offset -> line lookup
    std::vector<size_t> line_starts{0};
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '\n') line_starts.push_back(i + 1);
    }
    const auto line_of = [&](size_t offset) {
        const auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
        return static_cast<int>(it - line_starts.begin());
    };

    std::vector<Violation> violations;
    for (const auto& rule : rules::pattern_rules()) {
        for (const auto& match : rules::find_all(rule, code)) {
            violations.push_back(Violation{
                rule.severity,
                std::string(rule.category),
                std::string(rule.description),
                line_of(match.offset),
                std::string(rule.suggestion),
                std::string(rule.id)});
        }
    }
    return violations;
}

bool SecurityAnalyzer::structural_pass(std::string_view code, std::vector<Violation>& out) {
    const auto parsed = PythonParser::parse(code);
    if (!parsed.success) {
        out.push_back(Violation{
            Severity::MEDIUM, "syntax",
            std::format("Syntax error may indicate obfuscated code: {}", parsed.error_message),
            parsed.error_line,
            "Submit syntactically valid code",
            "parse"});
        return false;
    }

    for (const auto& check : checks::structural_checks()) {
        check.run(parsed.tree, out);
    }
    return true;
}

// ============================================================================
// Scoring
// ============================================================================

int SecurityAnalyzer::complexity(std::string_view code) {
    int score = 1;
    score += count_words(code, kControlKeywords);
    score += count_words(code, kDefinitionKeywords);
    score += std::max(indentation_depth(code), brace_depth(code));
    return score;
}

int SecurityAnalyzer::risk_score(const std::vector<Violation>& violations) {
    int total = 0;
    for (const auto& v : violations) {
        total += severity_weight(v.severity);
    }
    return total;
}

RiskLevel SecurityAnalyzer::risk_level_for(int score) {
    if (score >= 20) return RiskLevel::CRITICAL;
    if (score >= 10) return RiskLevel::HIGH;
    if (score >= 5) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

std::vector<ComplianceStatus> SecurityAnalyzer::evaluate_compliance(
    const std::vector<Violation>& violations) {

    std::vector<ComplianceStatus> result;
    for (const auto& framework : rules::compliance_frameworks()) {
        ComplianceStatus status;
        status.framework = std::string(framework.name);

        for (const auto& v : violations) {
            const bool relevant = std::find(framework.categories.begin(),
                                            framework.categories.end(),
                                            v.category) != framework.categories.end();
            if (!relevant) continue;
            ++status.violation_count;
            if (std::find(status.categories.begin(), status.categories.end(), v.category) ==
                status.categories.end()) {
                status.categories.push_back(v.category);
            }
        }
        status.passed = status.violation_count == 0;
        result.push_back(std::move(status));
    }
    return result;
}

std::vector<std::string> SecurityAnalyzer::recommendations(const std::vector<Violation>& violations) {
    std::vector<std::string> seen_categories;
    std::vector<std::string> out;
    for (const auto& v : violations) {
        if (std::find(seen_categories.begin(), seen_categories.end(), v.category) !=
            seen_categories.end()) {
            continue;
        }
        seen_categories.push_back(v.category);

        auto text = rules::recommendation_for(v.category);
        if (std::find(out.begin(), out.end(), text) == out.end()) {
            out.push_back(std::move(text));
        }
    }
    return out;
}

} // namespace codegate
