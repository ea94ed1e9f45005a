#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

/**
 * @brief Static risk assessment of a code submission
 *
 * Two passes are unioned: the pattern pass runs the fixed rule table over
 * the raw source for every language; the structural pass parses Python and
 * runs the ordered structural checks over the syntax tree. A parse failure
 * degrades to pattern-only results plus one `syntax` violation.
 *
 * analyze() is deterministic and has no side effects. Risk is advisory:
 * nothing here blocks execution.
 *
 * Thread-safety: immutable after construction, safe for concurrent use.
 */
class SecurityAnalyzer {
public:
    struct Config {
        int complexity_threshold = 50;
        bool structural_analysis = true;
    };

    SecurityAnalyzer() : SecurityAnalyzer(Config{}) {}
    explicit SecurityAnalyzer(const Config& config);

    [[nodiscard]] RiskAssessment analyze(std::string_view code, std::string_view language) const;

    // Building blocks, exposed for tests and the scan directive

    [[nodiscard]] static std::vector<Violation> pattern_pass(std::string_view code);

    /// Returns false (and appends a syntax violation) when the source does not parse
    static bool structural_pass(std::string_view code, std::vector<Violation>& out);

    [[nodiscard]] static int complexity(std::string_view code);
    [[nodiscard]] static int risk_score(const std::vector<Violation>& violations);
    [[nodiscard]] static RiskLevel risk_level_for(int score);
    [[nodiscard]] static std::vector<ComplianceStatus> evaluate_compliance(
        const std::vector<Violation>& violations);
    [[nodiscard]] static std::vector<std::string> recommendations(
        const std::vector<Violation>& violations);

    [[nodiscard]] static bool has_grammar(std::string_view language);

private:
    Config config_;
};

} // namespace codegate
