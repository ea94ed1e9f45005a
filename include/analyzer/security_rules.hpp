#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codegate::rules {

// ============================================================================
// Pattern Steps
// ============================================================================

/**
 * Patterns are flat step sequences evaluated left to right by a linear
 * matcher. There is no general backtracking: ANY_OF commits to the first
 * alternative that matches, and SCAN_LINE is the only step that searches
 * forward (bounded by the end of the current line).
 */
enum class StepKind {
    BOUNDARY,       // previous char is not an identifier char
    LITERAL,        // case-insensitive text
    OPT_SPACE,      // zero or more whitespace
    REQ_SPACE,      // one or more whitespace
    ANY_OF,         // '|'-separated literal alternatives
    WORD_END,       // next char is not an identifier char
    QUOTE,          // ' or "
    SCAN_LINE       // literal found later on the same line
};

struct Step {
    StepKind kind;
    std::string_view text = {};
};

struct PatternRule {
    std::string_view id;
    std::span<const Step> steps;
    Severity severity;
    std::string_view category;
    std::string_view description;
    std::string_view suggestion;
};

struct RuleMatch {
    const PatternRule* rule = nullptr;
    size_t offset = 0;
};

/// The fixed rule table, in evaluation order
[[nodiscard]] std::span<const PatternRule> pattern_rules();

/// Returns the end offset if `steps` match at exactly `pos`
[[nodiscard]] std::optional<size_t> match_at(std::span<const Step> steps,
                                             std::string_view text, size_t pos);

/// All non-overlapping matches of one rule, in source order
[[nodiscard]] std::vector<RuleMatch> find_all(const PatternRule& rule, std::string_view text);

// ============================================================================
// Compliance & Recommendations
// ============================================================================

struct ComplianceFramework {
    std::string_view name;
    std::span<const std::string_view> categories;
};

[[nodiscard]] std::span<const ComplianceFramework> compliance_frameworks();

/// Templated remediation text for a violation category
[[nodiscard]] std::string recommendation_for(std::string_view category);

} // namespace codegate::rules
