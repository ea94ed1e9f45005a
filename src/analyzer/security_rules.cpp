#include "analyzer/security_rules.hpp"

#include <cctype>
#include <format>

namespace codegate::rules {

namespace {

using enum StepKind;

// ============================================================================
// Rule Patterns
// ============================================================================

constexpr Step kOsSystem[]      = {{BOUNDARY}, {LITERAL, "os.system"}, {OPT_SPACE}, {LITERAL, "("}};
constexpr Step kEval[]          = {{BOUNDARY}, {LITERAL, "eval"}, {OPT_SPACE}, {LITERAL, "("}};
constexpr Step kExec[]          = {{BOUNDARY}, {LITERAL, "exec"}, {OPT_SPACE}, {LITERAL, "("}};
constexpr Step kShellTrue[]     = {{BOUNDARY}, {LITERAL, "subprocess."}, {ANY_OF, "call|run|popen"},
                                   {OPT_SPACE}, {LITERAL, "("}, {OPT_SPACE}, {LITERAL, "shell"},
                                   {OPT_SPACE}, {LITERAL, "="}, {OPT_SPACE}, {LITERAL, "true"}};
constexpr Step kDynImport[]     = {{BOUNDARY}, {LITERAL, "__import__"}, {OPT_SPACE}, {LITERAL, "("}};
constexpr Step kCompile[]       = {{BOUNDARY}, {LITERAL, "compile"}, {OPT_SPACE}, {LITERAL, "("}};
constexpr Step kOpenTraversal[] = {{BOUNDARY}, {LITERAL, "open"}, {OPT_SPACE}, {LITERAL, "("},
                                   {OPT_SPACE}, {QUOTE}, {SCAN_LINE, "../"}};
constexpr Step kImportOs[]      = {{BOUNDARY}, {LITERAL, "import"}, {REQ_SPACE}, {LITERAL, "os"}, {WORD_END}};
constexpr Step kImportSubproc[] = {{BOUNDARY}, {LITERAL, "import"}, {REQ_SPACE}, {LITERAL, "subprocess"}, {WORD_END}};
constexpr Step kImportHttp[]    = {{BOUNDARY}, {LITERAL, "import"}, {REQ_SPACE},
                                   {ANY_OF, "urllib|requests|httplib"}, {WORD_END}};
constexpr Step kImportSocket[]  = {{BOUNDARY}, {LITERAL, "import"}, {REQ_SPACE}, {LITERAL, "socket"}, {WORD_END}};
constexpr Step kImportPickle[]  = {{BOUNDARY}, {LITERAL, "import"}, {REQ_SPACE}, {LITERAL, "pickle"}, {WORD_END}};
constexpr Step kInput[]         = {{BOUNDARY}, {LITERAL, "input"}, {OPT_SPACE}, {LITERAL, "("}};

constexpr PatternRule kRules[] = {
    // Critical
    {"os-system", kOsSystem, Severity::CRITICAL, "system",
     "Direct system command execution",
     "Use subprocess with an explicit argument list instead"},
    {"eval-call", kEval, Severity::CRITICAL, "injection",
     "Dynamic code evaluation (code injection risk)",
     "Avoid eval(); use a specific parser such as ast.literal_eval"},
    {"exec-call", kExec, Severity::CRITICAL, "injection",
     "Dynamic code execution (code injection risk)",
     "Avoid exec(); call the intended functions directly"},

    // High
    {"shell-true", kShellTrue, Severity::HIGH, "system",
     "Shell command execution with shell=True",
     "Use shell=False and pass arguments as a list"},
    {"dynamic-import", kDynImport, Severity::HIGH, "injection",
     "Dynamic module import",
     "Use static imports"},
    {"compile-call", kCompile, Severity::HIGH, "injection",
     "Dynamic code compilation",
     "Avoid compiling code at runtime"},
    {"open-traversal", kOpenTraversal, Severity::HIGH, "file_access",
     "Path traversal attempt in file access",
     "Validate and sanitize file paths"},

    // Medium
    {"import-os", kImportOs, Severity::MEDIUM, "system",
     "Operating system access imported",
     "Review OS access requirements"},
    {"import-subprocess", kImportSubproc, Severity::MEDIUM, "system",
     "Subprocess module imported",
     "Review subprocess usage"},
    {"import-http", kImportHttp, Severity::MEDIUM, "network",
     "Network access module imported",
     "Review network access requirements"},
    {"import-socket", kImportSocket, Severity::MEDIUM, "network",
     "Socket programming imported",
     "Review socket usage"},

    // Low
    {"import-pickle", kImportPickle, Severity::LOW, "serialization",
     "Pickle can execute arbitrary code on load",
     "Prefer JSON or another data-only format"},
    {"input-call", kInput, Severity::LOW, "input",
     "User input read without validation",
     "Validate and sanitize user input"},
};

// ============================================================================
// Compliance Tables
// ============================================================================

constexpr std::string_view kOwasp[] = {
    "injection", "dangerous_function", "string_injection", "path_traversal",
    "file_access", "serialization", "input"};
constexpr std::string_view kSoc2[] = {
    "system", "network", "suspicious_import", "file_access"};
constexpr std::string_view kIso27001[] = {
    "system", "network", "serialization", "syntax", "complexity"};

constexpr ComplianceFramework kFrameworks[] = {
    {"OWASP", kOwasp},
    {"SOC2", kSoc2},
    {"ISO27001", kIso27001},
};

struct CategoryAdvice {
    std::string_view category;
    std::string_view text;
};

constexpr CategoryAdvice kAdvice[] = {
    {"injection", "Implement input validation and avoid dynamic code evaluation"},
    {"dangerous_function", "Replace reflective and dynamic-evaluation calls with explicit logic"},
    {"system", "Minimize system-level access and rely on container isolation"},
    {"network", "Validate all network requests and responses; use HTTPS"},
    {"suspicious_import", "Justify each sensitive module import during review"},
    {"file_access", "Implement file access controls and sanitize all paths"},
    {"path_traversal", "Resolve paths against an allowed root before opening files"},
    {"string_injection", "Sanitize values passed to string formatting"},
    {"serialization", "Use data-only serialization formats for untrusted input"},
    {"input", "Validate and bound all user-provided input"},
    {"syntax", "Submit syntactically valid code; malformed code may hide obfuscation"},
    {"complexity", "Break down complex code for easier security review"},
};

// ============================================================================
// Matcher Primitives
// ============================================================================

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool literal_at(std::string_view text, size_t pos, std::string_view lit) {
    if (pos + lit.size() > text.size()) return false;
    for (size_t j = 0; j < lit.size(); ++j) {
        if (std::tolower(static_cast<unsigned char>(text[pos + j])) !=
            std::tolower(static_cast<unsigned char>(lit[j]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::span<const PatternRule> pattern_rules() {
    return kRules;
}

std::span<const ComplianceFramework> compliance_frameworks() {
    return kFrameworks;
}

std::string recommendation_for(std::string_view category) {
    for (const auto& advice : kAdvice) {
        if (advice.category == category) return std::string(advice.text);
    }
    return std::format("Review code flagged under '{}'", category);
}

std::optional<size_t> match_at(std::span<const Step> steps, std::string_view text, size_t pos) {
    for (size_t s = 0; s < steps.size(); ++s) {
        const Step& step = steps[s];
        switch (step.kind) {
            case BOUNDARY:
                if (pos > 0 && is_ident_char(text[pos - 1])) return std::nullopt;
                break;

            case LITERAL:
                if (!literal_at(text, pos, step.text)) return std::nullopt;
                pos += step.text.size();
                break;

            case OPT_SPACE:
                while (pos < text.size() && is_space(text[pos])) ++pos;
                break;

            case REQ_SPACE: {
                const size_t start = pos;
                while (pos < text.size() && is_space(text[pos])) ++pos;
                if (pos == start) return std::nullopt;
                break;
            }

            case ANY_OF: {
                bool matched = false;
                std::string_view rest = step.text;
                while (!matched) {
                    const size_t bar = rest.find('|');
                    const std::string_view alt = rest.substr(0, bar);
                    if (!alt.empty() && literal_at(text, pos, alt)) {
                        pos += alt.size();
                        matched = true;
                    }
                    if (bar == std::string_view::npos) break;
                    rest.remove_prefix(bar + 1);
                }
                if (!matched) return std::nullopt;
                break;
            }

            case WORD_END:
                if (pos < text.size() && is_ident_char(text[pos])) return std::nullopt;
                break;

            case QUOTE:
                if (pos >= text.size() || (text[pos] != '\'' && text[pos] != '"')) return std::nullopt;
                ++pos;
                break;

            case SCAN_LINE: {
                bool found = false;
                while (pos < text.size() && text[pos] != '\n') {
                    if (literal_at(text, pos, step.text)) {
                        pos += step.text.size();
                        found = true;
                        break;
                    }
                    ++pos;
                }
                if (!found) return std::nullopt;
                break;
            }
        }
    }
    return pos;
}

std::vector<RuleMatch> find_all(const PatternRule& rule, std::string_view text) {
    std::vector<RuleMatch> matches;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto end = match_at(rule.steps, text, pos);
        if (end) {
            matches.push_back(RuleMatch{&rule, pos});
            pos = (*end > pos) ? *end : pos + 1;
        } else {
            ++pos;
        }
    }
    return matches;
}

} // namespace codegate::rules
