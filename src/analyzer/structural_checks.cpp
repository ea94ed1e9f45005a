#include "analyzer/structural_checks.hpp"

#include <format>

namespace codegate::checks {

namespace {

struct FunctionSeverity {
    std::string_view name;
    Severity severity;
};

constexpr FunctionSeverity kDangerousFunctions[] = {
    {"eval", Severity::CRITICAL},
    {"exec", Severity::CRITICAL},
    {"compile", Severity::HIGH},
    {"__import__", Severity::HIGH},
    {"getattr", Severity::MEDIUM},
    {"setattr", Severity::MEDIUM},
    {"delattr", Severity::MEDIUM},
};

constexpr FunctionSeverity kSensitiveModules[] = {
    {"os", Severity::MEDIUM},
    {"subprocess", Severity::MEDIUM},
    {"socket", Severity::MEDIUM},
    {"urllib", Severity::MEDIUM},
    {"requests", Severity::MEDIUM},
    {"pickle", Severity::LOW},
    {"marshal", Severity::LOW},
    {"ctypes", Severity::HIGH},
};

constexpr std::string_view kNetworkConstructors[] = {
    "socket.socket", "socket.create_connection",
    "urllib.request.urlopen", "urlopen",
    "requests.get", "requests.post", "requests.put", "requests.patch",
    "requests.delete", "requests.head", "requests.request",
    "http.client.HTTPConnection", "http.client.HTTPSConnection",
    "ftplib.FTP", "smtplib.SMTP", "telnetlib.Telnet",
};

constexpr StructuralCheck kChecks[] = {
    {"dangerous_functions", &check_dangerous_functions},
    {"sensitive_imports", &check_sensitive_imports},
    {"string_formatting", &check_string_formatting},
    {"file_access", &check_file_access},
    {"network_calls", &check_network_calls},
};

std::string_view top_level_module(std::string_view dotted) {
    return dotted.substr(0, dotted.find('.'));
}

void flag_module(std::string_view module, int line, std::vector<Violation>& out) {
    for (const auto& entry : kSensitiveModules) {
        if (entry.name == module) {
            out.push_back(Violation{
                entry.severity, "suspicious_import",
                std::format("Import of potentially dangerous module: {}", module),
                line,
                std::format("Review usage of the {} module", module),
                "sensitive_imports"});
            return;
        }
    }
}

} // anonymous namespace

std::span<const StructuralCheck> structural_checks() {
    return kChecks;
}

void check_dangerous_functions(const SyntaxNode& tree, std::vector<Violation>& out) {
    walk(tree, [&](const SyntaxNode& node) {
        if (!node.is_simple_call()) return;
        for (const auto& fn : kDangerousFunctions) {
            if (fn.name == node.names[0]) {
                out.push_back(Violation{
                    fn.severity, "dangerous_function",
                    std::format("Use of dangerous function: {}", fn.name),
                    node.line,
                    std::format("Avoid using {}", fn.name),
                    "dangerous_functions"});
                return;
            }
        }
    });
}

void check_sensitive_imports(const SyntaxNode& tree, std::vector<Violation>& out) {
    walk(tree, [&](const SyntaxNode& node) {
        if (node.kind == NodeKind::IMPORT) {
            for (const auto& module : node.names) {
                flag_module(top_level_module(module), node.line, out);
            }
        } else if (node.kind == NodeKind::IMPORT_FROM && !node.names.empty()) {
            const std::string_view module = node.names[0];
            if (!module.empty() && module.front() != '.') {
                flag_module(top_level_module(module), node.line, out);
            }
        }
    });
}

void check_string_formatting(const SyntaxNode& tree, std::vector<Violation>& out) {
    walk(tree, [&](const SyntaxNode& node) {
        if (node.kind != NodeKind::CALL || node.names.size() < 2) return;
        if (node.names.back() != "format") return;
        out.push_back(Violation{
            Severity::LOW, "string_injection",
            "String formatting may be vulnerable to injection",
            node.line,
            "Validate and sanitize format arguments",
            "string_formatting"});
    });
}

void check_file_access(const SyntaxNode& tree, std::vector<Violation>& out) {
    walk(tree, [&](const SyntaxNode& node) {
        if (!node.is_simple_call() || node.names[0] != "open") return;
        if (!node.first_literal) return;
        const std::string& path = *node.first_literal;
        if (path.find("..") == std::string::npos && !path.starts_with('/')) return;
        out.push_back(Violation{
            Severity::HIGH, "path_traversal",
            std::format("Potential path traversal in file operation: '{}'", path),
            node.line,
            "Validate and sanitize file paths",
            "file_access"});
    });
}

void check_network_calls(const SyntaxNode& tree, std::vector<Violation>& out) {
    walk(tree, [&](const SyntaxNode& node) {
        if (node.kind != NodeKind::CALL || node.names.empty() || node.names[0].empty()) return;
        const std::string callee = node.qualified_name();
        for (const auto ctor : kNetworkConstructors) {
            if (ctor == callee) {
                out.push_back(Violation{
                    Severity::MEDIUM, "network",
                    std::format("Network client constructed: {}", callee),
                    node.line,
                    "Confirm outbound network access is required and restricted",
                    "network_calls"});
                return;
            }
        }
    });
}

} // namespace codegate::checks
