#pragma once

#include "core/types.hpp"
#include "parser/python_parser.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace codegate::checks {

using CheckFn = void (*)(const SyntaxNode& tree, std::vector<Violation>& out);

struct StructuralCheck {
    std::string_view name;
    CheckFn run;
};

/// Checks in the order they are applied to a parsed module
[[nodiscard]] std::span<const StructuralCheck> structural_checks();

void check_dangerous_functions(const SyntaxNode& tree, std::vector<Violation>& out);
void check_sensitive_imports(const SyntaxNode& tree, std::vector<Violation>& out);
void check_string_formatting(const SyntaxNode& tree, std::vector<Violation>& out);
void check_file_access(const SyntaxNode& tree, std::vector<Violation>& out);
void check_network_calls(const SyntaxNode& tree, std::vector<Violation>& out);

} // namespace codegate::checks
