#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END
};

struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;       // raw text; for STRING the literal body without quotes
    int line = 1;
    bool formatted = false; // f-string (not a constant)
};

// ============================================================================
// Syntax Tree
// ============================================================================

enum class NodeKind {
    MODULE,
    IMPORT,         // import a.b, c
    IMPORT_FROM,    // from a.b import c
    CALL
};

/**
 * @brief Reduced Python syntax tree
 *
 * Only the node kinds security checks care about are kept. A CALL's
 * callee is the dotted name chain leading to the parenthesis; a chain
 * rooted in a non-name expression (a literal, a subscript, another call)
 * starts with an empty element, so `"{}".format(x)` yields {"", "format"}.
 * Calls nested in another call's arguments are its children.
 */
struct SyntaxNode {
    NodeKind kind = NodeKind::MODULE;
    int line = 0;
    std::vector<std::string> names;             // callee chain or imported modules
    std::optional<std::string> first_literal;   // first positional arg, if a plain string constant
    std::vector<SyntaxNode> children;

    /// Dotted callee, e.g. "socket.socket"; empty leading part is dropped
    [[nodiscard]] std::string qualified_name() const;

    /// True for a call on a bare identifier (`eval(...)`, not `x.eval(...)`)
    [[nodiscard]] bool is_simple_call() const {
        return kind == NodeKind::CALL && names.size() == 1 && !names[0].empty();
    }
};

/// Pre-order traversal over a tree
template<typename Fn>
void walk(const SyntaxNode& node, Fn&& fn) {
    fn(node);
    for (const auto& child : node.children) {
        walk(child, fn);
    }
}

// ============================================================================
// Parser
// ============================================================================

/**
 * @brief Lightweight Python tokenizer and recognizer
 *
 * Detects the syntax errors that matter for obfuscation screening:
 * unterminated strings, unbalanced brackets, inconsistent indentation,
 * stray characters and juxtaposed operands (`print "x"`). It is not a
 * full grammar; code it accepts may still be rejected by CPython.
 *
 * Thread-safety: stateless, safe for concurrent use.
 */
class PythonParser {
public:
    struct ParseResult {
        bool success = false;
        std::string error_message;
        int error_line = 0;
        SyntaxNode tree;

        static ParseResult ok(SyntaxNode tree) {
            ParseResult result;
            result.success = true;
            result.tree = std::move(tree);
            return result;
        }

        static ParseResult error(std::string message, int line) {
            ParseResult result;
            result.success = false;
            result.error_message = std::move(message);
            result.error_line = line;
            return result;
        }
    };

    [[nodiscard]] static ParseResult parse(std::string_view source);

    struct TokenizeResult {
        bool success = false;
        std::vector<Token> tokens;
        std::string error_message;
        int error_line = 0;
    };

    [[nodiscard]] static TokenizeResult tokenize(std::string_view source);
};

} // namespace codegate
