#include "parser/python_parser.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace codegate {

namespace {

constexpr std::string_view kKeywords[] = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"};

// Soft keywords that may lead a statement followed directly by an operand
constexpr std::string_view kSoftKeywords[] = {"match", "case", "type"};

// Longest first so greedy matching picks "**=" before "**"
constexpr std::string_view kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...",
    "**", "//", "==", "!=", "<=", ">=", "->", ":=", "<<", ">>",
    "+=", "-=", "*=", "/=", "%=", "@=", "&=", "|=", "^=",
    "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">",
    "=", ".", ",", ":", ";"};

bool is_keyword(std::string_view word) {
    return std::find(std::begin(kKeywords), std::end(kKeywords), word) != std::end(kKeywords);
}

bool is_soft_keyword(std::string_view word) {
    return std::find(std::begin(kSoftKeywords), std::end(kSoftKeywords), word) != std::end(kSoftKeywords);
}

bool is_ident_start(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool is_string_prefix(std::string_view word) {
    if (word.empty() || word.size() > 2) return false;
    bool raw = false, bytes = false, fmt = false, uni = false;
    for (char c : word) {
        switch (std::tolower(static_cast<unsigned char>(c))) {
            case 'r': if (raw) return false; raw = true; break;
            case 'b': if (bytes) return false; bytes = true; break;
            case 'f': if (fmt) return false; fmt = true; break;
            case 'u': if (uni) return false; uni = true; break;
            default: return false;
        }
    }
    if (uni && word.size() > 1) return false;
    return !(bytes && fmt);
}

bool is_closing(std::string_view op) {
    return op == ")" || op == "]" || op == "}";
}

bool is_operand(const Token& t) {
    if (t.kind == TokenKind::NUMBER || t.kind == TokenKind::STRING) return true;
    return t.kind == TokenKind::NAME && !is_keyword(t.text);
}

// ============================================================================
// Lexer
// ============================================================================

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    PythonParser::TokenizeResult run() {
        bool line_start = true;

        while (pos_ < src_.size()) {
            if (line_start && brackets_.empty()) {
                int col = 0;
                size_t p = pos_;
                while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t' || src_[p] == '\f')) {
                    col = (src_[p] == '\t') ? (col / 8 + 1) * 8 : col + 1;
                    ++p;
                }
                if (p >= src_.size()) {
                    pos_ = p;
                    break;
                }
                if (src_[p] == '\n' || src_[p] == '\r' || src_[p] == '#') {
                    // Blank or comment-only lines do not affect indentation
                    while (p < src_.size() && src_[p] != '\n') ++p;
                    if (p < src_.size()) {
                        ++p;
                        ++line_;
                    }
                    pos_ = p;
                    continue;
                }
                pos_ = p;
                if (!indent_to(col)) return std::move(result_);
                line_start = false;
            }

            const char c = src_[pos_];

            if (c == '\n') {
                if (brackets_.empty()) {
                    end_logical_line();
                    line_start = true;
                }
                ++line_;
                ++pos_;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                ++pos_;
                continue;
            }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (c == '\\') {
                size_t p = pos_ + 1;
                if (p < src_.size() && src_[p] == '\r') ++p;
                if (p < src_.size() && src_[p] == '\n') {
                    pos_ = p + 1;
                    ++line_;
                    continue;
                }
                return fail("unexpected character after line continuation character", line_);
            }

            bool ok = true;
            if (is_ident_start(c)) {
                ok = lex_name();
            } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                       (c == '.' && pos_ + 1 < src_.size() &&
                        std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                ok = lex_number();
            } else if (c == '\'' || c == '"') {
                ok = lex_string("");
            } else if (c == '(' || c == '[' || c == '{') {
                brackets_.push_back({c, line_});
                ok = emit(TokenKind::OP, std::string(1, c), line_);
                ++pos_;
            } else if (c == ')' || c == ']' || c == '}') {
                ok = close_bracket(c);
            } else {
                ok = lex_operator();
            }
            if (!ok) return std::move(result_);
        }

        if (!brackets_.empty()) {
            return fail(std::format("'{}' was never closed", brackets_.back().ch),
                        brackets_.back().line);
        }
        end_logical_line();
        if (pending_block_) {
            return fail("expected an indented block", line_);
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            push(TokenKind::DEDENT, "", line_);
        }
        push(TokenKind::END, "", line_);
        result_.success = true;
        return std::move(result_);
    }

private:
    struct OpenBracket {
        char ch;
        int line;
    };

    PythonParser::TokenizeResult fail(std::string message, int line) {
        result_.success = false;
        result_.error_message = std::move(message);
        result_.error_line = line;
        return std::move(result_);
    }

    bool set_error(std::string message, int line) {
        result_.error_message = std::move(message);
        result_.error_line = line;
        return false;
    }

    void push(TokenKind kind, std::string text, int line, bool formatted = false) {
        result_.tokens.push_back(Token{kind, std::move(text), line, formatted});
    }

    [[nodiscard]] const Token* last_in_line() const {
        if (result_.tokens.empty()) return nullptr;
        const Token& t = result_.tokens.back();
        if (t.kind == TokenKind::NEWLINE || t.kind == TokenKind::INDENT ||
            t.kind == TokenKind::DEDENT) {
            return nullptr;
        }
        return &t;
    }

    [[nodiscard]] bool at_statement_start(size_t back) const {
        const auto& tokens = result_.tokens;
        if (tokens.size() <= back) return true;
        const Token& t = tokens[tokens.size() - 1 - back];
        return t.kind == TokenKind::NEWLINE || t.kind == TokenKind::INDENT ||
               t.kind == TokenKind::DEDENT || (t.kind == TokenKind::OP && t.text == ";");
    }

    // Two operands side by side (`print "x"`, `a b`) are never valid Python
    bool emit(TokenKind kind, std::string text, int line, bool formatted = false) {
        Token candidate{kind, text, line, formatted};
        if (is_operand(candidate)) {
            if (const Token* prev = last_in_line()) {
                const bool prev_operand = is_operand(*prev) ||
                    (prev->kind == TokenKind::OP && is_closing(prev->text));
                const bool concat = prev->kind == TokenKind::STRING && kind == TokenKind::STRING;
                const bool soft = prev->kind == TokenKind::NAME && is_soft_keyword(prev->text) &&
                                  at_statement_start(1);
                if (prev_operand && !concat && !soft) {
                    return set_error("invalid syntax", line);
                }
            }
        }
        push(kind, std::move(text), line, formatted);
        return true;
    }

    bool indent_to(int col) {
        if (col > indents_.back()) {
            if (!pending_block_) return set_error("unexpected indent", line_);
            indents_.push_back(col);
            push(TokenKind::INDENT, "", line_);
        } else {
            if (pending_block_) return set_error("expected an indented block", line_);
            while (col < indents_.back()) {
                indents_.pop_back();
                push(TokenKind::DEDENT, "", line_);
            }
            if (col != indents_.back()) {
                return set_error("unindent does not match any outer indentation level", line_);
            }
        }
        pending_block_ = false;
        return true;
    }

    void end_logical_line() {
        const Token* last = last_in_line();
        if (!last) return;
        pending_block_ = last->kind == TokenKind::OP && last->text == ":";
        push(TokenKind::NEWLINE, "", line_);
    }

    bool lex_name() {
        const size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;
        const std::string_view word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '\'' || src_[pos_] == '"') &&
            is_string_prefix(word)) {
            return lex_string(word);
        }
        return emit(TokenKind::NAME, std::string(word), line_);
    }

    bool lex_number() {
        const size_t start = pos_;
        const bool hex = src_.substr(pos_, 2) == "0x" || src_.substr(pos_, 2) == "0X";
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (is_ident_char(c) || c == '.') {
                ++pos_;
            } else if ((c == '+' || c == '-') && !hex && pos_ > start &&
                       (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
                ++pos_;
            } else {
                break;
            }
        }
        return emit(TokenKind::NUMBER, std::string(src_.substr(start, pos_ - start)), line_);
    }

    bool lex_string(std::string_view prefix) {
        const char quote = src_[pos_];
        const bool triple = pos_ + 2 < src_.size() &&
                            src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
        const int start_line = line_;
        const size_t body_start = pos_ + (triple ? 3 : 1);
        size_t p = body_start;

        while (true) {
            if (p >= src_.size()) {
                return set_error(triple ? "unterminated triple-quoted string literal"
                                        : "unterminated string literal", start_line);
            }
            const char c = src_[p];
            if (c == '\\') {
                if (p + 1 < src_.size() && src_[p + 1] == '\n') ++line_;
                p += 2;
                continue;
            }
            if (c == '\n') {
                if (!triple) return set_error("unterminated string literal", start_line);
                ++line_;
                ++p;
                continue;
            }
            if (c == quote) {
                if (!triple) break;
                if (p + 2 < src_.size() && src_[p + 1] == quote && src_[p + 2] == quote) break;
            }
            ++p;
        }

        std::string body(src_.substr(body_start, p - body_start));
        pos_ = p + (triple ? 3 : 1);

        const bool formatted = prefix.find_first_of("fF") != std::string_view::npos;
        return emit(TokenKind::STRING, std::move(body), start_line, formatted);
    }

    bool close_bracket(char c) {
        const char expected = (c == ')') ? '(' : (c == ']') ? '[' : '{';
        if (brackets_.empty()) {
            return set_error(std::format("unmatched '{}'", c), line_);
        }
        if (brackets_.back().ch != expected) {
            return set_error(std::format("closing parenthesis '{}' does not match opening parenthesis '{}'",
                                         c, brackets_.back().ch), line_);
        }
        brackets_.pop_back();
        push(TokenKind::OP, std::string(1, c), line_);
        ++pos_;
        return true;
    }

    bool lex_operator() {
        for (const auto op : kOperators) {
            if (src_.substr(pos_, op.size()) == op) {
                push(TokenKind::OP, std::string(op), line_);
                pos_ += op.size();
                return true;
            }
        }
        const char c = src_[pos_];
        if (std::isprint(static_cast<unsigned char>(c))) {
            return set_error(std::format("invalid character '{}'", c), line_);
        }
        return set_error(std::format("invalid non-printable character 0x{:02x}",
                                     static_cast<unsigned char>(c)), line_);
    }

    std::string_view src_;
    size_t pos_ = 0;
    int line_ = 1;
    std::vector<int> indents_{0};
    std::vector<OpenBracket> brackets_;
    bool pending_block_ = false;
    PythonParser::TokenizeResult result_;
};

// ============================================================================
// Tree Builder
// ============================================================================

bool is_op(const Token& t, std::string_view text) {
    return t.kind == TokenKind::OP && t.text == text;
}

bool is_name(const Token& t, std::string_view text) {
    return t.kind == TokenKind::NAME && t.text == text;
}

class TreeBuilder {
public:
    explicit TreeBuilder(const std::vector<Token>& tokens) : tokens_(tokens) {
        root_.kind = NodeKind::MODULE;
        root_.line = 1;
    }

    SyntaxNode build() {
        size_t i = 0;
        while (i < tokens_.size() && tokens_[i].kind != TokenKind::END) {
            const Token& tok = tokens_[i];

            if (frames_.empty() && statement_start(i) && is_name(tok, "import")) {
                i = parse_import(i);
                continue;
            }
            if (frames_.empty() && statement_start(i) && is_name(tok, "from")) {
                i = parse_from_import(i);
                continue;
            }

            if (is_op(tok, "(")) {
                open_paren(i);
            } else if (is_op(tok, "[") || is_op(tok, "{")) {
                frames_.push_back(nullptr);
            } else if (is_op(tok, ")") || is_op(tok, "]") || is_op(tok, "}")) {
                if (!frames_.empty()) frames_.pop_back();
            }
            ++i;
        }
        return std::move(root_);
    }

private:
    SyntaxNode& parent() {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (*it) return **it;
        }
        return root_;
    }

    [[nodiscard]] bool statement_start(size_t i) const {
        if (i == 0) return true;
        const Token& prev = tokens_[i - 1];
        return prev.kind == TokenKind::NEWLINE || prev.kind == TokenKind::INDENT ||
               prev.kind == TokenKind::DEDENT || is_op(prev, ";") || is_op(prev, ":");
    }

    // Reads `a.b.c`; returns index past the name
    size_t dotted_name(size_t i, std::string& out) const {
        out.clear();
        while (i < tokens_.size()) {
            if (tokens_[i].kind == TokenKind::NAME && !is_name(tokens_[i], "import")) {
                out += tokens_[i].text;
                ++i;
            } else if (is_op(tokens_[i], ".") || is_op(tokens_[i], "...")) {
                out += tokens_[i].text;
                ++i;
                continue;
            } else {
                break;
            }
            if (i < tokens_.size() && (is_op(tokens_[i], ".") || is_op(tokens_[i], "..."))) {
                continue;
            }
            break;
        }
        return i;
    }

    size_t parse_import(size_t i) {
        SyntaxNode node;
        node.kind = NodeKind::IMPORT;
        node.line = tokens_[i].line;
        ++i;

        while (i < tokens_.size() && tokens_[i].kind != TokenKind::NEWLINE &&
               !is_op(tokens_[i], ";")) {
            if (tokens_[i].kind == TokenKind::NAME) {
                std::string module;
                i = dotted_name(i, module);
                if (!module.empty()) node.names.push_back(std::move(module));
                if (i < tokens_.size() && is_name(tokens_[i], "as")) i += 2;
            } else {
                ++i;
            }
        }
        root_.children.push_back(std::move(node));
        return i;
    }

    size_t parse_from_import(size_t i) {
        SyntaxNode node;
        node.kind = NodeKind::IMPORT_FROM;
        node.line = tokens_[i].line;
        ++i;

        std::string module;
        i = dotted_name(i, module);
        node.names.push_back(std::move(module));

        while (i < tokens_.size() && tokens_[i].kind != TokenKind::NEWLINE &&
               !is_op(tokens_[i], ";")) {
            if (is_op(tokens_[i], "(")) {
                // from x import (a, b) spans lines inside the brackets
                while (i < tokens_.size() && !is_op(tokens_[i], ")")) ++i;
            }
            if (i < tokens_.size()) ++i;
        }
        root_.children.push_back(std::move(node));
        return i;
    }

    void open_paren(size_t i) {
        if (i == 0 || !is_call_site(i)) {
            frames_.push_back(nullptr);
            return;
        }

        SyntaxNode call;
        call.kind = NodeKind::CALL;

        // Walk back over NAME ('.' NAME)* to build the callee chain
        size_t j = i - 1;
        std::vector<std::string> parts;
        if (tokens_[j].kind == TokenKind::NAME) {
            parts.push_back(tokens_[j].text);
            while (j >= 2 && is_op(tokens_[j - 1], ".") &&
                   tokens_[j - 2].kind == TokenKind::NAME && !is_keyword(tokens_[j - 2].text)) {
                j -= 2;
                parts.push_back(tokens_[j].text);
            }
            if (j >= 1 && is_op(tokens_[j - 1], ".")) {
                parts.emplace_back();
            }
        } else {
            parts.emplace_back();
        }
        std::reverse(parts.begin(), parts.end());
        call.names = std::move(parts);
        call.line = tokens_[j].line;
        call.first_literal = first_literal(i + 1);

        auto& siblings = parent().children;
        siblings.push_back(std::move(call));
        frames_.push_back(&siblings.back());
    }

    [[nodiscard]] bool is_call_site(size_t i) const {
        const Token& prev = tokens_[i - 1];
        if (prev.kind == TokenKind::NAME) {
            if (is_keyword(prev.text)) return false;
            if (i >= 2 && (is_name(tokens_[i - 2], "def") || is_name(tokens_[i - 2], "class"))) {
                return false;
            }
            return true;
        }
        return is_op(prev, ")") || is_op(prev, "]");
    }

    // Adjacent plain string tokens followed by ',' or ')' form a constant
    [[nodiscard]] std::optional<std::string> first_literal(size_t k) const {
        std::string value;
        bool any = false;
        while (k < tokens_.size() && tokens_[k].kind == TokenKind::STRING) {
            if (tokens_[k].formatted) return std::nullopt;
            value += tokens_[k].text;
            any = true;
            ++k;
        }
        if (!any || k >= tokens_.size()) return std::nullopt;
        if (is_op(tokens_[k], ",") || is_op(tokens_[k], ")")) return value;
        return std::nullopt;
    }

    const std::vector<Token>& tokens_;
    SyntaxNode root_;
    std::vector<SyntaxNode*> frames_;   // nullptr = non-call bracket
};

} // anonymous namespace

std::string SyntaxNode::qualified_name() const {
    std::string out;
    for (const auto& part : names) {
        if (part.empty()) continue;
        if (!out.empty()) out += '.';
        out += part;
    }
    return out;
}

PythonParser::TokenizeResult PythonParser::tokenize(std::string_view source) {
    return Lexer(source).run();
}

PythonParser::ParseResult PythonParser::parse(std::string_view source) {
    auto tokens = tokenize(source);
    if (!tokens.success) {
        return ParseResult::error(std::move(tokens.error_message), tokens.error_line);
    }
    return ParseResult::ok(TreeBuilder(tokens.tokens).build());
}

} // namespace codegate
