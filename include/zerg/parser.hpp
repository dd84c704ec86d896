// parser.hpp - recursive-descent parser over the lexer's token stream
#pragma once
#include "zerg/ast.hpp"
#include "zerg/lexer.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace zerg {

// Diagnostic codes carried by syntax_error and ParseResult.
inline constexpr const char* kUnexpectedToken = "E0101";
inline constexpr const char* kUnexpectedEof = "E0102";
inline constexpr const char* kUnsupportedRule = "E0103";
inline constexpr const char* kNestingTooDeep = "E0104";

struct syntax_error : std::runtime_error {
    syntax_error(std::string code, const std::string& message, std::optional<Token> token = std::nullopt)
        : std::runtime_error(message), code_(std::move(code)), token_(std::move(token)) {}

    const std::string& code() const { return code_; }
    const std::optional<Token>& token() const { return token_; }
    int line() const { return token_ ? token_->line() : 0; }
    int col() const { return token_ ? token_->col() : 0; }

private:
    std::string code_;
    std::optional<Token> token_;
};

struct ParseResult {
    bool success{false};
    ast_ptr root;              // set when success
    std::string code;          // diagnostic code when !success
    std::string error_message; // If !success, human-readable message
    int line{0};
    int column{0};
};

// Grammar:
//   source    := block*        (until RBRACE or end of input)
//   block     := NOP | fn_stmt
//   fn_stmt   := FN func_head scope
//   func_head := NAME LPARENTHESES [func_args] RPARENTHESES [ARROW type_hint]
//   scope     := LBRACE source RBRACE
//
// One Parser may be reused for several sources, but not concurrently.
class Parser {
public:
    // Scopes nested deeper than this are rejected with kNestingTooDeep. Parsing,
    // rendering and releasing a tree all recurse once per level.
    static constexpr int kMaxScopeDepth = 256;

    Parser() = default;
    explicit Parser(Lexer lexer) : lexer_(std::move(lexer)) {}

    // Throws syntax_error on any grammar violation; no partial tree.
    ast_ptr parse(std::string_view src);

    // Non-throwing wrapper: syntax errors land in the result, prefixed with
    // the filename, and are echoed as JSON when ZERG_DIAG_JSON is set.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>");

private:
    std::optional<Token> next_token();
    void push_back(Token t);
    Token require(TokenType expected, const char* what);

    ast_ptr parse_source();
    ast_ptr parse_scope();
    ast_ptr parse_block(Token prev);
    ast_ptr parse_func_stmt(Token prev);
    ast_ptr parse_func_head();
    ast_ptr parse_func_args(Token prev);
    ast_ptr parse_type_hint(Token prev);

    void trace(const char* rule, const std::optional<Token>& t) const;

    Lexer lexer_;
    std::optional<TokenStream> tokens_;
    std::vector<Token> pushback_;
    int scope_depth_ = 0;
    bool trace_ = false;
};

// Single entry point for collaborators: one compilation unit in, root node out.
ast_ptr parse(std::string_view src);

} // namespace zerg
