// token.hpp - token categories, literal spellings and the Token value type
#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zerg {

// Closed set of lexical categories. The structural ones carry no fixed
// spelling; every other category is keyed by the literal in k_literal_table.
enum class TokenType {
    ROOT,
    UNKNOWN,
    NEWLINE,
    COMMENT,
    INDENT, // reserved for a layout-sensitive mode, never produced
    DEDENT, // reserved for a layout-sensitive mode, never produced
    SPACE,
    STRING,
    NAME,

    // operators
    ADD,
    SUB,
    MUL,
    DIV,
    MOD,
    NEG,
    INC,
    DEC,
    LT,
    GT,
    AND,
    OR,
    NOT,
    XOR,
    LSHIFT,
    RSHIFT,
    LPARENTHESES,
    RPARENTHESES,
    LBRACE,
    RBRACE,
    LBRACKET,
    RBRACKET,
    ARROW,

    // reserved words
    FN,
    PRINT,
    NOP,
};

struct LiteralEntry { std::string_view spelling; TokenType type; };

inline constexpr std::array<LiteralEntry, 26> k_literal_table{{
    {"+", TokenType::ADD},
    {"-", TokenType::SUB},
    {"*", TokenType::MUL},
    {"/", TokenType::DIV},
    {"%", TokenType::MOD},
    {"~", TokenType::NEG},
    {"++", TokenType::INC},
    {"--", TokenType::DEC},
    {"<", TokenType::LT},
    {">", TokenType::GT},
    {"&", TokenType::AND},
    {"|", TokenType::OR},
    {"!", TokenType::NOT},
    {"^", TokenType::XOR},
    {"<<", TokenType::LSHIFT},
    {">>", TokenType::RSHIFT},
    {"(", TokenType::LPARENTHESES},
    {")", TokenType::RPARENTHESES},
    {"{", TokenType::LBRACE},
    {"}", TokenType::RBRACE},
    {"[", TokenType::LBRACKET},
    {"]", TokenType::RBRACKET},
    {"->", TokenType::ARROW},
    {"fn", TokenType::FN},
    {"print", TokenType::PRINT},
    {"nop", TokenType::NOP},
}};

// Exact-match lookup of a literal-keyed category by spelling.
std::optional<TokenType> lookup_literal(std::string_view spelling);

// Same lookup restricted to the reserved words (fn, print, nop).
std::optional<TokenType> lookup_keyword(std::string_view spelling);

// Canonical upper-case tag ("FN", "LPARENTHESES", "SPACE", ...).
std::string_view token_type_name(TokenType t);

// Literal spelling of a literal-keyed category; empty for structural ones.
std::string_view token_spelling(TokenType t);

inline bool is_keyword(TokenType t) { return t == TokenType::FN || t == TokenType::PRINT || t == TokenType::NOP; }

class Token {
public:
    Token(std::string raw, TokenType type, int line = 0, int col = 0)
        : raw_(std::move(raw)), type_(type), line_(line), col_(col) {}

    const std::string& raw() const { return raw_; }
    TokenType type() const { return type_; }
    // 1-based source position of the first byte; 0 for synthetic tokens.
    int line() const { return line_; }
    int col() const { return col_; }

    // Text used by tree rendering and diagnostics: bracketed tag for
    // whitespace-like categories, the raw text otherwise.
    std::string display() const;

private:
    std::string raw_;
    TokenType type_;
    int line_;
    int col_;
};

// Synthetic token labelling a tree root.
inline Token root_token() { return Token(".", TokenType::ROOT); }

} // namespace zerg
