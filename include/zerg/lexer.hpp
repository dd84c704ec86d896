// lexer.hpp - four-stage, pull-based tokenizer
#pragma once
#include "zerg/token.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zerg {

// Lazy, single-use sequence of tokens. Nothing is computed until next() is
// called; once next() has returned nullopt the stream stays exhausted.
class TokenStream {
public:
    using PullFn = std::function<std::optional<Token>()>;

    explicit TokenStream(PullFn pull) : pull_(std::move(pull)) {}
    TokenStream(TokenStream&&) = default;
    TokenStream& operator=(TokenStream&&) = default;
    TokenStream(const TokenStream&) = delete;
    TokenStream& operator=(const TokenStream&) = delete;

    std::optional<Token> next();

    // Drain the remaining tokens.
    std::vector<Token> collect();

private:
    PullFn pull_;
    bool done_ = false;
};

// Source text -> classified tokens, in four independent passes:
//   1. segment            newline / comment / space run / string / unknown run
//   2. extract_operators  split unknown runs into operator and non-operator pieces
//   3. identify_words     unknown -> reserved word or NAME
//   4. remove_noise       drop SPACE, COMMENT and NEWLINE
// Each stage pulls from the previous one on demand. The lexer never fails on
// source content; odd input just produces odd tokens.
class Lexer {
public:
    static constexpr std::string_view kOperators = "+-*/%<>&|!^~(){}[]";

    Lexer() : operators_(kOperators) {}

    // Full pipeline (stages 1-4). The source is copied, so the returned
    // stream does not depend on the caller's buffer.
    TokenStream lex(std::string_view src) const;

    TokenStream segment(std::string_view src) const;
    TokenStream extract_operators(TokenStream upstream) const;
    TokenStream identify_words(TokenStream upstream) const;
    TokenStream remove_noise(TokenStream upstream) const;

    bool is_operator_char(char c) const { return operators_.find(c) != std::string::npos; }

    // Greedy literal match over a run of operator characters: take the whole
    // remaining run if it is a known spelling, otherwise peel one character
    // and retry. Throws std::logic_error if a single character has no
    // category (a broken operator table, not bad input).
    void split_operators(std::string_view run, int line, int col, std::deque<Token>& out) const;

private:
    void split_unknown(const Token& t, std::deque<Token>& out) const;

    std::string operators_;
};

} // namespace zerg
