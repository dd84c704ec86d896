#include "zerg/lexer.hpp"
#include "zerg/features.hpp"
#include "pegtl/grammar.hpp"
#include "pegtl/actions.hpp"

#include <tao/pegtl.hpp>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <utility>

namespace zerg {

std::optional<Token> TokenStream::next(){
    if(done_) return std::nullopt;
    auto t = pull_();
    if(!t) done_ = true;
    return t;
}

std::vector<Token> TokenStream::collect(){
    std::vector<Token> out;
    while(auto t = next()) out.push_back(std::move(*t));
    return out;
}

namespace {

// Owns the source copy together with the PEGTL input reading it, so the
// stage-1 stream can outlive the caller's buffer.
struct segment_source {
    std::string text;
    tao::pegtl::memory_input<> in;

    explicit segment_source(std::string_view src)
        : text(src), in(text.data(), text.size(), "zerg") {}
};

} // namespace

TokenStream Lexer::segment(std::string_view src) const {
    auto st = std::make_shared<segment_source>(src);
    return TokenStream([st]() -> std::optional<Token> {
        if(st->in.empty()) return std::nullopt;
        pegtl_front::actions::segment_state out;
        const bool ok = tao::pegtl::parse< pegtl_front::grammar::segment, pegtl_front::actions::action >(st->in, out);
        if(!ok || !out.token)
            throw std::logic_error("segment grammar did not match non-empty input");
        return std::move(out.token);
    });
}

void Lexer::split_operators(std::string_view run, int line, int col, std::deque<Token>& out) const {
    while(!run.empty()){
        if(auto whole = lookup_literal(run)){
            out.emplace_back(std::string(run), *whole, line, col);
            return;
        }
        auto first = lookup_literal(run.substr(0, 1));
        if(!first)
            throw std::logic_error("operator character '" + std::string(run.substr(0, 1)) + "' has no single-character category");
        out.emplace_back(std::string(run.substr(0, 1)), *first, line, col);
        run.remove_prefix(1);
        ++col;
    }
}

void Lexer::split_unknown(const Token& t, std::deque<Token>& out) const {
    const std::string& raw = t.raw();
    size_t start = 0;
    while(start < raw.size()){
        const bool op = is_operator_char(raw[start]);
        size_t end = start + 1;
        while(end < raw.size() && is_operator_char(raw[end]) == op) ++end;
        std::string_view run(raw.data() + start, end - start);
        const int col = t.col() + static_cast<int>(start);
        if(op) split_operators(run, t.line(), col, out);
        else out.emplace_back(std::string(run), TokenType::UNKNOWN, t.line(), col);
        start = end;
    }
}

TokenStream Lexer::extract_operators(TokenStream upstream) const {
    auto src = std::make_shared<TokenStream>(std::move(upstream));
    auto pending = std::make_shared<std::deque<Token>>();
    return TokenStream([src, pending, self = *this]() -> std::optional<Token> {
        while(pending->empty()){
            auto t = src->next();
            if(!t) return std::nullopt;
            if(t->type() != TokenType::UNKNOWN) return t;
            self.split_unknown(*t, *pending);
        }
        Token t = std::move(pending->front());
        pending->pop_front();
        return t;
    });
}

TokenStream Lexer::identify_words(TokenStream upstream) const {
    auto src = std::make_shared<TokenStream>(std::move(upstream));
    return TokenStream([src]() -> std::optional<Token> {
        auto t = src->next();
        if(!t || t->type() != TokenType::UNKNOWN) return t;
        const TokenType ty = lookup_keyword(t->raw()).value_or(TokenType::NAME);
        return Token(t->raw(), ty, t->line(), t->col());
    });
}

TokenStream Lexer::remove_noise(TokenStream upstream) const {
    auto src = std::make_shared<TokenStream>(std::move(upstream));
    return TokenStream([src]() -> std::optional<Token> {
        while(auto t = src->next()){
            switch(t->type()){
                case TokenType::SPACE:
                case TokenType::COMMENT:
                case TokenType::NEWLINE:
                    continue;
                default:
                    return t;
            }
        }
        return std::nullopt;
    });
}

TokenStream Lexer::lex(std::string_view src) const {
    TokenStream base = remove_noise(identify_words(extract_operators(segment(src))));
    if(!trace_lexer_enabled()) return base;
    auto inner = std::make_shared<TokenStream>(std::move(base));
    return TokenStream([inner]() -> std::optional<Token> {
        auto t = inner->next();
        if(t){
            std::fprintf(stderr, "[dbg][lexer] %d:%d %s '%s'\n", t->line(), t->col(),
                         std::string(token_type_name(t->type())).c_str(), t->raw().c_str());
        } else {
            std::fprintf(stderr, "[dbg][lexer] end of input\n");
        }
        return t;
    });
}

} // namespace zerg
