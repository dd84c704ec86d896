#include "zerg/parser.hpp"
#include "zerg/diagnostics_json.hpp"
#include "zerg/features.hpp"
#include <cstdio>
#include <sstream>
#include <string>

namespace zerg {

namespace {

std::string describe(const Token& t){
    std::ostringstream oss;
    oss << token_type_name(t.type()) << " '" << t.display() << "' at line " << t.line() << ", col " << t.col();
    return oss.str();
}

[[noreturn]] void expected_but_got(const std::optional<Token>& got, const std::string& expected){
    if(!got) throw syntax_error(kUnexpectedEof, "expected " + expected + " but reached end of input");
    throw syntax_error(kUnexpectedToken, "expected " + expected + " but got " + describe(*got), got);
}

} // namespace

std::optional<Token> Parser::next_token(){
    if(!pushback_.empty()){
        Token t = std::move(pushback_.back());
        pushback_.pop_back();
        return t;
    }
    if(!tokens_) return std::nullopt;
    return tokens_->next();
}

void Parser::push_back(Token t){
    if(trace_) std::fprintf(stderr, "[dbg][parser] push back %s\n", describe(t).c_str());
    pushback_.push_back(std::move(t));
}

Token Parser::require(TokenType expected, const char* what){
    auto t = next_token();
    if(!t || t->type() != expected) expected_but_got(t, what);
    return std::move(*t);
}

void Parser::trace(const char* rule, const std::optional<Token>& t) const {
    if(!trace_) return;
    if(t) std::fprintf(stderr, "[dbg][parser] %s <- %s\n", rule, describe(*t).c_str());
    else std::fprintf(stderr, "[dbg][parser] %s <- end of input\n", rule);
}

ast_ptr Parser::parse(std::string_view src){
    trace_ = trace_parser_enabled();
    scope_depth_ = 0;
    pushback_.clear();
    tokens_.emplace(lexer_.lex(src));
    ast_ptr root = parse_source();
    tokens_.reset();
    pushback_.clear();
    return root;
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename){
    ParseResult r;
    try {
        r.root = parse(src);
        r.success = true;
    } catch(const syntax_error& e){
        tokens_.reset();
        pushback_.clear();
        r.success = false;
        r.code = e.code();
        r.error_message = std::string(filename) + ": " + e.what();
        r.line = e.line();
        r.column = e.col();
    }
    maybe_print_json(r);
    return r;
}

// Only one statement per scope is accepted; whatever follows it at top level
// is left unread.
ast_ptr Parser::parse_source(){
    ast_ptr root = make_node();
    auto prev = next_token();
    trace("source", prev);
    if(!prev) return root;
    if(prev->type() == TokenType::RBRACE){
        push_back(std::move(*prev));
        return root;
    }
    root->append(parse_block(std::move(*prev)));
    return root;
}

ast_ptr Parser::parse_scope(){
    Token open = require(TokenType::LBRACE, "'{'");
    trace("scope", open);
    if(scope_depth_ >= kMaxScopeDepth)
        throw syntax_error(kNestingTooDeep, "scopes nested deeper than " + std::to_string(kMaxScopeDepth) + " levels at " + describe(open), open);
    ++scope_depth_;
    ast_ptr body = parse_source();
    require(TokenType::RBRACE, "'}'");
    --scope_depth_;
    return body;
}

ast_ptr Parser::parse_block(Token prev){
    trace("block", prev);
    switch(prev.type()){
        case TokenType::NOP:
            return make_node(std::move(prev));
        case TokenType::FN:
            return parse_func_stmt(std::move(prev));
        default:
            throw syntax_error(kUnexpectedToken, "unexpected token " + describe(prev), prev);
    }
}

ast_ptr Parser::parse_func_stmt(Token prev){
    ast_ptr node = make_node(std::move(prev));
    ast_ptr head = parse_func_head();
    ast_ptr body = parse_scope();
    node->append(std::move(head)).append(std::move(body));
    return node;
}

ast_ptr Parser::parse_func_head(){
    Token name = require(TokenType::NAME, "function name");
    trace("func_head", name);
    ast_ptr node = make_node(std::move(name));

    require(TokenType::LPARENTHESES, "'(' after function name");
    auto prev = next_token();
    if(!prev) expected_but_got(prev, "')'");
    if(prev->type() != TokenType::RPARENTHESES)
        node->append(parse_func_args(std::move(*prev)));

    prev = next_token();
    if(prev){
        if(prev->type() == TokenType::ARROW) node->append(parse_type_hint(std::move(*prev)));
        else push_back(std::move(*prev));
    }
    return node;
}

ast_ptr Parser::parse_func_args(Token prev){
    throw syntax_error(kUnsupportedRule, "function arguments are not supported yet, got " + describe(prev), prev);
}

ast_ptr Parser::parse_type_hint(Token prev){
    throw syntax_error(kUnsupportedRule, "function return type hints are not supported yet", prev);
}

ast_ptr parse(std::string_view src){
    Parser p;
    return p.parse(src);
}

} // namespace zerg
