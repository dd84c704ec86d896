#include "zerg/token.hpp"

namespace zerg {

std::optional<TokenType> lookup_literal(std::string_view spelling){
    for(const auto& e : k_literal_table){
        if(e.spelling == spelling) return e.type;
    }
    return std::nullopt;
}

std::optional<TokenType> lookup_keyword(std::string_view spelling){
    auto t = lookup_literal(spelling);
    if(t && is_keyword(*t)) return t;
    return std::nullopt;
}

std::string_view token_type_name(TokenType t){
    switch(t){
        case TokenType::ROOT: return "ROOT";
        case TokenType::UNKNOWN: return "UNKNOWN";
        case TokenType::NEWLINE: return "NEWLINE";
        case TokenType::COMMENT: return "COMMENT";
        case TokenType::INDENT: return "INDENT";
        case TokenType::DEDENT: return "DEDENT";
        case TokenType::SPACE: return "SPACE";
        case TokenType::STRING: return "STRING";
        case TokenType::NAME: return "NAME";
        case TokenType::ADD: return "ADD";
        case TokenType::SUB: return "SUB";
        case TokenType::MUL: return "MUL";
        case TokenType::DIV: return "DIV";
        case TokenType::MOD: return "MOD";
        case TokenType::NEG: return "NEG";
        case TokenType::INC: return "INC";
        case TokenType::DEC: return "DEC";
        case TokenType::LT: return "LT";
        case TokenType::GT: return "GT";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::XOR: return "XOR";
        case TokenType::LSHIFT: return "LSHIFT";
        case TokenType::RSHIFT: return "RSHIFT";
        case TokenType::LPARENTHESES: return "LPARENTHESES";
        case TokenType::RPARENTHESES: return "RPARENTHESES";
        case TokenType::LBRACE: return "LBRACE";
        case TokenType::RBRACE: return "RBRACE";
        case TokenType::LBRACKET: return "LBRACKET";
        case TokenType::RBRACKET: return "RBRACKET";
        case TokenType::ARROW: return "ARROW";
        case TokenType::FN: return "FN";
        case TokenType::PRINT: return "PRINT";
        case TokenType::NOP: return "NOP";
    }
    return "UNKNOWN";
}

std::string_view token_spelling(TokenType t){
    for(const auto& e : k_literal_table){
        if(e.type == t) return e.spelling;
    }
    return {};
}

std::string Token::display() const {
    switch(type_){
        case TokenType::SPACE: return "[SPACE]";
        case TokenType::NEWLINE: return "[NEWLINE]";
        default: return raw_;
    }
}

} // namespace zerg
