#pragma once
#include "grammar.hpp"
#include "zerg/token.hpp"
#include <optional>
#include <tao/pegtl.hpp>

namespace zerg::pegtl_front::actions {
using namespace tao::pegtl;

struct segment_state {
    std::optional<Token> token;

    template<typename ActionInput>
    void emit(const ActionInput& in, TokenType t){
        const auto pos = in.position();
        token.emplace(in.string(), t, static_cast<int>(pos.line), static_cast<int>(pos.column));
    }
};

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::newline > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, segment_state& st){ st.emit(in, TokenType::NEWLINE); }
};

template<> struct action< grammar::comment > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, segment_state& st){ st.emit(in, TokenType::COMMENT); }
};

template<> struct action< grammar::space_run > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, segment_state& st){ st.emit(in, TokenType::SPACE); }
};

template<> struct action< grammar::string_lit > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, segment_state& st){ st.emit(in, TokenType::STRING); }
};

template<> struct action< grammar::unknown_run > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, segment_state& st){ st.emit(in, TokenType::UNKNOWN); }
};

} // namespace zerg::pegtl_front::actions
