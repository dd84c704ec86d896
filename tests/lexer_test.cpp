#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "zerg/lexer.hpp"

using namespace zerg;

namespace {

std::vector<TokenType> types_of(const std::vector<Token>& toks){
    std::vector<TokenType> out;
    for(const auto& t : toks) out.push_back(t.type());
    return out;
}

std::vector<Token> lex_all(std::string_view src){
    Lexer lx;
    return lx.lex(src).collect();
}

const char* kSample =
    "// entry point\n"
    "fn main() -> int {\n"
    "\tprint \"hello, world\" // greet\n"
    "  a<<b ++c--d->>e\n"
    "}\n";

} // namespace

TEST(LexerSegment, ConcatenationReconstructsSource){
    Lexer lx;
    for(std::string src : {std::string(kSample), std::string(""), std::string(" \t\n\n"),
                           std::string("\"unterminated string\n fn"), std::string("x//y\r\n"), std::string("nop // tail")}){
        std::string rebuilt;
        for(const auto& t : lx.segment(src).collect()) rebuilt += t.raw();
        EXPECT_EQ(rebuilt, src);
    }
}

TEST(LexerSegment, CoarseCategories){
    Lexer lx;
    auto toks = lx.segment("a  // x\n\"b c\"").collect();
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0].type(), TokenType::UNKNOWN);
    EXPECT_EQ(toks[0].raw(), "a");
    EXPECT_EQ(toks[1].type(), TokenType::SPACE);
    EXPECT_EQ(toks[1].raw(), "  ");
    EXPECT_EQ(toks[2].type(), TokenType::COMMENT);
    EXPECT_EQ(toks[2].raw(), "// x");
    EXPECT_EQ(toks[3].type(), TokenType::NEWLINE);
    EXPECT_EQ(toks[4].type(), TokenType::STRING);
    EXPECT_EQ(toks[4].raw(), "\"b c\"");
}

TEST(LexerSegment, CommentMayEndAtEndOfInput){
    Lexer lx;
    auto toks = lx.segment("nop // tail").collect();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks.back().type(), TokenType::COMMENT);
    EXPECT_EQ(toks.back().raw(), "// tail");
    EXPECT_EQ(types_of(lex_all("nop // tail")), (std::vector<TokenType>{TokenType::NOP}));
}

TEST(LexerSegment, UnterminatedStringRunsToEnd){
    Lexer lx;
    auto toks = lx.segment("\"abc\ndef").collect();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type(), TokenType::STRING);
    EXPECT_EQ(toks[0].raw(), "\"abc\ndef");
}

TEST(LexerOperators, LongestMatch){
    EXPECT_EQ(types_of(lex_all("++")), (std::vector<TokenType>{TokenType::INC}));
    EXPECT_EQ(types_of(lex_all("+-")), (std::vector<TokenType>{TokenType::ADD, TokenType::SUB}));
    EXPECT_EQ(types_of(lex_all("->")), (std::vector<TokenType>{TokenType::ARROW}));
    // whole run fails, peel '-', then ">>" matches
    EXPECT_EQ(types_of(lex_all("->>")), (std::vector<TokenType>{TokenType::SUB, TokenType::RSHIFT}));
    EXPECT_EQ(types_of(lex_all("(){}")), (std::vector<TokenType>{
        TokenType::LPARENTHESES, TokenType::RPARENTHESES, TokenType::LBRACE, TokenType::RBRACE}));
}

TEST(LexerOperators, SplitsMixedRuns){
    auto toks = lex_all("a<<b");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].raw(), "a");
    EXPECT_EQ(toks[0].type(), TokenType::NAME);
    EXPECT_EQ(toks[1].type(), TokenType::LSHIFT);
    EXPECT_EQ(toks[1].col(), 2);
    EXPECT_EQ(toks[2].raw(), "b");
    EXPECT_EQ(toks[2].col(), 4);
}

TEST(LexerOperators, CharactersOutsideOperatorSetStayInWords){
    // '=' is outside the operator set, so it stays part of the word
    auto toks = lex_all("a=b");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type(), TokenType::NAME);
    EXPECT_EQ(toks[0].raw(), "a=b");
}

TEST(LexerWords, ReservedWordsAndNames){
    EXPECT_EQ(types_of(lex_all("fn print nop fnx main")), (std::vector<TokenType>{
        TokenType::FN, TokenType::PRINT, TokenType::NOP, TokenType::NAME, TokenType::NAME}));
}

TEST(LexerWords, DigitsAreNames){
    auto toks = lex_all("1+22");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].type(), TokenType::NAME);
    EXPECT_EQ(toks[0].raw(), "1");
    EXPECT_EQ(toks[1].type(), TokenType::ADD);
    EXPECT_EQ(toks[2].type(), TokenType::NAME);
    EXPECT_EQ(toks[2].raw(), "22");
    EXPECT_EQ(toks[2].col(), 3);
}

TEST(LexerWords, StringsKeepQuotes){
    auto toks = lex_all("print \"a b\"");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[1].type(), TokenType::STRING);
    EXPECT_EQ(toks[1].raw(), "\"a b\"");
}

TEST(LexerNoise, WhitespaceOnlyIsEmpty){
    for(const char* src : {"", " ", "\t", "  \t\t  ", "\t \t"}){
        EXPECT_TRUE(lex_all(src).empty()) << "input: '" << src << "'";
    }
}

TEST(LexerNoise, NoNoiseCategoriesSurvive){
    for(const auto& t : lex_all(kSample)){
        EXPECT_NE(t.type(), TokenType::SPACE);
        EXPECT_NE(t.type(), TokenType::COMMENT);
        EXPECT_NE(t.type(), TokenType::NEWLINE);
    }
}

TEST(LexerNoise, StagesComposeLikeLex){
    Lexer lx;
    auto staged = lx.remove_noise(lx.identify_words(lx.extract_operators(lx.segment(kSample)))).collect();
    auto whole = lx.lex(kSample).collect();
    ASSERT_EQ(staged.size(), whole.size());
    for(size_t i=0;i<whole.size();++i){
        EXPECT_EQ(staged[i].raw(), whole[i].raw());
        EXPECT_EQ(staged[i].type(), whole[i].type());
    }
}

TEST(LexerPositions, LineAndColumn){
    auto toks = lex_all("fn main()\n  nop");
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0].line(), 1); EXPECT_EQ(toks[0].col(), 1);
    EXPECT_EQ(toks[1].line(), 1); EXPECT_EQ(toks[1].col(), 4);
    EXPECT_EQ(toks[2].line(), 1); EXPECT_EQ(toks[2].col(), 8);
    EXPECT_EQ(toks[3].line(), 1); EXPECT_EQ(toks[3].col(), 9);
    EXPECT_EQ(toks[4].line(), 2); EXPECT_EQ(toks[4].col(), 3);
}

TEST(LexerStream, StaysExhausted){
    Lexer lx;
    auto s = lx.lex("nop");
    auto t = s.next();
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->type(), TokenType::NOP);
    EXPECT_FALSE(s.next().has_value());
    EXPECT_FALSE(s.next().has_value());
    EXPECT_TRUE(s.collect().empty());
}

TEST(LexerStream, OutlivesSourceBuffer){
    Lexer lx;
    TokenStream s = [&]{
        std::string src = "fn main";
        return lx.lex(src);
    }();
    auto toks = s.collect();
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[1].raw(), "main");
}

TEST(LexerTrace, EnabledByEnvironment){
    setenv("ZERG_TRACE_LEXER", "1", 1);
    testing::internal::CaptureStderr();
    lex_all("nop");
    std::string err = testing::internal::GetCapturedStderr();
    unsetenv("ZERG_TRACE_LEXER");
    EXPECT_NE(err.find("[dbg][lexer] 1:1 NOP 'nop'"), std::string::npos);
    EXPECT_NE(err.find("[dbg][lexer] end of input"), std::string::npos);
}
