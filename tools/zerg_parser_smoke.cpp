#include <cassert>
#include <iostream>
#include "zerg/parser.hpp"

int main(){
    zerg::Parser p;
    {
        auto r = p.parse_string("  // empty unit\n\n", "mem");
        assert(r.success);
        assert(r.root && r.root->children().empty());
    }
    {
        const char* src = R"(// one empty function
fn main() {
    // empty body
}
)";
        auto r = p.parse_string(src, "mem2");
        assert(r.success);
        const auto& fn = r.root->children().at(0);
        assert(fn->token().type() == zerg::TokenType::FN);
        assert(fn->children().at(0)->token().raw() == "main");
    }
    {
        const char* src = R"(
fn main() {
    nop
}
)";
        auto r = p.parse_string(src, "mem3");
        assert(r.success);
        std::cout << r.root->to_string() << "\n";
    }
    {
        auto r = p.parse_string("fn main(", "mem4");
        assert(!r.success);
        assert(r.code == zerg::kUnexpectedEof);
    }
    std::cout << "parser smoke ok\n";
    return 0;
}
