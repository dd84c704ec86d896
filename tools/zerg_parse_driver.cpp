#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "zerg/parser.hpp"

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: zerg_parse_driver <source-file> [--tokens]\n"; return 1; }
    std::string file = argv[1];
    bool dump_tokens = argc>2 && std::string(argv[2])=="--tokens";
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read file: " << file << "\n"; return 1; }

    if(dump_tokens){
        zerg::Lexer lx;
        auto stream = lx.lex(src);
        while(auto t = stream.next()){
            std::cout << t->line() << ":" << t->col() << "\t" << zerg::token_type_name(t->type()) << "\t" << t->display() << "\n";
        }
        return 0;
    }

    zerg::Parser p;
    auto r = p.parse_string(src, file);
    if(!r.success){ std::cerr << "[" << r.code << "] " << r.error_message << "\n"; return 2; }
    std::cout << r.root->to_string() << "\n";
    return 0;
}
