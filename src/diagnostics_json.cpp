#include "zerg/diagnostics_json.hpp"
#include "zerg/features.hpp"
#include "zerg/parser.hpp"
#include <cstdio>
#include <sstream>

namespace zerg {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        const char* esc = nullptr;
        switch(c){
            case '"': esc = "\\\""; break;
            case '\\': esc = "\\\\"; break;
            case '\n': esc = "\\n"; break;
            case '\r': esc = "\\r"; break;
            case '\t': esc = "\\t"; break;
            default: break;
        }
        if(esc){ out += esc; continue; }
        const auto u = static_cast<unsigned char>(c);
        if(u < 0x20){
            char buf[7];
            std::snprintf(buf, sizeof(buf), "\\u%04X", u);
            out += buf;
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    if(!r.success){
        os<<"{"
            "\"code\":"<<json_escape(r.code)
            <<",\"message\":"<<json_escape(r.error_message)
            <<",\"line\":"<<r.line
            <<",\"col\":"<<r.column
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ParseResult& r){
    if(!diag_json_enabled()) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace zerg
