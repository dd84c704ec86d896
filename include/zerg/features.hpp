#pragma once
#include <cstdlib>
#include <string_view>

namespace zerg {
// A flag value counts as enabled when it starts with 1, t/T or y/Y
// ("1", "true", "Yes", ...). Unset or empty is disabled.
inline bool flag_value_enabled(std::string_view v) {
    if(v.empty()) return false;
    switch(v.front()){
        case '1': case 't': case 'T': case 'y': case 'Y': return true;
        default: return false;
    }
}
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    return v && flag_value_enabled(v);
}
inline bool trace_lexer_enabled(){ return flag_enabled("ZERG_TRACE_LEXER"); }
inline bool trace_parser_enabled(){ return flag_enabled("ZERG_TRACE_PARSER"); }
inline bool diag_json_enabled(){ return flag_enabled("ZERG_DIAG_JSON"); }
}
