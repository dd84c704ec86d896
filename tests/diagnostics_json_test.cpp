#include <cassert>
#include <iostream>
#include <string>
#include "zerg/diagnostics_json.hpp"
#include "zerg/features.hpp"
#include "zerg/parser.hpp"

using namespace zerg;

static std::string to_json(const char* src){
    Parser p;
    return diagnostics_to_json(p.parse_string(src, "mem"));
}

static void test_json_success(){
    auto js = to_json("fn main() { nop }");
    assert(js == "{\"success\":true,\"errors\":[]}");
}

static void test_json_error(){
    auto js = to_json("fn + () { }");
    assert(js.find("\"success\":false")!=std::string::npos);
    assert(js.find("\"code\":\"E0101\"")!=std::string::npos);
    assert(js.find("\"line\":1")!=std::string::npos);
    assert(js.find("\"col\":4")!=std::string::npos);
    assert(js.find("mem: ")!=std::string::npos);
}

static void test_json_escape(){
    assert(json_escape("a\"b") == "\"a\\\"b\"");
    assert(json_escape("x\ny") == "\"x\\ny\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

static void test_json_escape_quotes_and_controls(){
    assert(json_escape("") == "\"\"");
    assert(json_escape("a\\b\tc\r") == "\"a\\\\b\\tc\\r\"");
    assert(json_escape("\x1f") == "\"\\u001F\"");
    assert(json_escape("fn main()") == "\"fn main()\"");
}

static void test_flag_values(){
    assert(flag_value_enabled("1"));
    assert(flag_value_enabled("true"));
    assert(flag_value_enabled("Yes"));
    assert(flag_value_enabled("T"));
    assert(!flag_value_enabled(""));
    assert(!flag_value_enabled("0"));
    assert(!flag_value_enabled("no"));
    assert(!flag_value_enabled("false"));
    assert(!flag_enabled("ZERG_FLAG_THAT_IS_NEVER_SET"));
}

void run_diagnostics_json_tests(){
    test_json_success();
    test_json_error();
    test_json_escape();
    test_json_escape_quotes_and_controls();
    test_flag_values();
    std::cout << "[diagnostics_json] ok\n";
}
