#include <iostream>
#include <exception>
// Only GTest::gtest is linked (not gtest_main), so GoogleTest is dispatched
// explicitly after the assert-based suites.
#include <gtest/gtest.h>

void run_token_tests();
void run_diagnostics_json_tests();

int main(int argc, char** argv){
    try{
        run_token_tests();
        run_diagnostics_json_tests();
    }catch(const std::exception& e){ std::cerr << "[zerg] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
