#include <iostream>
#include <exception>
#include "test_env.hpp"
// We link GTest::gtest, not gtest_main: the assert-based smoke pass runs first,
// then every GoogleTest case compiled into this binary.
#include <gtest/gtest.h>

void run_smoke_tests();

int main(int argc, char** argv){
    try{
        run_smoke_tests();
    }catch(const std::exception& e){ std::cerr << "[smoke] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
