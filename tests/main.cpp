#include <exception>
#include <iostream>

// Only GTest::gtest is linked (not gtest_main): the smoke harness runs first, then every GoogleTest
// suite compiled into this binary.
#include <gtest/gtest.h>

void run_env_detect_smoke_test();
void run_pipeline_smoke_test();

int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    // test discovery parses stdout of --gtest_list_tests
    if(!::testing::GTEST_FLAG(list_tests)){
        try{
            run_env_detect_smoke_test();
            run_pipeline_smoke_test();
        }catch(const std::exception& e){ std::cerr << "[stagec] exception: " << e.what() << "\n"; return 1; }
    }
    return RUN_ALL_TESTS();
}
