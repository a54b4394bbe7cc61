#include <gtest/gtest.h>

#include <string>

#include "stagec/diagnostics_json.hpp"
#include "test_modules.hpp"

using namespace stagec;

TEST(DiagnosticsJson, Escaping){
    EXPECT_EQ(json_escape("plain"), "\"plain\"");
    EXPECT_EQ(json_escape("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(json_escape("l1\nl2\t"), "\"l1\\nl2\\t\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, SerializesErrorsAndWarnings){
    CompileResult r;
    r.success = false;
    r.errors.push_back(ErrorReporter::make("E1003", "unknown label 7", "f", 4, "add label 7"));
    r.warnings.push_back(ErrorReporter::make("W2001", "pass pipeline 'x' rejected", "g"));
    EXPECT_EQ(diagnostics_to_json(r),
              "{\"success\":false,\"errors\":[{\"code\":\"E1003\",\"message\":\"unknown label 7\",\"hint\":\"add label 7\","
              "\"function\":\"f\",\"pc\":4}],\"warnings\":[{\"code\":\"W2001\",\"message\":\"pass pipeline 'x' rejected\","
              "\"hint\":\"\",\"function\":\"g\",\"pc\":-1}]}");
}

TEST(DiagnosticsJson, PrintedOnlyWhenEnabled){
    Module m = stagec_test::read_or_fail("func f\n  br 2\nend\n");
    CompileContext ctx;
    CompileEnv env;

    ::testing::internal::CaptureStderr();
    compile_module(m, ctx, env);
    EXPECT_EQ(::testing::internal::GetCapturedStderr().find("\"errors\""), std::string::npos);

    env.diagJson = true;
    ::testing::internal::CaptureStderr();
    auto res = compile_module(m, ctx, env);
    const std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(res.success);
    EXPECT_NE(out.find("{\"success\":false,\"errors\":[{\"code\":\"E1003\""), std::string::npos) << out;
}
