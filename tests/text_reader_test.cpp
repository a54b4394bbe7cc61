#include <gtest/gtest.h>

#include "stagec/text_reader.hpp"
#include "test_modules.hpp"

using namespace stagec;

TEST(TextReader, ReadsDemoModule){
    auto rr = text::read_module(stagec_test::kDemoModule, "demo.sm");
    ASSERT_TRUE(rr.success) << rr.error_message;
    EXPECT_EQ(rr.module.name, "demo");
    ASSERT_EQ(rr.module.functions.size(), 11u);
    const FunctionBody& fib = rr.module.functions[0];
    EXPECT_EQ(fib.name, "fib");
    EXPECT_EQ(fib.numParams, 1u);
    EXPECT_EQ(fib.numLocals, 3u);
    EXPECT_EQ(fib.code.front().op, Opcode::Const);
    EXPECT_EQ(fib.code.back().op, Opcode::Return);
}

TEST(TextReader, CallsResolveByNameIncludingForwardReferences){
    auto rr = text::read_module(R"(
func a
  call b
  return
end
func b
  i64.const -7
  return
end
)");
    ASSERT_TRUE(rr.success) << rr.error_message;
    EXPECT_TRUE(rr.module.name.empty());
    const Instr& call = rr.module.functions[0].code[0];
    EXPECT_EQ(call.op, Opcode::Call);
    EXPECT_EQ(call.imm, 1);
    EXPECT_EQ(rr.module.functions[1].code[0].imm, -7);
}

TEST(TextReader, CallByIndexIsKeptVerbatim){
    auto rr = text::read_module("func a\n  call 5\n  return\nend\n");
    ASSERT_TRUE(rr.success) << rr.error_message;
    EXPECT_EQ(rr.module.functions[0].code[0].imm, 5); // range is checked by the front end
}

TEST(TextReader, EmptyInputIsAnEmptyModule){
    auto rr = text::read_module("  ; nothing here\n");
    ASSERT_TRUE(rr.success) << rr.error_message;
    EXPECT_TRUE(rr.module.functions.empty());
}

TEST(TextReader, UnknownInstructionReportsPosition){
    auto rr = text::read_module("func f\n  i64.bogus\nend\n");
    ASSERT_FALSE(rr.success);
    EXPECT_EQ(rr.line, 2);
    EXPECT_EQ(rr.column, 3);
    EXPECT_NE(rr.error_message.find("unknown instruction 'i64.bogus'"), std::string::npos) << rr.error_message;
}

TEST(TextReader, OperandArityIsChecked){
    auto missing = text::read_module("func f\n  local.get\n  return\nend\n");
    ASSERT_FALSE(missing.success);
    EXPECT_NE(missing.error_message.find("needs an operand"), std::string::npos) << missing.error_message;

    auto extra = text::read_module("func f\n  i64.add 3\n  return\nend\n");
    ASSERT_FALSE(extra.success);
    EXPECT_NE(extra.error_message.find("takes no operand"), std::string::npos) << extra.error_message;

    auto named = text::read_module("func f\n  br loop\nend\n");
    ASSERT_FALSE(named.success);
    EXPECT_NE(named.error_message.find("needs an integer operand"), std::string::npos) << named.error_message;
}

TEST(TextReader, UnknownCallTarget){
    auto rr = text::read_module("func f\n  i64.const 1\n  call nowhere\n  return\nend\n", "m.sm");
    ASSERT_FALSE(rr.success);
    EXPECT_EQ(rr.line, 3);
    EXPECT_NE(rr.error_message.find("unknown call target 'nowhere'"), std::string::npos) << rr.error_message;
    EXPECT_EQ(rr.error_message.rfind("m.sm:3:", 0), 0u) << rr.error_message;
}

TEST(TextReader, MissingEndIsAnError){
    auto rr = text::read_module("func f\n  i64.const 1\n  return\n");
    EXPECT_FALSE(rr.success);
    EXPECT_GT(rr.line, 0);
}

TEST(TextReader, MissingFile){
    auto rr = text::read_module_file("/nonexistent/stagec/module.sm");
    ASSERT_FALSE(rr.success);
    EXPECT_NE(rr.error_message.find("cannot open"), std::string::npos);
}
