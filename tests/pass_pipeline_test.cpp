#include <gtest/gtest.h>

#include <cassert>
#include <iostream>
#include <string>

#include <llvm/IR/Instructions.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "stagec/ir/block_layout.hpp"
#include "stagec/ir/frontend.hpp"
#include "stagec/ir/pass_pipeline.hpp"
#include "test_env.hpp"
#include "test_modules.hpp"

using namespace stagec;

namespace {

struct MemOps { int allocas = 0, loads = 0, stores = 0; };

MemOps count_mem_ops(const llvm::Function& F){
    MemOps n;
    for(auto& bb : F)
        for(auto& ins : bb){
            if(llvm::isa<llvm::AllocaInst>(ins)) ++n.allocas;
            else if(llvm::isa<llvm::LoadInst>(ins)) ++n.loads;
            else if(llvm::isa<llvm::StoreInst>(ins)) ++n.stores;
        }
    return n;
}

// Builds `fn` from the demo module and runs the optimizer under `env`.
MemOps optimize(const std::string& fn, const CompileEnv& env, std::vector<CompileError>* warnings = nullptr){
    Module m = stagec_test::read_or_fail(stagec_test::kDemoModule);
    llvm::LLVMContext llctx;
    llvm::Module M(fn, llctx);
    std::vector<CompileError> errs, warns;
    ErrorReporter rep{&errs, &warns};
    CompileContext ctx;
    llvm::Function* F = ir::frontend::build_function(ctx, m, stagec_test::index_of(m, fn), M, rep);
    EXPECT_NE(F, nullptr);
    if(!F) return {};
    ir::pass_pipeline::run_pass_pipeline(ctx, M, env, rep, fn);
    EXPECT_TRUE(errs.empty());
    if(warnings) *warnings = warns;
    return count_mem_ops(*F);
}

} // namespace

// Env detection smoke run, called from main before the GoogleTest suites.
void run_env_detect_smoke_test(){
    std::cout << "[stagec] env detect smoke test...\n";
    ScopedEnv opt("STAGEC_OPT_LEVEL", "o2");
    ScopedEnv regs("STAGEC_NUM_REGS", "6");
    ScopedEnv json("STAGEC_DIAG_JSON", "");
    CompileEnv e = detectEnv();
    assert(e.optLevel == 2);
    assert(e.numRegs == 6);
    assert(!e.diagJson);
    (void)e;
    std::cout << "[stagec] env detect smoke test passed\n";
}

TEST(PassPipeline, Presets){
    EXPECT_TRUE(ir::pass_pipeline::preset_pipeline(0).empty());
    EXPECT_NE(ir::pass_pipeline::preset_pipeline(1).find("mem2reg"), std::string::npos);
    EXPECT_NE(ir::pass_pipeline::preset_pipeline(2).find("sroa"), std::string::npos);
    EXPECT_EQ(ir::pass_pipeline::preset_pipeline(2).find("gvn"), std::string::npos);
    EXPECT_NE(ir::pass_pipeline::preset_pipeline(3).find("gvn"), std::string::npos);
}

TEST(PassPipeline, O0KeepsLocalsInMemory){
    CompileEnv env;
    env.optLevel = 0;
    auto n = optimize("fib", env);
    EXPECT_EQ(n.allocas, 4);
    EXPECT_GT(n.loads, 0);
}

TEST(PassPipeline, O1PromotesLocals){
    CompileEnv env;
    env.optLevel = 1;
    auto n = optimize("fib", env);
    EXPECT_EQ(n.allocas, 0);
    EXPECT_EQ(n.loads, 0);
    EXPECT_EQ(n.stores, 0);
}

TEST(PassPipeline, CustomPipelineOverridesPreset){
    CompileEnv env;
    env.optLevel = 0;
    env.passPipeline = "function(mem2reg)";
    std::vector<CompileError> warnings;
    auto n = optimize("collatz", env, &warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(n.allocas, 0);
}

TEST(PassPipeline, RejectedPipelineFallsBackToPreset){
    CompileEnv env;
    env.optLevel = 1;
    env.passPipeline = "not-a-valid-pipeline";
    std::vector<CompileError> warnings;
    auto n = optimize("fib", env, &warnings);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].code, "W2001");
    EXPECT_EQ(warnings[0].function, "fib");
    EXPECT_NE(warnings[0].message.find("not-a-valid-pipeline"), std::string::npos);
    EXPECT_EQ(n.allocas, 0); // the O1 preset ran instead
}

TEST(PassPipeline, RejectedPipelineStillCompiles){
    CompileEnv env;
    env.passPipeline = "not-a-valid-pipeline";
    Module m = stagec_test::read_or_fail(stagec_test::kDemoModule);
    CompileContext ctx;
    auto res = compile_module(m, ctx, env);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.warnings.size(), m.functions.size());
    auto r = stagec_test::compile_and_run(stagec_test::kDemoModule, "fib", {10}, env);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value, 55);
}

TEST(PassPipeline, BlockLayoutPutsEntryFirstAndDropsDeadBlocks){
    Module m = stagec_test::read_or_fail("func f params=1\n  local.get 0\n  return\n  label 5\n  i64.const 1\n  return\nend\n");
    llvm::LLVMContext llctx;
    llvm::Module M("f", llctx);
    ErrorReporter rep{};
    CompileContext ctx;
    llvm::Function* F = ir::frontend::build_function(ctx, m, 0, M, rep);
    ASSERT_NE(F, nullptr);
    EXPECT_EQ(F->size(), 2u);
    ir::block_layout::run(*F);
    EXPECT_EQ(F->size(), 1u);
    EXPECT_EQ(F->getEntryBlock().getName(), "entry");
}

TEST(DetectEnv, ReadsVariables){
    ScopedEnv opt("STAGEC_OPT_LEVEL", "O3");
    ScopedEnv pipe("STAGEC_PASS_PIPELINE", "function(dce)");
    ScopedEnv regs("STAGEC_NUM_REGS", "8");
    ScopedEnv seed("STAGEC_VERIFY_SEED", "42");
    ScopedEnv hp("STAGEC_HIGH_PRESSURE_THRESHOLD", "100");
    ScopedEnv stack("STAGEC_STACK_SIZE", "65536");
    ScopedEnv json("STAGEC_DIAG_JSON", "1");
    CompileEnv e = detectEnv();
    EXPECT_EQ(e.optLevel, 3);
    EXPECT_EQ(e.passPipeline, "function(dce)");
    EXPECT_EQ(e.numRegs, 8u);
    ASSERT_TRUE(e.verifySeed.has_value());
    EXPECT_EQ(*e.verifySeed, 42u);
    EXPECT_EQ(e.highPressureThreshold, 100u);
    EXPECT_EQ(e.stackSize, 65536u);
    EXPECT_TRUE(e.diagJson);
}

TEST(DetectEnv, DefaultsAndClamping){
    ScopedEnv opt("STAGEC_OPT_LEVEL", "fast");
    ScopedEnv pipe("STAGEC_PASS_PIPELINE", "");
    ScopedEnv regs("STAGEC_NUM_REGS", "2");
    ScopedEnv seed("STAGEC_VERIFY_SEED", "x42");
    ScopedEnv stack("STAGEC_STACK_SIZE", "100");
    ScopedEnv json("STAGEC_DIAG_JSON", "yes");
    CompileEnv e = detectEnv();
    EXPECT_EQ(e.optLevel, 1);
    EXPECT_TRUE(e.passPipeline.empty());
    EXPECT_EQ(e.numRegs, 4u);
    EXPECT_FALSE(e.verifySeed.has_value());
    EXPECT_EQ(e.stackSize, CompileEnv{}.stackSize);
    EXPECT_FALSE(e.diagJson);

    ScopedEnv many("STAGEC_NUM_REGS", "99");
    EXPECT_EQ(detectEnv().numRegs, 14u);
}
