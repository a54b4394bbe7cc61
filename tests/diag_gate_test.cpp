#include <gtest/gtest.h>

#include "stagec/diag_gate.hpp"

using namespace stagec::diag;

static_assert(kStackGuardPageSize == 8096, "guard page size is part of the runtime contract");
static_assert(!Gate{}.needFunctionName(), "a default gate never tracks function names");
static_assert(kGate.deterministicVerifyingIter == kDeterministicVerifyingIter);

TEST(DiagGate, Defaults){
    constexpr Gate g{};
    EXPECT_FALSE(g.frontEndLogging);
    EXPECT_FALSE(g.ssaLogging);
    EXPECT_FALSE(g.regAllocLogging);
    EXPECT_FALSE(g.printSSA);
    EXPECT_FALSE(g.printMachineCodeHexPerFunction());
    EXPECT_TRUE(g.ssaValidation);
    EXPECT_TRUE(g.regAllocValidation);
    EXPECT_TRUE(g.stackGuardCheck);
    EXPECT_FALSE(g.deterministicVerifier);
    EXPECT_EQ(g.deterministicVerifyingIter, 5);
}

TEST(DiagGate, ProcessGateFollowsBuildMacros){
    EXPECT_EQ(kGate.printSSA, static_cast<bool>(STAGEC_PRINT_SSA));
    EXPECT_EQ(kGate.deterministicVerifier, static_cast<bool>(STAGEC_DETERMINISTIC_VERIFIER));
    EXPECT_EQ(kGate.stackGuardCheck, static_cast<bool>(STAGEC_STACK_GUARD_CHECK));
    EXPECT_EQ(kGate.ssaValidation, static_cast<bool>(STAGEC_SSA_VALIDATION));
}

TEST(DiagGate, HexFlagIsUnionOfBothModes){
    Gate g{};
    g.printMachineCodeHexPerFunctionUnmodified = true;
    EXPECT_TRUE(g.printMachineCodeHexPerFunction());
    g = Gate{};
    g.printMachineCodeHexPerFunctionDisassemblable = true;
    EXPECT_TRUE(g.printMachineCodeHexPerFunction());
}

TEST(DiagGate, EveryPrintFlagNeedsFunctionName){
    bool Gate::*prints[] = {
        &Gate::printSSA, &Gate::printOptimizedSSA, &Gate::printBlockLaidOutSSA,
        &Gate::printSSAToBackendIRLowering, &Gate::printRegisterAllocated, &Gate::printFinalizedMachineCode,
        &Gate::printMachineCodeHexPerFunctionUnmodified, &Gate::printMachineCodeHexPerFunctionDisassemblable,
        &Gate::deterministicVerifier,
    };
    for(auto flag : prints){
        Gate g{};
        g.*flag = true;
        EXPECT_TRUE(g.needFunctionName());
    }
}

TEST(DiagGate, LoggingAndValidationDoNotNeedFunctionName){
    Gate g{};
    g.frontEndLogging = g.ssaLogging = g.regAllocLogging = true;
    g.ssaValidation = g.regAllocValidation = g.stackGuardCheck = true;
    EXPECT_FALSE(g.needFunctionName());
}
