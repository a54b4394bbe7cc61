#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>

#include "stagec/fatal.hpp"
#include "stagec/ir/context.hpp"
#include "stagec/verifier.hpp"
#include "test_modules.hpp"

using namespace stagec;
using stagec_test::FatalHookGuard;
using stagec_test::FatalIntercepted;

namespace {

const char* const kNames[] = {"f0", "f1", "f2"};

// Drives the verifier the way compile_module does, with `snapshot` producing each stage output.
template<class Snapshot>
void drive(verify::Verifier& v, const CompileContext& base, Snapshot snapshot){
    for(int it = 0; it < v.iterations(); ++it){
        v.beginIteration();
        for(std::size_t i = 0; i < v.functionOrder().size(); ++i){
            std::size_t idx = v.translatedIndex(i);
            auto ctx = base.withFunctionName(kNames[idx]);
            v.recordOrCheck(ctx, "ssa", snapshot(idx));
        }
    }
}

} // namespace

TEST(Verifier, FirstPassKeepsNaturalOrder){
    verify::Verifier v(5, 3, 7);
    v.beginIteration();
    EXPECT_TRUE(v.initialPassDone());
    EXPECT_EQ(v.currentIteration(), 1);
    for(std::size_t i = 0; i < 5; ++i) EXPECT_EQ(v.translatedIndex(i), i);
}

TEST(Verifier, ShuffledPassesArePermutations){
    verify::Verifier v(16, 6, 1234);
    for(int it = 0; it < 6; ++it){
        v.beginIteration();
        auto order = v.functionOrder();
        std::sort(order.begin(), order.end());
        std::vector<std::size_t> expected(16);
        std::iota(expected.begin(), expected.end(), std::size_t{0});
        EXPECT_EQ(order, expected) << "iteration " << v.currentIteration();
    }
}

TEST(Verifier, SameSeedSameOrders){
    verify::Verifier a(10, 4, 99), b(10, 4, 99);
    for(int it = 0; it < 4; ++it){
        a.beginIteration();
        b.beginIteration();
        EXPECT_EQ(a.functionOrder(), b.functionOrder());
    }
    EXPECT_EQ(a.seed(), 99u);
}

TEST(Verifier, RecordThenMatchingCheckIsSilent){
    const diag::Gate g = stagec_test::verifying_gate();
    verify::Verifier v(1, 2, 1);
    auto ctx = CompileContext(g).withVerifier(v).withFunctionName("f0");
    v.beginIteration();
    v.recordOrCheck(ctx, "ssa", "x");
    v.recordOrCheck(ctx, "ssa", "x");
    v.recordOrCheck(ctx, "regalloc", "y");
    EXPECT_EQ(v.snapshotCount(), 2u);
}

TEST(Verifier, StableSnapshotsPassEveryIteration){
    const diag::Gate g = stagec_test::verifying_gate(3);
    verify::Verifier v(3, 3, 5);
    FatalHookGuard hook;
    drive(v, CompileContext(g), [](std::size_t idx){ return std::string(kNames[idx]); });
    EXPECT_EQ(v.currentIteration(), 3);
    EXPECT_EQ(v.snapshotCount(), 3u);
}

TEST(Verifier, LeakingStateIsReportedAtTheSecondIteration){
    const diag::Gate g = stagec_test::verifying_gate(3);
    verify::Verifier v(3, 3, 5);
    FatalHookGuard hook;
    int tick = 0;
    auto snapshot = [&](std::size_t idx){
        if(idx == 1) return "ssa:" + std::to_string(tick++);
        return std::string(kNames[idx]);
    };
    try {
        drive(v, CompileContext(g), snapshot);
        FAIL() << "expected a determinism violation";
    } catch (const FatalIntercepted& e) {
        EXPECT_EQ(e.report.kind, fatal::Kind::DeterminismViolation);
        EXPECT_EQ(verify::snapshot_key(e.report.function, e.report.scope), "f1:ssa");
        EXPECT_EQ(e.report.oldValue, "ssa:0");
        EXPECT_EQ(e.report.newValue, "ssa:1");
        EXPECT_NE(e.report.message.find("BUG: Deterministic compilation failed for function f1"), std::string::npos);
        EXPECT_NE(e.report.message.find("[old]"), std::string::npos);
    }
    EXPECT_EQ(v.currentIteration(), 2);
}

TEST(Verifier, UnboundFunctionNameIsMisuse){
    verify::Verifier v(1, 1, 1);
    v.beginIteration();
    CompileContext ctx; // default gate does not track names
    EXPECT_THROW(v.recordOrCheck(ctx.withFunctionName("f0"), "ssa", "x"), ContextMisuse);
}

TEST(Fatal, KindNamesLeadTheReport){
    EXPECT_STREQ(fatal::kind_name(fatal::Kind::DeterminismViolation), "DeterminismViolation");
    EXPECT_STREQ(fatal::kind_name(fatal::Kind::StackGuardCorruption), "StackGuardCorruption");
}

TEST(VerifierDeathTest, MismatchTerminatesTheProcess){
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_EXIT({
        const diag::Gate g = stagec_test::verifying_gate(2);
        verify::Verifier v(1, 2, 1);
        auto ctx = CompileContext(g).withFunctionName("f0");
        v.beginIteration();
        v.recordOrCheck(ctx, "ssa", "before");
        v.beginIteration();
        v.recordOrCheck(ctx, "ssa", "after");
    }, ::testing::ExitedWithCode(1), "\\[fatal\\] DeterminismViolation.*BUG: Deterministic compilation failed for function f0");
}
