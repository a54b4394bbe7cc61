#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "stagec/compiler.hpp"
#include "stagec/fatal.hpp"
#include "stagec/runtime/executor.hpp"
#include "stagec/text_reader.hpp"

namespace stagec_test {

// fib, fact, max, collatz, pick, bits, ltu, sum8, call8, wide, down
extern const char* const kDemoModule;

stagec::Module read_or_fail(const char* src);
std::size_t index_of(const stagec::Module& m, const std::string& name);

// Compiles `src` with an explicit env (process environment is not consulted) and runs `fn`.
// Compile failures are reported as test failures and return a default (not ok) result.
stagec::runtime::ExecResult compile_and_run(const char* src, const std::string& fn, std::vector<int64_t> args,
                                            const stagec::CompileEnv& env = stagec::CompileEnv{},
                                            const stagec::diag::Gate& gate = stagec::diag::kGate);

// Gate with the deterministic verifier on (and therefore function names tracked).
stagec::diag::Gate verifying_gate(int iterations = stagec::diag::kDeterministicVerifyingIter);

// Thrown by the test fatal hook so a violation can be inspected instead of exiting.
struct FatalIntercepted : std::runtime_error {
    explicit FatalIntercepted(stagec::fatal::Report r) : std::runtime_error(r.message), report(std::move(r)) {}
    stagec::fatal::Report report;
};

// Installs the throwing fatal hook for the lifetime of the guard.
class FatalHookGuard {
public:
    FatalHookGuard();
    ~FatalHookGuard();
};

} // namespace stagec_test
