// Executes finalised code of the virtual target on a GuardedStack.
#pragma once
#include <cstddef>
#include <cstdint>

#include <llvm/ADT/ArrayRef.h>

#include "stagec/backend/finalize.hpp"
#include "stagec/diag_gate.hpp"
#include "stagec/runtime/stack_guard.hpp"

namespace stagec::runtime {

enum class Trap : uint8_t { None, StackOverflow, Unreachable, MemoryFault, FuelExhausted, BadInstruction };

const char* trap_name(Trap t);

struct ExecResult {
    bool ok = false;
    int64_t value = 0;
    Trap trap = Trap::None;
};

inline constexpr uint64_t kDefaultFuel = 10'000'000;
// saved fp + return address pushed by every call
inline constexpr std::size_t kCallFrameBytes = 16;

// Frame layout, stack growing down:
//   [fp + 16 + 8k]  incoming argument k
//   [fp + 8]        return address
//   [fp]            saved fp
//   [fp - 8(s+1)]   slot s
//   [sp + 8k]       outgoing argument k
// Enter N traps StackOverflow unless N bytes plus one call frame fit above the guard page, so
// well-formed code never writes into the guard.
class Executor {
public:
    // Throws std::invalid_argument for a disassemblable module. The gate must outlive the executor.
    Executor(const backend::CompiledModule& module, GuardedStack& stack, const diag::Gate& gate = diag::kGate);
    Executor(const backend::CompiledModule&, GuardedStack&, const diag::Gate&&) = delete;

    void setFuel(uint64_t fuel){ fuel_ = fuel; }

    // Runs function `index` to completion. Throws std::out_of_range for a bad index and
    // std::invalid_argument for an argument count mismatch. With the gate's stackGuardCheck on, the
    // guard page is checked after the run.
    ExecResult invoke(std::size_t index, llvm::ArrayRef<int64_t> args);

private:
    ExecResult run(std::size_t index, llvm::ArrayRef<int64_t> args);
    bool load(int64_t addr, int64_t& out) const;
    bool store(int64_t addr, int64_t value);

    const backend::CompiledModule& module_;
    GuardedStack& stack_;
    const diag::Gate* gate_;
    uint64_t fuel_ = kDefaultFuel;
    int64_t regs_[backend::kNumPhysRegs] = {};
};

} // namespace stagec::runtime
