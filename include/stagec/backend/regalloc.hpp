// Block-local linear register allocation over MIR.
#pragma once
#include <string>

#include "stagec/backend/machine_ir.hpp"

namespace stagec::backend::regalloc {

struct Options {
    unsigned numRegs = kMaxAllocatableRegs;  // r0..r(numRegs-1) are handed out
    bool highRegisterPressure = false;       // pick the least recently used victim instead of the furthest next use
    bool logging = false;
};

struct Stats {
    unsigned spills = 0;
    unsigned reloads = 0;
    unsigned callSpills = 0;
};

// Assigns physical registers in place. Every vreg lives in a single block (lowering routes
// cross-block values through frame slots), so blocks are allocated independently. Spill slots are
// appended to fn.numSlots. A call clobbers every register; values live across it are spilled first.
// Throws std::invalid_argument when numRegs is outside [kMinAllocatableRegs, kMaxAllocatableRegs].
Stats allocate(MFunction& fn, const Options& opts);

// Re-simulates the allocated code block by block, tracking which vreg each register and slot holds.
// Returns an empty string when consistent, otherwise a description of the first mismatch.
std::string validate(const MFunction& fn, unsigned numRegs);

} // namespace stagec::backend::regalloc
