// Diagnostic gate: build-time switches for stage prints, logging and validators.
#pragma once
#include <cstddef>

// These macros must stay disabled by default. Enable them (CMake options of the same name)
// only while debugging a specific stage.
#ifndef STAGEC_FRONTEND_LOGGING
#define STAGEC_FRONTEND_LOGGING 0
#endif
#ifndef STAGEC_SSA_LOGGING
#define STAGEC_SSA_LOGGING 0
#endif
#ifndef STAGEC_REGALLOC_LOGGING
#define STAGEC_REGALLOC_LOGGING 0
#endif
#ifndef STAGEC_PRINT_SSA
#define STAGEC_PRINT_SSA 0
#endif
#ifndef STAGEC_PRINT_OPTIMIZED_SSA
#define STAGEC_PRINT_OPTIMIZED_SSA 0
#endif
#ifndef STAGEC_PRINT_BLOCK_LAID_OUT_SSA
#define STAGEC_PRINT_BLOCK_LAID_OUT_SSA 0
#endif
#ifndef STAGEC_PRINT_SSA_TO_BACKEND_IR_LOWERING
#define STAGEC_PRINT_SSA_TO_BACKEND_IR_LOWERING 0
#endif
#ifndef STAGEC_PRINT_REGISTER_ALLOCATED
#define STAGEC_PRINT_REGISTER_ALLOCATED 0
#endif
#ifndef STAGEC_PRINT_FINALIZED_MACHINE_CODE
#define STAGEC_PRINT_FINALIZED_MACHINE_CODE 0
#endif
#ifndef STAGEC_PRINT_MACHINE_CODE_HEX_UNMODIFIED
#define STAGEC_PRINT_MACHINE_CODE_HEX_UNMODIFIED 0
#endif
#ifndef STAGEC_PRINT_MACHINE_CODE_HEX_DISASSEMBLABLE
#define STAGEC_PRINT_MACHINE_CODE_HEX_DISASSEMBLABLE 0
#endif
#ifndef STAGEC_DETERMINISTIC_VERIFIER
#define STAGEC_DETERMINISTIC_VERIFIER 0
#endif

// Validations and the stack guard check stay enabled until fuzzing has been clean for long enough.
#ifndef STAGEC_SSA_VALIDATION
#define STAGEC_SSA_VALIDATION 1
#endif
#ifndef STAGEC_REGALLOC_VALIDATION
#define STAGEC_REGALLOC_VALIDATION 1
#endif
#ifndef STAGEC_STACK_GUARD_CHECK
#define STAGEC_STACK_GUARD_CHECK 1
#endif

namespace stagec::diag {

inline constexpr std::size_t kStackGuardPageSize = 8096;
inline constexpr int kDeterministicVerifyingIter = 5;

struct Gate {
    // ----- Debug logging -----
    bool frontEndLogging = false;
    bool ssaLogging = false;
    bool regAllocLogging = false;

    // ----- Output prints -----
    bool printSSA = false;
    bool printOptimizedSSA = false;
    bool printBlockLaidOutSSA = false;
    bool printSSAToBackendIRLowering = false;
    bool printRegisterAllocated = false;
    bool printFinalizedMachineCode = false;
    bool printMachineCodeHexPerFunctionUnmodified = false;
    // Prints the machine code after zeroing call targets so the dump disassembles cleanly.
    // Code finalized this way must not be executed.
    bool printMachineCodeHexPerFunctionDisassemblable = false;

    // ----- Validations -----
    bool ssaValidation = true;
    bool regAllocValidation = true;

    // ----- Stack guard check -----
    bool stackGuardCheck = true;

    // ----- Deterministic compilation verifier -----
    // Expensive; enable when in doubt about compilation determinism.
    bool deterministicVerifier = false;
    int deterministicVerifyingIter = kDeterministicVerifyingIter;

    constexpr bool printMachineCodeHexPerFunction() const {
        return printMachineCodeHexPerFunctionUnmodified || printMachineCodeHexPerFunctionDisassemblable;
    }

    // True when any output is tagged with the current function name.
    constexpr bool needFunctionName() const {
        return printSSA ||
               printOptimizedSSA ||
               printBlockLaidOutSSA ||
               printSSAToBackendIRLowering ||
               printRegisterAllocated ||
               printFinalizedMachineCode ||
               printMachineCodeHexPerFunction() ||
               deterministicVerifier;
    }
};

constexpr Gate build_gate(){
    Gate g{};
    g.frontEndLogging = STAGEC_FRONTEND_LOGGING;
    g.ssaLogging = STAGEC_SSA_LOGGING;
    g.regAllocLogging = STAGEC_REGALLOC_LOGGING;
    g.printSSA = STAGEC_PRINT_SSA;
    g.printOptimizedSSA = STAGEC_PRINT_OPTIMIZED_SSA;
    g.printBlockLaidOutSSA = STAGEC_PRINT_BLOCK_LAID_OUT_SSA;
    g.printSSAToBackendIRLowering = STAGEC_PRINT_SSA_TO_BACKEND_IR_LOWERING;
    g.printRegisterAllocated = STAGEC_PRINT_REGISTER_ALLOCATED;
    g.printFinalizedMachineCode = STAGEC_PRINT_FINALIZED_MACHINE_CODE;
    g.printMachineCodeHexPerFunctionUnmodified = STAGEC_PRINT_MACHINE_CODE_HEX_UNMODIFIED;
    g.printMachineCodeHexPerFunctionDisassemblable = STAGEC_PRINT_MACHINE_CODE_HEX_DISASSEMBLABLE;
    g.ssaValidation = STAGEC_SSA_VALIDATION;
    g.regAllocValidation = STAGEC_REGALLOC_VALIDATION;
    g.stackGuardCheck = STAGEC_STACK_GUARD_CHECK;
    g.deterministicVerifier = STAGEC_DETERMINISTIC_VERIFIER;
    return g;
}

// Process-wide gate, fixed at build time.
inline constexpr Gate kGate = build_gate();

} // namespace stagec::diag
