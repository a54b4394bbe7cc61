// Compile driver: runs every pipeline stage over each function of a module.
#pragma once
#include <cstddef>
#include <memory>
#include <vector>

#include <llvm/ADT/StringMap.h>
#include <llvm/IR/LLVMContext.h>

#include "stagec/backend/finalize.hpp"
#include "stagec/backend/lower.hpp"
#include "stagec/backend/machine_ir.hpp"
#include "stagec/compile_error.hpp"
#include "stagec/ir/context.hpp"
#include "stagec/module.hpp"

namespace stagec {

struct CompileResult {
    bool success = true;
    std::vector<CompileError> errors;
    std::vector<CompileError> warnings;
    backend::CompiledModule module;  // indexed like the source module
    std::size_t verifiedSnapshots = 0; // distinct (function, scope) snapshots held by the verifier
};

// Reusable per-module compiler. One instance compiles every function of one module (and, under the
// deterministic verifier, every pass over it); per-function state is reset between functions, so
// nothing a function leaves behind may reach the next one's output.
class Compiler {
public:
    Compiler(const Module& module, const CompileEnv& env);

    // Front end, SSA validation, optimizer, block layout, lowering, register allocation and
    // finalisation for function `index`. Each stage checkpoints its snapshot through ctx.
    // Returns false after reporting into `rep`.
    bool compileFunction(const CompileContext& ctx, std::size_t index, backend::CompiledFunction& out,
                         ErrorReporter& rep);

    // Symbol name -> function index, shared by the front end and lowering.
    const llvm::StringMap<uint32_t>& functionIndex() const { return funcIndex_; }

private:
    void reset();

    const Module& module_;
    const CompileEnv& env_;
    llvm::LLVMContext llctx_;
    llvm::StringMap<uint32_t> funcIndex_;
    backend::Lowerer lowerer_;
    backend::MFunction mfn_;
};

// Compiles every function of `module`. Marks the context high-register-pressure when the module's
// instruction count reaches env.highPressureThreshold. With the gate's deterministicVerifier on, the
// module is compiled gate.deterministicVerifyingIter times in shuffled function order and every
// snapshot is checked against the first pass (a mismatch is fatal). Output is ordered by function
// index. Function names must be unique (E1010).
CompileResult compile_module(const Module& module, const CompileContext& ctx, const CompileEnv& env);

} // namespace stagec
