// Front end: stack bytecode -> LLVM SSA.
#pragma once
#include <cstddef>

#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>

#include "stagec/compile_error.hpp"
#include "stagec/ir/context.hpp"
#include "stagec/module.hpp"

namespace stagec::ir::frontend {

inline constexpr uint32_t kMaxParams = 8;
inline constexpr uint32_t kMaxLocals = 4096;

// Declares (or returns the existing declaration of) function `index` in M: i64 (i64 x numParams).
llvm::Function* declare_function(const Module& module, std::size_t index, llvm::Module& M);

// Emits the body of function `index` into M. Locals live in entry-block allocas; the operand stack
// is tracked at compile time. Returns nullptr after reporting into `rep` on malformed bytecode.
llvm::Function* build_function(const CompileContext& ctx, const Module& module, std::size_t index,
                               llvm::Module& M, ErrorReporter& rep);

} // namespace stagec::ir::frontend
