#pragma once
#include <string>

#include <llvm/IR/Module.h>

#include "stagec/compile_error.hpp"
#include "stagec/ir/context.hpp"

namespace stagec::ir::pass_pipeline {

// Preset pipeline text for an optimisation level; empty for 0. Presets only contain passes whose
// output the backend lowers (no vectorisation, no lookup tables, no intrinsics).
std::string preset_pipeline(int optLevel);

// Runs the SSA optimizer over M:
//   env.passPipeline textual new-PM pipeline overrides the preset when non-empty
//   env.optLevel (0/1/2/3) selects the preset otherwise
// A custom pipeline that fails to parse is reported as warning W2001 and the preset runs instead.
void run_pass_pipeline(const CompileContext& ctx, llvm::Module& M, const CompileEnv& env,
                       ErrorReporter& rep, const std::string& function);

} // namespace stagec::ir::pass_pipeline
