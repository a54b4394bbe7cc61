#include "stagec/ir/pass_pipeline.hpp"
#include <string>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace stagec::ir::pass_pipeline {

std::string preset_pipeline(int optLevel){
    switch(optLevel){
        case 0: return {};
        case 1: return "function(mem2reg,instsimplify,dce)";
        case 2: return "function(sroa,early-cse,simplifycfg,instsimplify,adce)";
        default: return "function(sroa,early-cse,gvn,simplifycfg,instsimplify,adce)";
    }
}

void run_pass_pipeline(const CompileContext& ctx, llvm::Module& M, const CompileEnv& env,
                       ErrorReporter& rep, const std::string& function){
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);

    const bool log = ctx.gate().ssaLogging;
    if(!env.passPipeline.empty()){
        llvm::ModulePassManager MPM;
        if(auto Err = PB.parsePassPipeline(MPM, env.passPipeline)){
            std::string msg = llvm::toString(std::move(Err));
            rep.emit_warning(ErrorReporter::make("W2001", "pass pipeline '" + env.passPipeline + "' rejected: " + msg,
                                                 function, -1, "falling back to the preset pipeline"));
        } else {
            if(log) llvm::errs() << "[ssa] " << function << ": running custom pipeline " << env.passPipeline << "\n";
            MPM.run(M, MAM);
            return;
        }
    }
    const std::string preset = preset_pipeline(env.optLevel);
    if(preset.empty()) return; // leave unoptimized
    llvm::ModulePassManager MPM;
    if(auto Err = PB.parsePassPipeline(MPM, preset)){
        // presets are fixed strings; a failure here means the LLVM build lacks one of the passes
        rep.emit_warning(ErrorReporter::make("W2001", "preset pipeline rejected: " + llvm::toString(std::move(Err)),
                                             function));
        return;
    }
    if(log) llvm::errs() << "[ssa] " << function << ": running preset O" << env.optLevel << " " << preset << "\n";
    MPM.run(M, MAM);
}

} // namespace stagec::ir::pass_pipeline
