#include "stagec/compiler.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include "stagec/backend/regalloc.hpp"
#include "stagec/diagnostics_json.hpp"
#include "stagec/ir/block_layout.hpp"
#include "stagec/ir/checkpoint.hpp"
#include "stagec/ir/frontend.hpp"
#include "stagec/ir/pass_pipeline.hpp"
#include "stagec/verifier.hpp"

namespace stagec {

namespace {

std::string print_function(const llvm::Function& F){
    std::string s;
    llvm::raw_string_ostream os(s);
    F.print(os);
    return os.str();
}

bool validate_ssa(const llvm::Function& F, const char* after, const std::string& label, ErrorReporter& rep){
    std::string msg;
    llvm::raw_string_ostream os(msg);
    if(!llvm::verifyFunction(F, &os)) return true;
    rep.emit_error(ErrorReporter::make("E3001", std::string("SSA validation failed after ") + after + ": " + os.str(), label));
    return false;
}

} // namespace

Compiler::Compiler(const Module& module, const CompileEnv& env) : module_(module), env_(env) {
    for(std::size_t i = 0; i < module.functions.size(); ++i)
        funcIndex_[function_label(module, i)] = static_cast<uint32_t>(i);
}

void Compiler::reset(){
    lowerer_.reset();
    mfn_ = backend::MFunction{};
}

bool Compiler::compileFunction(const CompileContext& ctx, std::size_t index, backend::CompiledFunction& out,
                               ErrorReporter& rep){
    reset();
    const diag::Gate& gate = ctx.gate();
    const std::string label = function_label(module_, index);
    auto M = std::make_unique<llvm::Module>(label, llctx_);

    llvm::Function* F = ir::frontend::build_function(ctx, module_, index, *M, rep);
    if(!F) return false;
    ir::checkpoint(ctx, gate.printSSA, "ssa", [&]{ return print_function(*F); });
    if(gate.ssaValidation && !validate_ssa(*F, "front end", label, rep)) return false;

    ir::pass_pipeline::run_pass_pipeline(ctx, *M, env_, rep, label);
    ir::checkpoint(ctx, gate.printOptimizedSSA, "optimized-ssa", [&]{ return print_function(*F); });
    if(gate.ssaValidation && !validate_ssa(*F, "optimization", label, rep)) return false;

    ir::block_layout::run(*F);
    ir::checkpoint(ctx, gate.printBlockLaidOutSSA, "block-laid-out-ssa", [&]{ return print_function(*F); });

    if(!lowerer_.lower(*F, funcIndex_, mfn_, rep)) return false;
    ir::checkpoint(ctx, gate.printSSAToBackendIRLowering, "lowered-ssa", [&]{ return backend::to_string(mfn_); });

    backend::regalloc::Options opts;
    opts.numRegs = env_.numRegs;
    opts.highRegisterPressure = ctx.isHighRegisterPressure();
    opts.logging = gate.regAllocLogging;
    backend::regalloc::allocate(mfn_, opts);
    ir::checkpoint(ctx, gate.printRegisterAllocated, "regalloc", [&]{ return backend::to_string(mfn_); });
    if(gate.regAllocValidation){
        if(auto err = backend::regalloc::validate(mfn_, opts.numRegs); !err.empty()){
            rep.emit_error(ErrorReporter::make("E5001", "register allocation validation failed: " + err, label));
            return false;
        }
    }

    out = backend::finalize_function(mfn_, gate.printMachineCodeHexPerFunctionDisassemblable);
    ir::checkpoint(ctx, gate.printFinalizedMachineCode, "finalized", [&]{ return backend::to_string(mfn_); });
    if(gate.printMachineCodeHexPerFunction() || ctx.verifier()){
        const std::string hex = backend::to_hex(out);
        if(gate.printMachineCodeHexPerFunction())
            llvm::errs() << "[stagec] " << label << " machine code (" << out.code.size() << " bytes): " << hex << "\n";
        if(auto* v = ctx.verifier()) v->recordOrCheck(ctx, "machine-code", hex);
    }
    return true;
}

CompileResult compile_module(const Module& module, const CompileContext& base, const CompileEnv& env){
    CompileResult res;
    ErrorReporter rep{&res.errors, &res.warnings};
    const std::size_t n = module.functions.size();
    {
        llvm::StringMap<std::size_t> seen;
        for(std::size_t i = 0; i < n; ++i){
            const std::string label = function_label(module, i);
            if(!seen.try_emplace(label, i).second)
                rep.emit_error(ErrorReporter::make("E1010", "duplicate function name " + label, label));
        }
    }
    if(!res.errors.empty()){
        res.success = false;
        maybe_print_json(res, env);
        return res;
    }

    CompileContext ctx = base;
    if(instruction_count(module) >= env.highPressureThreshold) ctx = ctx.withHighRegisterPressure();
    const diag::Gate& gate = ctx.gate();
    Compiler compiler(module, env);

    // One pass over the module; `v` picks the order when verifying.
    auto runPass = [&](const CompileContext& c, verify::Verifier* v){
        bool ok = true;
        res.module.functions.assign(n, backend::CompiledFunction{});
        for(std::size_t i = 0; i < n; ++i){
            const std::size_t fi = v ? v->translatedIndex(i) : i;
            const CompileContext fctx = c.withFunctionName(function_label(module, fi));
            if(!compiler.compileFunction(fctx, fi, res.module.functions[fi], rep)) ok = false;
        }
        return ok;
    };

    if(gate.deterministicVerifier){
        const int iterations = std::max(1, gate.deterministicVerifyingIter);
        std::optional<verify::Verifier> verifier;
        if(env.verifySeed) verifier.emplace(n, iterations, *env.verifySeed);
        else verifier.emplace(n, iterations);
        const CompileContext vctx = ctx.withVerifier(*verifier);
        for(int it = 0; it < iterations; ++it){
            verifier->beginIteration();
            if(it == 1) rep.warnings = nullptr; // later passes repeat the first pass's warnings
            if(!runPass(vctx, &*verifier)) break; // errors repeat on every pass; report them once
        }
        res.verifiedSnapshots = verifier->snapshotCount();
        if(gate.ssaLogging)
            llvm::errs() << "[stagec] " << module.name << ": " << iterations << " verified passes, "
                         << verifier->snapshotCount() << " snapshots, seed " << verifier->seed() << "\n";
    } else {
        runPass(ctx, nullptr);
    }

    res.success = res.errors.empty();
    res.module.disassemblable = gate.printMachineCodeHexPerFunctionDisassemblable;
    maybe_print_json(res, env);
    return res;
}

} // namespace stagec
