#include "stagec/ir/frontend.hpp"

#include <map>
#include <string>
#include <vector>

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/Support/raw_ostream.h>

namespace stagec::ir::frontend {

llvm::Function* declare_function(const Module& module, std::size_t index, llvm::Module& M){
    const std::string label = function_label(module, index);
    if(auto* F = M.getFunction(label)) return F;
    auto& llctx = M.getContext();
    auto* i64 = llvm::Type::getInt64Ty(llctx);
    std::vector<llvm::Type*> params(module.functions[index].numParams, i64);
    auto* FT = llvm::FunctionType::get(i64, params, false);
    auto* F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, label, &M);
    unsigned i = 0;
    for(auto& a : F->args()) a.setName("p" + std::to_string(i++));
    return F;
}

namespace {

// Per-function emission state. Labels are created detached and inserted when reached, so block
// order follows the bytecode.
struct Emitter {
    const Module& module;
    const FunctionBody& body;
    std::string label;
    llvm::Module& M;
    ErrorReporter& rep;
    llvm::Function* F = nullptr;
    std::map<int64_t, llvm::BasicBlock*> labels;
    std::vector<llvm::AllocaInst*> locals;
    std::vector<llvm::Value*> stack;
    bool failed = false;

    void fail(const char* code, std::string msg, int pc, std::string hint = ""){
        if(failed) return;
        failed = true;
        rep.emit_error(ErrorReporter::make(code, std::move(msg), label, pc, std::move(hint)));
    }

    llvm::Value* pop(int pc){
        if(stack.empty()){
            fail("E1001", "operand stack underflow at " + std::string(opcode_name(body.code[pc].op)), pc);
            return nullptr;
        }
        auto* v = stack.back(); stack.pop_back();
        return v;
    }

    // Drops the half-built body together with label blocks that never got a parent. Inserted
    // blocks die with F; detached ones go only after F is erased, which drops the branches into them.
    void discard(){
        std::vector<llvm::BasicBlock*> detached;
        for(auto& [id, bb] : labels) if(bb && !bb->getParent()) detached.push_back(bb);
        labels.clear();
        if(F) F->eraseFromParent();
        F = nullptr;
        for(auto* bb : detached) delete bb;
    }
};

llvm::CmpInst::Predicate predicate_for(Opcode op){
    switch(op){
        case Opcode::Eq: return llvm::CmpInst::ICMP_EQ;
        case Opcode::Ne: return llvm::CmpInst::ICMP_NE;
        case Opcode::LtS: return llvm::CmpInst::ICMP_SLT;
        case Opcode::LeS: return llvm::CmpInst::ICMP_SLE;
        case Opcode::GtS: return llvm::CmpInst::ICMP_SGT;
        case Opcode::GeS: return llvm::CmpInst::ICMP_SGE;
        case Opcode::LtU: return llvm::CmpInst::ICMP_ULT;
        default: return llvm::CmpInst::ICMP_EQ;
    }
}

} // namespace

llvm::Function* build_function(const CompileContext& ctx, const Module& module, std::size_t index,
                               llvm::Module& M, ErrorReporter& rep){
    const FunctionBody& body = module.functions[index];
    Emitter E{module, body, function_label(module, index), M, rep};
    if(body.numParams > kMaxParams){
        E.fail("E1006", "function takes " + std::to_string(body.numParams) + " parameters", -1,
               "at most " + std::to_string(kMaxParams) + " parameters are supported");
        return nullptr;
    }
    if(body.numLocals > kMaxLocals){
        E.fail("E1011", "function declares " + std::to_string(body.numLocals) + " locals", -1,
               "at most " + std::to_string(kMaxLocals) + " locals are supported");
        return nullptr;
    }
    // Labels and branch targets are validated up front so forward branches can be emitted directly.
    for(std::size_t pc = 0; pc < body.code.size(); ++pc){
        const Instr& in = body.code[pc];
        if(in.op == Opcode::Label && !E.labels.emplace(in.imm, nullptr).second){
            E.fail("E1009", "duplicate label " + std::to_string(in.imm), static_cast<int>(pc));
            return nullptr;
        }
    }
    for(std::size_t pc = 0; pc < body.code.size(); ++pc){
        const Instr& in = body.code[pc];
        if((in.op == Opcode::Br || in.op == Opcode::BrIf) && !E.labels.count(in.imm)){
            E.fail("E1003", "unknown label " + std::to_string(in.imm), static_cast<int>(pc));
            return nullptr;
        }
    }

    auto& llctx = M.getContext();
    auto* i64 = llvm::Type::getInt64Ty(llctx);
    for(auto& [id, bb] : E.labels) bb = llvm::BasicBlock::Create(llctx, "L" + std::to_string(id));

    E.F = declare_function(module, index, M);
    auto* entry = llvm::BasicBlock::Create(llctx, "entry", E.F);
    llvm::IRBuilder<> B(entry);
    const uint32_t nlocals = body.numParams + body.numLocals;
    for(uint32_t i = 0; i < nlocals; ++i)
        E.locals.push_back(B.CreateAlloca(i64, nullptr, "l" + std::to_string(i)));
    for(uint32_t i = 0; i < nlocals; ++i){
        llvm::Value* init = i < body.numParams ? static_cast<llvm::Value*>(E.F->getArg(i)) : llvm::ConstantInt::get(i64, 0);
        B.CreateStore(init, E.locals[i]);
    }

    bool terminated = false;
    for(std::size_t upc = 0; upc < body.code.size() && !E.failed; ++upc){
        const int pc = static_cast<int>(upc);
        const Instr& in = body.code[upc];
        if(terminated && in.op != Opcode::Label){
            E.fail("E1004", std::string("unreachable ") + opcode_name(in.op) + " after a terminator", pc,
                   "start a new block with a label");
            break;
        }
        switch(in.op){
            case Opcode::Const:
                E.stack.push_back(llvm::ConstantInt::get(i64, static_cast<uint64_t>(in.imm), true));
                break;
            case Opcode::LocalGet:
            case Opcode::LocalSet:
            case Opcode::LocalTee: {
                if(in.imm < 0 || static_cast<uint64_t>(in.imm) >= nlocals){
                    E.fail("E1007", "local index " + std::to_string(in.imm) + " out of range", pc);
                    break;
                }
                auto* slot = E.locals[static_cast<std::size_t>(in.imm)];
                if(in.op == Opcode::LocalGet){ E.stack.push_back(B.CreateLoad(i64, slot)); break; }
                auto* v = E.pop(pc); if(!v) break;
                B.CreateStore(v, slot);
                if(in.op == Opcode::LocalTee) E.stack.push_back(v);
                break;
            }
            case Opcode::Add: case Opcode::Sub: case Opcode::Mul:
            case Opcode::And: case Opcode::Or: case Opcode::Xor:
            case Opcode::Shl: case Opcode::ShrS: case Opcode::ShrU: {
                auto* rhs = E.pop(pc); if(!rhs) break;
                auto* lhs = E.pop(pc); if(!lhs) break;
                llvm::Value* r = nullptr;
                switch(in.op){
                    case Opcode::Add: r = B.CreateAdd(lhs, rhs); break;
                    case Opcode::Sub: r = B.CreateSub(lhs, rhs); break;
                    case Opcode::Mul: r = B.CreateMul(lhs, rhs); break;
                    case Opcode::And: r = B.CreateAnd(lhs, rhs); break;
                    case Opcode::Or: r = B.CreateOr(lhs, rhs); break;
                    case Opcode::Xor: r = B.CreateXor(lhs, rhs); break;
                    // shift counts are taken modulo 64
                    case Opcode::Shl: r = B.CreateShl(lhs, B.CreateAnd(rhs, 63)); break;
                    case Opcode::ShrS: r = B.CreateAShr(lhs, B.CreateAnd(rhs, 63)); break;
                    default: r = B.CreateLShr(lhs, B.CreateAnd(rhs, 63)); break;
                }
                E.stack.push_back(r);
                break;
            }
            case Opcode::Eq: case Opcode::Ne: case Opcode::LtS: case Opcode::LeS:
            case Opcode::GtS: case Opcode::GeS: case Opcode::LtU: {
                auto* rhs = E.pop(pc); if(!rhs) break;
                auto* lhs = E.pop(pc); if(!lhs) break;
                E.stack.push_back(B.CreateZExt(B.CreateICmp(predicate_for(in.op), lhs, rhs), i64));
                break;
            }
            case Opcode::Eqz: {
                auto* v = E.pop(pc); if(!v) break;
                E.stack.push_back(B.CreateZExt(B.CreateICmpEQ(v, llvm::ConstantInt::get(i64, 0)), i64));
                break;
            }
            case Opcode::Label: {
                if(!E.stack.empty()){ E.fail("E1002", "operand stack not empty at label", pc); break; }
                auto* bb = E.labels[in.imm];
                if(!terminated) B.CreateBr(bb);
                bb->insertInto(E.F);
                B.SetInsertPoint(bb);
                terminated = false;
                break;
            }
            case Opcode::Br:
                if(!E.stack.empty()){ E.fail("E1002", "operand stack not empty at br", pc); break; }
                B.CreateBr(E.labels[in.imm]);
                terminated = true;
                break;
            case Opcode::BrIf: {
                auto* c = E.pop(pc); if(!c) break;
                if(!E.stack.empty()){ E.fail("E1002", "operand stack not empty at br_if", pc); break; }
                auto* cont = llvm::BasicBlock::Create(llctx, "c" + std::to_string(pc), E.F);
                B.CreateCondBr(B.CreateICmpNE(c, llvm::ConstantInt::get(i64, 0)), E.labels[in.imm], cont);
                B.SetInsertPoint(cont);
                break;
            }
            case Opcode::Call: {
                if(in.imm < 0 || static_cast<uint64_t>(in.imm) >= module.functions.size()){
                    E.fail("E1008", "call target " + std::to_string(in.imm) + " out of range", pc);
                    break;
                }
                const auto callee = static_cast<std::size_t>(in.imm);
                if(module.functions[callee].numParams > kMaxParams){
                    E.fail("E1006", "callee " + function_label(module, callee) + " takes too many parameters", pc);
                    break;
                }
                std::vector<llvm::Value*> args(module.functions[callee].numParams);
                for(std::size_t k = args.size(); k-- > 0; ){
                    args[k] = E.pop(pc);
                    if(!args[k]) break;
                }
                if(E.failed) break;
                E.stack.push_back(B.CreateCall(declare_function(module, callee, M), args));
                break;
            }
            case Opcode::Drop:
                E.pop(pc);
                break;
            case Opcode::Return: {
                auto* v = E.pop(pc); if(!v) break;
                B.CreateRet(v);
                E.stack.clear();
                terminated = true;
                break;
            }
            case Opcode::Unreachable:
                B.CreateUnreachable();
                E.stack.clear();
                terminated = true;
                break;
        }
    }
    if(!E.failed && !terminated)
        E.fail("E1005", "function does not end with return", static_cast<int>(body.code.size()),
               "the last instruction of a function must be return, br or unreachable");
    if(E.failed){ E.discard(); return nullptr; }

    if(ctx.gate().frontEndLogging)
        llvm::errs() << "[frontend] " << E.label << ": " << body.code.size() << " instrs, "
                     << E.F->size() << " blocks, " << nlocals << " locals\n";
    return E.F;
}

} // namespace stagec::ir::frontend
