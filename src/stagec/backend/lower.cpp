#include "stagec/backend/lower.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <llvm/IR/CFG.h>
#include <llvm/IR/Constants.h>
#include <llvm/Support/raw_ostream.h>

namespace stagec::backend {

namespace {

// Use of a value outside its block. A phi operand counts as a use at the end of the incoming block.
bool used_outside(const llvm::Instruction& I){
    for(const llvm::Use& U : I.uses()){
        auto* user = llvm::cast<llvm::Instruction>(U.getUser());
        const llvm::BasicBlock* where = user->getParent();
        if(auto* phi = llvm::dyn_cast<llvm::PHINode>(user)) where = phi->getIncomingBlock(U);
        if(where != I.getParent()) return true;
    }
    return false;
}

bool cond_for(llvm::CmpInst::Predicate p, Cond& out){
    switch(p){
        case llvm::CmpInst::ICMP_EQ: out = Cond::Eq; return true;
        case llvm::CmpInst::ICMP_NE: out = Cond::Ne; return true;
        case llvm::CmpInst::ICMP_SLT: out = Cond::Lt; return true;
        case llvm::CmpInst::ICMP_SLE: out = Cond::Le; return true;
        case llvm::CmpInst::ICMP_SGT: out = Cond::Gt; return true;
        case llvm::CmpInst::ICMP_SGE: out = Cond::Ge; return true;
        case llvm::CmpInst::ICMP_ULT: out = Cond::Ult; return true;
        case llvm::CmpInst::ICMP_ULE: out = Cond::Ule; return true;
        case llvm::CmpInst::ICMP_UGT: out = Cond::Ugt; return true;
        case llvm::CmpInst::ICMP_UGE: out = Cond::Uge; return true;
        default: return false;
    }
}

bool is_i1(const llvm::Value* v){ return v->getType()->isIntegerTy(1); }

} // namespace

void Lowerer::reset(){
    funcIndex_ = nullptr;
    fn_ = nullptr;
    cur_ = nullptr;
    rep_ = nullptr;
    label_.clear();
    failed_ = false;
    blockIndex_.clear();
    slotOf_.clear();
    local_.clear();
}

bool Lowerer::fail(const char* code, std::string msg){
    if(!failed_) rep_->emit_error(ErrorReporter::make(code, std::move(msg), label_));
    failed_ = true;
    return false;
}

bool Lowerer::checkType(const llvm::Value* v){
    llvm::Type* t = v->getType();
    if(t->isVoidTy() || t->isIntegerTy(64) || t->isIntegerTy(1)) return true;
    std::string ty; llvm::raw_string_ostream os(ty); t->print(os);
    return fail("E4002", "unsupported type " + os.str());
}

void Lowerer::emit(MOpcode opc, std::vector<MOperand> ops){
    cur_->instrs.push_back(MInstr{opc, std::move(ops)});
}

void Lowerer::define(const llvm::Value* v, uint32_t vreg){
    local_[v] = vreg;
    if(auto it = slotOf_.find(v); it != slotOf_.end())
        emit(MOpcode::StSlot, {MOperand::reg(vreg), MOperand::slot(it->second)});
}

bool Lowerer::assignSlots(const llvm::Function& F){
    for(auto& BB : F){
        for(auto& I : BB){
            if(auto* AI = llvm::dyn_cast<llvm::AllocaInst>(&I)){
                if(!AI->getAllocatedType()->isIntegerTy(64) || AI->isArrayAllocation())
                    return fail("E4002", "stack slot " + AI->getName().str() + " is not a single i64");
                for(const llvm::User* U : AI->users()){
                    if(auto* LI = llvm::dyn_cast<llvm::LoadInst>(U); LI && LI->getPointerOperand() == AI) continue;
                    if(auto* SI = llvm::dyn_cast<llvm::StoreInst>(U); SI && SI->getPointerOperand() == AI && SI->getValueOperand() != AI) continue;
                    return fail("E4003", "address of stack slot " + AI->getName().str() + " escapes");
                }
                slotOf_[AI] = fn_->newSlot();
                continue;
            }
            if(!checkType(&I)) return false;
            if(llvm::isa<llvm::PHINode>(I) || (!I.getType()->isVoidTy() && used_outside(I)))
                slotOf_[&I] = fn_->newSlot();
        }
    }
    return true;
}

uint32_t Lowerer::materializeConstant(const llvm::Constant* c){
    int64_t value = 0;
    if(auto* ci = llvm::dyn_cast<llvm::ConstantInt>(c)){
        // i1 values are kept as 0/1
        value = ci->getBitWidth() == 1 ? static_cast<int64_t>(ci->getZExtValue()) : ci->getSExtValue();
    } else if(!llvm::isa<llvm::UndefValue>(c)){
        fail("E4001", "unsupported constant operand");
    }
    uint32_t r = fn_->newVReg();
    emit(MOpcode::MovRI, {MOperand::reg(r), MOperand::immediate(value)});
    return r;
}

uint32_t Lowerer::use(const llvm::Value* v){
    if(auto* c = llvm::dyn_cast<llvm::Constant>(v)) return materializeConstant(c);
    if(auto it = local_.find(v); it != local_.end()) return it->second;
    if(auto* a = llvm::dyn_cast<llvm::Argument>(v)){
        uint32_t r = fn_->newVReg();
        emit(MOpcode::LdArg, {MOperand::reg(r), MOperand::immediate(a->getArgNo())});
        local_[v] = r;
        return r;
    }
    if(auto it = slotOf_.find(v); it != slotOf_.end()){
        uint32_t r = fn_->newVReg();
        emit(MOpcode::LdSlot, {MOperand::reg(r), MOperand::slot(it->second)});
        local_[v] = r;
        return r;
    }
    throw std::logic_error("lowering " + label_ + ": value used before its definition in block " + cur_->name);
}

bool Lowerer::lowerInstruction(const llvm::Instruction& I){
    switch(I.getOpcode()){
        case llvm::Instruction::Alloca:
            return true;
        case llvm::Instruction::Add: case llvm::Instruction::Sub: case llvm::Instruction::Mul:
        case llvm::Instruction::And: case llvm::Instruction::Or: case llvm::Instruction::Xor:
        case llvm::Instruction::Shl: case llvm::Instruction::AShr: case llvm::Instruction::LShr: {
            MOpcode opc = MOpcode::Add;
            switch(I.getOpcode()){
                case llvm::Instruction::Sub: opc = MOpcode::Sub; break;
                case llvm::Instruction::Mul: opc = MOpcode::Mul; break;
                case llvm::Instruction::And: opc = MOpcode::And; break;
                case llvm::Instruction::Or: opc = MOpcode::Or; break;
                case llvm::Instruction::Xor: opc = MOpcode::Xor; break;
                case llvm::Instruction::Shl: opc = MOpcode::Shl; break;
                case llvm::Instruction::AShr: opc = MOpcode::ShrS; break;
                case llvm::Instruction::LShr: opc = MOpcode::ShrU; break;
                default: break;
            }
            uint32_t a = use(I.getOperand(0));
            uint32_t b = use(I.getOperand(1));
            uint32_t r = fn_->newVReg();
            emit(opc, {MOperand::reg(r), MOperand::reg(a), MOperand::reg(b)});
            if(is_i1(&I) && opc != MOpcode::And && opc != MOpcode::Or && opc != MOpcode::Xor){
                uint32_t one = fn_->newVReg();
                emit(MOpcode::MovRI, {MOperand::reg(one), MOperand::immediate(1)});
                uint32_t n = fn_->newVReg();
                emit(MOpcode::And, {MOperand::reg(n), MOperand::reg(r), MOperand::reg(one)});
                r = n;
            }
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::ICmp: {
            auto& cmp = llvm::cast<llvm::ICmpInst>(I);
            Cond c;
            if(!cond_for(cmp.getPredicate(), c)) return fail("E4001", "unsupported icmp predicate");
            if(cmp.isSigned() && is_i1(cmp.getOperand(0))) return fail("E4002", "signed comparison of i1 values");
            uint32_t a = use(cmp.getOperand(0));
            uint32_t b = use(cmp.getOperand(1));
            uint32_t r = fn_->newVReg();
            emit(MOpcode::CmpSet, {MOperand::reg(r), MOperand::reg(a), MOperand::reg(b), MOperand::cond(c)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::Select: {
            auto& sel = llvm::cast<llvm::SelectInst>(I);
            uint32_t c = use(sel.getCondition());
            uint32_t t = use(sel.getTrueValue());
            uint32_t f = use(sel.getFalseValue());
            uint32_t r = fn_->newVReg();
            emit(MOpcode::Select, {MOperand::reg(r), MOperand::reg(c), MOperand::reg(t), MOperand::reg(f)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::ZExt:
        case llvm::Instruction::Freeze: {
            uint32_t s = use(I.getOperand(0));
            uint32_t r = fn_->newVReg();
            emit(MOpcode::MovRR, {MOperand::reg(r), MOperand::reg(s)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::SExt: {
            // i1 -> i64: 0 - x
            uint32_t s = use(I.getOperand(0));
            uint32_t z = fn_->newVReg();
            emit(MOpcode::MovRI, {MOperand::reg(z), MOperand::immediate(0)});
            uint32_t r = fn_->newVReg();
            emit(MOpcode::Sub, {MOperand::reg(r), MOperand::reg(z), MOperand::reg(s)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::Trunc: {
            uint32_t s = use(I.getOperand(0));
            uint32_t one = fn_->newVReg();
            emit(MOpcode::MovRI, {MOperand::reg(one), MOperand::immediate(1)});
            uint32_t r = fn_->newVReg();
            emit(MOpcode::And, {MOperand::reg(r), MOperand::reg(s), MOperand::reg(one)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::Load: {
            auto& LI = llvm::cast<llvm::LoadInst>(I);
            auto* AI = llvm::dyn_cast<llvm::AllocaInst>(LI.getPointerOperand());
            auto it = AI ? slotOf_.find(AI) : slotOf_.end();
            if(it == slotOf_.end()) return fail("E4003", "load through a pointer that is not a stack slot");
            uint32_t r = fn_->newVReg();
            emit(MOpcode::LdSlot, {MOperand::reg(r), MOperand::slot(it->second)});
            define(&I, r);
            return !failed_;
        }
        case llvm::Instruction::Store: {
            auto& SI = llvm::cast<llvm::StoreInst>(I);
            auto* AI = llvm::dyn_cast<llvm::AllocaInst>(SI.getPointerOperand());
            auto it = AI ? slotOf_.find(AI) : slotOf_.end();
            if(it == slotOf_.end()) return fail("E4003", "store through a pointer that is not a stack slot");
            uint32_t v = use(SI.getValueOperand());
            emit(MOpcode::StSlot, {MOperand::reg(v), MOperand::slot(it->second)});
            return !failed_;
        }
        case llvm::Instruction::Call: {
            auto& CI = llvm::cast<llvm::CallInst>(I);
            const llvm::Function* callee = CI.getCalledFunction();
            if(!callee || callee->isIntrinsic()) return fail("E4001", "unsupported call (indirect or intrinsic)");
            auto idx = funcIndex_->find(callee->getName());
            if(idx == funcIndex_->end()) return fail("E4001", "call to unknown function " + callee->getName().str());
            const unsigned n = CI.arg_size();
            for(unsigned k = 0; k < n; ++k){
                uint32_t a = use(CI.getArgOperand(k));
                emit(MOpcode::StArg, {MOperand::reg(a), MOperand::immediate(k)});
            }
            fn_->maxOutgoingArgs = std::max(fn_->maxOutgoingArgs, n);
            uint32_t r = fn_->newVReg();
            emit(MOpcode::Call, {MOperand::reg(r), MOperand::func(idx->second)});
            define(&I, r);
            return !failed_;
        }
        default:
            return fail("E4001", std::string("unsupported instruction ") + I.getOpcodeName());
    }
}

void Lowerer::emitPhiCopies(const llvm::BasicBlock* from){
    std::vector<const llvm::BasicBlock*> succs;
    for(const llvm::BasicBlock* s : llvm::successors(from))
        if(std::find(succs.begin(), succs.end(), s) == succs.end()) succs.push_back(s);
    std::vector<std::pair<uint32_t, const llvm::Value*>> copies;
    for(const llvm::BasicBlock* s : succs)
        for(const llvm::PHINode& phi : s->phis())
            copies.emplace_back(slotOf_.lookup(&phi), phi.getIncomingValueForBlock(from));
    // parallel copy: read every incoming value before any phi slot is overwritten
    std::vector<uint32_t> regs;
    regs.reserve(copies.size());
    for(auto& [slot, v] : copies) regs.push_back(use(v));
    for(std::size_t i = 0; i < copies.size(); ++i)
        emit(MOpcode::StSlot, {MOperand::reg(regs[i]), MOperand::slot(copies[i].first)});
}

bool Lowerer::lowerTerminator(const llvm::Instruction& T){
    const llvm::BasicBlock* BB = T.getParent();
    if(auto* RI = llvm::dyn_cast<llvm::ReturnInst>(&T)){
        if(!RI->getReturnValue()) return fail("E4002", "function returns void");
        uint32_t r = use(RI->getReturnValue());
        emit(MOpcode::Ret, {MOperand::reg(r)});
        return !failed_;
    }
    if(auto* BI = llvm::dyn_cast<llvm::BranchInst>(&T)){
        if(BI->isUnconditional()){
            emitPhiCopies(BB);
            emit(MOpcode::Jmp, {MOperand::block(blockIndex_.lookup(BI->getSuccessor(0)))});
            return !failed_;
        }
        uint32_t c = use(BI->getCondition());
        emitPhiCopies(BB);
        emit(MOpcode::JmpNZ, {MOperand::reg(c), MOperand::block(blockIndex_.lookup(BI->getSuccessor(0)))});
        emit(MOpcode::Jmp, {MOperand::block(blockIndex_.lookup(BI->getSuccessor(1)))});
        return !failed_;
    }
    if(auto* SI = llvm::dyn_cast<llvm::SwitchInst>(&T)){
        // compare chain in case order, default last
        uint32_t c = use(SI->getCondition());
        emitPhiCopies(BB);
        for(auto& cs : SI->cases()){
            uint32_t k = fn_->newVReg();
            emit(MOpcode::MovRI, {MOperand::reg(k), MOperand::immediate(cs.getCaseValue()->getSExtValue())});
            uint32_t t = fn_->newVReg();
            emit(MOpcode::CmpSet, {MOperand::reg(t), MOperand::reg(c), MOperand::reg(k), MOperand::cond(Cond::Eq)});
            emit(MOpcode::JmpNZ, {MOperand::reg(t), MOperand::block(blockIndex_.lookup(cs.getCaseSuccessor()))});
        }
        emit(MOpcode::Jmp, {MOperand::block(blockIndex_.lookup(SI->getDefaultDest()))});
        return !failed_;
    }
    if(llvm::isa<llvm::UnreachableInst>(T)){
        emit(MOpcode::Trap, {MOperand::immediate(static_cast<int64_t>(TrapCode::Unreachable))});
        return true;
    }
    return fail("E4001", std::string("unsupported terminator ") + T.getOpcodeName());
}

bool Lowerer::lower(const llvm::Function& F, const llvm::StringMap<uint32_t>& funcIndex, MFunction& out,
                    ErrorReporter& rep){
    reset();
    funcIndex_ = &funcIndex;
    rep_ = &rep;
    fn_ = &out;
    out = MFunction{};
    out.name = F.getName().str();
    out.numParams = static_cast<uint32_t>(F.arg_size());
    label_ = out.name;

    uint32_t i = 0;
    for(auto& BB : F){
        blockIndex_[&BB] = i;
        out.blocks.push_back(MBlock{BB.hasName() ? BB.getName().str() : "bb" + std::to_string(i), {}});
        ++i;
    }
    if(!assignSlots(F)) return false;

    i = 0;
    for(auto& BB : F){
        cur_ = &out.blocks[i++];
        local_.clear();
        for(auto& I : BB){
            if(llvm::isa<llvm::PHINode>(I)) continue;
            const bool ok = I.isTerminator() ? lowerTerminator(I) : lowerInstruction(I);
            if(!ok) return false;
        }
    }
    return true;
}

} // namespace stagec::backend
