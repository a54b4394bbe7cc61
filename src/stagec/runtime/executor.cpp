#include "stagec/runtime/executor.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace stagec::runtime {

using backend::MOpcode;

namespace {
constexpr int64_t kReturnToHost = -1;
constexpr int64_t kFrame = static_cast<int64_t>(kCallFrameBytes);

ExecResult trapped(Trap t){ ExecResult r; r.trap = t; return r; }

bool compare(backend::Cond c, int64_t x, int64_t y){
    const auto ux = static_cast<uint64_t>(x), uy = static_cast<uint64_t>(y);
    switch(c){
        case backend::Cond::Eq: return x == y;
        case backend::Cond::Ne: return x != y;
        case backend::Cond::Lt: return x < y;
        case backend::Cond::Le: return x <= y;
        case backend::Cond::Gt: return x > y;
        case backend::Cond::Ge: return x >= y;
        case backend::Cond::Ult: return ux < uy;
        case backend::Cond::Ule: return ux <= uy;
        case backend::Cond::Ugt: return ux > uy;
        case backend::Cond::Uge: return ux >= uy;
    }
    return false;
}
} // namespace

const char* trap_name(Trap t){
    switch(t){
        case Trap::None: return "none";
        case Trap::StackOverflow: return "stack overflow";
        case Trap::Unreachable: return "unreachable";
        case Trap::MemoryFault: return "memory fault";
        case Trap::FuelExhausted: return "fuel exhausted";
        case Trap::BadInstruction: return "bad instruction";
    }
    return "?";
}

Executor::Executor(const backend::CompiledModule& module, GuardedStack& stack, const diag::Gate& gate)
    : module_(module), stack_(stack), gate_(&gate) {
    if(module.disassemblable)
        throw std::invalid_argument("module was finalized for disassembly (call targets zeroed) and cannot run");
}

bool Executor::load(int64_t addr, int64_t& out) const {
    if(addr < 0 || static_cast<uint64_t>(addr) + 8 > stack_.size()) return false;
    std::memcpy(&out, stack_.data() + addr, 8);
    return true;
}

bool Executor::store(int64_t addr, int64_t value){
    if(addr < 0 || static_cast<uint64_t>(addr) + 8 > stack_.size()) return false;
    std::memcpy(stack_.data() + addr, &value, 8);
    return true;
}

ExecResult Executor::invoke(std::size_t index, llvm::ArrayRef<int64_t> args){
    if(index >= module_.functions.size())
        throw std::out_of_range("function index " + std::to_string(index) + " out of range");
    const auto& f = module_.functions[index];
    if(args.size() != f.numParams)
        throw std::invalid_argument(f.name + " expects " + std::to_string(f.numParams) + " arguments, got " +
                                    std::to_string(args.size()));
    std::fill(std::begin(regs_), std::end(regs_), 0);
    ExecResult r = run(index, args);
    if(gate_->stackGuardCheck) stack_.check();
    return r;
}

ExecResult Executor::run(std::size_t index, llvm::ArrayRef<int64_t> args){
    const int64_t limit = static_cast<int64_t>(stack_.stackLimit());
    int64_t sp = static_cast<int64_t>(stack_.stackTop());
    int64_t fp = 0;
    if(sp - static_cast<int64_t>(8 * args.size()) - kFrame < limit) return trapped(Trap::StackOverflow);
    sp -= static_cast<int64_t>(8 * args.size());
    for(std::size_t k = 0; k < args.size(); ++k) store(sp + 8 * static_cast<int64_t>(k), args[k]);
    sp -= kFrame;
    store(sp, 0);
    store(sp + 8, kReturnToHost);

    const backend::CompiledFunction* f = &module_.functions[index];
    std::size_t pc = 0;
    uint64_t fuel = fuel_;
    int64_t* R = regs_;
    for(;;){
        if(fuel-- == 0) return trapped(Trap::FuelExhausted);
        if(pc + backend::kInstrSize > f->code.size()) return trapped(Trap::BadInstruction);
        const backend::DecodedInstr in = backend::decode(&f->code[pc]);
        pc += backend::kInstrSize;
        if(in.a >= backend::kNumPhysRegs || in.b >= backend::kNumPhysRegs || in.c >= backend::kNumPhysRegs)
            return trapped(Trap::BadInstruction);
        switch(in.opc){
            case MOpcode::Enter:
                fp = sp;
                if(in.imm < 0 || sp - in.imm - kFrame < limit) return trapped(Trap::StackOverflow);
                sp -= in.imm;
                break;
            case MOpcode::MovRR: R[in.a] = R[in.b]; break;
            case MOpcode::MovRI: R[in.a] = in.imm; break;
            case MOpcode::Add: R[in.a] = static_cast<int64_t>(static_cast<uint64_t>(R[in.b]) + static_cast<uint64_t>(R[in.c])); break;
            case MOpcode::Sub: R[in.a] = static_cast<int64_t>(static_cast<uint64_t>(R[in.b]) - static_cast<uint64_t>(R[in.c])); break;
            case MOpcode::Mul: R[in.a] = static_cast<int64_t>(static_cast<uint64_t>(R[in.b]) * static_cast<uint64_t>(R[in.c])); break;
            case MOpcode::And: R[in.a] = R[in.b] & R[in.c]; break;
            case MOpcode::Or: R[in.a] = R[in.b] | R[in.c]; break;
            case MOpcode::Xor: R[in.a] = R[in.b] ^ R[in.c]; break;
            case MOpcode::Shl: R[in.a] = static_cast<int64_t>(static_cast<uint64_t>(R[in.b]) << (R[in.c] & 63)); break;
            case MOpcode::ShrS: R[in.a] = R[in.b] >> (R[in.c] & 63); break;
            case MOpcode::ShrU: R[in.a] = static_cast<int64_t>(static_cast<uint64_t>(R[in.b]) >> (R[in.c] & 63)); break;
            case MOpcode::CmpSet: R[in.a] = compare(static_cast<backend::Cond>(in.d), R[in.b], R[in.c]) ? 1 : 0; break;
            case MOpcode::Select:
                if(in.d >= backend::kNumPhysRegs) return trapped(Trap::BadInstruction);
                R[in.a] = R[in.b] ? R[in.c] : R[in.d];
                break;
            case MOpcode::LdSlot:
                if(!load(fp - 8 * (in.imm + 1), R[in.a])) return trapped(Trap::MemoryFault);
                break;
            case MOpcode::StSlot:
                if(!store(fp - 8 * (in.imm + 1), R[in.a])) return trapped(Trap::MemoryFault);
                break;
            case MOpcode::LdArg:
                if(!load(fp + 16 + 8 * in.imm, R[in.a])) return trapped(Trap::MemoryFault);
                break;
            case MOpcode::StArg:
                if(!store(sp + 8 * in.imm, R[in.a])) return trapped(Trap::MemoryFault);
                break;
            case MOpcode::Call: {
                if(in.imm < 0 || static_cast<uint64_t>(in.imm) >= module_.functions.size()) return trapped(Trap::BadInstruction);
                sp -= kFrame;
                const int64_t ret = static_cast<int64_t>((static_cast<uint64_t>(index) << 32) | pc);
                if(!store(sp, fp) || !store(sp + 8, ret)) return trapped(Trap::MemoryFault);
                index = static_cast<std::size_t>(in.imm);
                f = &module_.functions[index];
                pc = 0;
                break;
            }
            case MOpcode::Ret: {
                const int64_t v = R[in.a];
                int64_t savedFp = 0, ret = 0;
                sp = fp;
                if(!load(sp, savedFp) || !load(sp + 8, ret)) return trapped(Trap::MemoryFault);
                sp += kFrame;
                fp = savedFp;
                if(ret == kReturnToHost){
                    ExecResult r; r.ok = true; r.value = v;
                    return r;
                }
                index = static_cast<std::size_t>(static_cast<uint64_t>(ret) >> 32);
                pc = static_cast<std::size_t>(ret & 0xffffffff);
                if(index >= module_.functions.size()) return trapped(Trap::BadInstruction);
                f = &module_.functions[index];
                if(pc < backend::kInstrSize || pc > f->code.size()) return trapped(Trap::BadInstruction);
                // the call instruction names the result register
                R[backend::decode(&f->code[pc - backend::kInstrSize]).a] = v;
                break;
            }
            case MOpcode::Jmp: pc = static_cast<std::size_t>(in.imm); break;
            case MOpcode::JmpNZ: if(R[in.a]) pc = static_cast<std::size_t>(in.imm); break;
            case MOpcode::Trap: return trapped(Trap::Unreachable);
            default: return trapped(Trap::BadInstruction);
        }
    }
}

} // namespace stagec::runtime
