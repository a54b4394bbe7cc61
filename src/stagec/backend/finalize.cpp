#include "stagec/backend/finalize.hpp"

#include <cstring>
#include <stdexcept>

#include <llvm/ADT/StringExtras.h>

namespace stagec::backend {

static void encode(const MInstr& ins, const std::vector<uint32_t>& blockOffset, bool disassemblable, uint8_t* p){
    std::memset(p, 0, kInstrSize);
    p[0] = static_cast<uint8_t>(ins.opc);
    int field = 1;
    int64_t imm = 0;
    for(const MOperand& o : ins.ops){
        switch(o.kind){
            case MOperand::Kind::Reg:
                if(field > 4) throw std::logic_error("too many register operands");
                p[field++] = static_cast<uint8_t>(o.phys);
                break;
            case MOperand::Kind::Cond:
                p[4] = static_cast<uint8_t>(o.imm);
                break;
            case MOperand::Kind::Block:
                imm = blockOffset[static_cast<std::size_t>(o.imm)];
                break;
            case MOperand::Kind::Func:
                imm = disassemblable ? 0 : o.imm;
                break;
            default:
                imm = o.imm;
                break;
        }
    }
    uint64_t u = static_cast<uint64_t>(imm);
    for(int i = 0; i < 8; ++i) p[8 + i] = static_cast<uint8_t>(u >> (8 * i));
}

DecodedInstr decode(const uint8_t* p){
    DecodedInstr d;
    d.opc = static_cast<MOpcode>(p[0]);
    d.a = p[1]; d.b = p[2]; d.c = p[3]; d.d = p[4];
    uint64_t u = 0;
    for(int i = 0; i < 8; ++i) u |= static_cast<uint64_t>(p[8 + i]) << (8 * i);
    d.imm = static_cast<int64_t>(u);
    return d;
}

CompiledFunction finalize_function(MFunction& fn, bool disassemblable){
    if(!fn.allocated) throw std::logic_error("finalize " + fn.name + ": registers not allocated");
    if(fn.blocks.empty()) throw std::logic_error("finalize " + fn.name + ": no blocks");
    for(std::size_t b = 0; b + 1 < fn.blocks.size(); ++b){
        auto& instrs = fn.blocks[b].instrs;
        if(!instrs.empty() && instrs.back().opc == MOpcode::Jmp && instrs.back().ops[0].imm == static_cast<int64_t>(b + 1))
            instrs.pop_back();
    }
    auto& entry = fn.blocks.front().instrs;
    entry.insert(entry.begin(), MInstr{MOpcode::Enter, {MOperand::immediate(fn.frameBytes())}});

    std::vector<uint32_t> blockOffset(fn.blocks.size());
    uint32_t off = 0;
    for(std::size_t b = 0; b < fn.blocks.size(); ++b){
        blockOffset[b] = off;
        off += static_cast<uint32_t>(fn.blocks[b].instrs.size() * kInstrSize);
    }

    CompiledFunction out;
    out.name = fn.name;
    out.numParams = fn.numParams;
    out.code.resize(off);
    uint8_t* p = out.code.data();
    for(auto& block : fn.blocks)
        for(auto& ins : block.instrs){ encode(ins, blockOffset, disassemblable, p); p += kInstrSize; }
    return out;
}

std::string to_hex(const CompiledFunction& f){
    return llvm::toHex(f.code, /*LowerCase*/ true);
}

} // namespace stagec::backend
