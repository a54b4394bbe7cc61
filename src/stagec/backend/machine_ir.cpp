#include "stagec/backend/machine_ir.hpp"
#include <sstream>

namespace stagec::backend {

bool defines_first(MOpcode opc){
    switch(opc){
        case MOpcode::MovRR: case MOpcode::MovRI:
        case MOpcode::Add: case MOpcode::Sub: case MOpcode::Mul: case MOpcode::And:
        case MOpcode::Or: case MOpcode::Xor: case MOpcode::Shl: case MOpcode::ShrS: case MOpcode::ShrU:
        case MOpcode::CmpSet: case MOpcode::Select:
        case MOpcode::LdSlot: case MOpcode::LdArg: case MOpcode::Call:
            return true;
        default:
            return false;
    }
}

const char* opcode_name(MOpcode opc){
    switch(opc){
        case MOpcode::Enter: return "enter";
        case MOpcode::MovRR: return "mov";
        case MOpcode::MovRI: return "movi";
        case MOpcode::Add: return "add";
        case MOpcode::Sub: return "sub";
        case MOpcode::Mul: return "mul";
        case MOpcode::And: return "and";
        case MOpcode::Or: return "or";
        case MOpcode::Xor: return "xor";
        case MOpcode::Shl: return "shl";
        case MOpcode::ShrS: return "sar";
        case MOpcode::ShrU: return "shr";
        case MOpcode::CmpSet: return "cset";
        case MOpcode::Select: return "sel";
        case MOpcode::LdSlot: return "ldslot";
        case MOpcode::StSlot: return "stslot";
        case MOpcode::LdArg: return "ldarg";
        case MOpcode::StArg: return "starg";
        case MOpcode::Call: return "call";
        case MOpcode::Jmp: return "jmp";
        case MOpcode::JmpNZ: return "jnz";
        case MOpcode::Ret: return "ret";
        case MOpcode::Trap: return "trap";
    }
    return "?";
}

const char* cond_name(Cond c){
    switch(c){
        case Cond::Eq: return "eq";
        case Cond::Ne: return "ne";
        case Cond::Lt: return "lt";
        case Cond::Le: return "le";
        case Cond::Gt: return "gt";
        case Cond::Ge: return "ge";
        case Cond::Ult: return "ult";
        case Cond::Ule: return "ule";
        case Cond::Ugt: return "ugt";
        case Cond::Uge: return "uge";
    }
    return "?";
}

static void print_operand(std::ostringstream& os, const MFunction& fn, const MOperand& o){
    switch(o.kind){
        case MOperand::Kind::Reg:
            if(o.phys >= 0) os << 'r' << o.phys;
            else os << 'v' << o.vreg;
            break;
        case MOperand::Kind::Imm: os << '#' << o.imm; break;
        case MOperand::Kind::Slot: os << "[s" << o.imm << ']'; break;
        case MOperand::Kind::Block:
            os << 'b' << o.imm;
            if(o.imm >= 0 && static_cast<std::size_t>(o.imm) < fn.blocks.size()) os << '<' << fn.blocks[o.imm].name << '>';
            break;
        case MOperand::Kind::Func: os << "@" << o.imm; break;
        case MOperand::Kind::Cond: os << cond_name(static_cast<Cond>(o.imm)); break;
    }
}

std::string to_string(const MFunction& fn){
    std::ostringstream os;
    os << "function " << fn.name << " (params=" << fn.numParams << ", slots=" << fn.numSlots
       << ", vregs=" << fn.numVRegs << ", frame=" << fn.frameBytes() << ")\n";
    for(std::size_t b = 0; b < fn.blocks.size(); ++b){
        os << 'b' << b << ' ' << fn.blocks[b].name << ":\n";
        for(auto& ins : fn.blocks[b].instrs){
            os << "  " << opcode_name(ins.opc);
            for(std::size_t i = 0; i < ins.ops.size(); ++i){
                os << (i ? ", " : " ");
                print_operand(os, fn, ins.ops[i]);
            }
            os << '\n';
        }
    }
    return os.str();
}

} // namespace stagec::backend
