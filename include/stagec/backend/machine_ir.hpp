// Backend IR for the 64-bit virtual target: blocks of instructions over virtual registers, frame slots
// and block/function references. Lowering produces it; the register allocator fills in physical
// registers and spill slots; the finaliser encodes it.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace stagec::backend {

inline constexpr unsigned kNumPhysRegs = 16;
inline constexpr unsigned kMaxAllocatableRegs = 14;
inline constexpr unsigned kMinAllocatableRegs = 4;

enum class MOpcode : uint8_t {
    Enter,   // imm = frame bytes; prologue, emitted by the finaliser
    MovRR,   // dst, src
    MovRI,   // dst, imm
    Add, Sub, Mul, And, Or, Xor, Shl, ShrS, ShrU, // dst, lhs, rhs
    CmpSet,  // dst, lhs, rhs, cond
    Select,  // dst, cond, tval, fval
    LdSlot,  // dst, slot
    StSlot,  // src, slot
    LdArg,   // dst, incoming argument index
    StArg,   // src, outgoing argument index
    Call,    // dst, func
    Jmp,     // block
    JmpNZ,   // cond, block
    Ret,     // src
    Trap     // imm = trap code
};

enum class Cond : uint8_t { Eq, Ne, Lt, Le, Gt, Ge, Ult, Ule, Ugt, Uge };

enum class TrapCode : uint8_t { Unreachable = 1 };

struct MOperand {
    enum class Kind : uint8_t { Reg, Imm, Slot, Block, Func, Cond };
    Kind kind = Kind::Imm;
    uint32_t vreg = 0;  // Reg
    int phys = -1;      // Reg, once allocated
    int64_t imm = 0;    // Imm value, slot index, block index, function index or Cond

    static MOperand reg(uint32_t v){ MOperand o; o.kind = Kind::Reg; o.vreg = v; return o; }
    static MOperand immediate(int64_t v){ MOperand o; o.kind = Kind::Imm; o.imm = v; return o; }
    static MOperand slot(uint32_t s){ MOperand o; o.kind = Kind::Slot; o.imm = s; return o; }
    static MOperand block(uint32_t b){ MOperand o; o.kind = Kind::Block; o.imm = b; return o; }
    static MOperand func(uint32_t f){ MOperand o; o.kind = Kind::Func; o.imm = f; return o; }
    static MOperand cond(Cond c){ MOperand o; o.kind = Kind::Cond; o.imm = static_cast<int64_t>(c); return o; }

    bool isReg() const { return kind == Kind::Reg; }
};

struct MInstr {
    MOpcode opc;
    std::vector<MOperand> ops;
};

struct MBlock {
    std::string name;
    std::vector<MInstr> instrs;
};

struct MFunction {
    std::string name;
    uint32_t numParams = 0;
    std::vector<MBlock> blocks;
    uint32_t numVRegs = 0;
    uint32_t numSlots = 0;          // lowering slots plus spill slots added by the allocator
    uint32_t maxOutgoingArgs = 0;
    bool allocated = false;

    // Frame bytes reserved by Enter: slots then outgoing arguments, 16-byte aligned.
    uint32_t frameBytes() const { return (8u * (numSlots + maxOutgoingArgs) + 15u) & ~15u; }

    uint32_t newVReg(){ return numVRegs++; }
    uint32_t newSlot(){ return numSlots++; }
};

// True when the first operand of `opc` is a register definition.
bool defines_first(MOpcode opc);

const char* opcode_name(MOpcode opc);
const char* cond_name(Cond c);

// Text listing; this is the snapshot of the lowering, regalloc and finalised stages.
std::string to_string(const MFunction& fn);

} // namespace stagec::backend
