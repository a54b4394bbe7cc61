// Machine code finalisation and the fixed-width encoding of the virtual target.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "stagec/backend/machine_ir.hpp"

namespace stagec::backend {

// Every instruction is 16 bytes: [op][a][b][c][d][pad x3][imm, little-endian i64].
// Register operands fill a, b, c, d in order; a condition code goes to d; the slot, immediate,
// function index or branch target (byte offset in the function) goes to imm.
inline constexpr std::size_t kInstrSize = 16;

struct CompiledFunction {
    std::string name;
    uint32_t numParams = 0;
    std::vector<uint8_t> code;
};

struct CompiledModule {
    std::vector<CompiledFunction> functions;
    // Call targets were zeroed for a clean disassembly dump; not executable.
    bool disassemblable = false;
};

struct DecodedInstr {
    MOpcode opc;
    uint8_t a = 0, b = 0, c = 0, d = 0;
    int64_t imm = 0;
};

DecodedInstr decode(const uint8_t* p);

// Adds the Enter prologue, drops jumps to the next block and encodes `fn` (which must be allocated).
// `fn` keeps the final instruction sequence so its listing matches the bytes.
CompiledFunction finalize_function(MFunction& fn, bool disassemblable);

// Lowercase hex of the encoded bytes.
std::string to_hex(const CompiledFunction& f);

} // namespace stagec::backend
