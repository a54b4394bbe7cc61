// Decoded bytecode module as handed over by the module decoder.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stagec {

// Stack bytecode over i64 values. Comparisons push 0 or 1.
enum class Opcode : uint8_t {
    Const,      // imm = value
    LocalGet,   // imm = local index (params first)
    LocalSet,
    LocalTee,
    Add, Sub, Mul, And, Or, Xor, Shl, ShrS, ShrU,
    Eq, Ne, LtS, LeS, GtS, GeS, LtU, Eqz,
    Label,      // imm = label id; operand stack must be empty
    Br,         // imm = label id
    BrIf,       // imm = label id; pops the condition, branches when non-zero
    Call,       // imm = function index
    Drop,
    Return,     // pops the result
    Unreachable
};

struct Instr {
    Opcode op;
    int64_t imm = 0;
};

struct FunctionBody {
    std::string name;          // may be empty
    uint32_t numParams = 0;
    uint32_t numLocals = 0;    // in addition to params
    std::vector<Instr> code;
};

struct Module {
    std::string name;
    std::vector<FunctionBody> functions;
};

// Stable identity used to key diagnostics: the function name, or "func[i]" when unnamed.
std::string function_label(const Module& m, std::size_t index);

const char* opcode_name(Opcode op);

// Total instruction count over all function bodies.
std::size_t instruction_count(const Module& m);

} // namespace stagec
