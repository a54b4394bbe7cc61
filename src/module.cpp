#include "stagec/module.hpp"

namespace stagec {

std::string function_label(const Module& m, std::size_t index){
    if(index < m.functions.size() && !m.functions[index].name.empty()) return m.functions[index].name;
    return "func[" + std::to_string(index) + "]";
}

const char* opcode_name(Opcode op){
    switch(op){
        case Opcode::Const: return "i64.const";
        case Opcode::LocalGet: return "local.get";
        case Opcode::LocalSet: return "local.set";
        case Opcode::LocalTee: return "local.tee";
        case Opcode::Add: return "i64.add";
        case Opcode::Sub: return "i64.sub";
        case Opcode::Mul: return "i64.mul";
        case Opcode::And: return "i64.and";
        case Opcode::Or: return "i64.or";
        case Opcode::Xor: return "i64.xor";
        case Opcode::Shl: return "i64.shl";
        case Opcode::ShrS: return "i64.shr_s";
        case Opcode::ShrU: return "i64.shr_u";
        case Opcode::Eq: return "i64.eq";
        case Opcode::Ne: return "i64.ne";
        case Opcode::LtS: return "i64.lt_s";
        case Opcode::LeS: return "i64.le_s";
        case Opcode::GtS: return "i64.gt_s";
        case Opcode::GeS: return "i64.ge_s";
        case Opcode::LtU: return "i64.lt_u";
        case Opcode::Eqz: return "i64.eqz";
        case Opcode::Label: return "label";
        case Opcode::Br: return "br";
        case Opcode::BrIf: return "br_if";
        case Opcode::Call: return "call";
        case Opcode::Drop: return "drop";
        case Opcode::Return: return "return";
        case Opcode::Unreachable: return "unreachable";
    }
    return "?";
}

std::size_t instruction_count(const Module& m){
    std::size_t n = 0;
    for(auto &f : m.functions) n += f.code.size();
    return n;
}

} // namespace stagec
