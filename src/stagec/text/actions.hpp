#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <tao/pegtl.hpp>

#include "grammar.hpp"
#include "stagec/module.hpp"

namespace stagec::text {

// Parse state shared by the actions.
struct build_state {
    Module module;
    std::string mnemonic;
    std::optional<tao::pegtl::position> mnemonic_pos;
    bool has_operand = false;
    bool operand_is_name = false;
    int64_t operand = 0;
    std::string operand_name;
    // calls by name are resolved once every function is known
    struct pending_call { std::size_t fn; std::size_t pc; std::string target; tao::pegtl::position pos; };
    std::vector<pending_call> calls;
};

struct mnemonic_info { const char* text; Opcode op; bool operand; };

inline const std::vector<mnemonic_info>& mnemonics(){
    static const std::vector<mnemonic_info> table = {
        {"i64.const", Opcode::Const, true}, {"local.get", Opcode::LocalGet, true},
        {"local.set", Opcode::LocalSet, true}, {"local.tee", Opcode::LocalTee, true},
        {"i64.add", Opcode::Add, false}, {"i64.sub", Opcode::Sub, false}, {"i64.mul", Opcode::Mul, false},
        {"i64.and", Opcode::And, false}, {"i64.or", Opcode::Or, false}, {"i64.xor", Opcode::Xor, false},
        {"i64.shl", Opcode::Shl, false}, {"i64.shr_s", Opcode::ShrS, false}, {"i64.shr_u", Opcode::ShrU, false},
        {"i64.eq", Opcode::Eq, false}, {"i64.ne", Opcode::Ne, false}, {"i64.lt_s", Opcode::LtS, false},
        {"i64.le_s", Opcode::LeS, false}, {"i64.gt_s", Opcode::GtS, false}, {"i64.ge_s", Opcode::GeS, false},
        {"i64.lt_u", Opcode::LtU, false}, {"i64.eqz", Opcode::Eqz, false},
        {"label", Opcode::Label, true}, {"br", Opcode::Br, true}, {"br_if", Opcode::BrIf, true},
        {"call", Opcode::Call, true}, {"drop", Opcode::Drop, false}, {"return", Opcode::Return, false},
        {"unreachable", Opcode::Unreachable, false},
    };
    return table;
}

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<typename Input>
uint32_t parse_count(const Input& in){
    try {
        unsigned long v = std::stoul(in.string());
        if(v > UINT32_MAX) throw std::out_of_range("count");
        return static_cast<uint32_t>(v);
    } catch(const std::out_of_range&){
        throw parse_error("count " + in.string() + " out of range", in.position());
    }
}

template<> struct action< grammar::module_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.module.name = in.string(); }
};

template<> struct action< grammar::func_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        FunctionBody f; f.name = in.string();
        st.module.functions.push_back(std::move(f));
    }
};

template<> struct action< grammar::params_value > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.module.functions.back().numParams = parse_count(in); }
};

template<> struct action< grammar::locals_value > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.module.functions.back().numLocals = parse_count(in); }
};

template<> struct action< grammar::mnemonic > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.mnemonic = in.string();
        st.mnemonic_pos.emplace(in.position());
        st.has_operand = false;
    }
};

template<> struct action< grammar::int_operand > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        try {
            st.operand = std::stoll(in.string());
        } catch(const std::out_of_range&){
            throw parse_error("integer " + in.string() + " out of range", in.position());
        }
        st.has_operand = true;
        st.operand_is_name = false;
    }
};

template<> struct action< grammar::name_operand > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.operand_name = in.string();
        st.has_operand = true;
        st.operand_is_name = true;
    }
};

template<> struct action< grammar::instruction > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        const mnemonic_info* info = nullptr;
        for(auto& m : mnemonics()) if(st.mnemonic == m.text){ info = &m; break; }
        if(!info) throw parse_error("unknown instruction '" + st.mnemonic + "'", *st.mnemonic_pos);
        if(info->operand != st.has_operand)
            throw parse_error(std::string("'") + info->text + (info->operand ? "' needs an operand" : "' takes no operand"),
                              *st.mnemonic_pos);
        FunctionBody& f = st.module.functions.back();
        Instr ins{info->op, 0};
        if(st.has_operand && st.operand_is_name){
            if(info->op != Opcode::Call)
                throw parse_error(std::string("'") + info->text + "' needs an integer operand", *st.mnemonic_pos);
            st.calls.push_back({st.module.functions.size() - 1, f.code.size(), st.operand_name, *st.mnemonic_pos});
        } else if(st.has_operand){
            ins.imm = st.operand;
        }
        f.code.push_back(ins);
    }
};

} // namespace actions
} // namespace stagec::text
