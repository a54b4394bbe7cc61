#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "stagec/compiler.hpp"
#include "stagec/runtime/executor.hpp"
#include "stagec/runtime/stack_guard.hpp"
#include "stagec/text_reader.hpp"

using namespace stagec;

static void print_diag(const char* kind, const CompileError& e){
    std::cerr << kind << " " << e.code << " [" << e.function;
    if(e.pc >= 0) std::cerr << " @" << e.pc;
    std::cerr << "]: " << e.message << "\n";
    if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: stagec_driver <module-file> [--run <function> [args...]] [--verify]\n"; return 1; }
    std::string file = argv[1];
    std::string entry;
    std::vector<int64_t> args;
    bool verify = false;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="--verify"){ verify = true; continue; }
        if(a=="--run" && i+1<argc){
            entry = argv[++i];
            while(i+1<argc && std::string(argv[i+1]).rfind("--",0)!=0) args.push_back(std::strtoll(argv[++i], nullptr, 0));
            continue;
        }
        std::cerr << "unknown argument: " << a << "\n"; return 1;
    }

    auto rr = text::read_module_file(file);
    if(!rr.success){ std::cerr << rr.error_message << " (line " << rr.line << ", column " << rr.column << ")\n"; return 1; }

    diag::Gate gate = diag::kGate;
    if(verify) gate.deterministicVerifier = true;
    CompileEnv env = detectEnv();
    CompileContext ctx(gate);
    auto res = compile_module(rr.module, ctx, env);
    for(auto &w: res.warnings) print_diag("warning", w);
    if(!res.success){ std::cerr << "Compilation failed:\n"; for(auto &e: res.errors) print_diag("error", e); return 2; }
    std::cerr << "[stagec] compiled " << res.module.functions.size() << " functions" << (verify ? " (verified)" : "") << "\n";
    if(entry.empty()) return 0;

    std::size_t index = rr.module.functions.size();
    for(std::size_t i=0;i<rr.module.functions.size();++i) if(function_label(rr.module, i)==entry){ index = i; break; }
    if(index==rr.module.functions.size()){ std::cerr << "Entry function not found: " << entry << "\n"; return 3; }
    if(res.module.disassemblable){ std::cerr << "module was finalized for disassembly and cannot run\n"; return 3; }
    if(args.size()!=rr.module.functions[index].numParams){
        std::cerr << entry << " expects " << rr.module.functions[index].numParams << " arguments\n"; return 3;
    }

    runtime::GuardedStack stack(env.stackSize);
    runtime::Executor exec(res.module, stack, gate);
    auto r = exec.invoke(index, args);
    if(!r.ok){ std::cerr << "Trap: " << runtime::trap_name(r.trap) << "\n"; return 4; }
    std::cout << "Result: " << r.value << "\n";
    return 0;
}
