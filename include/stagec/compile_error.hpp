// Ordinary compilation diagnostics (malformed bytecode, unsupported constructs, validator failures).
#pragma once
#include <string>
#include <vector>

namespace stagec {

struct CompileError { std::string code; std::string message; std::string hint; std::string function; int pc=-1; };

// Central reporter so every stage shares formatting.
struct ErrorReporter {
    std::vector<CompileError>* errors=nullptr;
    std::vector<CompileError>* warnings=nullptr;
    void emit_error(CompileError e){ if(errors) errors->push_back(std::move(e)); }
    void emit_warning(CompileError w){ if(warnings) warnings->push_back(std::move(w)); }
    static CompileError make(std::string code, std::string message, std::string function, int pc=-1, std::string hint=""){
        return CompileError{std::move(code), std::move(message), std::move(hint), std::move(function), pc};
    }
};

} // namespace stagec
