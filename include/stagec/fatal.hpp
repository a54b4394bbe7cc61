// Fatal reporting for internal-consistency violations of the compiler.
#pragma once
#include <string>

namespace stagec::fatal {

enum class Kind { DeterminismViolation, StackGuardCorruption };

const char* kind_name(Kind k);

struct Report {
    Kind kind;
    std::string function; // empty for StackGuardCorruption
    std::string scope;    // empty for StackGuardCorruption
    std::string oldValue; // guard page hex dump for StackGuardCorruption
    std::string newValue; // adjoining stack hex dump for StackGuardCorruption
    std::string message;  // full rendered diagnostic
};

// Called before the process terminates. A hook may throw to intercept the violation (test harnesses);
// if it returns, the report is printed to stderr and the process exits with status 1.
using Hook = void (*)(const Report& report, void* userData);

void install_fatal_hook(Hook hook, void* userData = nullptr);
void remove_fatal_hook();

[[noreturn]] void raise_fatal(const Report& report);

} // namespace stagec::fatal
