#include "stagec/fatal.hpp"
#include <cstdlib>
#include <mutex>
#include <llvm/Support/raw_ostream.h>

namespace stagec::fatal {

static std::mutex hookMutex;
static Hook installedHook = nullptr;
static void* installedUserData = nullptr;

const char* kind_name(Kind k){
    switch(k){
        case Kind::DeterminismViolation: return "DeterminismViolation";
        case Kind::StackGuardCorruption: return "StackGuardCorruption";
    }
    return "unknown";
}

void install_fatal_hook(Hook hook, void* userData){
    std::lock_guard<std::mutex> lock(hookMutex);
    installedHook = hook;
    installedUserData = userData;
}

void remove_fatal_hook(){
    std::lock_guard<std::mutex> lock(hookMutex);
    installedHook = nullptr;
    installedUserData = nullptr;
}

void raise_fatal(const Report& report){
    Hook hook; void* userData;
    {
        std::lock_guard<std::mutex> lock(hookMutex);
        hook = installedHook; userData = installedUserData;
    }
    // Called without the lock held: the hook may throw.
    if(hook) hook(report, userData);
    llvm::errs() << "[fatal] " << kind_name(report.kind) << "\n";
    llvm::errs() << report.message;
    if(report.message.empty() || report.message.back() != '\n') llvm::errs() << "\n";
    llvm::errs().flush();
    std::exit(1);
}

} // namespace stagec::fatal
