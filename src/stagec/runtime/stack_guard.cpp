#include "stagec/runtime/stack_guard.hpp"
#include <stdexcept>
#include <string>

#include <llvm/ADT/StringExtras.h>

#include "stagec/fatal.hpp"

namespace stagec::runtime {

void check_stack_guard_page(llvm::ArrayRef<uint8_t> region){
    if(region.size() < kGuardPageSize)
        throw std::invalid_argument("stack guard region of " + std::to_string(region.size()) +
                                    " bytes is smaller than the guard page (" + std::to_string(kGuardPageSize) + ")");
    for(std::size_t i = 0; i < kGuardPageSize; ++i){
        if(region[i] == 0) continue;
        fatal::Report r;
        r.kind = fatal::Kind::StackGuardCorruption;
        r.oldValue = llvm::toHex(region.take_front(kGuardPageSize), /*LowerCase*/ true);
        r.newValue = llvm::toHex(region.drop_front(kGuardPageSize), /*LowerCase*/ true);
        r.message = "BUG: stack guard page is corrupted (first non-zero byte at offset " + std::to_string(i) + "):\n"
                    "\tguard_page=" + r.oldValue + "\n"
                    "\tstack=" + r.newValue + "\n";
        fatal::raise_fatal(r);
    }
}

GuardedStack::GuardedStack(std::size_t stackSize) : buf_(kGuardPageSize + stackSize, 0) {}

} // namespace stagec::runtime
