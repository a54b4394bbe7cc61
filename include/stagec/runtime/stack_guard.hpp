#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <llvm/ADT/ArrayRef.h>

#include "stagec/diag_gate.hpp"

namespace stagec::runtime {

inline constexpr std::size_t kGuardPageSize = diag::kStackGuardPageSize;

// Checks that the guard page at the start of `region` is still all zero. `region` is the guard page
// followed by the adjoining stack; the stack part only feeds the diagnostic dump.
// A non-zero byte is a fatal StackGuardCorruption. Throws std::invalid_argument when the region is
// shorter than the guard page.
void check_stack_guard_page(llvm::ArrayRef<uint8_t> region);

// One zero-initialised allocation laid out as [guard page][stack]. The stack grows downward toward
// the guard page, so an overflowing frame writes into the guard first.
// Owned by a single execution context; check only while no generated code is running on it.
class GuardedStack {
public:
    explicit GuardedStack(std::size_t stackSize);

    uint8_t* data() { return buf_.data(); }
    const uint8_t* data() const { return buf_.data(); }
    std::size_t size() const { return buf_.size(); }
    std::size_t stackSize() const { return buf_.size() - kGuardPageSize; }

    // Offsets into data(): the lowest usable stack byte and one past the highest.
    std::size_t stackLimit() const { return kGuardPageSize; }
    std::size_t stackTop() const { return buf_.size(); }

    llvm::ArrayRef<uint8_t> guardPage() const { return llvm::ArrayRef<uint8_t>(buf_.data(), kGuardPageSize); }
    llvm::ArrayRef<uint8_t> region() const { return llvm::ArrayRef<uint8_t>(buf_); }

    void check() const { check_stack_guard_page(region()); }

private:
    std::vector<uint8_t> buf_;
};

} // namespace stagec::runtime
