#pragma once
#include <llvm/IR/Function.h>

namespace stagec::ir::block_layout {

// Prepares F for lowering: drops unreachable blocks, splits every critical edge (so phi copies can
// sit at the end of the predecessor) and orders blocks in reverse post-order, entry first.
void run(llvm::Function& F);

} // namespace stagec::ir::block_layout
