#include "stagec/ir/block_layout.hpp"
#include <vector>
#include <llvm/ADT/PostOrderIterator.h>
#include <llvm/IR/CFG.h>
#include <llvm/Transforms/Utils/BasicBlockUtils.h>
#include <llvm/Transforms/Utils/Local.h>

namespace stagec::ir::block_layout {

void run(llvm::Function& F){
    if(F.isDeclaration()) return;
    llvm::removeUnreachableBlocks(F);
    llvm::SplitAllCriticalEdges(F);
    llvm::ReversePostOrderTraversal<llvm::Function*> rpot(&F);
    std::vector<llvm::BasicBlock*> order(rpot.begin(), rpot.end());
    for(std::size_t i = 1; i < order.size(); ++i) order[i]->moveAfter(order[i-1]);
}

} // namespace stagec::ir::block_layout
