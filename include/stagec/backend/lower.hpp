// Lowering of laid-out LLVM SSA to MIR.
#pragma once
#include <string>

#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>

#include "stagec/backend/machine_ir.hpp"
#include "stagec/compile_error.hpp"

namespace stagec::backend {

// Reusable lowering state; reset between functions.
//
// Values that are used outside their defining block live in frame slots: stored right after the
// definition and reloaded once in every block that reads them. Each phi owns a slot written by copies
// at the end of its predecessors (all incoming values are read before any slot is written) and is
// reloaded in its block. Constants are rematerialised at each use. Critical edges must already be
// split so every copy has a single successor to serve.
class Lowerer {
public:
    // `funcIndex` maps callee symbol names to module function indices.
    // Returns false after reporting into `rep` (E4001 unsupported instruction, E4002 unsupported
    // type, E4003 escaping stack slot address).
    bool lower(const llvm::Function& F, const llvm::StringMap<uint32_t>& funcIndex, MFunction& out,
               ErrorReporter& rep);

    void reset();

private:
    bool fail(const char* code, std::string msg);
    bool checkType(const llvm::Value* v);
    bool assignSlots(const llvm::Function& F);
    uint32_t use(const llvm::Value* v);
    uint32_t materializeConstant(const llvm::Constant* c);
    bool lowerInstruction(const llvm::Instruction& I);
    bool lowerTerminator(const llvm::Instruction& T);
    void emitPhiCopies(const llvm::BasicBlock* from);
    void emit(MOpcode opc, std::vector<MOperand> ops);
    void define(const llvm::Value* v, uint32_t vreg);

    const llvm::StringMap<uint32_t>* funcIndex_ = nullptr;
    MFunction* fn_ = nullptr;
    MBlock* cur_ = nullptr;
    ErrorReporter* rep_ = nullptr;
    std::string label_;
    bool failed_ = false;
    llvm::DenseMap<const llvm::BasicBlock*, uint32_t> blockIndex_;
    llvm::DenseMap<const llvm::Value*, uint32_t> slotOf_;   // allocas, phis, cross-block values
    llvm::DenseMap<const llvm::Value*, uint32_t> local_;    // value -> vreg in the current block
};

} // namespace stagec::backend
