#include "stagec/backend/regalloc.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <llvm/Support/raw_ostream.h>

namespace stagec::backend::regalloc {

namespace {

constexpr unsigned kNever = std::numeric_limits<unsigned>::max();

struct VState {
    int phys = -1;
    int slot = -1;        // spill slot, assigned on first spill
    bool saved = false;   // value currently stored in `slot`
    unsigned lastAccess = 0;
};

// Allocation state for one block. Vreg ids are function-wide but each vreg is confined to a block.
class BlockAllocator {
public:
    BlockAllocator(MFunction& fn, const Options& opts, Stats& stats)
        : fn_(fn), opts_(opts), stats_(stats), vs_(fn.numVRegs) {}

    void run(MBlock& block){
        std::fill(owner_.begin(), owner_.end(), -1);
        collectUses(block);
        std::vector<MInstr> out;
        out.reserve(block.instrs.size());
        for(unsigned idx = 0; idx < block.instrs.size(); ++idx){
            MInstr ins = block.instrs[idx];
            const bool def = defines_first(ins.opc);
            std::vector<int> pinned;
            // uses
            for(std::size_t i = def ? 1 : 0; i < ins.ops.size(); ++i){
                MOperand& o = ins.ops[i];
                if(!o.isReg()) continue;
                VState& v = vs_[o.vreg];
                if(v.phys < 0){
                    if(!v.saved) throw std::logic_error("regalloc " + fn_.name + ": v" + std::to_string(o.vreg) + " used before definition");
                    int p = take(pinned, idx, out);
                    out.push_back(MInstr{MOpcode::LdSlot, {physOperand(o.vreg, p), MOperand::slot(v.slot)}});
                    bind(o.vreg, p);
                    ++stats_.reloads;
                    if(opts_.logging) llvm::errs() << "[regalloc] " << fn_.name << ": reload v" << o.vreg << " -> r" << p << "\n";
                }
                o.phys = v.phys;
                v.lastAccess = idx;
                pinned.push_back(v.phys);
            }
            if(ins.opc == MOpcode::Call) clobberAll(idx, out);
            // registers whose value dies here can be reused by the definition
            for(std::size_t i = def ? 1 : 0; i < ins.ops.size(); ++i){
                const MOperand& o = ins.ops[i];
                if(o.isReg() && nextUse(o.vreg, idx) == kNever && vs_[o.vreg].phys >= 0) release(o.vreg);
            }
            if(def){
                MOperand& d = ins.ops[0];
                int p = take(pinned, idx, out);
                bind(d.vreg, p);
                d.phys = p;
                vs_[d.vreg].lastAccess = idx;
            }
            out.push_back(std::move(ins));
            if(def && nextUse(out.back().ops[0].vreg, idx) == kNever) release(out.back().ops[0].vreg);
        }
        block.instrs = std::move(out);
    }

private:
    static MOperand physOperand(uint32_t vreg, int p){ MOperand o = MOperand::reg(vreg); o.phys = p; return o; }

    void collectUses(const MBlock& block){
        uses_.clear();
        for(unsigned idx = 0; idx < block.instrs.size(); ++idx){
            const MInstr& ins = block.instrs[idx];
            for(std::size_t i = defines_first(ins.opc) ? 1 : 0; i < ins.ops.size(); ++i)
                if(ins.ops[i].isReg()) uses_[ins.ops[i].vreg].push_back(idx);
        }
    }

    unsigned nextUse(uint32_t vreg, unsigned idx) const {
        auto it = uses_.find(vreg);
        if(it == uses_.end()) return kNever;
        auto pos = std::upper_bound(it->second.begin(), it->second.end(), idx);
        return pos == it->second.end() ? kNever : *pos;
    }

    void bind(uint32_t vreg, int p){ owner_[p] = static_cast<int>(vreg); vs_[vreg].phys = p; }
    void release(uint32_t vreg){ owner_[vs_[vreg].phys] = -1; vs_[vreg].phys = -1; }

    // Stores the value (once per vreg, the vreg never changes) and frees its register.
    void spill(uint32_t vreg, std::vector<MInstr>& out){
        VState& v = vs_[vreg];
        if(!v.saved){
            if(v.slot < 0) v.slot = static_cast<int>(fn_.newSlot());
            out.push_back(MInstr{MOpcode::StSlot, {physOperand(vreg, v.phys), MOperand::slot(v.slot)}});
            v.saved = true;
            ++stats_.spills;
            if(opts_.logging) llvm::errs() << "[regalloc] " << fn_.name << ": spill v" << vreg << " (r" << v.phys << ") -> slot " << v.slot << "\n";
        }
        release(vreg);
    }

    int take(const std::vector<int>& pinned, unsigned idx, std::vector<MInstr>& out){
        for(unsigned p = 0; p < opts_.numRegs; ++p) if(owner_[p] < 0) return static_cast<int>(p);
        int victim = -1;
        unsigned best = 0;
        for(unsigned p = 0; p < opts_.numRegs; ++p){
            if(std::find(pinned.begin(), pinned.end(), static_cast<int>(p)) != pinned.end()) continue;
            const uint32_t v = static_cast<uint32_t>(owner_[p]);
            if(opts_.highRegisterPressure){
                // least recently used
                unsigned score = kNever - vs_[v].lastAccess;
                if(victim < 0 || score > best){ victim = static_cast<int>(p); best = score; }
            } else {
                unsigned score = nextUse(v, idx);
                if(victim < 0 || score > best){ victim = static_cast<int>(p); best = score; }
            }
        }
        if(victim < 0) throw std::logic_error("regalloc " + fn_.name + ": every register is pinned");
        spill(static_cast<uint32_t>(owner_[victim]), out);
        return victim;
    }

    void clobberAll(unsigned idx, std::vector<MInstr>& out){
        for(unsigned p = 0; p < opts_.numRegs; ++p){
            if(owner_[p] < 0) continue;
            const uint32_t v = static_cast<uint32_t>(owner_[p]);
            if(nextUse(v, idx) != kNever){ spill(v, out); ++stats_.callSpills; }
            else release(v);
        }
    }

    MFunction& fn_;
    const Options& opts_;
    Stats& stats_;
    std::vector<VState> vs_;
    std::vector<int> owner_ = std::vector<int>(kNumPhysRegs, -1);
    std::unordered_map<uint32_t, std::vector<unsigned>> uses_;
};

} // namespace

Stats allocate(MFunction& fn, const Options& opts){
    if(opts.numRegs < kMinAllocatableRegs || opts.numRegs > kMaxAllocatableRegs)
        throw std::invalid_argument("register count " + std::to_string(opts.numRegs) + " outside [" +
                                    std::to_string(kMinAllocatableRegs) + ", " + std::to_string(kMaxAllocatableRegs) + "]");
    Stats stats;
    BlockAllocator ra(fn, opts, stats);
    for(auto& block : fn.blocks) ra.run(block);
    fn.allocated = true;
    if(opts.logging)
        llvm::errs() << "[regalloc] " << fn.name << ": " << stats.spills << " spills, " << stats.reloads
                     << " reloads, " << stats.callSpills << " across calls, slots=" << fn.numSlots << "\n";
    return stats;
}

std::string validate(const MFunction& fn, unsigned numRegs){
    for(std::size_t b = 0; b < fn.blocks.size(); ++b){
        std::vector<int64_t> regHolds(kNumPhysRegs, -1);
        std::unordered_map<int64_t, int64_t> slotHolds;
        std::unordered_set<uint32_t> defined;
        const auto& instrs = fn.blocks[b].instrs;
        for(std::size_t i = 0; i < instrs.size(); ++i){
            const MInstr& ins = instrs[i];
            const std::string where = " at b" + std::to_string(b) + ":" + std::to_string(i) + " (" + opcode_name(ins.opc) + ")";
            const bool def = defines_first(ins.opc);
            for(std::size_t k = 0; k < ins.ops.size(); ++k){
                const MOperand& o = ins.ops[k];
                if(!o.isReg()) continue;
                if(o.phys < 0) return "v" + std::to_string(o.vreg) + " has no register" + where;
                if(static_cast<unsigned>(o.phys) >= numRegs) return "r" + std::to_string(o.phys) + " is not allocatable" + where;
                if(def && k == 0) continue;
                if(regHolds[o.phys] != o.vreg)
                    return "r" + std::to_string(o.phys) + " holds " +
                           (regHolds[o.phys] < 0 ? std::string("nothing") : "v" + std::to_string(regHolds[o.phys])) +
                           " but v" + std::to_string(o.vreg) + " is read" + where;
            }
            if(ins.opc == MOpcode::StSlot) slotHolds[ins.ops[1].imm] = ins.ops[0].vreg;
            if(ins.opc == MOpcode::LdSlot && defined.count(ins.ops[0].vreg)){
                // reload of a spilled value: the slot must still hold it
                auto it = slotHolds.find(ins.ops[1].imm);
                if(it == slotHolds.end() || it->second != ins.ops[0].vreg)
                    return "slot " + std::to_string(ins.ops[1].imm) + " does not hold v" +
                           std::to_string(ins.ops[0].vreg) + " on reload" + where;
            }
            if(ins.opc == MOpcode::Call) std::fill(regHolds.begin(), regHolds.end(), -1);
            if(def){
                regHolds[ins.ops[0].phys] = ins.ops[0].vreg;
                defined.insert(ins.ops[0].vreg);
            }
        }
    }
    return {};
}

} // namespace stagec::backend::regalloc
