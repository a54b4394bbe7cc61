#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "stagec/diag_gate.hpp"

namespace stagec {

namespace verify { class Verifier; }

// Run-time knobs read from the process environment (see detectEnv).
struct CompileEnv {
    int optLevel = 1;                 // preset SSA pipeline, 0..3
    std::string passPipeline;         // textual new-PM pipeline; overrides optLevel when non-empty
    unsigned numRegs = 14;            // allocatable registers, clamped to [4, 14]
    std::optional<uint64_t> verifySeed;
    std::size_t highPressureThreshold = 50000; // module instruction count
    std::size_t stackSize = 1u << 20;
    bool diagJson = false;
};

// Reads STAGEC_* environment variables into a CompileEnv. Unset or malformed values keep defaults.
CompileEnv detectEnv();

// Raised when a stage asks the context for a binding that was never made.
struct ContextMisuse : std::logic_error {
    using std::logic_error::logic_error;
};

// Per-module compilation scope passed by reference through every stage.
// The with* transforms return an updated copy; the original is left untouched.
class CompileContext {
public:
    // The gate is held by address and must outlive the context.
    explicit CompileContext(const diag::Gate& gate = diag::kGate) : gate_(&gate) {}
    explicit CompileContext(const diag::Gate&&) = delete;

    const diag::Gate& gate() const { return *gate_; }

    // Binds the current function name. When the gate does not need function names this is a
    // plain copy, so no name is ever stored.
    CompileContext withFunctionName(std::string name) const;
    bool hasFunctionName() const { return functionName_.has_value(); }
    // Throws ContextMisuse when no name is bound.
    const std::string& currentFunctionName() const;

    CompileContext withHighRegisterPressure() const;
    bool isHighRegisterPressure() const { return highRegisterPressure_; }

    CompileContext withVerifier(verify::Verifier& v) const;
    verify::Verifier* verifier() const { return verifier_; }

private:
    const diag::Gate* gate_;
    std::optional<std::string> functionName_;
    bool highRegisterPressure_ = false;
    verify::Verifier* verifier_ = nullptr;
};

} // namespace stagec
