#include "stagec/ir/context.hpp"

namespace stagec {

CompileContext CompileContext::withFunctionName(std::string name) const {
    CompileContext out(*this);
    if(gate_->needFunctionName()) out.functionName_ = std::move(name);
    return out;
}

const std::string& CompileContext::currentFunctionName() const {
    if(!functionName_)
        throw ContextMisuse("current function name requested but never bound (withFunctionName not called, or the diagnostic gate does not track function names)");
    return *functionName_;
}

CompileContext CompileContext::withHighRegisterPressure() const {
    CompileContext out(*this);
    out.highRegisterPressure_ = true;
    return out;
}

CompileContext CompileContext::withVerifier(verify::Verifier& v) const {
    CompileContext out(*this);
    out.verifier_ = &v;
    return out;
}

} // namespace stagec
