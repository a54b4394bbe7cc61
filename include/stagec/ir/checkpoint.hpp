#pragma once
#include <string>
#include <string_view>
#include <llvm/Support/raw_ostream.h>

#include "stagec/ir/context.hpp"
#include "stagec/verifier.hpp"

namespace stagec::ir {

// Stage checkpoint: prints the snapshot when `print` is set and hands it to the verifier when one is
// attached. `render` runs only if somebody consumes its result.
template <typename Render>
void checkpoint(const CompileContext& ctx, bool print, std::string_view scope, Render&& render){
    verify::Verifier* v = ctx.verifier();
    if(!print && !v) return;
    const std::string text = render();
    if(print){
        llvm::errs() << "=== " << scope << " (" << ctx.currentFunctionName() << ") ===\n" << text;
        if(text.empty() || text.back() != '\n') llvm::errs() << "\n";
    }
    if(v) v->recordOrCheck(ctx, scope, text);
}

} // namespace stagec::ir
