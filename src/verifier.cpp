#include "stagec/verifier.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

#include "stagec/fatal.hpp"
#include "stagec/ir/context.hpp"

namespace stagec::verify {

static uint64_t wall_clock_seed(){
    return static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
}

Verifier::Verifier(std::size_t functionCount, int iterations)
    : Verifier(functionCount, iterations, wall_clock_seed()) {}

Verifier::Verifier(std::size_t functionCount, int iterations, uint64_t seed)
    : iterations_(iterations), seed_(seed), order_(functionCount), rng_(seed) {
    std::iota(order_.begin(), order_.end(), std::size_t{0});
}

void Verifier::beginIteration(){
    ++currentIteration_;
    if(!initialPassDone_){
        // First pass compiles in natural order to establish the expected snapshots.
        initialPassDone_ = true;
        return;
    }
    std::shuffle(order_.begin(), order_.end(), rng_);
}

std::string snapshot_key(std::string_view function, std::string_view scope){
    std::string key;
    key.reserve(function.size() + 1 + scope.size());
    key.append(function).append(":").append(scope);
    return key;
}

void Verifier::recordOrCheck(const CompileContext& ctx, std::string_view scope, const std::string& value){
    const std::string& fn = ctx.currentFunctionName();
    std::string key = snapshot_key(fn, scope);
    auto it = snapshots_.find(key);
    if(it == snapshots_.end()){
        snapshots_.emplace(std::move(key), value);
        return;
    }
    if(it->second == value) return;

    fatal::Report r;
    r.kind = fatal::Kind::DeterminismViolation;
    r.function = fn;
    r.scope = std::string(scope);
    r.oldValue = it->second;
    r.newValue = value;
    r.message =
        "BUG: Deterministic compilation failed for function " + fn + " at scope=\"" + r.scope + "\" "
        "(iteration " + std::to_string(currentIteration_) + " of " + std::to_string(iterations_) +
        ", seed " + std::to_string(seed_) + ").\n"
        "\n"
        "This is mostly due to (but might not be limited to):\n"
        "\t* Resetting the front end, the SSA builder or the backend between functions doesn't work as expected,\n"
        "\t  and the compilation has been affected by the previous iterations.\n"
        "\t* Using a map with non-deterministic iteration order.\n"
        "\n"
        "---------- [old] ----------\n" + r.oldValue + "\n"
        "\n"
        "---------- [new] ----------\n" + r.newValue + "\n";
    fatal::raise_fatal(r);
}

} // namespace stagec::verify
