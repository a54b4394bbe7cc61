// Deterministic compilation verifier: compiles a module several times, shuffling the order in which
// functions are handed to the pipeline, and checks that every stage snapshot comes out identical.
#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stagec {
class CompileContext;
}

namespace stagec::verify {

// Not thread-safe. One verifier belongs to one module compilation running on one thread.
class Verifier {
public:
    // Seeds the shuffle from the wall clock.
    Verifier(std::size_t functionCount, int iterations);
    Verifier(std::size_t functionCount, int iterations, uint64_t seed);

    // Starts a pass. The first pass keeps the natural order (the baseline); every later pass
    // shuffles the function order in place.
    void beginIteration();

    // Function index the pipeline should compile at logical position i of the current pass.
    std::size_t translatedIndex(std::size_t i) const { return order_[i]; }

    // Records the snapshot for (current function, scope) on first sight; afterwards it must match.
    // A mismatch is a fatal DeterminismViolation. Throws ContextMisuse when ctx has no function name.
    void recordOrCheck(const CompileContext& ctx, std::string_view scope, const std::string& value);

    int iterations() const { return iterations_; }
    int currentIteration() const { return currentIteration_; }
    bool initialPassDone() const { return initialPassDone_; }
    const std::vector<std::size_t>& functionOrder() const { return order_; }
    std::size_t snapshotCount() const { return snapshots_.size(); }
    uint64_t seed() const { return seed_; }

private:
    bool initialPassDone_ = false;
    int iterations_;
    int currentIteration_ = 0;
    uint64_t seed_;
    std::vector<std::size_t> order_;
    std::mt19937_64 rng_;
    std::unordered_map<std::string, std::string> snapshots_;
};

// Composite snapshot key for a function and diagnostic scope.
std::string snapshot_key(std::string_view function, std::string_view scope);

} // namespace stagec::verify
