#include "stagec/ir/context.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace stagec {

static bool parse_u64(const char* s, uint64_t& out){
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 0);
    if(!end || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

// Reads process env vars and constructs a CompileEnv.
CompileEnv detectEnv(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("STAGEC_OPT_LEVEL")) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (s=="0"||s=="o0") e.optLevel = 0;
        else if (s=="2"||s=="o2") e.optLevel = 2;
        else if (s=="3"||s=="o3") e.optLevel = 3;
        else e.optLevel = 1;
    }

    if (const char* v = get("STAGEC_PASS_PIPELINE")) e.passPipeline = v;

    uint64_t n = 0;
    if (const char* v = get("STAGEC_NUM_REGS"); v && parse_u64(v, n))
        e.numRegs = static_cast<unsigned>(std::clamp<uint64_t>(n, 4, 14));

    if (const char* v = get("STAGEC_VERIFY_SEED"); v && parse_u64(v, n)) e.verifySeed = n;

    if (const char* v = get("STAGEC_HIGH_PRESSURE_THRESHOLD"); v && parse_u64(v, n))
        e.highPressureThreshold = static_cast<std::size_t>(n);

    // Anything smaller cannot hold a single frame.
    if (const char* v = get("STAGEC_STACK_SIZE"); v && parse_u64(v, n) && n >= 4096)
        e.stackSize = static_cast<std::size_t>(n);

    if (const char* v = get("STAGEC_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    return e;
}

} // namespace stagec
