// diagnostics_json.hpp - JSON serialization for CompileResult diagnostics
#pragma once
#include "stagec/compiler.hpp"
#include <string>

namespace stagec {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const CompileResult& r);

// If env.diagJson (STAGEC_DIAG_JSON=1), print diagnostics JSON to stderr.
void maybe_print_json(const CompileResult& r, const CompileEnv& env);

} // namespace stagec
