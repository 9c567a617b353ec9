// diagnostics_json.hpp - JSON serialization for CompileResult
#pragma once
#include "ksc/diagnostics.hpp"
#include <string>

namespace ksc {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const CompileResult& r);

// Print diagnostics JSON to stderr.
void print_json(const CompileResult& r);

} // namespace ksc
