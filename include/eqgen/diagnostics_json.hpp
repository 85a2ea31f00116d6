// diagnostics_json.hpp - JSON serialization for check results
#pragma once
#include "eqgen/diagnostics.hpp"
#include "eqgen/options.hpp"
#include <string>

namespace eqgen {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const CheckResult& r);

// With diag_json set, print "[eqgen][diag] <json>" to stderr.
void maybe_print_json(const CheckResult& r, const Options& o);

} // namespace eqgen
