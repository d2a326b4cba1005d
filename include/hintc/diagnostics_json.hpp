// diagnostics_json.hpp - JSON serialization for violation diagnostics
#pragma once
#include "hintc/report.hpp"
#include "hintc/conf.hpp"
#include <string>
#include <vector>

namespace hintc {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const Diagnostic& d);
std::string diagnostics_to_json(const std::vector<Diagnostic>& ds);

// If conf.diag_json (HINTC_DIAG_JSON=1), print the diagnostic as JSON to stderr.
void maybe_print_json(const Diagnostic& d, const CheckConf& conf);
void maybe_print_json(const Diagnostic& d);

} // namespace hintc
