// diagnostics_json.hpp - JSON serialization for GenerateResult
#pragma once
#include "tekhne/diagnostics.hpp"
#include <string>

namespace tekhne {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string:
// {"success":bool,"errors":[...],"warnings":[...]}, each entry with code, message, hint, line, col, notes.
std::string diagnostics_to_json(const GenerateResult& r);

// If TEKHNE_DIAG_JSON is set in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const GenerateResult& r);

} // namespace tekhne
