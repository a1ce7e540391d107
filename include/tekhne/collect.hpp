#pragma once
#include "tekhne/ast.hpp"
#include <string>
#include <unordered_set>

namespace tekhne {

// Distinct identifier names referenced in one kernel: identifier atoms in every expression,
// declared variable names and argument names. Member selectors (`.x`) are field names and
// are not collected. The result is fresh on every call.
std::unordered_set<std::string> collect_identifiers(const kernel_spec& k);

// Same walk over a single expression, adding to an existing set.
void collect_identifiers(const expr& e, std::unordered_set<std::string>& out);

} // namespace tekhne
