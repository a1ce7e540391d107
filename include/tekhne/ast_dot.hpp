#pragma once
#include "tekhne/ast.hpp"
#include <string>

namespace tekhne {

// Render the tree as a Graphviz digraph. One node per production, labelled with its kind
// and, for leaves, the source text; edges run parent to child in source order.
std::string to_dot(const program& prog);

} // namespace tekhne
