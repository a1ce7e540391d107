// Umbrella header: parse + generate in one call
#pragma once
#include "tekhne/ast.hpp"
#include "tekhne/codegen.hpp"
#include "tekhne/diagnostics.hpp"
#include "tekhne/parser.hpp"
#include <string>
#include <string_view>

namespace tekhne {

struct TranslateResult {
    bool success{false};
    std::string text;
    program prog;             // parsed tree, empty on a syntax error
    GenerateResult diagnostics; // syntax errors are reported here as E0100
};

// Parse then generate. Prints diagnostics JSON to stderr when TEKHNE_DIAG_JSON is set.
TranslateResult translate(std::string_view src, const GeneratorOptions& opts = {}, std::string_view filename = "<memory>");

} // namespace tekhne
