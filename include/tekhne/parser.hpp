#pragma once
#include "tekhne/ast.hpp"
#include <string>
#include <string_view>

namespace tekhne {

struct ParseResult {
    bool success{false};
    program prog;              // Valid only when success is true
    std::string error_message; // If !success, human-readable message
    std::string token;         // Offending token text, or "end of input"
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse kernel-language source text into an AST.
    // On a syntax error no partial tree is returned: prog stays empty and success is false.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

// Describe the token starting at the front of `rest` for error messages.
std::string describe_token(std::string_view rest);

} // namespace tekhne
