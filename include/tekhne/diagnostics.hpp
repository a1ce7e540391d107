// Generation diagnostics: codes, messages and source positions
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace tekhne {

// Codes:
//   E0100 syntax error (reported by translate())
//   W0200 degraded output: node kind without a translation rule
//   W0300 unresolved builtin, W0301 shared initializer dropped, W0302 builtin in device function,
//   W0303 storage qualifier on a local declaration ignored
//   E0400 module-scope name conflict, E0401 entry symbol collision, E0402 invalid for initializer
struct GenNote { std::string message; int line=-1; int col=-1; };
struct GenError { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<GenNote> notes; };
struct GenWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<GenNote> notes; };

struct ErrorReporter {
    std::vector<GenError>* errors=nullptr;
    std::vector<GenWarning>* warnings=nullptr;
    void emit_error(const GenError& e){ if(errors) errors->push_back(e); }
    void emit_warning(const GenWarning& w){ if(warnings) warnings->push_back(w); }
    GenError make_error(std::string code, std::string message, std::string hint, int line, int col){ return GenError{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
    GenWarning make_warning(std::string code, std::string message, std::string hint, int line, int col){ return GenWarning{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
};

struct GenerateResult { bool success{false}; std::string text; std::vector<GenError> errors; std::vector<GenWarning> warnings; };

} // namespace tekhne
