#include "tekhne/tekhne.hpp"
#include "tekhne/diagnostics_json.hpp"

namespace tekhne {

TranslateResult translate(std::string_view src, const GeneratorOptions& opts, std::string_view filename){
    TranslateResult out;
    Parser parser;
    auto pres = parser.parse_string(src, filename);
    if(!pres.success){
        ErrorReporter rep{&out.diagnostics.errors, &out.diagnostics.warnings};
        auto err = rep.make_error("E0100", pres.error_message, "", pres.line, pres.column);
        err.notes.push_back(GenNote{"token: " + pres.token, pres.line, pres.column});
        rep.emit_error(err);
        if(opts.log) opts.log(LogLevel::error, std::string(filename) + ":" + std::to_string(pres.line) + ":" + std::to_string(pres.column) + ": parse error: " + pres.error_message);
        maybe_print_json(out.diagnostics);
        return out;
    }
    out.prog = std::move(pres.prog);
    CodeGenerator gen(opts);
    out.diagnostics = gen.generate(out.prog);
    maybe_print_json(out.diagnostics);
    out.success = out.diagnostics.success;
    out.text = out.diagnostics.text;
    return out;
}

} // namespace tekhne
