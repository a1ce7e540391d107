// WGSL code generator: walks a parsed program and re-emits it as compute-shader source
#pragma once
#include "tekhne/ast.hpp"
#include "tekhne/diagnostics.hpp"
#include "tekhne/features.hpp"
#include "tekhne/log.hpp"
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tekhne {

// A source builtin variable and the entry-point parameter that provides it.
// An empty `builtin` marks a variable with no target equivalent.
struct BuiltinMapping { std::string source; std::string builtin; std::string type{"vec3<u32>"}; };

struct GeneratorOptions {
    std::string indent_unit{"    "};
    std::unordered_map<std::string, std::string> type_map{
        {"int", "i32"}, {"float", "f32"}, {"unsigned", "u32"}, {"uint", "u32"}};
    // Signature order of injected parameters.
    std::vector<BuiltinMapping> builtins{
        {"threadIdx", "local_invocation_id"},
        {"blockIdx", "workgroup_id"},
        {"gridDim", "num_workgroups"},
        {"blockDim", ""}};
    std::unordered_map<std::string, std::string> call_map{
        {"__syncthreads", "workgroupBarrier"}, {"__threadfence_block", "workgroupBarrier"},
        {"sqrtf", "sqrt"}, {"expf", "exp"}, {"logf", "log"}, {"sinf", "sin"}, {"cosf", "cos"},
        {"fabsf", "abs"}, {"fminf", "min"}, {"fmaxf", "max"}, {"powf", "pow"}};
    std::string workgroup_size;                 // non-empty: @compute @workgroup_size(N)
    bool always_brace{always_brace_enabled()};  // brace single-statement bodies
    bool emit_bindings{true};                   // kernel arguments become @group(0) bindings
    LogSink log;                                // may be empty
};

class CodeGenerator {
public:
    explicit CodeGenerator(GeneratorOptions opts = {}): opts_(std::move(opts)){}
    // Translate every kernel in order. On a generation error no text is produced.
    // The generator may be reused; all state is reset per call and per kernel.
    GenerateResult generate(const program& prog);
    const GeneratorOptions& options() const { return opts_; }

private:
    GeneratorOptions opts_;

    // per call
    GenerateResult* result_ = nullptr;
    std::map<std::string, std::string> module_names_; // name -> declaration text
    std::unordered_set<std::string> symbols_;
    std::map<std::string, size_t> binding_slots_;     // argument name -> @binding index
    size_t entry_count_ = 0;

    // per kernel
    int depth_ = 0;
    std::unordered_set<std::string> idents_;
    std::vector<std::string> module_lines_;
    std::ostringstream body_;

    struct depth_scope {
        int& d;
        explicit depth_scope(int& depth): d(depth){ ++d; }
        ~depth_scope(){ --d; }
        depth_scope(const depth_scope&) = delete;
        depth_scope& operator=(const depth_scope&) = delete;
    };

    std::string emit_kernel(const kernel_spec& k);
    std::string entry_signature(const kernel_spec& k, std::vector<std::string>& unresolved);
    std::string device_signature(const kernel_spec& k);
    void bind_arguments(const kernel_spec& k);
    void declare_module(const std::string& name, const std::string& text, source_pos pos);
    void claim_symbol(const std::string& name, source_pos pos);

    void emit_stmt(const stmt& s);
    void emit_body(const std::string& header, const block& b);
    void emit_conditional(const conditional& c);
    void emit_declaration(const declaration& d, source_pos pos);
    std::string inline_stmt(const stmt& s);
    std::string declarator_text(const type_ref& t, const declarator& d);
    void line(const std::string& text);

    std::string expr_text(const expr& e);
    std::string map_type(const std::string& name) const;
    std::string array_type(const std::string& elem, const std::vector<expr_ptr>& dims);

    void warn(const std::string& code, const std::string& message, const std::string& hint, source_pos pos);
    [[noreturn]] void fail(const std::string& code, const std::string& message, const std::string& hint, source_pos pos);
    void log(LogLevel lvl, const std::string& msg) const { if(opts_.log) opts_.log(lvl, msg); }
};

} // namespace tekhne
