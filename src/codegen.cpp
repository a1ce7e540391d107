#include "tekhne/codegen.hpp"
#include "tekhne/collect.hpp"
#include <stdexcept>
#include <utility>

namespace tekhne {

namespace {

// Unwinds out of a kernel; generate() turns it into the result.
struct generation_error : std::runtime_error {
    GenError err;
    explicit generation_error(GenError e): std::runtime_error(e.message), err(std::move(e)){}
};

std::string at(source_pos pos){ return " (" + std::to_string(pos.line) + ":" + std::to_string(pos.col) + ")"; }

} // namespace

GenerateResult CodeGenerator::generate(const program& prog){
    GenerateResult r;
    result_ = &r;
    module_names_.clear();
    symbols_.clear();
    binding_slots_.clear();
    entry_count_ = 0;
    for(const auto& k : prog.kernels)
        if(k.qualifier==function_qualifier::global) ++entry_count_;

    std::string text;
    try {
        for(const auto& k : prog.kernels){
            std::string chunk = emit_kernel(k);
            if(!text.empty()) text += "\n";
            text += chunk;
        }
        r.success = true;
        r.text = std::move(text);
    } catch (const generation_error& e){
        ErrorReporter rep{&r.errors, &r.warnings};
        rep.emit_error(e.err);
        log(LogLevel::error, e.err.code + ": " + e.err.message + at(source_pos{e.err.line, e.err.col}));
        r.success = false;
        r.text.clear();
    }
    result_ = nullptr;
    return r;
}

std::string CodeGenerator::emit_kernel(const kernel_spec& k){
    depth_ = 0;
    idents_ = collect_identifiers(k);
    module_lines_.clear();
    body_.str("");
    body_.clear();

    const bool entry = k.qualifier==function_qualifier::global;
    log(LogLevel::debug, std::string("kernel ") + k.decl.name + ": " + std::to_string(idents_.size()) + " identifiers");

    std::vector<std::string> unresolved;
    std::string signature = entry ? entry_signature(k, unresolved) : device_signature(k);
    if(entry && opts_.emit_bindings) bind_arguments(k);

    {
        depth_scope scope(depth_);
        for(const auto& s : k.body) emit_stmt(*s);
    }

    std::string out;
    for(const auto& l : module_lines_) out += l + "\n";
    if(!module_lines_.empty()) out += "\n";
    for(const auto& u : unresolved) out += "// unresolved: " + u + "\n";
    if(entry){
        out += "@compute";
        if(!opts_.workgroup_size.empty()) out += " @workgroup_size(" + opts_.workgroup_size + ")";
        out += "\n";
    }
    out += signature + " {\n";
    out += body_.str();
    out += "}\n";
    return out;
}

std::string CodeGenerator::entry_signature(const kernel_spec& k, std::vector<std::string>& unresolved){
    const std::string name = entry_count_ > 1 ? "main_" + k.decl.name : "main";
    claim_symbol(name, k.decl.pos);
    std::vector<std::string> params;
    for(const auto& b : opts_.builtins){
        if(!idents_.count(b.source)) continue;
        if(b.builtin.empty()){
            unresolved.push_back(b.source + " has no WGSL builtin");
            warn("W0300", "builtin '" + b.source + "' has no target equivalent", "pass the value as a uniform argument", k.decl.pos);
            continue;
        }
        params.push_back("@builtin(" + b.builtin + ") " + b.source + " : " + b.type);
    }
    if(!opts_.emit_bindings){
        for(const auto& a : k.decl.args)
            params.push_back(a.name + " : " + (a.type.pointer ? "array<" + map_type(a.type.name) + ">" : map_type(a.type.name)));
    }
    std::string sig = "fn " + name + "(";
    for(size_t i=0;i<params.size();++i){ if(i) sig += ", "; sig += params[i]; }
    return sig + ")";
}

std::string CodeGenerator::device_signature(const kernel_spec& k){
    claim_symbol(k.decl.name, k.decl.pos);
    for(const auto& b : opts_.builtins){
        if(idents_.count(b.source))
            warn("W0302", "builtin '" + b.source + "' used in device function '" + k.decl.name + "'", "pass the value as a parameter from the kernel", k.decl.pos);
    }
    std::string sig = "fn " + k.decl.name + "(";
    for(size_t i=0;i<k.decl.args.size();++i){
        const auto& a = k.decl.args[i];
        if(i) sig += ", ";
        sig += a.name + " : ";
        sig += a.type.pointer ? "ptr<storage, array<" + map_type(a.type.name) + ">, read_write>" : map_type(a.type.name);
    }
    sig += ")";
    if(k.return_type!="void") sig += " -> " + map_type(k.return_type);
    return sig;
}

// Slots are numbered per program in first-use order, so an argument name
// shared by several kernels binds to one resource.
void CodeGenerator::bind_arguments(const kernel_spec& k){
    for(const auto& a : k.decl.args){
        const size_t slot = binding_slots_.emplace(a.name, binding_slots_.size()).first->second;
        std::string text = "@group(0) @binding(" + std::to_string(slot) + ") ";
        if(a.type.pointer) text += "var<storage, read_write> " + a.name + " : array<" + map_type(a.type.name) + ">;";
        else text += "var<uniform> " + a.name + " : " + map_type(a.type.name) + ";";
        declare_module(a.name, text, a.pos);
    }
}

void CodeGenerator::declare_module(const std::string& name, const std::string& text, source_pos pos){
    auto it = module_names_.find(name);
    if(it==module_names_.end()){
        module_names_.emplace(name, text);
        module_lines_.push_back(text);
        return;
    }
    if(it->second==text) return;
    GenError e{"E0400", "conflicting module-scope declarations of '" + name + "'", "rename one of the declarations", pos.line, pos.col, {}};
    e.notes.push_back(GenNote{"previous: " + it->second, -1, -1});
    e.notes.push_back(GenNote{"     now: " + text, pos.line, pos.col});
    throw generation_error(std::move(e));
}

void CodeGenerator::claim_symbol(const std::string& name, source_pos pos){
    if(!symbols_.insert(name).second)
        fail("E0401", "function symbol '" + name + "' is emitted twice", "rename the kernel or device function", pos);
}

// ---- statements ----

void CodeGenerator::line(const std::string& text){
    for(int i=0;i<depth_;++i) body_ << opts_.indent_unit;
    body_ << text << "\n";
}

void CodeGenerator::emit_body(const std::string& header, const block& b){
    if(b.braced || opts_.always_brace){
        line(header + " {");
        {
            depth_scope scope(depth_);
            for(const auto& s : b.stmts) emit_stmt(*s);
        }
        line("}");
        return;
    }
    line(header);
    depth_scope scope(depth_);
    for(const auto& s : b.stmts) emit_stmt(*s);
}

void CodeGenerator::emit_conditional(const conditional& c){
    struct clause { std::string header; const block* body; };
    std::vector<clause> clauses;
    auto flatten = [&](const conditional& cur, bool first, auto& self) -> void {
        clauses.push_back(clause{std::string(first ? "if (" : "else if (") + expr_text(*cur.if_.cond) + ")", &cur.if_.body});
        for(const auto& e : cur.elses){
            if(const conditional* nested = else_if_target(e)) self(*nested, false, self);
            else clauses.push_back(clause{"else", &e.body});
        }
    };
    flatten(c, true, flatten);

    bool open = false; // previous clause left its closing brace for this header
    for(const auto& cl : clauses){
        const bool braced = cl.body->braced || opts_.always_brace;
        const std::string header = (open ? "} " : "") + cl.header;
        if(braced){
            line(header + " {");
            depth_scope scope(depth_);
            for(const auto& s : cl.body->stmts) emit_stmt(*s);
        } else {
            line(header);
            depth_scope scope(depth_);
            for(const auto& s : cl.body->stmts) emit_stmt(*s);
        }
        open = braced;
    }
    if(open) line("}");
}

std::string CodeGenerator::declarator_text(const type_ref& t, const declarator& d){
    std::string s = "var " + d.name + " : " + array_type(map_type(t.name), d.dims);
    if(d.init) s += " = " + expr_text(*d.init);
    return s;
}

void CodeGenerator::emit_declaration(const declaration& d, source_pos pos){
    if(d.qualifier==storage_qualifier::shared){
        for(const auto& decl : d.declarators){
            if(decl.init)
                warn("W0301", "initializer on workgroup variable '" + decl.name + "' dropped", "assign the value in the kernel body", decl.pos);
            const std::string text = "var<workgroup> " + decl.name + " : " + array_type(map_type(d.type.name), decl.dims) + ";";
            declare_module(decl.name, text, decl.pos);
        }
        return;
    }
    if(d.qualifier!=storage_qualifier::none)
        warn("W0303", std::string("storage qualifier ") + spelling(d.qualifier) + " ignored on local declaration", "", pos);
    for(const auto& decl : d.declarators) line(declarator_text(d.type, decl) + ";");
}

std::string CodeGenerator::inline_stmt(const stmt& s){
    if(const auto* d = std::get_if<declaration>(&s.data)){
        if(d->qualifier==storage_qualifier::shared || d->declarators.size()!=1)
            fail("E0402", "for initializer must declare exactly one local variable", "move the declaration before the loop", s.pos);
        if(d->qualifier!=storage_qualifier::none)
            warn("W0303", std::string("storage qualifier ") + spelling(d->qualifier) + " ignored on local declaration", "", s.pos);
        return declarator_text(d->type, d->declarators.front());
    }
    if(const auto* a = std::get_if<assignment>(&s.data))
        return expr_text(*a->target) + " " + spelling(a->op) + " " + expr_text(*a->value);
    if(const auto* e = std::get_if<expr_stmt>(&s.data))
        return expr_text(*e->value);
    fail("E0402", "unsupported statement in for header", "", s.pos);
}

void CodeGenerator::emit_stmt(const stmt& s){
    std::visit([&](const auto& n){
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, for_loop>){
            const std::string init = inline_stmt(*n.init);
            const std::string post = inline_stmt(*n.post);
            emit_body("for (" + init + "; " + expr_text(*n.cond) + "; " + post + ")", n.body);
        } else if constexpr (std::is_same_v<T, while_loop>){
            emit_body("while (" + expr_text(*n.cond) + ")", n.body);
        } else if constexpr (std::is_same_v<T, conditional>){
            emit_conditional(n);
        } else if constexpr (std::is_same_v<T, declaration>){
            emit_declaration(n, s.pos);
        } else if constexpr (std::is_same_v<T, expr_stmt>){
            line(expr_text(*n.value) + ";");
        } else if constexpr (std::is_same_v<T, assignment>){
            line(expr_text(*n.target) + " " + spelling(n.op) + " " + expr_text(*n.value) + ";");
        } else if constexpr (std::is_same_v<T, jump_stmt>){
            if(n.value) line(std::string(spelling(n.kind)) + " " + expr_text(*n.value) + ";");
            else line(std::string(spelling(n.kind)) + ";");
        } else {
            static_assert(always_false_v<T>, "unhandled statement kind");
        }
    }, s.data);
}

// ---- expressions ----

std::string CodeGenerator::expr_text(const expr& e){
    return std::visit([&](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, literal>){
            return n.text;
        } else if constexpr (std::is_same_v<T, identifier>){
            return n.name;
        } else if constexpr (std::is_same_v<T, paren_expr>){
            return "(" + expr_text(*n.inner) + ")";
        } else if constexpr (std::is_same_v<T, call_expr>){
            std::string callee = expr_text(*n.callee);
            if(const auto* id = std::get_if<identifier>(&n.callee->data)){
                auto it = opts_.call_map.find(id->name);
                if(it!=opts_.call_map.end()) callee = it->second;
            }
            std::string s = callee + "(";
            for(size_t i=0;i<n.args.size();++i){ if(i) s += ", "; s += expr_text(*n.args[i]); }
            return s + ")";
        } else if constexpr (std::is_same_v<T, index_expr>){
            return expr_text(*n.base) + "[" + expr_text(*n.index) + "]";
        } else if constexpr (std::is_same_v<T, member_expr>){
            return expr_text(*n.base) + "." + n.member;
        } else if constexpr (std::is_same_v<T, postfix_expr>){
            return expr_text(*n.operand) + spelling(n.op);
        } else if constexpr (std::is_same_v<T, unary_expr>){
            if(n.op==unary_op::deref){
                warn("W0200", "no translation for dereference; emitting operand", "index the pointer argument instead", e.pos);
                return expr_text(*n.operand);
            }
            return spelling(n.op) + expr_text(*n.operand);
        } else if constexpr (std::is_same_v<T, binary_expr>){
            return expr_text(*n.lhs) + " " + spelling(n.op) + " " + expr_text(*n.rhs);
        } else {
            static_assert(always_false_v<T>, "unhandled expression kind");
        }
    }, e.data);
}

std::string CodeGenerator::map_type(const std::string& name) const {
    auto it = opts_.type_map.find(name);
    return it==opts_.type_map.end() ? name : it->second;
}

// T x[A][B] -> array<array<T, B>, A>
std::string CodeGenerator::array_type(const std::string& elem, const std::vector<expr_ptr>& dims){
    std::string t = elem;
    for(auto it = dims.rbegin(); it!=dims.rend(); ++it) t = "array<" + t + ", " + expr_text(**it) + ">";
    return t;
}

// ---- diagnostics ----

void CodeGenerator::warn(const std::string& code, const std::string& message, const std::string& hint, source_pos pos){
    ErrorReporter rep{&result_->errors, &result_->warnings};
    rep.emit_warning(rep.make_warning(code, message, hint, pos.line, pos.col));
    log(LogLevel::warning, code + ": " + message + at(pos));
}

void CodeGenerator::fail(const std::string& code, const std::string& message, const std::string& hint, source_pos pos){
    ErrorReporter rep;
    throw generation_error(rep.make_error(code, message, hint, pos.line, pos.col));
}

} // namespace tekhne
