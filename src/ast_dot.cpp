#include "tekhne/ast_dot.hpp"
#include <sstream>

namespace tekhne {

namespace {

std::string dot_escape(const std::string& s){
    std::string o;
    for(char c : s){
        if(c=='"' || c=='\\') o += '\\';
        o += c;
    }
    return o;
}

struct dot_writer {
    std::ostringstream os;
    int next = 0;

    int node(const std::string& label){
        const int id = next++;
        os << "  n" << id << " [label=\"" << dot_escape(label) << "\"];\n";
        return id;
    }
    void edge(int from, int to){ os << "  n" << from << " -> n" << to << ";\n"; }
    int child(int parent, const std::string& label){ int id = node(label); edge(parent, id); return id; }

    int visit(const expr& e){
        return std::visit([&](const auto& n) -> int {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, literal>){
                return node("literal " + n.text);
            } else if constexpr (std::is_same_v<T, identifier>){
                return node("identifier " + n.name);
            } else if constexpr (std::is_same_v<T, paren_expr>){
                int id = node("paren"); edge(id, visit(*n.inner)); return id;
            } else if constexpr (std::is_same_v<T, call_expr>){
                int id = node("call");
                edge(id, visit(*n.callee));
                for(const auto& a : n.args) edge(id, visit(*a));
                return id;
            } else if constexpr (std::is_same_v<T, index_expr>){
                int id = node("index"); edge(id, visit(*n.base)); edge(id, visit(*n.index)); return id;
            } else if constexpr (std::is_same_v<T, member_expr>){
                int id = node("member ." + n.member); edge(id, visit(*n.base)); return id;
            } else if constexpr (std::is_same_v<T, postfix_expr>){
                int id = node(std::string("postfix ") + spelling(n.op)); edge(id, visit(*n.operand)); return id;
            } else if constexpr (std::is_same_v<T, unary_expr>){
                int id = node(std::string("prefix ") + spelling(n.op)); edge(id, visit(*n.operand)); return id;
            } else if constexpr (std::is_same_v<T, binary_expr>){
                int id = node(std::string("binary ") + spelling(n.op)); edge(id, visit(*n.lhs)); edge(id, visit(*n.rhs)); return id;
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        }, e.data);
    }

    int visit(const block& b, const std::string& label){
        int id = node(b.braced ? label + " {}" : label);
        for(const auto& s : b.stmts) edge(id, visit(*s));
        return id;
    }

    int visit(const stmt& s){
        return std::visit([&](const auto& n) -> int {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, for_loop>){
                int id = node("for_loop");
                edge(id, visit(*n.init)); edge(id, visit(*n.cond)); edge(id, visit(*n.post));
                edge(id, visit(n.body, "body"));
                return id;
            } else if constexpr (std::is_same_v<T, while_loop>){
                int id = node("while_loop"); edge(id, visit(*n.cond)); edge(id, visit(n.body, "body")); return id;
            } else if constexpr (std::is_same_v<T, conditional>){
                int id = node("conditional");
                int c = child(id, "if_clause");
                edge(c, visit(*n.if_.cond)); edge(c, visit(n.if_.body, "body"));
                for(const auto& e : n.elses) edge(id, visit(e.body, "else_clause"));
                return id;
            } else if constexpr (std::is_same_v<T, declaration>){
                std::string label = "declaration ";
                if(n.qualifier!=storage_qualifier::none) label += std::string(spelling(n.qualifier)) + " ";
                int id = node(label + n.type.name);
                for(const auto& d : n.declarators){
                    int dn = child(id, "declarator " + d.name);
                    for(const auto& dim : d.dims) edge(dn, visit(*dim));
                    if(d.init) edge(dn, visit(*d.init));
                }
                return id;
            } else if constexpr (std::is_same_v<T, expr_stmt>){
                int id = node("expr_stmt"); edge(id, visit(*n.value)); return id;
            } else if constexpr (std::is_same_v<T, assignment>){
                int id = node(std::string("assignment ") + spelling(n.op));
                edge(id, visit(*n.target)); edge(id, visit(*n.value));
                return id;
            } else if constexpr (std::is_same_v<T, jump_stmt>){
                int id = node(spelling(n.kind));
                if(n.value) edge(id, visit(*n.value));
                return id;
            } else {
                static_assert(always_false_v<T>, "unhandled statement kind");
            }
        }, s.data);
    }
};

} // namespace

std::string to_dot(const program& prog){
    dot_writer w;
    w.os << "digraph parse_tree {\n";
    int root = w.node("program");
    for(const auto& k : prog.kernels){
        int kid = w.child(root, std::string("kernel_spec ") + spelling(k.qualifier) + " " + k.return_type);
        int decl = w.child(kid, "kernel_decl " + k.decl.name);
        for(const auto& a : k.decl.args)
            w.child(decl, "argument " + a.type.name + (a.type.pointer ? "* " : " ") + a.name);
        int body = w.child(kid, "body");
        for(const auto& s : k.body) w.edge(body, w.visit(*s));
    }
    w.os << "}\n";
    return w.os.str();
}

} // namespace tekhne
