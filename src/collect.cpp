#include "tekhne/collect.hpp"

namespace tekhne {

namespace {

struct collector {
    std::unordered_set<std::string>& out;

    void visit(const expr_ptr& e){ if(e) collect_identifiers(*e, out); }

    void visit(const block& b){ for(const auto& s : b.stmts) visit(s); }

    void visit(const stmt_ptr& s){
        if(!s) return;
        std::visit([&](const auto& n){
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, for_loop>){
                visit(n.init); visit(n.cond); visit(n.post); visit(n.body);
            } else if constexpr (std::is_same_v<T, while_loop>){
                visit(n.cond); visit(n.body);
            } else if constexpr (std::is_same_v<T, conditional>){
                visit(n.if_.cond); visit(n.if_.body);
                for(const auto& e : n.elses) visit(e.body);
            } else if constexpr (std::is_same_v<T, declaration>){
                for(const auto& d : n.declarators){
                    out.insert(d.name);
                    for(const auto& dim : d.dims) visit(dim);
                    visit(d.init);
                }
            } else if constexpr (std::is_same_v<T, expr_stmt>){
                visit(n.value);
            } else if constexpr (std::is_same_v<T, assignment>){
                visit(n.target); visit(n.value);
            } else if constexpr (std::is_same_v<T, jump_stmt>){
                visit(n.value);
            } else {
                static_assert(always_false_v<T>, "unhandled statement kind");
            }
        }, s->data);
    }
};

} // namespace

void collect_identifiers(const expr& e, std::unordered_set<std::string>& out){
    std::visit([&](const auto& n){
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, literal>){
        } else if constexpr (std::is_same_v<T, identifier>){
            out.insert(n.name);
        } else if constexpr (std::is_same_v<T, paren_expr>){
            collect_identifiers(*n.inner, out);
        } else if constexpr (std::is_same_v<T, call_expr>){
            collect_identifiers(*n.callee, out);
            for(const auto& a : n.args) collect_identifiers(*a, out);
        } else if constexpr (std::is_same_v<T, index_expr>){
            collect_identifiers(*n.base, out);
            collect_identifiers(*n.index, out);
        } else if constexpr (std::is_same_v<T, member_expr>){
            collect_identifiers(*n.base, out); // selector is a field name
        } else if constexpr (std::is_same_v<T, postfix_expr> || std::is_same_v<T, unary_expr>){
            collect_identifiers(*n.operand, out);
        } else if constexpr (std::is_same_v<T, binary_expr>){
            collect_identifiers(*n.lhs, out);
            collect_identifiers(*n.rhs, out);
        } else {
            static_assert(always_false_v<T>, "unhandled expression kind");
        }
    }, e.data);
}

std::unordered_set<std::string> collect_identifiers(const kernel_spec& k){
    std::unordered_set<std::string> out;
    for(const auto& a : k.decl.args) out.insert(a.name);
    collector c{out};
    for(const auto& s : k.body) c.visit(s);
    return out;
}

} // namespace tekhne
