#pragma once
#include "tekhne/ast.hpp"
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tekhne::pegtl_front {

// Shared state threaded through every action. Stacks only; each committed production
// pops what its children pushed and pushes its own node.
struct build_state {
    // expressions
    struct chain_frame { size_t operand_base; size_t op_base; };
    std::vector<expr_ptr> operands;
    std::vector<chain_frame> chains;
    std::vector<binary_op> ops;
    std::vector<std::pair<unary_op, source_pos>> prefix_ops;
    std::vector<size_t> call_marks;
    std::string member;
    std::optional<assign_op> pending_assign;
    expr_ptr pending_return;

    // statements
    struct stmt_frame { bool braced{false}; std::vector<stmt_ptr> stmts; };
    std::vector<stmt_frame> frames;
    std::vector<block> bodies;
    std::vector<conditional> conds;
    std::optional<declaration> decl;

    // kernels
    std::optional<kernel_spec> kernel;
    program prog;

    expr_ptr pop_operand(){ expr_ptr e = std::move(operands.back()); operands.pop_back(); return e; }
    block pop_body(){ block b = std::move(bodies.back()); bodies.pop_back(); return b; }
    void push_stmt(stmt_data d, source_pos pos){ frames.back().stmts.push_back(make_stmt(std::move(d), pos)); }
};

// Position of the first token inside a match; skips the leading padding that ws<> consumed.
inline source_pos token_pos(int line, int col, std::string_view text){
    size_t i = 0;
    auto step = [&](){ if(text[i]=='\n'){ ++line; col = 1; } else ++col; ++i; };
    while(i < text.size()){
        if(std::isspace(static_cast<unsigned char>(text[i]))){ step(); continue; }
        if(text.compare(i, 2, "//")==0){ while(i<text.size() && text[i]!='\n') step(); continue; }
        if(text.compare(i, 2, "/*")==0){
            step(); step();
            while(i<text.size() && text.compare(i, 2, "*/")!=0) step();
            if(i<text.size()){ step(); step(); }
            continue;
        }
        break;
    }
    return source_pos{line, col};
}

inline std::string trim(std::string_view s){
    size_t b = 0, e = s.size();
    while(b<e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e>b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return std::string(s.substr(b, e-b));
}

// "unsigned int" (with any padding between the words) is spelled "unsigned" in the tree.
inline std::string normalize_type(std::string_view s){
    std::string t = trim(s);
    if(t.size() > 8 && t.compare(0, 8, "unsigned")==0 && !std::isalnum(static_cast<unsigned char>(t[8])) && t[8]!='_')
        return "unsigned";
    return t;
}

// Fold operands[k..] joined by ops[k..] into one tree. Lower level binds tighter; equal
// levels associate to the left because the right operand only absorbs tighter operators.
inline expr_ptr fold_chain(const std::vector<expr_ptr>& xs, const std::vector<binary_op>& ops, size_t& k, int limit){
    expr_ptr lhs = xs[k];
    while(k < ops.size() && precedence(ops[k]) <= limit){
        binary_op op = ops[k];
        ++k;
        expr_ptr rhs = fold_chain(xs, ops, k, precedence(op) - 1);
        source_pos pos = lhs->pos;
        lhs = make_expr(binary_expr{op, std::move(lhs), std::move(rhs)}, pos);
    }
    return lhs;
}

} // namespace tekhne::pegtl_front
