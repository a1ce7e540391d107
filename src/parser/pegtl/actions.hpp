#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <string_view>

namespace tekhne::pegtl_front::actions {
using namespace tao::pegtl;
using tekhne::pegtl_front::build_state;

template<typename Input>
std::string_view view(const Input& in){ return std::string_view(in.begin(), in.size()); }

template<typename Input>
source_pos pos_of(const Input& in){
    const auto p = in.position();
    return token_pos(static_cast<int>(p.line), static_cast<int>(p.column), view(in));
}

template<typename Rule>
struct action : nothing<Rule> {};

// ---- atoms ----
template<> struct action< grammar::int_lit > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.operands.push_back(make_expr(literal{literal_kind::integer, in.string()}, pos_of(in)));
    }
};
template<> struct action< grammar::signed_lit > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.operands.push_back(make_expr(literal{literal_kind::signed_integer, in.string()}, pos_of(in)));
    }
};
template<> struct action< grammar::decimal_lit > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.operands.push_back(make_expr(literal{literal_kind::decimal, in.string()}, pos_of(in)));
    }
};
template<> struct action< grammar::bool_lit > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.operands.push_back(make_expr(literal{literal_kind::boolean, in.string()}, pos_of(in)));
    }
};
template<> struct action< grammar::identifier_atom > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.operands.push_back(make_expr(identifier{in.string()}, pos_of(in)));
    }
};
template<> struct action< grammar::paren_atom > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        auto inner = st.pop_operand();
        st.operands.push_back(make_expr(paren_expr{std::move(inner)}, pos_of(in)));
    }
};

// ---- postfix ----
template<> struct action< grammar::call_open > {
    template<typename Input> static void apply(const Input&, build_state& st){
        st.call_marks.push_back(st.operands.size());
    }
};
template<> struct action< grammar::call_suffix > {
    template<typename Input> static void apply(const Input&, build_state& st){
        const size_t mark = st.call_marks.back(); st.call_marks.pop_back();
        std::vector<expr_ptr> args(st.operands.begin() + static_cast<std::ptrdiff_t>(mark), st.operands.end());
        st.operands.resize(mark);
        auto callee = st.pop_operand();
        source_pos pos = callee->pos;
        st.operands.push_back(make_expr(call_expr{std::move(callee), std::move(args)}, pos));
    }
};
template<> struct action< grammar::index_suffix > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto index = st.pop_operand();
        auto base = st.pop_operand();
        source_pos pos = base->pos;
        st.operands.push_back(make_expr(index_expr{std::move(base), std::move(index)}, pos));
    }
};
template<> struct action< grammar::member_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.member = in.string(); }
};
template<> struct action< grammar::member_suffix > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto base = st.pop_operand();
        source_pos pos = base->pos;
        st.operands.push_back(make_expr(member_expr{std::move(base), std::move(st.member)}, pos));
        st.member.clear();
    }
};
template<postfix_op Op>
struct postfix_action {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto operand = st.pop_operand();
        source_pos pos = operand->pos;
        st.operands.push_back(make_expr(postfix_expr{Op, std::move(operand)}, pos));
    }
};
template<> struct action< grammar::postfix_inc > : postfix_action<postfix_op::inc> {};
template<> struct action< grammar::postfix_dec > : postfix_action<postfix_op::dec> {};

// ---- prefix ----
template<> struct action< grammar::prefix_op > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        const std::string s = in.string();
        unary_op op = unary_op::plus;
        if(s=="++") op = unary_op::pre_inc;
        else if(s=="--") op = unary_op::pre_dec;
        else if(s=="-") op = unary_op::neg;
        else if(s=="!") op = unary_op::log_not;
        else if(s=="~") op = unary_op::bit_not;
        else if(s=="*") op = unary_op::deref;
        st.prefix_ops.emplace_back(op, pos_of(in));
    }
};
template<> struct action< grammar::prefix_application > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto [op, pos] = st.prefix_ops.back(); st.prefix_ops.pop_back();
        auto operand = st.pop_operand();
        st.operands.push_back(make_expr(unary_expr{op, std::move(operand)}, pos));
    }
};

// ---- binary chains ----
template<> struct action< grammar::chain_begin > {
    static void apply0(build_state& st){
        st.chains.push_back(build_state::chain_frame{st.operands.size() - 1, st.ops.size()});
    }
};
template<> struct action< grammar::binary_op > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        const std::string s = in.string();
        binary_op op = binary_op::mod;
        if(s=="*") op = binary_op::mul;
        else if(s=="/") op = binary_op::div;
        else if(s=="+") op = binary_op::add;
        else if(s=="-") op = binary_op::sub;
        else if(s=="<<") op = binary_op::shl;
        else if(s==">>") op = binary_op::shr;
        else if(s=="<") op = binary_op::lt;
        else if(s==">") op = binary_op::gt;
        else if(s=="<=") op = binary_op::le;
        else if(s==">=") op = binary_op::ge;
        else if(s=="==") op = binary_op::eq;
        else if(s=="!=") op = binary_op::ne;
        else if(s=="&") op = binary_op::bit_and;
        else if(s=="^") op = binary_op::bit_xor;
        else if(s=="|") op = binary_op::bit_or;
        else if(s=="&&") op = binary_op::log_and;
        else if(s=="||") op = binary_op::log_or;
        st.ops.push_back(op);
    }
};
template<> struct action< grammar::expression > {
    template<typename Input> static void apply(const Input&, build_state& st){
        const auto frame = st.chains.back(); st.chains.pop_back();
        std::vector<expr_ptr> xs(st.operands.begin() + static_cast<std::ptrdiff_t>(frame.operand_base), st.operands.end());
        std::vector<binary_op> ops(st.ops.begin() + static_cast<std::ptrdiff_t>(frame.op_base), st.ops.end());
        st.operands.resize(frame.operand_base);
        st.ops.resize(frame.op_base);
        size_t k = 0;
        st.operands.push_back(fold_chain(xs, ops, k, precedence(binary_op::log_or)));
    }
};

// ---- assignment ----
template<> struct action< grammar::assign_op > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        const std::string s = in.string();
        if(s=="+=") st.pending_assign = assign_op::add;
        else if(s=="-=") st.pending_assign = assign_op::sub;
        else if(s=="*=") st.pending_assign = assign_op::mul;
        else if(s=="/=") st.pending_assign = assign_op::div;
        else st.pending_assign = assign_op::assign;
    }
};
template<> struct action< grammar::assignment_core > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        auto value = st.pop_operand();
        auto target = st.pop_operand();
        const assign_op op = st.pending_assign.value_or(assign_op::assign);
        st.pending_assign.reset();
        st.push_stmt(assignment{std::move(target), op, std::move(value)}, pos_of(in));
    }
};

// ---- declarations ----
template<> struct action< grammar::decl_begin > {
    static void apply0(build_state& st){ st.decl = declaration{}; }
};
template<> struct action< grammar::storage > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        const std::string s = in.string();
        st.decl->qualifier = s=="__shared__" ? storage_qualifier::shared
                           : s=="__global__" ? storage_qualifier::global
                           : storage_qualifier::device;
    }
};
template<> struct action< grammar::decl_type > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.decl->type.name = normalize_type(view(in)); }
};
template<> struct action< grammar::decl_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        declarator d; d.name = in.string(); d.pos = pos_of(in);
        st.decl->declarators.push_back(std::move(d));
    }
};
template<> struct action< grammar::array_dim > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.decl->declarators.back().dims.push_back(st.pop_operand()); }
};
template<> struct action< grammar::declarator_init > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.decl->declarators.back().init = st.pop_operand(); }
};
template<> struct action< grammar::declaration_stmt > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.push_stmt(std::move(*st.decl), pos_of(in));
        st.decl.reset();
    }
};

// ---- bodies ----
template<> struct action< grammar::body_begin > {
    static void apply0(build_state& st){ st.frames.emplace_back(); }
};
template<> struct action< grammar::braced_block > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.frames.back().braced = true; }
};
template<> struct action< grammar::body > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto frame = std::move(st.frames.back()); st.frames.pop_back();
        st.bodies.push_back(block{frame.braced, std::move(frame.stmts)});
    }
};

// ---- simple statements ----
template<> struct action< grammar::expr_statement > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.push_stmt(expr_stmt{st.pop_operand()}, pos_of(in));
    }
};
template<> struct action< grammar::return_value > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.pending_return = st.pop_operand(); }
};
template<> struct action< grammar::return_stmt > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.push_stmt(jump_stmt{jump_kind::return_, std::move(st.pending_return)}, pos_of(in));
        st.pending_return.reset();
    }
};
template<> struct action< grammar::break_stmt > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.push_stmt(jump_stmt{jump_kind::break_, nullptr}, pos_of(in)); }
};
template<> struct action< grammar::continue_stmt > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.push_stmt(jump_stmt{jump_kind::continue_, nullptr}, pos_of(in)); }
};

// ---- conditionals and loops ----
template<> struct action< grammar::cond_begin > {
    static void apply0(build_state& st){ st.conds.emplace_back(); }
};
template<> struct action< grammar::if_clause > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto body = st.pop_body();
        st.conds.back().if_ = if_clause{st.pop_operand(), std::move(body)};
    }
};
template<> struct action< grammar::else_clause > {
    template<typename Input> static void apply(const Input&, build_state& st){
        st.conds.back().elses.push_back(else_clause{st.pop_body()});
    }
};
template<> struct action< grammar::conditional > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        auto c = std::move(st.conds.back()); st.conds.pop_back();
        st.push_stmt(std::move(c), pos_of(in));
    }
};
template<> struct action< grammar::while_loop > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        auto body = st.pop_body();
        auto cond = st.pop_operand();
        st.push_stmt(while_loop{std::move(cond), std::move(body)}, pos_of(in));
    }
};
// The header frame collects the init statement and the post clause, in that order.
template<> struct action< grammar::for_begin > {
    static void apply0(build_state& st){ st.frames.emplace_back(); }
};
template<> struct action< grammar::post_expr > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.push_stmt(expr_stmt{st.pop_operand()}, pos_of(in));
    }
};
template<> struct action< grammar::for_loop > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        auto body = st.pop_body();
        auto header = std::move(st.frames.back()); st.frames.pop_back();
        auto cond = st.pop_operand();
        for_loop f;
        f.init = header.stmts.at(0);
        f.cond = std::move(cond);
        f.post = header.stmts.at(1);
        f.body = std::move(body);
        st.push_stmt(std::move(f), pos_of(in));
    }
};

// ---- kernels ----
template<> struct action< grammar::fn_qualifier > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        kernel_spec k;
        k.qualifier = in.string()=="__device__" ? function_qualifier::device : function_qualifier::global;
        k.pos = pos_of(in);
        st.kernel = std::move(k);
    }
};
template<> struct action< grammar::return_type > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.kernel->return_type = normalize_type(view(in)); }
};
template<> struct action< grammar::kernel_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        st.kernel->decl.name = trim(view(in));
        st.kernel->decl.pos = pos_of(in);
    }
};
template<> struct action< grammar::param_type > {
    template<typename Input> static void apply(const Input& in, build_state& st){
        argument a; a.type.name = normalize_type(view(in)); a.pos = pos_of(in);
        st.kernel->decl.args.push_back(std::move(a));
    }
};
template<> struct action< grammar::param_pointer > {
    template<typename Input> static void apply(const Input&, build_state& st){ st.kernel->decl.args.back().type.pointer = true; }
};
template<> struct action< grammar::param_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){ st.kernel->decl.args.back().name = in.string(); }
};
template<> struct action< grammar::kernel_body > {
    template<typename Input> static void apply(const Input&, build_state& st){
        auto frame = std::move(st.frames.back()); st.frames.pop_back();
        st.kernel->body = std::move(frame.stmts);
    }
};
template<> struct action< grammar::kernel_spec > {
    template<typename Input> static void apply(const Input&, build_state& st){
        st.prog.kernels.push_back(std::move(*st.kernel));
        st.kernel.reset();
    }
};

} // namespace tekhne::pegtl_front::actions
