// Kernel-language AST: closed variants for expressions and statements with source positions
#pragma once
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tekhne
{

    struct expr;
    struct stmt;

    using expr_ptr = std::shared_ptr<const expr>;
    using stmt_ptr = std::shared_ptr<const stmt>;

    struct source_pos
    {
        int line = 0;
        int col = 0;
    };

    enum class literal_kind
    {
        integer,
        signed_integer,
        decimal,
        boolean
    };

    // Binary operators, precedence levels 3 (tightest) through 12 (loosest).
    enum class binary_op
    {
        mul,
        div,
        mod,
        add,
        sub,
        shl,
        shr,
        lt,
        gt,
        le,
        ge,
        eq,
        ne,
        bit_and,
        bit_xor,
        bit_or,
        log_and,
        log_or
    };

    enum class unary_op
    {
        pre_inc,
        pre_dec,
        plus,
        neg,
        log_not,
        bit_not,
        deref
    };

    enum class postfix_op
    {
        inc,
        dec
    };

    enum class assign_op
    {
        assign,
        add,
        sub,
        mul,
        div
    };

    enum class storage_qualifier
    {
        none,
        shared,
        global,
        device
    };

    enum class function_qualifier
    {
        global,
        device
    };

    enum class jump_kind
    {
        return_,
        break_,
        continue_
    };

    // ---- expressions ----
    struct literal
    {
        literal_kind kind;
        std::string text;
    };
    struct identifier
    {
        std::string name;
    };
    struct paren_expr
    {
        expr_ptr inner;
    };
    struct call_expr
    {
        expr_ptr callee;
        std::vector<expr_ptr> args;
    };
    struct index_expr
    {
        expr_ptr base;
        expr_ptr index;
    };
    struct member_expr
    {
        expr_ptr base;
        std::string member;
    };
    struct postfix_expr
    {
        postfix_op op;
        expr_ptr operand;
    };
    struct unary_expr
    {
        unary_op op;
        expr_ptr operand;
    };
    struct binary_expr
    {
        binary_op op;
        expr_ptr lhs;
        expr_ptr rhs;
    };

    using expr_data = std::variant<literal, identifier, paren_expr, call_expr, index_expr, member_expr,
                                   postfix_expr, unary_expr, binary_expr>;

    struct expr
    {
        expr_data data;
        source_pos pos;
    };

    // ---- statements ----
    struct type_ref
    {
        std::string name;
        bool pointer = false;
    };

    struct declarator
    {
        std::string name;
        std::vector<expr_ptr> dims;
        expr_ptr init; // may be null
        source_pos pos;
    };

    struct declaration
    {
        storage_qualifier qualifier = storage_qualifier::none;
        type_ref type;
        std::vector<declarator> declarators;
    };

    struct assignment
    {
        expr_ptr target;
        assign_op op;
        expr_ptr value;
    };

    struct expr_stmt
    {
        expr_ptr value;
    };

    struct jump_stmt
    {
        jump_kind kind;
        expr_ptr value; // only for return, may be null
    };

    // A statement body: either a braced block or exactly one unbraced statement.
    struct block
    {
        bool braced = false;
        std::vector<stmt_ptr> stmts;
    };

    struct if_clause
    {
        expr_ptr cond;
        block body;
    };

    struct else_clause
    {
        block body;
    };

    struct conditional
    {
        if_clause if_;
        std::vector<else_clause> elses;
    };

    struct while_loop
    {
        expr_ptr cond;
        block body;
    };

    struct for_loop
    {
        stmt_ptr init; // declaration or assignment
        expr_ptr cond;
        stmt_ptr post; // expr_stmt or assignment
        block body;
    };

    using stmt_data = std::variant<for_loop, while_loop, conditional, declaration, expr_stmt, assignment, jump_stmt>;

    struct stmt
    {
        stmt_data data;
        source_pos pos;
    };

    // ---- kernels ----
    struct argument
    {
        type_ref type;
        std::string name;
        source_pos pos;
    };

    struct kernel_decl
    {
        std::string name;
        std::vector<argument> args;
        source_pos pos;
    };

    struct kernel_spec
    {
        function_qualifier qualifier = function_qualifier::global;
        std::string return_type;
        kernel_decl decl;
        std::vector<stmt_ptr> body;
        source_pos pos;
    };

    struct program
    {
        std::vector<kernel_spec> kernels;
    };

    // Used as the else branch of exhaustive `if constexpr` visitors.
    template <typename>
    inline constexpr bool always_false_v = false;

    // Declared precedence table: 3 = multiplicative ... 12 = logical or. All levels are left-associative.
    int precedence(binary_op op);

    const char *spelling(binary_op op);
    const char *spelling(unary_op op);
    const char *spelling(postfix_op op);
    const char *spelling(assign_op op);
    const char *spelling(storage_qualifier q);
    const char *spelling(function_qualifier q);
    const char *spelling(jump_kind k);

    // If the else clause is an unbraced single nested conditional (an else-if), return it.
    const conditional *else_if_target(const else_clause &c);

    inline expr_ptr make_expr(expr_data d, source_pos pos) { return std::make_shared<const expr>(expr{std::move(d), pos}); }
    inline stmt_ptr make_stmt(stmt_data d, source_pos pos) { return std::make_shared<const stmt>(stmt{std::move(d), pos}); }

} // namespace tekhne
