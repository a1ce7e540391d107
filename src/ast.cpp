#include "tekhne/ast.hpp"

namespace tekhne
{

    int precedence(binary_op op)
    {
        switch (op)
        {
        case binary_op::mul:
        case binary_op::div:
        case binary_op::mod:
            return 3;
        case binary_op::add:
        case binary_op::sub:
            return 4;
        case binary_op::shl:
        case binary_op::shr:
            return 5;
        case binary_op::lt:
        case binary_op::gt:
        case binary_op::le:
        case binary_op::ge:
            return 6;
        case binary_op::eq:
        case binary_op::ne:
            return 7;
        case binary_op::bit_and:
            return 8;
        case binary_op::bit_xor:
            return 9;
        case binary_op::bit_or:
            return 10;
        case binary_op::log_and:
            return 11;
        case binary_op::log_or:
            return 12;
        }
        return 12;
    }

    const char *spelling(binary_op op)
    {
        switch (op)
        {
        case binary_op::mul: return "*";
        case binary_op::div: return "/";
        case binary_op::mod: return "%";
        case binary_op::add: return "+";
        case binary_op::sub: return "-";
        case binary_op::shl: return "<<";
        case binary_op::shr: return ">>";
        case binary_op::lt: return "<";
        case binary_op::gt: return ">";
        case binary_op::le: return "<=";
        case binary_op::ge: return ">=";
        case binary_op::eq: return "==";
        case binary_op::ne: return "!=";
        case binary_op::bit_and: return "&";
        case binary_op::bit_xor: return "^";
        case binary_op::bit_or: return "|";
        case binary_op::log_and: return "&&";
        case binary_op::log_or: return "||";
        }
        return "?";
    }

    const char *spelling(unary_op op)
    {
        switch (op)
        {
        case unary_op::pre_inc: return "++";
        case unary_op::pre_dec: return "--";
        case unary_op::plus: return "+";
        case unary_op::neg: return "-";
        case unary_op::log_not: return "!";
        case unary_op::bit_not: return "~";
        case unary_op::deref: return "*";
        }
        return "?";
    }

    const char *spelling(postfix_op op)
    {
        return op == postfix_op::inc ? "++" : "--";
    }

    const char *spelling(assign_op op)
    {
        switch (op)
        {
        case assign_op::assign: return "=";
        case assign_op::add: return "+=";
        case assign_op::sub: return "-=";
        case assign_op::mul: return "*=";
        case assign_op::div: return "/=";
        }
        return "?";
    }

    const char *spelling(storage_qualifier q)
    {
        switch (q)
        {
        case storage_qualifier::none: return "";
        case storage_qualifier::shared: return "__shared__";
        case storage_qualifier::global: return "__global__";
        case storage_qualifier::device: return "__device__";
        }
        return "";
    }

    const char *spelling(function_qualifier q)
    {
        return q == function_qualifier::global ? "__global__" : "__device__";
    }

    const char *spelling(jump_kind k)
    {
        switch (k)
        {
        case jump_kind::return_: return "return";
        case jump_kind::break_: return "break";
        case jump_kind::continue_: return "continue";
        }
        return "?";
    }

    const conditional *else_if_target(const else_clause &c)
    {
        if (c.body.braced || c.body.stmts.size() != 1 || !c.body.stmts.front())
            return nullptr;
        return std::get_if<conditional>(&c.body.stmts.front()->data);
    }

} // namespace tekhne
