#pragma once
#include <tao/pegtl.hpp>

namespace tekhne::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : seq< two<'/'>, until< eolf > > {};
struct block_comment_tail : until< string<'*','/'> > {};
struct block_comment : seq< string<'/','*'>, must< block_comment_tail > > {};
struct space_or_comment : sor< space, comment_line, block_comment > {};

template<typename Rule>
using ws = pad< Rule, space_or_comment >;

// Keywords
struct kw_if : keyword<'i','f'> {};
struct kw_else : keyword<'e','l','s','e'> {};
struct kw_for : keyword<'f','o','r'> {};
struct kw_while : keyword<'w','h','i','l','e'> {};
struct kw_return : keyword<'r','e','t','u','r','n'> {};
struct kw_break : keyword<'b','r','e','a','k'> {};
struct kw_continue : keyword<'c','o','n','t','i','n','u','e'> {};
struct kw_true : keyword<'t','r','u','e'> {};
struct kw_false : keyword<'f','a','l','s','e'> {};
struct kw_unsigned : keyword<'u','n','s','i','g','n','e','d'> {};
struct kw_int : keyword<'i','n','t'> {};
struct kw_shared : keyword<'_','_','s','h','a','r','e','d','_','_'> {};
struct kw_global : keyword<'_','_','g','l','o','b','a','l','_','_'> {};
struct kw_device : keyword<'_','_','d','e','v','i','c','e','_','_'> {};
struct reserved : sor< kw_if, kw_else, kw_for, kw_while, kw_return, kw_break, kw_continue,
                       kw_true, kw_false, kw_shared, kw_global, kw_device > {};

struct ident : seq< not_at< reserved >, tao::pegtl::identifier > {};

// Punctuation
struct tok_lparen : ws< one<'('> > {};
struct tok_rparen : ws< one<')'> > {};
struct tok_lbrace : ws< one<'{'> > {};
struct tok_rbrace : ws< one<'}'> > {};
struct tok_lbracket : ws< one<'['> > {};
struct tok_rbracket : ws< one<']'> > {};
struct tok_semi : ws< one<';'> > {};
struct tok_comma : ws< one<','> > {};
struct tok_dot : ws< one<'.'> > {};
struct tok_star : ws< one<'*'> > {};
struct tok_assign : ws< seq< one<'='>, not_at< one<'='> > > > {};

// Literals
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct float_suffix : one<'f','F'> {};
struct decimal_lit : seq< sor< seq< sor< seq< plus< digit >, one<'.'>, star< digit > >,
                                         seq< one<'.'>, plus< digit > > >,
                                    opt< exponent > >,
                               seq< plus< digit >, exponent > >,
                          opt< float_suffix >,
                          not_at< identifier_other > > {};
struct hex_digits : seq< one<'0'>, one<'x','X'>, plus< xdigit > > {};
struct int_digits : seq< sor< hex_digits, plus< digit > >, opt< one<'u','U'> >,
                         not_at< one<'.'> >, not_at< identifier_other > > {};
struct int_lit : seq< int_digits > {};
struct signed_lit : seq< one<'+','-'>, int_digits > {};
struct bool_lit : sor< kw_true, kw_false > {};

// Expressions
struct expression;
struct unary_expr;
struct identifier_atom : ident {};
struct paren_atom : seq< tok_lparen, must< expression >, must< tok_rparen > > {};
struct atom : sor< decimal_lit, signed_lit, int_lit, bool_lit, identifier_atom, paren_atom > {};

struct call_open : one<'('> {};
struct call_arg : seq< expression > {};
struct call_suffix : seq< ws< call_open >, opt< list_must< call_arg, tok_comma > >, must< tok_rparen > > {};
struct index_suffix : seq< tok_lbracket, must< expression >, must< tok_rbracket > > {};
struct member_name : ident {};
struct member_suffix : seq< tok_dot, must< ws< member_name > > > {};
struct postfix_inc : string<'+','+'> {};
struct postfix_dec : string<'-','-'> {};
struct postfix_suffix : sor< call_suffix, index_suffix, member_suffix, ws< postfix_inc >, ws< postfix_dec > > {};
struct postfix_chain : seq< ws< atom >, star< postfix_suffix > > {};

struct prefix_op : sor< string<'+','+'>, string<'-','-'>, one<'+','-','!','~','*'> > {};
struct prefix_application : seq< ws< prefix_op >, must< unary_expr > > {};
// A sign glued to an integer in operand position is a signed literal, not a prefix operator.
struct unary_expr : sor< seq< at< ws< signed_lit > >, postfix_chain >, prefix_application, postfix_chain > {};

struct binary_op : sor< string<'<','<'>, string<'>','>'>, string<'<','='>, string<'>','='>,
                        string<'=','='>, string<'!','='>, string<'&','&'>, string<'|','|'>,
                        one<'<'>, one<'>'>, one<'&'>, one<'^'>, one<'|'>,
                        seq< one<'+'>, not_at< one<'+','='> > >,
                        seq< one<'-'>, not_at< one<'-','='> > >,
                        seq< one<'*'>, not_at< one<'='> > >,
                        seq< one<'/'>, not_at< one<'='> > >,
                        one<'%'> > {};
// Flat operand/operator chain; folded by precedence climbing in the expression action.
// chain_begin sits after the first operand so a failed attempt leaves no state behind.
struct chain_begin : success {};
struct expression : seq< unary_expr, chain_begin, star< ws< binary_op >, must< unary_expr > > > {};

// Lvalues and assignment
struct assign_op : sor< string<'+','='>, string<'-','='>, string<'*','='>, string<'/','='>,
                        seq< one<'='>, not_at< one<'='> > > > {};
struct lvalue : seq< ws< identifier_atom >, star< sor< index_suffix, member_suffix > > > {};
struct assign_guard : seq< lvalue, ws< assign_op > > {};
struct assignment_core : seq< lvalue, ws< assign_op >, must< expression > > {};
struct assignment_stmt : seq< at< assign_guard >, assignment_core, must< tok_semi > > {};

// Types and declarations
struct type_name : sor< seq< kw_unsigned, star< space_or_comment >, kw_int >, ident > {};
struct storage : sor< kw_shared, kw_global, kw_device > {};
struct decl_guard : seq< opt< ws< storage > >, ws< type_name >, ws< ident > > {};
struct decl_begin : success {};
struct decl_type : type_name {};
struct decl_name : ident {};
struct array_dim : seq< tok_lbracket, must< expression >, must< tok_rbracket > > {};
struct declarator_init : seq< tok_assign, must< expression > > {};
struct declarator : seq< ws< decl_name >, star< array_dim >, opt< declarator_init > > {};
struct declaration_stmt : seq< at< decl_guard >, decl_begin, opt< ws< storage > >, ws< decl_type >,
                               list_must< declarator, tok_comma >, must< tok_semi > > {};

// Statements
struct statement;
struct body_begin : success {};
struct braced_block : seq< tok_lbrace, star< statement >, must< tok_rbrace > > {};
struct body : seq< body_begin, sor< braced_block, statement > > {};

struct expr_statement : seq< expression, must< tok_semi > > {};

struct return_value : seq< expression > {};
struct return_stmt : seq< ws< kw_return >, opt< return_value >, must< tok_semi > > {};
struct break_stmt : seq< ws< kw_break >, must< tok_semi > > {};
struct continue_stmt : seq< ws< kw_continue >, must< tok_semi > > {};
struct jump_stmt : sor< return_stmt, break_stmt, continue_stmt > {};

struct cond_begin : success {};
struct if_clause : seq< ws< kw_if >, must< tok_lparen >, must< expression >, must< tok_rparen >, must< body > > {};
struct else_clause : seq< ws< kw_else >, must< body > > {};
struct conditional : seq< at< ws< kw_if > >, cond_begin, if_clause, star< else_clause > > {};

struct while_loop : seq< ws< kw_while >, must< tok_lparen >, must< expression >, must< tok_rparen >, must< body > > {};

struct for_begin : success {};
struct for_init : sor< declaration_stmt, assignment_stmt > {};
struct post_expr : seq< expression > {};
struct for_post : sor< seq< at< assign_guard >, assignment_core >, post_expr > {};
struct for_loop : seq< ws< kw_for >, for_begin, must< tok_lparen >, must< for_init >, must< expression >,
                       must< tok_semi >, must< for_post >, must< tok_rparen >, must< body > > {};

struct statement : sor< for_loop, while_loop, conditional, jump_stmt, declaration_stmt, assignment_stmt, expr_statement > {};

// Kernels
struct fn_qualifier : sor< kw_global, kw_device > {};
struct return_type : ws< type_name > {};
struct kernel_name : ws< ident > {};
struct param_type : type_name {};
struct param_pointer : one<'*'> {};
struct param_name : ident {};
struct parameter : seq< ws< param_type >, opt< ws< param_pointer > >, must< ws< param_name > > > {};
struct param_list : seq< tok_lparen, opt< list_must< parameter, tok_comma > >, must< tok_rparen > > {};
struct kernel_body : seq< body_begin, braced_block > {};
struct kernel_spec : seq< ws< fn_qualifier >, must< return_type >, must< kernel_name >, must< param_list >, must< kernel_body > > {};

struct translation_unit : seq< star< space_or_comment >, star< kernel_spec >, star< space_or_comment >, must< eof > > {};

} // namespace tekhne::pegtl_front::grammar
