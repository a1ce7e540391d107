#pragma once
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <string_view>

namespace tekhne {
std::string describe_token(std::string_view rest);
}

namespace tekhne::pegtl_front::errors {
using namespace tao::pegtl;
namespace g = tekhne::pegtl_front::grammar;

// Message for a must<> failure on Rule; nullptr falls back to the rule name.
template<typename Rule> inline constexpr const char* message = nullptr;

template<> inline constexpr const char* message< g::tok_lparen > = "expected '('";
template<> inline constexpr const char* message< g::tok_rparen > = "expected ')'";
template<> inline constexpr const char* message< g::tok_rbrace > = "expected '}'";
template<> inline constexpr const char* message< g::tok_rbracket > = "expected ']'";
template<> inline constexpr const char* message< g::tok_semi > = "expected ';'";
template<> inline constexpr const char* message< g::expression > = "expected expression";
template<> inline constexpr const char* message< g::unary_expr > = "expected operand";
template<> inline constexpr const char* message< g::call_arg > = "expected argument";
template<> inline constexpr const char* message< g::declarator > = "expected declarator";
template<> inline constexpr const char* message< g::ws< g::member_name > > = "expected member name";
template<> inline constexpr const char* message< g::body > = "expected statement or '{'";
template<> inline constexpr const char* message< g::kernel_body > = "expected '{'";
template<> inline constexpr const char* message< g::for_init > = "expected declaration or assignment";
template<> inline constexpr const char* message< g::for_post > = "expected expression or assignment";
template<> inline constexpr const char* message< g::return_type > = "expected return type";
template<> inline constexpr const char* message< g::kernel_name > = "expected kernel name";
template<> inline constexpr const char* message< g::param_list > = "expected '('";
template<> inline constexpr const char* message< g::parameter > = "expected parameter";
template<> inline constexpr const char* message< g::ws< g::param_name > > = "expected parameter name";
template<> inline constexpr const char* message< g::block_comment_tail > = "unterminated comment";
template<> inline constexpr const char* message< eof > = "expected '__global__' or '__device__' function";

template<typename Rule>
struct control : normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...){
        std::string msg = message<Rule> ? message<Rule> : "parse error matching " + std::string(demangle<Rule>());
        msg += " but found '" + describe_token(std::string_view(in.current(), in.size(0))) + "'";
        throw parse_error(msg, in);
    }
};

} // namespace tekhne::pegtl_front::errors
