#include "tekhne/parser.hpp"
#include "pegtl/prelude.hpp"
#include "pegtl/grammar.hpp"
#include "pegtl/actions.hpp"
#include "pegtl/errors.hpp"
#include <tao/pegtl.hpp>
#include <cctype>

namespace tekhne {
using namespace tekhne::pegtl_front;

std::string describe_token(std::string_view rest){
    if(rest.empty()) return "end of input";
    auto is_word = [](char c){ return std::isalnum(static_cast<unsigned char>(c)) || c=='_'; };
    size_t n = 0;
    if(is_word(rest[0])){
        while(n < rest.size() && (is_word(rest[n]) || (rest[n]=='.' && std::isdigit(static_cast<unsigned char>(rest[0]))))) ++n;
        return std::string(rest.substr(0, n));
    }
    // longest operator first
    static const char* const ops[] = { "<<", ">>", "<=", ">=", "==", "!=", "&&", "||", "++", "--", "+=", "-=", "*=", "/=", "/*", "//" };
    for(const char* op : ops){
        if(rest.compare(0, 2, op)==0) return op;
    }
    if(std::isspace(static_cast<unsigned char>(rest[0]))){
        size_t i = 0;
        while(i < rest.size() && std::isspace(static_cast<unsigned char>(rest[i]))) ++i;
        return describe_token(rest.substr(i));
    }
    return std::string(1, rest[0]);
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    // Strip UTF-8 BOM if present
    if(src.size() >= 3 && static_cast<unsigned char>(src[0])==0xEF && static_cast<unsigned char>(src[1])==0xBB && static_cast<unsigned char>(src[2])==0xBF)
        src.remove_prefix(3);
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    build_state st;
    ParseResult r;
    try {
        tao::pegtl::parse< grammar::translation_unit, actions::action, errors::control >(in, st);
        r.success = true;
        r.prog = std::move(st.prog);
    } catch (const tao::pegtl::parse_error& e) {
        const auto& p = e.positions().front();
        r.success = false;
        r.error_message = std::string(e.message());
        r.token = describe_token(p.byte < src.size() ? src.substr(p.byte) : std::string_view{});
        r.line = static_cast<int>(p.line);
        r.column = static_cast<int>(p.column);
    }
    return r;
}

} // namespace tekhne
