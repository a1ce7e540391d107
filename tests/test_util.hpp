#pragma once
#include "tekhne/codegen.hpp"
#include "tekhne/parser.hpp"
#include <gtest/gtest.h>
#include <string>

// Options with every environment-dependent default pinned.
inline tekhne::GeneratorOptions test_options(){
    tekhne::GeneratorOptions o;
    o.always_brace = false;
    return o;
}

inline tekhne::program parse_ok(const std::string& src){
    tekhne::Parser p;
    auto r = p.parse_string(src, "test.cu");
    EXPECT_TRUE(r.success) << r.error_message << " at " << r.line << ":" << r.column;
    return r.prog;
}

inline tekhne::GenerateResult generate(const std::string& src, const tekhne::GeneratorOptions& opts = test_options()){
    tekhne::CodeGenerator gen(opts);
    return gen.generate(parse_ok(src));
}

inline std::string wgsl(const std::string& src, const tekhne::GeneratorOptions& opts = test_options()){
    auto r = generate(src, opts);
    EXPECT_TRUE(r.success) << (r.errors.empty() ? std::string() : r.errors.front().code + ": " + r.errors.front().message);
    return r.text;
}

inline bool has_warning(const tekhne::GenerateResult& r, const std::string& code){
    for(const auto& w : r.warnings) if(w.code==code) return true;
    return false;
}
