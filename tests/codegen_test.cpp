#include "test_util.hpp"

using namespace tekhne;

namespace {

size_t count_of(const std::string& hay, const std::string& needle){
    size_t n = 0;
    for(size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + needle.size())) ++n;
    return n;
}

} // namespace

TEST(Codegen, ThreadIndexScenario){
    const std::string expected =
        "@group(0) @binding(0) var<storage, read_write> a : array<i32>;\n"
        "\n"
        "@compute\n"
        "fn main(@builtin(local_invocation_id) threadIdx : vec3<u32>) {\n"
        "    var i : i32 = threadIdx.x;\n"
        "    a[i] += 1;\n"
        "}\n";
    EXPECT_EQ(wgsl("__global__ void k(int* a) { int i = threadIdx.x; a[i] += 1; }"), expected);
}

TEST(Codegen, EmptyKernel){
    EXPECT_EQ(wgsl("__global__ void k() { }"), "@compute\nfn main() {\n}\n");
}

TEST(Codegen, TypeRemapping){
    const std::string out = wgsl("__global__ void k(float s, unsigned int* u) { int a; float b; unsigned c; uint d; bool e; }");
    EXPECT_NE(out.find("var<uniform> s : f32;"), std::string::npos) << out;
    EXPECT_NE(out.find("var<storage, read_write> u : array<u32>;"), std::string::npos) << out;
    EXPECT_NE(out.find("    var a : i32;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    var b : f32;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    var c : u32;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    var d : u32;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    var e : bool;\n"), std::string::npos) << out;
}

TEST(Codegen, CustomTypeMap){
    auto opts = test_options();
    opts.type_map["half"] = "f16";
    EXPECT_NE(wgsl("__global__ void k() { half h; }", opts).find("var h : f16;"), std::string::npos);
}

TEST(Codegen, PrecedenceRoundTrip){
    const std::string out = wgsl("__global__ void k() { x = (a + b) * c - d / e % f << 1 < g == h & i ^ j | k && l || !m; }");
    EXPECT_NE(out.find("    x = (a + b) * c - d / e % f << 1 < g == h & i ^ j | k && l || !m;\n"), std::string::npos) << out;
}

TEST(Codegen, PrefixAndPostfixHaveNoSpaces){
    const std::string out = wgsl("__global__ void k() { i++; --j; x = -y + ~z; w = - -v; }");
    EXPECT_NE(out.find("    i++;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    --j;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    x = -y + ~z;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    w = --v;\n"), std::string::npos) << out;
}

TEST(Codegen, AssignmentOperatorsVerbatim){
    const std::string out = wgsl("__global__ void k() { a = 1; b += 2; c -= 3; d *= 4; e /= 5; }");
    EXPECT_NE(out.find("    a = 1;\n    b += 2;\n    c -= 3;\n    d *= 4;\n    e /= 5;\n"), std::string::npos) << out;
}

TEST(Codegen, ElseIfFlattening){
    const std::string src = R"(__global__ void k(int n) {
    int x = 0;
    if (n < 0) {
        x = -1;
    } else if (n == 0) {
        x = 0;
    } else {
        x = 1;
    }
})";
    const std::string expected =
        "@group(0) @binding(0) var<uniform> n : i32;\n"
        "\n"
        "@compute\n"
        "fn main() {\n"
        "    var x : i32 = 0;\n"
        "    if (n < 0) {\n"
        "        x = -1;\n"
        "    } else if (n == 0) {\n"
        "        x = 0;\n"
        "    } else {\n"
        "        x = 1;\n"
        "    }\n"
        "}\n";
    EXPECT_EQ(wgsl(src), expected);
}

TEST(Codegen, UnbracedClauses){
    const std::string out = wgsl("__global__ void k() { if (a) x = 1; else if (b) x = 2; else x = 3; }");
    const std::string expected =
        "    if (a)\n"
        "        x = 1;\n"
        "    else if (b)\n"
        "        x = 2;\n"
        "    else\n"
        "        x = 3;\n";
    EXPECT_NE(out.find(expected), std::string::npos) << out;
}

TEST(Codegen, MixedBracedAndUnbracedClauses){
    const std::string out = wgsl("__global__ void k() { if (a) x = 1; else { x = 2; } }");
    EXPECT_NE(out.find("    if (a)\n        x = 1;\n    else {\n        x = 2;\n    }\n"), std::string::npos) << out;
}

TEST(Codegen, EmptyBracedBodiesKeepBraces){
    const std::string out = wgsl("__global__ void k() { if (a) { } else { } while (b) { } }");
    EXPECT_NE(out.find("    if (a) {\n    } else {\n    }\n    while (b) {\n    }\n"), std::string::npos) << out;
}

TEST(Codegen, IndentationSymmetry){
    const std::string src = R"(__global__ void k(int n) {
    int s = 0;
    while (s < n) {
        if (s == 3)
            break;
        for (int i = 0; i < 2; i++) {
            s += i;
        }
        s += 1;
    }
    s = 0;
})";
    const std::string body =
        "    var s : i32 = 0;\n"
        "    while (s < n) {\n"
        "        if (s == 3)\n"
        "            break;\n"
        "        for (var i : i32 = 0; i < 2; i++) {\n"
        "            s += i;\n"
        "        }\n"
        "        s += 1;\n"
        "    }\n"
        "    s = 0;\n"
        "}\n";
    const std::string out = wgsl(src);
    ASSERT_GE(out.size(), body.size());
    EXPECT_EQ(out.substr(out.size() - body.size()), body) << out;
}

TEST(Codegen, UnbracedLoops){
    const std::string out = wgsl("__global__ void k(int* a, int n) { for (int i = 0; i < n; i++) a[i] = 0; while (n > 0) n = n - 1; }");
    EXPECT_NE(out.find("    for (var i : i32 = 0; i < n; i++)\n        a[i] = 0;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    while (n > 0)\n        n = n - 1;\n"), std::string::npos) << out;
}

TEST(Codegen, ForWithAssignmentHeader){
    const std::string out = wgsl("__global__ void k() { for (i = 0; i < 8; i += 2) { } }");
    EXPECT_NE(out.find("    for (i = 0; i < 8; i += 2) {\n    }\n"), std::string::npos) << out;
}

TEST(Codegen, CustomIndentUnit){
    auto opts = test_options();
    opts.indent_unit = "\t";
    EXPECT_EQ(wgsl("__global__ void k() { if (a) { b = 1; } }", opts), "@compute\nfn main() {\n\tif (a) {\n\t\tb = 1;\n\t}\n}\n");
}

TEST(Codegen, AlwaysBrace){
    auto opts = test_options();
    opts.always_brace = true;
    const std::string out = wgsl("__global__ void k() { if (a) x = 1; else x = 2; while (b) b = 0; }", opts);
    EXPECT_NE(out.find("    if (a) {\n        x = 1;\n    } else {\n        x = 2;\n    }\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    while (b) {\n        b = 0;\n    }\n"), std::string::npos) << out;
}

TEST(Codegen, JumpStatements){
    const std::string out = wgsl("__global__ void k() { while (a) { if (b) continue; break; } return; }");
    EXPECT_NE(out.find("            continue;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("        break;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    return;\n"), std::string::npos) << out;
}

TEST(Codegen, MultipleDeclaratorsAndArrays){
    const std::string out = wgsl("__global__ void k() { int a = 1, b; float m[4][2]; }");
    EXPECT_NE(out.find("    var a : i32 = 1;\n    var b : i32;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    var m : array<array<f32, 2>, 4>;\n"), std::string::npos) << out;
}

TEST(Codegen, BuiltinsInTableOrder){
    const std::string out = wgsl("__global__ void k() { int i = gridDim.x + blockIdx.x + threadIdx.x; }");
    EXPECT_NE(out.find("fn main(@builtin(local_invocation_id) threadIdx : vec3<u32>, "
                       "@builtin(workgroup_id) blockIdx : vec3<u32>, "
                       "@builtin(num_workgroups) gridDim : vec3<u32>) {\n"), std::string::npos) << out;
}

TEST(Codegen, BuiltinInjectionIsIdempotent){
    const std::string out = wgsl("__global__ void k() { x = threadIdx.x + threadIdx.y * threadIdx.z; }");
    EXPECT_EQ(count_of(out, "@builtin("), 1u) << out;
}

TEST(Codegen, NoBuiltinsNoParameters){
    EXPECT_NE(wgsl("__global__ void k(int* a) { a[0] = 1; }").find("fn main() {\n"), std::string::npos);
}

TEST(Codegen, UnresolvedBlockDim){
    auto r = generate("__global__ void k(int* a) { a[threadIdx.x] = blockDim.x; }");
    ASSERT_TRUE(r.success);
    const std::string expected =
        "@group(0) @binding(0) var<storage, read_write> a : array<i32>;\n"
        "\n"
        "// unresolved: blockDim has no WGSL builtin\n"
        "@compute\n"
        "fn main(@builtin(local_invocation_id) threadIdx : vec3<u32>) {\n"
        "    a[threadIdx.x] = blockDim.x;\n"
        "}\n";
    EXPECT_EQ(r.text, expected);
    EXPECT_TRUE(has_warning(r, "W0300"));
}

TEST(Codegen, SharedDeclarationsAreHoisted){
    auto r = generate("__global__ void k(float* a) { __shared__ float tile[64]; __shared__ int flag = 0; tile[threadIdx.x] = a[threadIdx.x]; }");
    ASSERT_TRUE(r.success);
    const std::string expected =
        "@group(0) @binding(0) var<storage, read_write> a : array<f32>;\n"
        "var<workgroup> tile : array<f32, 64>;\n"
        "var<workgroup> flag : i32;\n"
        "\n"
        "@compute\n"
        "fn main(@builtin(local_invocation_id) threadIdx : vec3<u32>) {\n"
        "    tile[threadIdx.x] = a[threadIdx.x];\n"
        "}\n";
    EXPECT_EQ(r.text, expected);
    EXPECT_TRUE(has_warning(r, "W0301"));
}

TEST(Codegen, LocalStorageQualifierIgnored){
    auto r = generate("__global__ void k() { __device__ int x = 1; }");
    ASSERT_TRUE(r.success);
    EXPECT_NE(r.text.find("    var x : i32 = 1;\n"), std::string::npos) << r.text;
    EXPECT_TRUE(has_warning(r, "W0303"));
}

TEST(Codegen, WorkgroupSize){
    auto opts = test_options();
    opts.workgroup_size = "64";
    EXPECT_EQ(wgsl("__global__ void k() { }", opts), "@compute @workgroup_size(64)\nfn main() {\n}\n");
}

TEST(Codegen, BindingsDisabled){
    auto opts = test_options();
    opts.emit_bindings = false;
    EXPECT_EQ(wgsl("__global__ void k(int* a, float s) { }", opts), "@compute\nfn main(a : array<i32>, s : f32) {\n}\n");
}

TEST(Codegen, MultipleKernelsGetDistinctEntries){
    const std::string expected =
        "@group(0) @binding(0) var<storage, read_write> a : array<i32>;\n"
        "\n"
        "@compute\n"
        "fn main_first() {\n"
        "    a[0] = 1;\n"
        "}\n"
        "\n"
        "@compute\n"
        "fn main_second() {\n"
        "    a[1] = 2;\n"
        "}\n";
    EXPECT_EQ(wgsl("__global__ void first(int* a) { a[0] = 1; } __global__ void second(int* a) { a[1] = 2; }"), expected);
}

TEST(Codegen, SharedArgumentKeepsFirstBindingSlot){
    const std::string expected =
        "@group(0) @binding(0) var<storage, read_write> x : array<f32>;\n"
        "@group(0) @binding(1) var<storage, read_write> y : array<f32>;\n"
        "\n"
        "@compute\n"
        "fn main_scale() {\n"
        "    y[0] = x[0] * 2.0;\n"
        "}\n"
        "\n"
        "@compute\n"
        "fn main_clear() {\n"
        "    y[0] = 0.0;\n"
        "}\n";
    auto r = generate("__global__ void scale(float* x, float* y) { y[0] = x[0] * 2.0; }\n"
                      "__global__ void clear(float* y) { y[0] = 0.0; }");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.text, expected);
}

TEST(Codegen, BindingSlotsContinueAcrossKernels){
    auto text = wgsl("__global__ void first(int* a) { } __global__ void second(float s, int* a) { }");
    EXPECT_NE(text.find("@group(0) @binding(0) var<storage, read_write> a : array<i32>;\n"), std::string::npos) << text;
    EXPECT_NE(text.find("@group(0) @binding(1) var<uniform> s : f32;\n"), std::string::npos) << text;
    EXPECT_EQ(text.find("@binding(2)"), std::string::npos) << text;
}

TEST(Codegen, ConflictingModuleScopeNames){
    auto r = generate("__global__ void first(int* a) { } __global__ void second(float* a) { }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.text.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E0400");
    EXPECT_EQ(r.errors[0].notes.size(), 2u);
}

TEST(Codegen, EntrySymbolCollision){
    auto r = generate("__global__ void k() { } __global__ void k() { }");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E0401");

    auto dev = generate("__device__ void main() { } __global__ void k() { }");
    EXPECT_FALSE(dev.success);
    ASSERT_EQ(dev.errors.size(), 1u);
    EXPECT_EQ(dev.errors[0].code, "E0401");
}

TEST(Codegen, InvalidForInitializer){
    auto r = generate("__global__ void k() { for (int i = 0, j = 0; i < 4; i++) { } }");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.text.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E0402");
    EXPECT_EQ(r.errors[0].line, 1);

    auto shared = generate("__global__ void k() { for (__shared__ int i = 0; i < 4; i++) { } }");
    EXPECT_FALSE(shared.success);
    EXPECT_EQ(shared.errors.at(0).code, "E0402");
}

TEST(Codegen, DeviceFunctions){
    const std::string out = wgsl(R"(__device__ float scale(float v, float* buf) { return v * buf[0]; }
__device__ void touch() { }
__global__ void k(float* a) { a[0] = scale(a[1], a); touch(); })");
    const std::string expected =
        "fn scale(v : f32, buf : ptr<storage, array<f32>, read_write>) -> f32 {\n"
        "    return v * buf[0];\n"
        "}\n"
        "\n"
        "fn touch() {\n"
        "}\n"
        "\n"
        "@group(0) @binding(0) var<storage, read_write> a : array<f32>;\n"
        "\n"
        "@compute\n"
        "fn main() {\n"
        "    a[0] = scale(a[1], a);\n"
        "    touch();\n"
        "}\n";
    EXPECT_EQ(out, expected);
}

TEST(Codegen, BuiltinInDeviceFunctionWarns){
    auto r = generate("__device__ int lane() { return threadIdx.x; }");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(has_warning(r, "W0302"));
    EXPECT_EQ(r.text.find("@builtin"), std::string::npos);
}

TEST(Codegen, CallRenames){
    const std::string out = wgsl("__global__ void k() { __syncthreads(); x = sqrtf(fmaxf(a, b)); y = mine(a); }");
    EXPECT_NE(out.find("    workgroupBarrier();\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    x = sqrt(max(a, b));\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    y = mine(a);\n"), std::string::npos) << out;
}

TEST(Codegen, DereferenceFallsBackToOperand){
    std::vector<std::string> logged;
    auto opts = test_options();
    opts.log = [&](LogLevel lvl, const std::string& msg){ if(lvl==LogLevel::warning) logged.push_back(msg); };
    auto r = generate("__global__ void k(int* p) { int v = *p; }", opts);
    ASSERT_TRUE(r.success);
    EXPECT_NE(r.text.find("    var v : i32 = p;\n"), std::string::npos) << r.text;
    EXPECT_TRUE(has_warning(r, "W0200"));
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].rfind("W0200", 0), 0u);
}

TEST(Codegen, LiteralsVerbatim){
    const std::string out = wgsl("__global__ void k() { x = 2.0f + 1e-3 + 0xFFu + -4; b = true; }");
    EXPECT_NE(out.find("    x = 2.0f + 1e-3 + 0xFFu + -4;\n"), std::string::npos) << out;
    EXPECT_NE(out.find("    b = true;\n"), std::string::npos) << out;
}

TEST(Codegen, DeterministicAndReusable){
    const std::string src = "__global__ void k(int* a) { __shared__ int t[4]; if (threadIdx.x < 4) { t[threadIdx.x] = a[blockIdx.x]; } }";
    CodeGenerator gen(test_options());
    auto prog = parse_ok(src);
    auto first = gen.generate(prog);
    auto second = gen.generate(prog);
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.text, wgsl(src));
}
