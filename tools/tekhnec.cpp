#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "tekhne/ast_dot.hpp"
#include "tekhne/features.hpp"
#include "tekhne/log.hpp"
#include "tekhne/tekhne.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static int usage(){
    std::cerr << "usage: tekhnec <input.cu> [-o out.wgsl] [-d] [-f] [-t] [--indent N] [--workgroup-size N] [--always-brace]\n"
                 "  -o, --output       output path (default: input basename with .wgsl)\n"
                 "  -d, --debug        debug logging; echo generated code to stdout\n"
                 "  -f, --file-log     also write log lines to 'tekhne.log'\n"
                 "  -t, --parse-tree   write the parse tree to 'parse-tree.dot'\n";
    return 2;
}

static std::string default_output(const std::string& input){
    std::string base = input;
    auto slash = base.find_last_of("/\\");
    if(slash != std::string::npos) base = base.substr(slash + 1);
    auto dot = base.find_last_of('.');
    if(dot != std::string::npos && dot != 0) base = base.substr(0, dot);
    return base + ".wgsl";
}

static bool all_digits(const std::string& s){
    if(s.empty()) return false;
    for(char c : s) if(c < '0' || c > '9') return false;
    return true;
}

int main(int argc, char** argv){
    try{
        std::string input, output;
        bool debug = tekhne::debug_enabled(), file_log = false, parse_tree = false;
        tekhne::GeneratorOptions opts;
        for(int i = 1; i < argc; ++i){
            const std::string a = argv[i];
            auto value = [&](std::string& dst){ if(i + 1 >= argc) return false; dst = argv[++i]; return true; };
            if(a == "-o" || a == "--output"){ if(!value(output)) return usage(); }
            else if(a == "-d" || a == "--debug") debug = true;
            else if(a == "-f" || a == "--file-log") file_log = true;
            else if(a == "-t" || a == "--parse-tree") parse_tree = true;
            else if(a == "--always-brace") opts.always_brace = true;
            else if(a == "--indent"){
                std::string n; if(!value(n) || !all_digits(n)) return usage();
                opts.indent_unit = std::string(static_cast<size_t>(std::stoi(n)), ' ');
            }
            else if(a == "--workgroup-size"){
                if(!value(opts.workgroup_size) || !all_digits(opts.workgroup_size)) return usage();
            }
            else if(a == "-h" || a == "--help"){ usage(); return 0; }
            else if(!a.empty() && a[0] == '-') return usage();
            else if(input.empty()) input = a;
            else return usage();
        }
        if(input.empty()) return usage();
        if(output.empty()) output = default_output(input);

        const tekhne::LogLevel threshold = debug ? tekhne::LogLevel::debug : tekhne::LogLevel::info;
        tekhne::LogSink log = tekhne::stream_sink(std::cerr, threshold);
        std::ofstream log_file;
        if(file_log){
            log_file.open("tekhne.log", std::ios::app);
            if(log_file) log = tekhne::tee_sink(log, tekhne::stream_sink(log_file, threshold));
            else log(tekhne::LogLevel::warning, "cannot open 'tekhne.log'; logging to stderr only");
            log(tekhne::LogLevel::debug, "Logging to 'tekhne.log'...");
        }
        opts.log = log;

        log(tekhne::LogLevel::debug, "Reading input file...");
        std::ifstream f(input, std::ios::binary);
        if(!f){
            const int err = errno;
            if(err == ENOENT) log(tekhne::LogLevel::error, "'" + input + "' not found!");
            else if(err == EACCES) log(tekhne::LogLevel::error, "No permission to read '" + input + "'!");
            else log(tekhne::LogLevel::error, "OS error reading '" + input + "': " + std::strerror(err));
            return 1;
        }
        const auto src = read_all(f);

        log(tekhne::LogLevel::debug, "Parsing input...");
        auto res = tekhne::translate(src, opts, input);
        if(!res.diagnostics.errors.empty() && res.diagnostics.errors.front().code == "E0100")
            return 1;

        if(parse_tree){
            log(tekhne::LogLevel::debug, "Generating parse tree to 'parse-tree.dot'");
            std::ofstream dot("parse-tree.dot");
            if(!dot){ log(tekhne::LogLevel::error, "cannot write 'parse-tree.dot'"); return 1; }
            dot << tekhne::to_dot(res.prog);
        }
        if(!res.success) return 1;

        if(debug){
            log(tekhne::LogLevel::debug, "Generated code:");
            std::cout << res.text;
        }
        std::ofstream out(output, std::ios::binary);
        if(!out){ log(tekhne::LogLevel::error, "cannot write '" + output + "'"); return 1; }
        out << res.text;
        log(tekhne::LogLevel::debug, "Wrote '" + output + "'");
        return 0;
    } catch(const std::exception& e){
        std::cerr << "tekhnec: exception: " << e.what() << "\n";
        return 1;
    }
}
