#include "tekhne/diagnostics_json.hpp"
#include "tekhne/features.hpp"
#include <cstdio>
#include <sstream>

namespace tekhne {

std::string json_escape(const std::string& s){
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        const auto u = static_cast<unsigned char>(c);
        if(c=='"' || c=='\\'){ out += '\\'; out += c; }
        else if(c=='\n') out += "\\n";
        else if(c=='\r') out += "\\r";
        else if(c=='\t') out += "\\t";
        else if(u < 0x20){ out += "\\u00"; out += hex[u >> 4]; out += hex[u & 0xF]; }
        else out += c;
    }
    out += '"';
    return out;
}

// Notes carry no code or hint; -1 positions mean "no location".
static void append_notes_json(std::ostringstream& os, const std::vector<GenNote>& notes){
    os<<"[";
    bool first = true;
    for(const auto& n : notes){
        if(!first) os<<",";
        first = false;
        os<<"{\"message\":"<<json_escape(n.message)<<",\"line\":"<<n.line<<",\"col\":"<<n.col<<"}";
    }
    os<<"]";
}

template<typename Diag>
static void append_entries_json(std::ostringstream& os, const std::vector<Diag>& entries){
    os<<"[";
    for(size_t i=0;i<entries.size(); ++i){
        const auto &d=entries[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(const GenerateResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_entries_json(os, r.errors);
    os<<",\"warnings\":";
    append_entries_json(os, r.warnings);
    os<<"}";
    return os.str();
}

void maybe_print_json(const GenerateResult& r){
    if(diag_json_enabled()){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace tekhne
