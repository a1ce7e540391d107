#pragma once
#include <cctype>
#include <cstdlib>
#include <string>

namespace tekhne {

// True when the variable is set to 1, t(rue), y(es) or on, in any case.
inline bool flag_enabled(const char* name) {
    const char* raw = std::getenv(name);
    if(!raw) return false;
    std::string v(raw);
    for(auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v=="1" || v=="t" || v=="true" || v=="y" || v=="yes" || v=="on";
}
inline bool debug_enabled(){ return flag_enabled("TEKHNE_DEBUG"); }
inline bool diag_json_enabled(){ return flag_enabled("TEKHNE_DIAG_JSON"); }
inline bool always_brace_enabled(){ return flag_enabled("TEKHNE_ALWAYS_BRACE"); }

} // namespace tekhne
