#include "tekhne/log.hpp"
#include "tekhne/features.hpp"
#include <iostream>
#include <utility>

namespace tekhne {

const char* level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::debug: return "debug";
        case LogLevel::info: return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error: return "error";
    }
    return "info";
}

LogSink stream_sink(std::ostream& os, LogLevel threshold){
    return [&os, threshold](LogLevel lvl, const std::string& msg){
        if(static_cast<int>(lvl) < static_cast<int>(threshold)) return;
        os << "[tekhne] ";
        if(lvl==LogLevel::warning || lvl==LogLevel::error) os << level_name(lvl) << ": ";
        os << msg << "\n";
    };
}

LogSink default_sink(){
    return stream_sink(std::cerr, debug_enabled() ? LogLevel::debug : LogLevel::info);
}

LogSink tee_sink(LogSink a, LogSink b){
    return [a=std::move(a), b=std::move(b)](LogLevel lvl, const std::string& msg){
        if(a) a(lvl, msg);
        if(b) b(lvl, msg);
    };
}

} // namespace tekhne
