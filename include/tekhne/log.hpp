#pragma once
#include <functional>
#include <ostream>
#include <string>

namespace tekhne {

enum class LogLevel { debug, info, warning, error };

using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* level_name(LogLevel lvl);

// Writes "[tekhne] message" lines to `os`; warnings and errors carry their level tag.
// Messages below `threshold` are dropped.
LogSink stream_sink(std::ostream& os, LogLevel threshold);

// stderr sink at info, or debug when TEKHNE_DEBUG is set.
LogSink default_sink();

// Forwards every message to both sinks.
LogSink tee_sink(LogSink a, LogSink b);

} // namespace tekhne
