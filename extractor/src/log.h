#pragma once

namespace chaptext {

// Diagnostics go to std::cerr; stdout is reserved for JSON results.
// Warnings are always printed, info and debug lines only when enabled.
enum class LogLevel { Warn = 0, Info = 1, Debug = 2 };

void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

}  // namespace chaptext
