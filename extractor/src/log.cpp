#include "log.h"

namespace chaptext {

static LogLevel g_log_level = LogLevel::Warn;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(g_log_level);
}

}  // namespace chaptext
