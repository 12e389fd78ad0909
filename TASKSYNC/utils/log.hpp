#pragma once

#include <string>

namespace tasksync::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
Level level();

// Accepts error|warn|warning|info|debug in any case; anything else yields fallback.
Level parse_level(const std::string& value, Level fallback);

// Mirrors every emitted line into the given file. An empty path closes the mirror.
bool set_file(const std::string& path, bool append);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
