#pragma once

#include <string>

namespace panelpress {
namespace log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

// Lines go to stderr and, once a file is opened, to that file as well.
// Debug lines are dropped unless verbose is set.
void init(const std::string& file_path, bool verbose);
void close();
void set_quiet(bool quiet);

void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warning(const std::string& message) { write(Level::Warning, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

}
}
