#pragma once
#include <string>

enum class LogLevel : int { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

namespace Logger {
void     set_level(LogLevel lvl);
LogLevel level();

// Lines go to this fd (STDERR_FILENO by default). The fd is not owned.
void set_sink_fd(int fd);
int  sink_fd();

// Additionally append every line to a file; empty path closes it.
bool open_log_file(const std::string& path);
void close_log_file();

bool enabled(LogLevel lvl);
void log(LogLevel lvl, const char* component, const std::string& msg);

const char* level_name(LogLevel lvl);

inline void debug(const char* comp, const std::string& msg) { if (enabled(LogLevel::Debug))   log(LogLevel::Debug, comp, msg); }
inline void info(const char* comp, const std::string& msg)  { if (enabled(LogLevel::Info))    log(LogLevel::Info, comp, msg); }
inline void warn(const char* comp, const std::string& msg)  { if (enabled(LogLevel::Warning)) log(LogLevel::Warning, comp, msg); }
inline void error(const char* comp, const std::string& msg) { if (enabled(LogLevel::Error))   log(LogLevel::Error, comp, msg); }
}
