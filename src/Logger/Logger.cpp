// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <atomic>
#include <cstring>
#include <ctime>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

namespace {
    std::atomic<int> g_level{static_cast<int>(LogLevel::Warning)};
    std::atomic<int> g_sink_fd{STDERR_FILENO};
    std::atomic<int> g_file_fd{-1};
    std::mutex       g_file_mtx;  // guards open/close of g_file_fd
}

namespace Logger {

void set_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

LogLevel level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }

void set_sink_fd(int fd) { g_sink_fd.store(fd, std::memory_order_relaxed); }

int sink_fd() { return g_sink_fd.load(std::memory_order_relaxed); }

// Desc: open (append) a log file mirrored alongside the sink fd
// In: const std::string& path
// Out: bool (false if the file cannot be opened)
bool open_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_file_mtx);
    int old = g_file_fd.exchange(-1);
    if (old >= 0) ::close(old);
    if (path.empty()) return true;

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return false;
    g_file_fd.store(fd);
    return true;
}

void close_log_file() { (void)open_log_file(std::string()); }

bool enabled(LogLevel lvl) {
    return lvl != LogLevel::Off && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     break;
    }
    return "OFF";
}

// Desc: format one timestamped line and write it to the sink (and log file)
// In: LogLevel lvl, const char* component, const std::string& msg
// Out: void
void log(LogLevel lvl, const char* component, const std::string& msg) {
    if (!enabled(lvl)) return;

    time_t now = ::time(nullptr);
    char buf[64];
    if (ctime_r(&now, buf)) {
        buf[std::strlen(buf) - 1] = '\0'; // strip '\n'
    } else {
        buf[0] = '\0';
    }

    std::string line;
    line.reserve(msg.size() + 64);
    line += "[";
    line += buf;
    line += "] [";
    line += level_name(lvl);
    line += "] [";
    line += component ? component : "-";
    line += "] ";
    line += msg;
    line += "\n";

    // one write() per line keeps lines whole across threads
    int fd = g_sink_fd.load(std::memory_order_relaxed);
    if (fd >= 0) {
        ssize_t _wr = ::write(fd, line.c_str(), line.size());
        (void)_wr;
    }
    int ffd = g_file_fd.load(std::memory_order_relaxed);
    if (ffd >= 0) {
        ssize_t _wr = ::write(ffd, line.c_str(), line.size());
        (void)_wr;
    }
}

}
