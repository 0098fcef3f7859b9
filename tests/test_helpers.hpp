#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

#include "Logger.hpp"
#include "RedactionTypes.hpp"

inline Rule make_rule(const std::string& name, const std::string& regex, const std::string& placeholder,
                      const std::string& category = "Unknown") {
    Rule r;
    r.name = name;
    r.regex = regex;
    r.placeholder = placeholder;
    r.category = category;
    return r;
}

inline std::string mktemp_dir(const char* prefix) {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (std::string(prefix) + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p)) return p.string();
    }
    return (base / (std::string(prefix) + "fallback")).string();
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Redirects the logger into a temp file for the lifetime of the object.
class LogCapture {
public:
    explicit LogCapture(LogLevel lvl = LogLevel::Debug)
        : old_fd_(Logger::sink_fd()), old_level_(Logger::level()) {
        char tmpl[] = "/tmp/cloakguard_log_XXXXXX";
        fd_ = ::mkstemp(tmpl);
        path_ = tmpl;
        Logger::set_sink_fd(fd_);
        Logger::set_level(lvl);
    }
    ~LogCapture() {
        Logger::set_sink_fd(old_fd_);
        Logger::set_level(old_level_);
        if (fd_ >= 0) ::close(fd_);
        ::unlink(path_.c_str());
    }
    std::string text() const { return read_file(path_); }

private:
    int fd_{-1};
    int old_fd_;
    LogLevel old_level_;
    std::string path_;
};
