#pragma once
#include <iosfwd>
#include <optional>
#include <string>

struct InputRequest {
    std::optional<std::string> text;
    std::string file;
    bool use_stdin = false;
};

struct LoadedInput {
    std::string text;
    std::string type;    // "text" or "pdf"
    std::string source;  // "<text>", "<stdin>" or the file path
};

class ContentParser {
public:
    static std::string detect_type(const std::string& raw_content);

    static bool extract_text(const std::string& type,
                             const std::string& raw_content,
                             std::string& out,
                             std::string& error);

    static bool load_file(const std::string& path, LoadedInput& out, std::string& error);
    static bool load_stream(std::istream& in, LoadedInput& out, std::string& error);

    // Exactly one of text / file / stdin must be given.
    static bool load_input(const InputRequest& req, LoadedInput& out, std::string& error);
};
