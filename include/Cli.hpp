#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "ContentParser.hpp"
#include "RedactionTypes.hpp"

constexpr const char* kCloakGuardVersion = "1.0.0";

enum class CliCommand { Help, Redact, Patterns, ConfigPath, InitConfig, Version };

struct CliOptions {
    CliCommand   command = CliCommand::Help;
    InputRequest input;
    std::string  config;
    std::string  audit_db;
    std::string  log_file;
    bool verbose = false;
    bool quiet   = false;
    bool summary = false;
    bool details = true;
    bool json    = false;
    bool force   = false;
};

// args excludes argv[0]. Returns false with 'error' set on a usage error.
bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& error);

int run_cli(const CliOptions& opts);
int cli_main(int argc, char** argv);

void print_help(std::ostream& os);

// foo/app.log -> foo/app_redacted.log ; PDFs become .txt
std::string redacted_output_path(const std::string& input_path, const std::string& type);

std::string format_redaction_table(const std::vector<RedactionRecord>& redactions);
std::string format_pattern_summary(const PatternSummary& summary, const std::string& config_path);

bool write_starter_config(const std::filesystem::path& path, bool force, std::string& error);
