// === src/Cli/Cli.cpp ===
#include "Cli.hpp"
#include "AuditStore.hpp"
#include "Logger.hpp"
#include "TextRedactor.hpp"
#include "XdgConfig.hpp"
#include "requirements.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

#define COLOR_GREEN  "\033[1;32m"
#define COLOR_CYAN   "\033[1;36m"
#define COLOR_YELLOW "\033[1;33m"
#define COLOR_RED    "\033[1;31m"
#define COLOR_RESET  "\033[0m"

namespace fs = std::filesystem;

static std::string paint(const char* color, const std::string& s) {
    if (!::isatty(STDERR_FILENO)) return s;
    return std::string(color) + s + COLOR_RESET;
}

void print_help(std::ostream& os) {
    os << "Usage:\n"
       << "  cloakguard redact [--text|-t TEXT | --file|-f FILE | --stdin] [options]\n"
       << "      --config, -c PATH    custom configuration file\n"
       << "      --verbose, -v        debug logging\n"
       << "      --quiet, -q          only errors on stderr\n"
       << "      --summary, -s        show pattern summary and exit\n"
       << "      --no-details         skip the redaction details table\n"
       << "      --json               print the detailed result as JSON\n"
       << "      --audit-db PATH      record the run in a SQLite audit database\n"
       << "      --log-file PATH      append log lines to PATH\n"
       << "  cloakguard patterns [--config|-c PATH] [--json] [--verbose|-v]\n"
       << "  cloakguard config-path\n"
       << "  cloakguard init-config [--force|-f]\n"
       << "  cloakguard version\n"
       << "  cloakguard -h, --help\n"
       << "\n"
       << "Configuration is loaded from --config, else ./" << XdgConfig::kConfigFilename
       << " or $XDG_CONFIG_HOME/" << XdgConfig::kAppName << "/" << XdgConfig::kConfigFilename
       << ", else built-in patterns only.\n";
}

// Desc: parse subcommand and options
// In: const std::vector<std::string>& args, CliOptions& out, std::string& error
// Out: bool (false on usage error)
bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& error) {
    out = CliOptions{};
    if (args.empty()) return true;

    const std::string& cmd = args[0];
    if (cmd == "-h" || cmd == "--help" || cmd == "help") return true;
    if      (cmd == "redact")      out.command = CliCommand::Redact;
    else if (cmd == "patterns")    out.command = CliCommand::Patterns;
    else if (cmd == "config-path") out.command = CliCommand::ConfigPath;
    else if (cmd == "init-config") out.command = CliCommand::InitConfig;
    else if (cmd == "version" || cmd == "--version") out.command = CliCommand::Version;
    else { error = "unknown command: " + cmd; return false; }

    const bool redact = out.command == CliCommand::Redact;
    const bool patterns = out.command == CliCommand::Patterns;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&](std::string& dst) -> bool {
            if (i + 1 >= args.size()) { error = "option " + a + " needs a value"; return false; }
            dst = args[++i];
            return true;
        };

        if (a == "-h" || a == "--help") { out.command = CliCommand::Help; return true; }

        if (redact && (a == "--text" || a == "-t")) {
            std::string t;
            if (!value(t)) return false;
            out.input.text = t;
        } else if (redact && (a == "--file" || a == "-f")) {
            if (!value(out.input.file)) return false;
        } else if (redact && a == "--stdin") {
            out.input.use_stdin = true;
        } else if ((redact || patterns) && (a == "--config" || a == "-c")) {
            if (!value(out.config)) return false;
        } else if ((redact || patterns) && (a == "--verbose" || a == "-v")) {
            out.verbose = true;
        } else if ((redact || patterns) && a == "--json") {
            out.json = true;
        } else if (redact && (a == "--quiet" || a == "-q")) {
            out.quiet = true;
        } else if (redact && (a == "--summary" || a == "-s")) {
            out.summary = true;
        } else if (redact && (a == "--details" || a == "-d")) {
            out.details = true;
        } else if (redact && a == "--no-details") {
            out.details = false;
        } else if (redact && a == "--audit-db") {
            if (!value(out.audit_db)) return false;
        } else if (redact && a == "--log-file") {
            if (!value(out.log_file)) return false;
        } else if (out.command == CliCommand::InitConfig && (a == "--force" || a == "-f")) {
            out.force = true;
        } else {
            error = "unknown option for " + cmd + ": " + a;
            return false;
        }
    }

    if (out.verbose && out.quiet) {
        error = "--verbose and --quiet are mutually exclusive";
        return false;
    }
    return true;
}

std::string redacted_output_path(const std::string& input_path, const std::string& type) {
    fs::path p(input_path);
    std::string ext = (type == "pdf") ? std::string(".txt") : p.extension().string();
    fs::path out = p.parent_path() / (p.stem().string() + "_redacted" + ext);
    return out.string();
}

// Desc: render pattern / position / replacement rows
// In: const std::vector<RedactionRecord>& redactions
// Out: std::string (table text)
std::string format_redaction_table(const std::vector<RedactionRecord>& redactions) {
    size_t w_name = 7, w_pos = 8;
    for (const auto& r : redactions) {
        w_name = std::max(w_name, r.pattern_name.size());
        w_pos  = std::max(w_pos, std::to_string(r.start_pos).size() + std::to_string(r.end_pos).size() + 1);
    }

    std::ostringstream os;
    os << std::left
       << std::setw(static_cast<int>(w_name)) << "Pattern" << "  "
       << std::setw(static_cast<int>(w_pos)) << "Position" << "  "
       << "Replacement" << "\n";
    os << std::string(w_name, '-') << "  " << std::string(w_pos, '-') << "  " << std::string(11, '-') << "\n";
    for (const auto& r : redactions) {
        os << std::setw(static_cast<int>(w_name)) << r.pattern_name << "  "
           << std::setw(static_cast<int>(w_pos)) << (std::to_string(r.start_pos) + "-" + std::to_string(r.end_pos)) << "  "
           << r.replacement << "\n";
    }
    return os.str();
}

std::string format_pattern_summary(const PatternSummary& summary, const std::string& config_path) {
    std::ostringstream os;
    os << "Configuration: " << (config_path.empty() ? std::string("built-in patterns") : config_path) << "\n";
    os << "Total patterns: " << summary.total_patterns << "\n\n";

    os << "Categories:\n";
    for (const auto& kv : summary.categories) {
        os << "  " << std::left << std::setw(24) << kv.first << kv.second << "\n";
    }

    size_t w_name = 4, w_cat = 8, w_ph = 11;
    for (const auto& d : summary.pattern_details) {
        w_name = std::max(w_name, d.name.size());
        w_cat  = std::max(w_cat, d.category.size());
        w_ph   = std::max(w_ph, d.placeholder.size());
    }
    os << "\nPatterns:\n";
    os << "  " << std::left
       << std::setw(static_cast<int>(w_name)) << "Name" << "  "
       << std::setw(static_cast<int>(w_cat)) << "Category" << "  "
       << std::setw(static_cast<int>(w_ph)) << "Placeholder" << "  "
       << "Description\n";
    for (const auto& d : summary.pattern_details) {
        os << "  "
           << std::setw(static_cast<int>(w_name)) << d.name << "  "
           << std::setw(static_cast<int>(w_cat)) << d.category << "  "
           << std::setw(static_cast<int>(w_ph)) << d.placeholder << "  "
           << d.description << "\n";
    }
    return os.str();
}

// Desc: write a starter config with one example rule
// In: const fs::path& path, bool force, std::string& error
// Out: bool (false if it exists without force, or on write failure)
bool write_starter_config(const fs::path& path, bool force, std::string& error) {
    std::error_code ec;
    if (fs::exists(path, ec) && !force) {
        error = "config already exists at: " + path.string() + " (use --force to overwrite)";
        return false;
    }
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    nlohmann::ordered_json rule;
    rule["name"] = "example_domain";
    rule["placeholder"] = "<REDACT_EXAMPLE_DOMAIN>";
    rule["regex"] = "example\\.com";

    nlohmann::ordered_json cfg;
    cfg["engine"]["prefilter"] = true;
    cfg["patterns"]["CUSTOM_PATTERNS"]["description"] = "Your custom patterns";
    cfg["patterns"]["CUSTOM_PATTERNS"]["rules"] = nlohmann::ordered_json::array({rule});

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot write " + path.string();
        return false;
    }
    out << cfg.dump(2) << "\n";
    if (!out.good()) {
        error = "write failed: " + path.string();
        return false;
    }
    return true;
}

static void setup_logging(const CliOptions& opts) {
    if (opts.verbose)     Logger::set_level(LogLevel::Debug);
    else if (opts.quiet)  Logger::set_level(LogLevel::Error);
    else                  Logger::set_level(LogLevel::Warning);

    if (!opts.log_file.empty() && !Logger::open_log_file(opts.log_file)) {
        std::cerr << paint(COLOR_YELLOW, "cannot open log file: " + opts.log_file) << "\n";
    }
}

static int run_patterns(const CliOptions& opts) {
    auto boot = Requirements::run(opts.config, "");
    if (!boot.ok) {
        std::cerr << paint(COLOR_RED, "Error: " + boot.error) << "\n";
        return 1;
    }
    const PatternSummary summary = boot.catalog.summary();
    if (opts.json) {
        std::cout << nlohmann::json(summary).dump(2) << "\n";
    } else {
        std::cout << format_pattern_summary(summary, boot.config_path);
    }
    return 0;
}

// Desc: redact subcommand: startup, input, redaction, output, audit
// In: const CliOptions& opts
// Out: int (exit code)
static int run_redact(const CliOptions& opts) {
    auto boot = Requirements::run(opts.config, opts.audit_db);
    if (!boot.ok) {
        std::cerr << paint(COLOR_RED, "Error: " + boot.error) << "\n";
        return 1;
    }

    TextRedactor redactor(boot.catalog);

    if (opts.summary) {
        if (opts.json) {
            std::cout << nlohmann::json(redactor.getPatternSummary()).dump(2) << "\n";
        } else if (!opts.quiet) {
            std::cout << format_pattern_summary(redactor.getPatternSummary(), boot.config_path);
        }
        return 0;
    }

    LoadedInput input;
    std::string err;
    if (!ContentParser::load_input(opts.input, input, err)) {
        std::cerr << paint(COLOR_RED, "Error loading input: " + err) << "\n";
        return 1;
    }

    RuleSnapshot snap = redactor.snapshot();
    const bool detailed = opts.details || opts.json || !opts.audit_db.empty();

    RedactionResult result;
    if (detailed) {
        result = TextRedactor::redactWithDetails(*snap, input.text);
    } else {
        result.redacted_text = TextRedactor::redactText(*snap, input.text);
    }

    if (!opts.audit_db.empty()) {
        AuditStore store(boot.db.get());
        if (store.recordRun(input.source, snap->ruleset_hash, result) < 0) {
            std::cerr << paint(COLOR_RED, "Error: failed to record audit run in " + opts.audit_db) << "\n";
            return 1;
        }
    }

    std::string output_path;
    if (!opts.input.file.empty()) {
        output_path = redacted_output_path(opts.input.file, input.type);
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open() || !(out << result.redacted_text)) {
            std::cerr << paint(COLOR_RED, "Error writing " + output_path) << "\n";
            return 1;
        }
    }

    if (opts.json) {
        std::cout << nlohmann::json(result).dump(2) << "\n";
        return 0;
    }

    if (!opts.quiet) {
        if (!detailed) {
            std::cerr << paint(COLOR_GREEN, "Redaction complete") << "\n";
        } else if (result.total_redactions > 0) {
            std::cerr << paint(COLOR_GREEN, "Redacted " + std::to_string(result.total_redactions) + " sensitive items") << "\n";
        } else {
            std::cerr << paint(COLOR_YELLOW, "No sensitive information found") << "\n";
        }
        const size_t skipped = detailed ? result.skipped_rules : snap->skipped.size();
        if (skipped > 0) {
            std::cerr << paint(COLOR_YELLOW, std::to_string(skipped) + " rule(s) skipped (invalid or failed)") << "\n";
        }
    }

    if (output_path.empty()) {
        std::cout << result.redacted_text;
        if (!result.redacted_text.empty() && result.redacted_text.back() != '\n') std::cout << "\n";
    } else if (!opts.quiet) {
        std::cerr << "Redacted output written to " << output_path << "\n";
    }

    if (opts.details && !opts.quiet && !result.redactions.empty()) {
        std::cerr << "\n" << paint(COLOR_CYAN, "Redaction Details:") << "\n"
                  << format_redaction_table(result.redactions);
    }
    return 0;
}

static int run_config_path() {
    std::error_code ec;
    std::cout << "Configuration Search Paths:\n";
    std::cout << "  Current directory: " << (fs::current_path(ec) / XdgConfig::kConfigFilename).string() << "\n";

    const auto dirs = XdgConfig::getConfigDirs();
    for (size_t i = 0; i < dirs.size(); ++i) {
        std::cout << (i == 0 ? "→ " : "  ")
                  << (dirs[i] / XdgConfig::kAppName / XdgConfig::kConfigFilename).string() << "\n";
    }

    if (auto found = XdgConfig::findConfigFile()) {
        std::cout << "\nConfig found at: " << found->string() << "\n";
    } else {
        std::cout << "\nNo config file found in XDG locations\n";
    }
    std::cout << "\nDefault config location (for writing):\n→ "
              << XdgConfig::getDefaultConfigPath().string() << "\n";
    return 0;
}

static int run_init_config(const CliOptions& opts) {
    XdgConfig::ensureConfigDirExists();
    const fs::path path = XdgConfig::getDefaultConfigPath();
    std::string err;
    if (!write_starter_config(path, opts.force, err)) {
        std::cerr << paint(COLOR_YELLOW, err) << "\n";
        return 1;
    }
    std::cout << "Created default config at: " << path.string() << "\n"
              << "You can now edit this file to add your own patterns.\n";
    return 0;
}

int run_cli(const CliOptions& opts) {
    setup_logging(opts);
    switch (opts.command) {
        case CliCommand::Help:       print_help(std::cout); return 0;
        case CliCommand::Redact:     return run_redact(opts);
        case CliCommand::Patterns:   return run_patterns(opts);
        case CliCommand::ConfigPath: return run_config_path();
        case CliCommand::InitConfig: return run_init_config(opts);
        case CliCommand::Version:
            std::cout << "CloakGuard v" << kCloakGuardVersion << "\n"
                      << "Secure text redaction for LLM interactions\n";
            return 0;
    }
    return 0;
}

int cli_main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    CliOptions opts;
    std::string err;
    if (!parse_cli(args, opts, err)) {
        std::cerr << "cloakguard: " << err << "\n\n";
        print_help(std::cerr);
        return 2;
    }
    return run_cli(opts);
}
