#include <catch2/catch.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "Cli.hpp"
#include "ContentParser.hpp"
#include "PatternCatalog.hpp"
#include "XdgConfig.hpp"
#include "requirements.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace {
// Points XDG_CONFIG_HOME and the working directory at a scratch dir.
class ScratchEnv {
public:
    ScratchEnv() : dir_(mktemp_dir("cg_env_")), old_cwd_(fs::current_path()) {
        const char* h = std::getenv("XDG_CONFIG_HOME");
        if (h) old_home_ = h;
        had_home_ = h != nullptr;
        ::setenv("XDG_CONFIG_HOME", (dir_ + "/xdg").c_str(), 1);
        ::setenv("XDG_CONFIG_DIRS", (dir_ + "/sys").c_str(), 1);
        fs::create_directories(dir_ + "/cwd");
        fs::current_path(dir_ + "/cwd");
    }
    ~ScratchEnv() {
        fs::current_path(old_cwd_);
        if (had_home_) ::setenv("XDG_CONFIG_HOME", old_home_.c_str(), 1);
        else ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_CONFIG_DIRS");
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
    fs::path old_cwd_;
    std::string old_home_;
    bool had_home_ = false;
};

void write_text(const std::string& path, const std::string& body) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << body;
}
}

TEST_CASE("parse_cli: redact with text input and flags") {
    CliOptions o;
    std::string err;
    REQUIRE(parse_cli({"redact", "--text", "hello", "-c", "my.json", "--no-details", "--json"}, o, err));
    REQUIRE(o.command == CliCommand::Redact);
    REQUIRE(o.input.text);
    REQUIRE(*o.input.text == "hello");
    REQUIRE(o.config == "my.json");
    REQUIRE_FALSE(o.details);
    REQUIRE(o.json);
}

TEST_CASE("parse_cli: -f is --file for redact and --force for init-config") {
    CliOptions o;
    std::string err;
    REQUIRE(parse_cli({"redact", "-f", "app.log", "--audit-db", "a.db"}, o, err));
    REQUIRE(o.input.file == "app.log");
    REQUIRE(o.audit_db == "a.db");

    REQUIRE(parse_cli({"init-config", "-f"}, o, err));
    REQUIRE(o.command == CliCommand::InitConfig);
    REQUIRE(o.force);
}

TEST_CASE("parse_cli: usage errors") {
    CliOptions o;
    std::string err;
    REQUIRE_FALSE(parse_cli({"bogus"}, o, err));
    REQUIRE_FALSE(err.empty());

    err.clear();
    REQUIRE_FALSE(parse_cli({"redact", "--text"}, o, err));
    REQUIRE(err.find("needs a value") != std::string::npos);

    REQUIRE_FALSE(parse_cli({"redact", "--stdin", "-v", "-q"}, o, err));
    REQUIRE_FALSE(parse_cli({"config-path", "--json"}, o, err));
    REQUIRE_FALSE(parse_cli({"patterns", "--stdin"}, o, err));
}

TEST_CASE("parse_cli: help and version") {
    CliOptions o;
    std::string err;
    REQUIRE(parse_cli({}, o, err));
    REQUIRE(o.command == CliCommand::Help);
    REQUIRE(parse_cli({"redact", "--help"}, o, err));
    REQUIRE(o.command == CliCommand::Help);
    REQUIRE(parse_cli({"--version"}, o, err));
    REQUIRE(o.command == CliCommand::Version);
}

TEST_CASE("Redacted output path keeps the extension, PDFs become text") {
    REQUIRE(redacted_output_path("logs/app.log", "text") == "logs/app_redacted.log");
    REQUIRE(redacted_output_path("notes", "text") == "notes_redacted");
    REQUIRE(redacted_output_path("/tmp/report.pdf", "pdf") == "/tmp/report_redacted.txt");
}

TEST_CASE("Redaction table lists every record") {
    RedactionRecord r;
    r.pattern_name = "aws_access_key_id";
    r.start_pos = 10;
    r.end_pos = 30;
    r.replacement = "<REDACT_AWS_KEY>";
    const std::string table = format_redaction_table({r});
    REQUIRE(table.find("Pattern") != std::string::npos);
    REQUIRE(table.find("aws_access_key_id") != std::string::npos);
    REQUIRE(table.find("10-30") != std::string::npos);
    REQUIRE(table.find("<REDACT_AWS_KEY>") != std::string::npos);
}

TEST_CASE("Starter config is loadable and not overwritten without force") {
    const std::string dir = mktemp_dir("cg_init_");
    const fs::path path = fs::path(dir) / "nested" / "config.json";
    std::string err;
    REQUIRE(write_starter_config(path, false, err));

    PatternCatalog c;
    REQUIRE(c.loadDefaults());
    const size_t before = c.patternCount();
    REQUIRE(c.loadFromFile(path.string()));
    REQUIRE(c.patternCount() == before + 1);
    REQUIRE(c.getRules().back().name == "example_domain");

    REQUIRE_FALSE(write_starter_config(path, false, err));
    REQUIRE(err.find("--force") != std::string::npos);
    REQUIRE(write_starter_config(path, true, err));
}

TEST_CASE("XDG directories follow the environment") {
    ScratchEnv env;
    REQUIRE(XdgConfig::getConfigHome().string() == env.dir() + "/xdg");
    auto dirs = XdgConfig::getConfigDirs();
    REQUIRE(dirs.size() == 2);
    REQUIRE(dirs[1].string() == env.dir() + "/sys");
    REQUIRE(XdgConfig::getDefaultConfigPath().string() == env.dir() + "/xdg/cloakguard/config.json");
    REQUIRE_FALSE(XdgConfig::findConfigFile());
    REQUIRE(XdgConfig::resolveConfigPath("").empty());
}

TEST_CASE("Config discovery order: cwd, user, system") {
    ScratchEnv env;
    const std::string sys = env.dir() + "/sys/cloakguard/config.json";
    const std::string user = env.dir() + "/xdg/cloakguard/config.json";
    const std::string local = env.dir() + "/cwd/config.json";

    write_text(sys, "{}");
    REQUIRE(XdgConfig::findConfigFile()->string() == sys);
    write_text(user, "{}");
    REQUIRE(XdgConfig::findConfigFile()->string() == user);
    write_text(local, "{}");
    REQUIRE(fs::equivalent(*XdgConfig::findConfigFile(), local));
}

TEST_CASE("Explicit config path that does not exist falls back to built-ins") {
    ScratchEnv env;
    LogCapture cap(LogLevel::Warning);
    REQUIRE(XdgConfig::resolveConfigPath(env.dir() + "/missing.json").empty());
    REQUIRE(cap.text().find("config file not found") != std::string::npos);
}

TEST_CASE("Startup loads defaults plus override and opens the audit DB") {
    ScratchEnv env;
    const std::string cfg = env.dir() + "/override.json";
    write_text(cfg, R"({"patterns":{"C":{"rules":[{"name":"t","regex":"T-[0-9]+","placeholder":"<T>"}]}}})");

    auto boot = Requirements::run(cfg, env.dir() + "/audit.db");
    REQUIRE(boot.ok);
    REQUIRE(boot.config_path == cfg);
    REQUIRE(boot.db);
    REQUIRE(boot.catalog.getRules().back().name == "t");
}

TEST_CASE("Startup fails on a broken override file") {
    ScratchEnv env;
    LogCapture cap(LogLevel::Error);
    const std::string cfg = env.dir() + "/broken.json";
    write_text(cfg, "{ nope");
    auto boot = Requirements::run(cfg, "");
    REQUIRE_FALSE(boot.ok);
    REQUIRE(boot.error.find(cfg) != std::string::npos);
}

TEST_CASE("Input: exactly one source") {
    LoadedInput in;
    std::string err;
    InputRequest none;
    REQUIRE_FALSE(ContentParser::load_input(none, in, err));

    InputRequest two;
    two.text = "a";
    two.use_stdin = true;
    REQUIRE_FALSE(ContentParser::load_input(two, in, err));

    InputRequest text;
    text.text = "";
    REQUIRE(ContentParser::load_input(text, in, err));
    REQUIRE(in.text.empty());
    REQUIRE(in.source == "<text>");
}

TEST_CASE("Input: files and streams") {
    const std::string dir = mktemp_dir("cg_input_");
    const std::string path = dir + "/app.log";
    write_text(path, "line1\nkey AKIA1234567890ABCDEF\n");

    LoadedInput in;
    std::string err;
    REQUIRE(ContentParser::load_file(path, in, err));
    REQUIRE(in.type == "text");
    REQUIRE(in.source == path);
    REQUIRE(in.text == "line1\nkey AKIA1234567890ABCDEF\n");

    REQUIRE_FALSE(ContentParser::load_file(dir + "/missing.log", in, err));
    REQUIRE(err.find("cannot open") != std::string::npos);

    std::istringstream ss("from stdin");
    REQUIRE(ContentParser::load_stream(ss, in, err));
    REQUIRE(in.text == "from stdin");
    REQUIRE(in.source == "<stdin>");
}

TEST_CASE("Input: PDF detection and unreadable PDF is an error") {
    REQUIRE(ContentParser::detect_type("%PDF-1.7\n...") == "pdf");
    REQUIRE(ContentParser::detect_type("plain %PDF-") == "text");

    const std::string dir = mktemp_dir("cg_pdf_");
    const std::string path = dir + "/bad.pdf";
    write_text(path, "%PDF-1.4\nthis is not really a pdf\n");
    LoadedInput in;
    std::string err;
    REQUIRE_FALSE(ContentParser::load_file(path, in, err));
    REQUIRE(err.find("poppler") != std::string::npos);
}
