#include "XdgConfig.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

static const char* kComp = "XdgConfig";

// Desc: check existence without throwing
// In: const fs::path& p
// Out: bool
static bool exists_noexcept(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

namespace XdgConfig {

fs::path getConfigHome() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg);

    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config";
}

// Desc: config home followed by $XDG_CONFIG_DIRS (default /etc/xdg)
// In: (none)
// Out: std::vector<fs::path> in precedence order
std::vector<fs::path> getConfigDirs() {
    std::vector<fs::path> dirs{getConfigHome()};

    const char* env = std::getenv("XDG_CONFIG_DIRS");
    std::string list = (env && *env) ? env : "/etc/xdg";

    size_t pos = 0;
    while (pos <= list.size()) {
        size_t colon = list.find(':', pos);
        if (colon == std::string::npos) colon = list.size();
        std::string item = list.substr(pos, colon - pos);
        if (!item.empty()) dirs.emplace_back(item);
        pos = colon + 1;
    }
    return dirs;
}

std::optional<fs::path> getAppConfigPath(const std::string& filename) {
    for (const auto& dir : getConfigDirs()) {
        fs::path p = dir / kAppName / filename;
        if (exists_noexcept(p)) return p;
    }
    return std::nullopt;
}

fs::path getDefaultConfigPath(const std::string& filename) {
    return getConfigHome() / kAppName / filename;
}

fs::path ensureConfigDirExists() {
    fs::path dir = getDefaultConfigPath().parent_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) Logger::warn(kComp, "cannot create " + dir.string() + ": " + ec.message());
    return dir;
}

std::optional<fs::path> findConfigFile(const std::string& filename) {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        fs::path local = cwd / filename;
        if (exists_noexcept(local)) return local;
    }
    return getAppConfigPath(filename);
}

// Desc: pick the override config for a run
// In: const std::string& explicit_path (may be empty)
// Out: std::string (path, or empty for built-in patterns only)
std::string resolveConfigPath(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        if (exists_noexcept(explicit_path)) return explicit_path;
        Logger::warn(kComp, "config file not found: " + explicit_path);
        return {};
    }
    if (auto found = findConfigFile()) {
        Logger::info(kComp, "using config from " + found->string());
        return found->string();
    }
    return {};
}

}
