#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// XDG base-directory lookup for the config file.
namespace XdgConfig {
constexpr const char* kAppName        = "cloakguard";
constexpr const char* kConfigFilename = "config.json";

std::filesystem::path getConfigHome();
std::vector<std::filesystem::path> getConfigDirs();

std::optional<std::filesystem::path> getAppConfigPath(const std::string& filename = kConfigFilename);
std::filesystem::path getDefaultConfigPath(const std::string& filename = kConfigFilename);
std::filesystem::path ensureConfigDirExists();

// ./<filename> first, then the XDG directories.
std::optional<std::filesystem::path> findConfigFile(const std::string& filename = kConfigFilename);

// Explicit path if it exists (warns otherwise), else findConfigFile(). Empty = built-ins only.
std::string resolveConfigPath(const std::string& explicit_path);
}
