#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace rewind {

// Name of the per-repository state directory. Always excluded from
// manifests and sandbox copies.
inline constexpr const char *kStateDirName = ".rewind";

struct RewindConfig {
    std::set<std::string> backupExtensions;
    std::uintmax_t maxBackupBytes = 0;
    std::set<std::string> manifestExcludes;
    std::set<std::string> sandboxExcludes;
    int maxSteps = 0;
    std::string python;
};

RewindConfig defaultConfig();

// Defaults, then <repo>/.rewind/config.json, then REWIND_* environment.
RewindConfig loadConfig(const std::filesystem::path &repo);

std::filesystem::path stateRoot(const std::filesystem::path &repo);
std::filesystem::path historyRoot(const std::filesystem::path &repo);
std::filesystem::path defaultRunsRoot(const std::filesystem::path &repo);

} // namespace rewind
