#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "common/config.hpp"
#include "common/models.hpp"

namespace rewind {

inline constexpr const char *kGuardModuleName = "sitecustomize.py";

/**
 * SandboxPreparer builds a disposable copy of a repository for running a
 * training script under the runtime guard:
 *
 *   <runsRoot>/<timestamp>/repo/            full copy, minus excluded dirs
 *   <runsRoot>/<timestamp>/repo/sitecustomize.py
 *
 * The original repository is only read. Runs are never reused and are not
 * cleaned up here.
 */
class SandboxPreparer {
public:
    explicit SandboxPreparer(RewindConfig config);

    IsolatedRun prepare(const std::filesystem::path &repo,
                        const std::filesystem::path &script,
                        const std::optional<std::filesystem::path> &runsRoot = std::nullopt) const;

private:
    RewindConfig m_config;

    void copyTree(const std::filesystem::path &source,
                  const std::filesystem::path &destination,
                  const std::filesystem::path &runsRoot) const;
    std::filesystem::path writeGuardModule(const std::filesystem::path &isolatedRepo) const;
};

// Uses the repository's loaded configuration.
IsolatedRun prepareSandbox(const std::filesystem::path &repo,
                           const std::filesystem::path &script,
                           const std::optional<std::filesystem::path> &runsRoot = std::nullopt);

// Contents of the runtime guard module written into every sandbox.
std::string guardModuleSource();

} // namespace rewind
