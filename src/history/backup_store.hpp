#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace rewind {

struct BackupResult {
    std::vector<std::string> backedUp;
    std::vector<SkippedFile> skipped;
};

// BackupStore mirrors eligible repository files under a history entry's
// backup root, at the same relative paths. Only text/code files below the
// configured size ceiling are kept; everything else can never be restored.
class BackupStore {
public:
    BackupStore(std::filesystem::path repo,
                std::filesystem::path backupRoot,
                const RewindConfig &config);

    BackupResult backup(const Manifest &manifest) const;

    bool isCandidate(const std::string &relPath) const;
    bool hasBackup(const std::string &relPath) const;
    std::filesystem::path backupPath(const std::string &relPath) const;

    const std::filesystem::path &root() const { return m_backupRoot; }

private:
    std::filesystem::path m_repo;
    std::filesystem::path m_backupRoot;
    std::set<std::string> m_extensions;
    std::uintmax_t m_maxBytes;
};

} // namespace rewind
