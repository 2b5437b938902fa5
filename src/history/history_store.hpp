#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace rewind {

// HistoryStore owns the per-repository history directory
// (<repo>/.rewind/history/<run_id>/). Each entry records a BEFORE manifest
// and backups at creation, and an AFTER manifest plus change set once the
// mutation has finished.
class HistoryStore {
public:
    explicit HistoryStore(const std::filesystem::path &repo);
    HistoryStore(const std::filesystem::path &repo, RewindConfig config);

    // Writes meta.json, before_manifest.json and the backups before
    // returning, so a restorable record exists even if the mutator crashes.
    HistoryEntry createEntry(const std::string &command);

    // Safe to call repeatedly; each call recomputes against the live tree.
    ChangeSet finalizeEntry(const HistoryEntry &entry);

    // Newest first. Entries with unreadable metadata are skipped.
    std::vector<HistoryMeta> listEntries() const;

    std::optional<HistoryEntry> loadEntry(const std::string &runId) const;
    std::optional<HistoryMeta> loadMeta(const std::string &runId) const;

    const std::filesystem::path &repo() const { return m_repo; }
    const RewindConfig &config() const { return m_config; }

private:
    std::filesystem::path m_repo;
    RewindConfig m_config;

    std::string allocateRunId() const;
    HistoryEntry entryFor(const std::string &runId) const;
};

ChangeSet computeChangeSet(const std::string &runId,
                           const Manifest &before,
                           const Manifest &after);

// std::nullopt when the record is missing or any field is malformed.
std::optional<Manifest> readManifest(const std::filesystem::path &path);
std::optional<ChangeSet> readChangeSet(const std::filesystem::path &path);

bool isValidRunId(const std::string &runId);

// Convenience wrappers using the repository's loaded configuration.
HistoryEntry createEntry(const std::filesystem::path &repo, const std::string &command);
ChangeSet finalizeEntry(const HistoryEntry &entry);
std::vector<HistoryMeta> listEntries(const std::filesystem::path &repo);

} // namespace rewind
