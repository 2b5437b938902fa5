#include "history/history_store.hpp"

#include <QDateTime>
#include <QString>

#include <algorithm>
#include <functional>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "history/backup_store.hpp"
#include "history/manifest_builder.hpp"

namespace rewind {

namespace {

std::filesystem::path canonicalRepo(const std::filesystem::path &repo)
{
    std::error_code ec;
    const std::filesystem::path resolved = std::filesystem::canonical(repo, ec);
    if (ec || !std::filesystem::is_directory(resolved, ec)) {
        throw HistoryError("repository not found: " + repo.string());
    }
    return resolved;
}

void logScanFailures(const ManifestScan &scan, const char *phase)
{
    if (scan.failures.empty()) {
        return;
    }
    RLOG_WARN(QStringLiteral("HistoryStore"),
              QStringLiteral("buildManifest"),
              QStringLiteral("manifest_scan_failures"),
              QStringLiteral("unreadable_files"),
              QStringLiteral("omit_from_manifest"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"phase", phase}, {"failures", scan.failures}}));
}

} // namespace

HistoryStore::HistoryStore(const std::filesystem::path &repo)
    : m_repo(canonicalRepo(repo))
    , m_config(loadConfig(m_repo))
{
}

HistoryStore::HistoryStore(const std::filesystem::path &repo, RewindConfig config)
    : m_repo(canonicalRepo(repo))
    , m_config(std::move(config))
{
}

HistoryEntry HistoryStore::createEntry(const std::string &command)
{
    const HistoryEntry entry = entryFor(allocateRunId());
    rewind::logging::CorrelationScope corr(QString::fromStdString(entry.runId));

    const ManifestScan before = buildManifest(m_repo, m_config.manifestExcludes);
    logScanFailures(before, "before");
    writeJsonFile(entry.beforeManifestPath, nlohmann::json(before.entries));

    const BackupStore backups(m_repo, entry.backupRoot, m_config);
    BackupResult backed = backups.backup(before.entries);

    HistoryMeta meta;
    meta.repo = m_repo.string();
    meta.runId = entry.runId;
    meta.createdAt = std::chrono::system_clock::now();
    meta.command = command;
    meta.backedUpFiles = std::move(backed.backedUp);
    meta.skippedFiles = std::move(backed.skipped);
    writeJsonFile(entry.metaPath, nlohmann::json(meta));

    RLOG_INFO(QStringLiteral("HistoryStore"),
              QStringLiteral("createEntry"),
              QStringLiteral("history_entry_created"),
              QStringLiteral("pre_mutation_snapshot"),
              QStringLiteral("manifest_and_backup"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runId", entry.runId},
                              {"command", command},
                              {"files", before.entries.size()},
                              {"backedUp", meta.backedUpFiles.size()},
                              {"skipped", meta.skippedFiles.size()}}));
    return entry;
}

ChangeSet HistoryStore::finalizeEntry(const HistoryEntry &entry)
{
    rewind::logging::CorrelationScope corr(QString::fromStdString(entry.runId));

    const auto before = readManifest(entry.beforeManifestPath);
    if (!before) {
        throw MissingHistoryError(entry.runId,
                                  "BEFORE manifest missing or malformed: "
                                      + entry.beforeManifestPath.string());
    }

    const ManifestScan after = buildManifest(m_repo, m_config.manifestExcludes);
    logScanFailures(after, "after");
    writeJsonFile(entry.afterManifestPath, nlohmann::json(after.entries));

    ChangeSet changes = computeChangeSet(entry.runId, *before, after.entries);
    writeJsonFile(entry.changesPath, nlohmann::json(changes));

    RLOG_INFO(QStringLiteral("HistoryStore"),
              QStringLiteral("finalizeEntry"),
              QStringLiteral("history_entry_finalized"),
              QStringLiteral("post_mutation_snapshot"),
              QStringLiteral("manifest_diff"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runId", entry.runId},
                              {"added", changes.added.size()},
                              {"deleted", changes.deleted.size()},
                              {"modified", changes.modified.size()}}));
    return changes;
}

std::vector<HistoryMeta> HistoryStore::listEntries() const
{
    std::vector<HistoryMeta> items;
    const std::filesystem::path root = historyRoot(m_repo);

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return items;
    }

    std::vector<std::string> runIds;
    for (const auto &dirEntry : std::filesystem::directory_iterator(root, ec)) {
        if (dirEntry.is_directory(ec)) {
            runIds.push_back(dirEntry.path().filename().string());
        }
    }
    std::sort(runIds.begin(), runIds.end(), std::greater<>());

    for (const auto &runId : runIds) {
        auto meta = loadMeta(runId);
        if (!meta) {
            RLOG_WARN(QStringLiteral("HistoryStore"),
                      QStringLiteral("listEntries"),
                      QStringLiteral("history_meta_unreadable"),
                      QStringLiteral("missing_or_malformed"),
                      QStringLiteral("skip_entry"),
                      rewind::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"runId", runId}}));
            continue;
        }
        items.push_back(std::move(*meta));
    }
    return items;
}

std::optional<HistoryEntry> HistoryStore::loadEntry(const std::string &runId) const
{
    if (!isValidRunId(runId)) {
        return std::nullopt;
    }
    HistoryEntry entry = entryFor(runId);
    std::error_code ec;
    if (!std::filesystem::is_directory(entry.root, ec)) {
        return std::nullopt;
    }
    return entry;
}

std::optional<HistoryMeta> HistoryStore::loadMeta(const std::string &runId) const
{
    if (!isValidRunId(runId)) {
        return std::nullopt;
    }
    const auto json = readJsonFile(entryFor(runId).metaPath);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    try {
        return json->get<HistoryMeta>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::string HistoryStore::allocateRunId() const
{
    // Millisecond UTC timestamp plus a counter keeps ids unique and sortable.
    const std::string base = QDateTime::currentDateTimeUtc()
                                 .toString(QStringLiteral("yyyyMMdd-HHmmss-zzz"))
                                 .toStdString();
    std::string error;
    const auto runId = claimUniqueDirectory(historyRoot(m_repo), base, &error);
    if (!runId) {
        throw HistoryError("failed to allocate a history entry: " + error);
    }
    return *runId;
}

HistoryEntry HistoryStore::entryFor(const std::string &runId) const
{
    HistoryEntry entry;
    entry.repo = m_repo;
    entry.runId = runId;
    entry.root = historyRoot(m_repo) / runId;
    entry.metaPath = entry.root / "meta.json";
    entry.beforeManifestPath = entry.root / "before_manifest.json";
    entry.afterManifestPath = entry.root / "after_manifest.json";
    entry.changesPath = entry.root / "changes.json";
    entry.backupRoot = entry.root / "before";
    return entry;
}

std::optional<Manifest> readManifest(const std::filesystem::path &path)
{
    const auto json = readJsonFile(path);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    try {
        return json->get<Manifest>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::optional<ChangeSet> readChangeSet(const std::filesystem::path &path)
{
    const auto json = readJsonFile(path);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    try {
        return json->get<ChangeSet>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

ChangeSet computeChangeSet(const std::string &runId,
                           const Manifest &before,
                           const Manifest &after)
{
    ChangeSet changes;
    changes.runId = runId;

    for (const auto &[rel, entry] : after) {
        const auto it = before.find(rel);
        if (it == before.end()) {
            changes.added.push_back(rel);
        } else if (it->second.sha256 != entry.sha256) {
            changes.modified.push_back(rel);
        }
    }
    for (const auto &[rel, entry] : before) {
        if (after.count(rel) == 0) {
            changes.deleted.push_back(rel);
        }
    }
    return changes;
}

bool isValidRunId(const std::string &runId)
{
    if (runId.empty() || runId == "." || runId == "..") {
        return false;
    }
    return std::none_of(runId.begin(), runId.end(), [](char c) {
        return c == '/' || c == '\\' || c == '\0';
    });
}

HistoryEntry createEntry(const std::filesystem::path &repo, const std::string &command)
{
    HistoryStore store(repo);
    return store.createEntry(command);
}

ChangeSet finalizeEntry(const HistoryEntry &entry)
{
    HistoryStore store(entry.repo);
    return store.finalizeEntry(entry);
}

std::vector<HistoryMeta> listEntries(const std::filesystem::path &repo)
{
    const HistoryStore store(repo);
    return store.listEntries();
}

} // namespace rewind
