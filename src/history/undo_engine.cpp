#include "history/undo_engine.hpp"

#include <QString>

#include <set>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "history/backup_store.hpp"
#include "history/manifest_builder.hpp"

namespace rewind {

namespace {

bool pathPresent(const std::filesystem::path &path)
{
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

std::vector<std::string> restoreTargets(const ChangeSet &changes)
{
    std::set<std::string> targets(changes.modified.begin(), changes.modified.end());
    targets.insert(changes.deleted.begin(), changes.deleted.end());
    return {targets.begin(), targets.end()};
}

// A live path diverges when its content differs from what the AFTER
// manifest recorded. Paths the AFTER manifest never saw (deleted files that
// reappeared) and files that cannot be read are not compared.
std::vector<std::string> findDivergence(const std::filesystem::path &repo,
                                        const Manifest &after,
                                        const std::vector<std::string> &targets)
{
    std::vector<std::string> divergent;
    for (const auto &rel : targets) {
        const auto recorded = after.find(rel);
        if (recorded == after.end()) {
            continue;
        }
        const std::filesystem::path live = repo / rel;
        if (!pathPresent(live)) {
            continue;
        }

        const auto current = hashFile(live);
        if (current && *current != recorded->second.sha256) {
            divergent.push_back(rel);
        }
    }
    return divergent;
}

void moveIntoPlace(const std::filesystem::path &staged, const std::filesystem::path &target)
{
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw HistoryError("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::filesystem::rename(staged, target, ec);
    if (!ec) {
        return;
    }

    // Staging lives under the repository, but .rewind may be a separate mount.
    std::string error;
    if (!copyFileBytes(staged, target, &error)) {
        throw HistoryError("cannot restore " + target.string() + ": " + error);
    }
}

} // namespace

UndoEngine::UndoEngine(const HistoryStore &store)
    : m_store(store)
{
}

UndoSummary UndoEngine::undo(const std::string &runId, bool force)
{
    rewind::logging::CorrelationScope corr(QString::fromStdString(runId));
    const std::filesystem::path &repo = m_store.repo();

    const auto entry = m_store.loadEntry(runId);
    if (!entry) {
        throw MissingHistoryError(runId, "History entry missing: " + runId);
    }

    const auto before = readManifest(entry->beforeManifestPath);
    const auto after = readManifest(entry->afterManifestPath);
    const auto changes = readChangeSet(entry->changesPath);
    if (!before || !after || !changes) {
        throw MissingHistoryError(runId,
                                  "History entry incomplete or missing: "
                                      + entry->root.string());
    }

    const std::vector<std::string> targets = restoreTargets(*changes);
    std::vector<std::string> divergent = findDivergence(repo, *after, targets);
    if (!divergent.empty()) {
        RLOG_WARN(QStringLiteral("UndoEngine"),
                  QStringLiteral("undo"),
                  force ? QStringLiteral("undo_divergence_overridden")
                        : QStringLiteral("undo_divergence_blocked"),
                  QStringLiteral("live_files_changed"),
                  QStringLiteral("hash_compare"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"runId", runId}, {"paths", divergent}}));
        if (!force) {
            throw DivergenceError(runId, std::move(divergent));
        }
    }

    UndoSummary summary;
    summary.runId = runId;

    // Stage every restorable file before touching the repository.
    const BackupStore backups(repo, entry->backupRoot, m_store.config());
    const std::filesystem::path staging = entry->root / "staging";
    std::error_code ec;
    std::filesystem::remove_all(staging, ec);

    std::vector<std::string> staged;
    for (const auto &rel : targets) {
        if (!backups.hasBackup(rel)) {
            summary.skippedNoBackup.push_back(rel);
            continue;
        }
        std::string error;
        if (!copyFileBytes(backups.backupPath(rel), staging / rel, &error)) {
            std::filesystem::remove_all(staging, ec);
            throw HistoryError("cannot stage backup of " + rel + ": " + error);
        }
        staged.push_back(rel);
    }

    for (const auto &rel : changes->added) {
        const std::filesystem::path live = repo / rel;
        if (!pathPresent(live)) {
            continue;
        }
        std::filesystem::remove(live, ec);
        if (ec) {
            RLOG_WARN(QStringLiteral("UndoEngine"),
                      QStringLiteral("undo"),
                      QStringLiteral("undo_remove_failed"),
                      QStringLiteral("io_error"),
                      QStringLiteral("leave_in_place"),
                      rewind::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", rel}, {"error", ec.message()}}));
            summary.removeFailed.push_back(rel);
            ec.clear();
            continue;
        }
        summary.removed.push_back(rel);
    }

    for (const auto &rel : staged) {
        moveIntoPlace(staging / rel, repo / rel);
        summary.restored.push_back(rel);
    }
    std::filesystem::remove_all(staging, ec);

    summary.outcome = summary.skippedNoBackup.empty() && summary.removeFailed.empty()
        ? UndoOutcome::Restored
        : UndoOutcome::RestoredWithGaps;
    summary.finishedAt = std::chrono::system_clock::now();
    writeJsonFile(entry->root / "undo.json", nlohmann::json(summary));

    RLOG_INFO(QStringLiteral("UndoEngine"),
              QStringLiteral("undo"),
              QStringLiteral("undo_complete"),
              QStringLiteral("user_request"),
              force ? QStringLiteral("forced_restore") : QStringLiteral("checked_restore"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runId", runId},
                              {"outcome", summary.outcome},
                              {"restored", summary.restored.size()},
                              {"removed", summary.removed.size()},
                              {"skippedNoBackup", summary.skippedNoBackup.size()},
                              {"removeFailed", summary.removeFailed.size()}}));
    return summary;
}

UndoSummary UndoEngine::undoLatest(bool force)
{
    const auto entries = m_store.listEntries();
    if (entries.empty()) {
        throw MissingHistoryError(std::string(), "No history entries found.");
    }
    return undo(entries.front().runId, force);
}

UndoSummary undo(const std::filesystem::path &repo, const std::string &runId, bool force)
{
    const HistoryStore store(repo);
    UndoEngine engine(store);
    return engine.undo(runId, force);
}

UndoSummary undoLatest(const std::filesystem::path &repo, bool force)
{
    const HistoryStore store(repo);
    UndoEngine engine(store);
    return engine.undoLatest(force);
}

} // namespace rewind
