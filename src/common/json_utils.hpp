#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace rewind {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toSkipReasonString(SkipReason reason)
{
    switch (reason) {
    case SkipReason::TooLarge:
        return "too_large";
    case SkipReason::Binary:
        return "binary";
    case SkipReason::Unreadable:
        return "unreadable";
    }
    return "unreadable";
}

inline SkipReason parseSkipReasonString(const std::string &value)
{
    if (value == "too_large") {
        return SkipReason::TooLarge;
    }
    if (value == "binary") {
        return SkipReason::Binary;
    }
    return SkipReason::Unreadable;
}

inline std::string toOutcomeString(UndoOutcome outcome)
{
    switch (outcome) {
    case UndoOutcome::NoHistory:
        return "no_history";
    case UndoOutcome::DivergenceBlocked:
        return "divergence_blocked";
    case UndoOutcome::Restored:
        return "restored";
    case UndoOutcome::RestoredWithGaps:
        return "restored_with_gaps";
    }
    return "no_history";
}

inline UndoOutcome parseOutcomeString(const std::string &value)
{
    if (value == "divergence_blocked") {
        return UndoOutcome::DivergenceBlocked;
    }
    if (value == "restored") {
        return UndoOutcome::Restored;
    }
    if (value == "restored_with_gaps") {
        return UndoOutcome::RestoredWithGaps;
    }
    return UndoOutcome::NoHistory;
}

inline std::string toModeString(MutationMode mode)
{
    switch (mode) {
    case MutationMode::DryRun:
        return "dry-run";
    case MutationMode::Plan:
        return "plan";
    case MutationMode::Apply:
        return "apply";
    }
    return "dry-run";
}

inline std::optional<MutationMode> parseModeString(const std::string &value)
{
    if (value == "dry-run") {
        return MutationMode::DryRun;
    }
    if (value == "plan") {
        return MutationMode::Plan;
    }
    if (value == "apply") {
        return MutationMode::Apply;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const SkipReason &reason)
{
    j = toSkipReasonString(reason);
}

inline void from_json(const nlohmann::json &j, SkipReason &reason)
{
    if (j.is_string()) {
        reason = parseSkipReasonString(j.get<std::string>());
    } else {
        reason = SkipReason::Unreadable;
    }
}

inline void to_json(nlohmann::json &j, const UndoOutcome &outcome)
{
    j = toOutcomeString(outcome);
}

inline void from_json(const nlohmann::json &j, UndoOutcome &outcome)
{
    if (j.is_string()) {
        outcome = parseOutcomeString(j.get<std::string>());
    } else {
        outcome = UndoOutcome::NoHistory;
    }
}

inline void to_json(nlohmann::json &j, const ManifestEntry &entry)
{
    j = nlohmann::json{
        {"rel_path", entry.relPath},
        {"size", entry.size},
        {"sha256", entry.sha256}
    };
}

// Manifest files are only trusted when every field is present; a partial
// record is reported to the caller as a parse failure.
inline void from_json(const nlohmann::json &j, ManifestEntry &entry)
{
    entry.relPath = j.at("rel_path").get<std::string>();
    entry.size = j.at("size").get<std::uintmax_t>();
    entry.sha256 = j.at("sha256").get<std::string>();
}

inline void to_json(nlohmann::json &j, const ScanFailure &failure)
{
    j = nlohmann::json{{"rel_path", failure.relPath}, {"reason", failure.reason}};
}

inline void to_json(nlohmann::json &j, const SkippedFile &file)
{
    j = nlohmann::json{{"rel_path", file.relPath}, {"reason", file.reason}};
}

inline void from_json(const nlohmann::json &j, SkippedFile &file)
{
    if (j.is_string()) {
        file.relPath = j.get<std::string>();
        file.reason = SkipReason::Unreadable;
        return;
    }
    file.relPath = j.value("rel_path", "");
    if (j.contains("reason")) {
        file.reason = j.at("reason").get<SkipReason>();
    } else {
        file.reason = SkipReason::Unreadable;
    }
}

inline void to_json(nlohmann::json &j, const HistoryMeta &meta)
{
    j = nlohmann::json{
        {"repo", meta.repo},
        {"run_id", meta.runId},
        {"created_at", toIso8601Utc(meta.createdAt)},
        {"command", meta.command},
        {"backed_up_files", meta.backedUpFiles},
        {"skipped_files", meta.skippedFiles},
        {"note", "Undo can only restore files that were backed up."}
    };
}

inline void from_json(const nlohmann::json &j, HistoryMeta &meta)
{
    meta.repo = j.value("repo", "");
    meta.runId = j.value("run_id", "");
    meta.createdAt = fromIso8601Utc(j.value("created_at", ""));
    meta.command = j.value("command", "");
    if (j.contains("backed_up_files") && j.at("backed_up_files").is_array()) {
        meta.backedUpFiles = j.at("backed_up_files").get<std::vector<std::string>>();
    } else {
        meta.backedUpFiles.clear();
    }
    if (j.contains("skipped_files") && j.at("skipped_files").is_array()) {
        meta.skippedFiles = j.at("skipped_files").get<std::vector<SkippedFile>>();
    } else {
        meta.skippedFiles.clear();
    }
}

inline void to_json(nlohmann::json &j, const ChangeSet &changes)
{
    j = nlohmann::json{
        {"run_id", changes.runId},
        {"added", changes.added},
        {"deleted", changes.deleted},
        {"modified", changes.modified}
    };
}

inline void from_json(const nlohmann::json &j, ChangeSet &changes)
{
    changes.runId = j.value("run_id", "");
    changes.added = j.at("added").get<std::vector<std::string>>();
    changes.deleted = j.at("deleted").get<std::vector<std::string>>();
    changes.modified = j.at("modified").get<std::vector<std::string>>();
}

inline void to_json(nlohmann::json &j, const UndoSummary &summary)
{
    j = nlohmann::json{
        {"run_id", summary.runId},
        {"outcome", summary.outcome},
        {"restored", summary.restored},
        {"removed", summary.removed},
        {"skipped_no_backup", summary.skippedNoBackup},
        {"remove_failed", summary.removeFailed},
        {"finished_at", toIso8601Utc(summary.finishedAt)}
    };
}

inline void to_json(nlohmann::json &j, const IsolatedRun &run)
{
    j = nlohmann::json{
        {"original_repo", run.originalRepo.string()},
        {"run_dir", run.runDir.string()},
        {"isolated_repo", run.isolatedRepo.string()},
        {"isolated_script", run.isolatedScript.string()},
        {"guard_module", run.guardModulePath.string()}
    };
}

inline void to_json(nlohmann::json &j, const SandboxRunResult &result)
{
    j = nlohmann::json{
        {"exit_code", result.exitCode},
        {"timed_out", result.timedOut},
        {"duration_ms", result.duration.count()},
        {"log_file", result.logFile.string()}
    };
}

inline void to_json(nlohmann::json &j, const MutationReport &report)
{
    j = nlohmann::json{
        {"mode", toModeString(report.mode)},
        {"run_id", report.runId},
        {"exit_code", report.exitCode},
        {"timed_out", report.timedOut},
        {"changes", report.changes}
    };
}

} // namespace rewind
