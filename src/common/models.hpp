#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace rewind {

struct ManifestEntry {
    std::string relPath;
    std::uintmax_t size = 0;
    std::string sha256;
};

// Keyed by POSIX-style relative path.
using Manifest = std::map<std::string, ManifestEntry>;

struct ScanFailure {
    std::string relPath;
    std::string reason;
};

struct ManifestScan {
    Manifest entries;
    std::vector<ScanFailure> failures;
};

struct SkippedFile {
    std::string relPath;
    SkipReason reason;
};

struct HistoryMeta {
    std::string repo;
    std::string runId;
    std::chrono::system_clock::time_point createdAt;
    std::string command;
    std::vector<std::string> backedUpFiles;
    std::vector<SkippedFile> skippedFiles;
};

struct HistoryEntry {
    std::filesystem::path repo;
    std::string runId;
    std::filesystem::path root;
    std::filesystem::path metaPath;
    std::filesystem::path beforeManifestPath;
    std::filesystem::path afterManifestPath;
    std::filesystem::path changesPath;
    std::filesystem::path backupRoot;
};

struct ChangeSet {
    std::string runId;
    std::vector<std::string> added;
    std::vector<std::string> deleted;
    std::vector<std::string> modified;
};

struct UndoSummary {
    std::string runId;
    UndoOutcome outcome = UndoOutcome::Restored;
    std::vector<std::string> restored;
    std::vector<std::string> removed;
    std::vector<std::string> skippedNoBackup;
    // Added files that could not be deleted.
    std::vector<std::string> removeFailed;
    std::chrono::system_clock::time_point finishedAt;
};

struct IsolatedRun {
    std::filesystem::path originalRepo;
    std::filesystem::path runDir;
    std::filesystem::path isolatedRepo;
    std::filesystem::path isolatedScript;
    std::filesystem::path guardModulePath;
};

struct SandboxRunResult {
    int exitCode = -1;
    bool timedOut = false;
    std::chrono::milliseconds duration{0};
    std::filesystem::path logFile;
};

struct MutationReport {
    MutationMode mode = MutationMode::DryRun;
    std::string runId;
    int exitCode = 0;
    bool timedOut = false;
    ChangeSet changes;
};

} // namespace rewind
