#include "cli/RewindCli.hpp"

#include <iostream>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "history/history_store.hpp"
#include "history/mutation_session.hpp"
#include "history/undo_engine.hpp"
#include "sandbox/sandbox_preparer.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace rewind {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  rewind history list --repo PATH [--format text|json]\n"
        "  rewind history show --repo PATH --run-id ID [--format text|json]\n"
        "  rewind undo --repo PATH (--run-id ID | --last) [--force]\n"
        "  rewind sandbox prepare --repo PATH --script PATH [--runs-root PATH]\n"
        "  rewind sandbox run --repo PATH --script PATH [--runs-root PATH]\n"
        "                     [--max-steps N] [--disable-saving] [--timeout SECONDS]\n"
        "  rewind mutate --repo PATH --mode dry-run|plan|apply [--yes]\n"
        "                [--timeout SECONDS] -- PROGRAM [ARGS...]\n");
}

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

// Options end at "--"; everything after it belongs to the mutator.
QStringList optionPart(const QStringList &args)
{
    const int sep = args.indexOf(QStringLiteral("--"));
    return sep < 0 ? args : args.mid(0, sep);
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const QStringList options = optionPart(args);
    const int idx = options.indexOf(key);
    if (idx < 0 || idx + 1 >= options.size()) {
        return QString();
    }
    return options.at(idx + 1);
}

bool hasFlag(const QStringList &args, const QString &flag)
{
    return optionPart(args).contains(flag);
}

std::optional<QString> parseFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty() || value == QStringLiteral("text")) {
        return QStringLiteral("text");
    }
    if (value == QStringLiteral("json")) {
        return value;
    }
    return std::nullopt;
}

// Empty optional means the value was present but not a positive integer.
std::optional<int> parsePositiveInt(const QStringList &args, const QString &key, int fallback)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}

std::filesystem::path toPath(const QString &value)
{
    return std::filesystem::path(value.toStdString());
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

void printPathList(const char *label, const std::vector<std::string> &paths)
{
    std::cout << label << " (" << paths.size() << ")\n";
    for (const auto &path : paths) {
        std::cout << "  - " << path << "\n";
    }
}

void renderHistoryListText(const std::vector<HistoryMeta> &entries)
{
    if (entries.empty()) {
        std::cout << "No history entries.\n";
        return;
    }
    for (const auto &meta : entries) {
        std::cout << meta.runId << "  " << formatLocalTime(meta.createdAt)
                  << "  backed up " << meta.backedUpFiles.size()
                  << ", skipped " << meta.skippedFiles.size();
        if (!meta.command.empty()) {
            std::cout << "  " << meta.command;
        }
        std::cout << "\n";
    }
}

void renderUndoSummary(const UndoSummary &summary)
{
    std::cout << "Undo of " << summary.runId << ": "
              << toOutcomeString(summary.outcome) << "\n";
    printPathList("Restored", summary.restored);
    printPathList("Removed", summary.removed);
    if (!summary.skippedNoBackup.empty()) {
        printPathList("Not restorable (no backup)", summary.skippedNoBackup);
    }
    if (!summary.removeFailed.empty()) {
        printPathList("Could not remove", summary.removeFailed);
    }
}

void renderMutationReport(const MutationReport &report, const std::filesystem::path &repo)
{
    std::cout << "Mode: " << toModeString(report.mode) << "\n";
    if (report.runId.empty()) {
        std::cout << "No changes made; nothing recorded.\n";
        return;
    }
    std::cout << "Run id: " << report.runId << "\n";
    std::cout << "Exit code: " << report.exitCode
              << (report.timedOut ? " (timed out)" : "") << "\n";
    printPathList("Added", report.changes.added);
    printPathList("Deleted", report.changes.deleted);
    printPathList("Modified", report.changes.modified);
    std::cout << "Undo with: rewind undo --repo " << repo.string()
              << " --run-id " << report.runId << "\n";
}

} // namespace

int RewindCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    RLOG_INFO(QStringLiteral("RewindCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("argv"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("history")) {
            return runHistory(args);
        }
        if (command == QStringLiteral("undo")) {
            return runUndo(args);
        }
        if (command == QStringLiteral("sandbox")) {
            return runSandbox(args);
        }
        if (command == QStringLiteral("mutate")) {
            return runMutate(args);
        }
    } catch (const DivergenceError &e) {
        std::cerr << e.what() << std::endl;
        return kExitFailed;
    } catch (const MissingHistoryError &e) {
        std::cerr << e.what() << std::endl;
        return kExitFailed;
    } catch (const std::exception &e) {
        RLOG_ERROR(QStringLiteral("RewindCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("report_to_stderr"),
                   rewind::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"error", e.what()}}));
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailed;
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

std::optional<QString> RewindCli::repoArgument(const QStringList &args) const
{
    const QString repo = getArgValue(args, QStringLiteral("--repo"));
    if (repo.isEmpty()) {
        return std::nullopt;
    }
    return repo;
}

int RewindCli::runHistory(const QStringList &args)
{
    const QString sub = args.size() > 2 ? args.at(2) : QString();
    const auto repo = repoArgument(args);
    const auto format = parseFormat(args);
    if (!repo) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    if (!format) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    const HistoryStore store(toPath(*repo));

    if (sub == QStringLiteral("list")) {
        const auto entries = store.listEntries();
        if (*format == QStringLiteral("json")) {
            std::cout << nlohmann::json(entries).dump(2) << std::endl;
        } else {
            renderHistoryListText(entries);
        }
        return kExitOk;
    }

    if (sub == QStringLiteral("show")) {
        const std::string runId = getArgValue(args, QStringLiteral("--run-id")).toStdString();
        if (runId.empty()) {
            std::cerr << usageText().toStdString();
            return kExitUsage;
        }
        const auto meta = store.loadMeta(runId);
        const auto entry = store.loadEntry(runId);
        if (!meta || !entry) {
            throw MissingHistoryError(runId, "History entry missing: " + runId);
        }
        const auto changes = readChangeSet(entry->changesPath);
        const auto undoRecord = readJsonFile(entry->root / "undo.json");

        if (*format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["meta"] = *meta;
            payload["changes"] = changes ? nlohmann::json(*changes) : nlohmann::json();
            payload["undo"] = undoRecord ? *undoRecord : nlohmann::json();
            std::cout << payload.dump(2) << std::endl;
            return kExitOk;
        }

        std::cout << "Run id:  " << meta->runId << "\n";
        std::cout << "Created: " << formatLocalTime(meta->createdAt) << "\n";
        std::cout << "Repo:    " << meta->repo << "\n";
        if (!meta->command.empty()) {
            std::cout << "Command: " << meta->command << "\n";
        }
        std::cout << "Backed up files: " << meta->backedUpFiles.size() << "\n";
        std::cout << "Skipped files (" << meta->skippedFiles.size() << ")\n";
        for (const auto &skipped : meta->skippedFiles) {
            std::cout << "  - " << skipped.relPath << " ["
                      << toSkipReasonString(skipped.reason) << "]\n";
        }
        if (changes) {
            printPathList("Added", changes->added);
            printPathList("Deleted", changes->deleted);
            printPathList("Modified", changes->modified);
        } else {
            std::cout << "Not finalized.\n";
        }
        if (undoRecord) {
            std::cout << "Undone: " << undoRecord->value("outcome", "") << " at "
                      << undoRecord->value("finished_at", "") << "\n";
        }
        return kExitOk;
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

int RewindCli::runUndo(const QStringList &args)
{
    const auto repo = repoArgument(args);
    const QString runId = getArgValue(args, QStringLiteral("--run-id"));
    const bool last = hasFlag(args, QStringLiteral("--last"));
    const bool force = hasFlag(args, QStringLiteral("--force"));

    if (!repo || (runId.isEmpty() == !last)) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const HistoryStore store(toPath(*repo));
    UndoEngine engine(store);
    const UndoSummary summary = last
        ? engine.undoLatest(force)
        : engine.undo(runId.toStdString(), force);
    renderUndoSummary(summary);
    return kExitOk;
}

int RewindCli::runSandbox(const QStringList &args)
{
    const QString sub = args.size() > 2 ? args.at(2) : QString();
    const auto repo = repoArgument(args);
    const QString script = getArgValue(args, QStringLiteral("--script"));
    const QString runsRoot = getArgValue(args, QStringLiteral("--runs-root"));

    if (!repo || script.isEmpty()
        || (sub != QStringLiteral("prepare") && sub != QStringLiteral("run"))) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    std::error_code ec;
    const std::filesystem::path repoPath = toPath(*repo);
    const std::filesystem::path resolvedRepo = std::filesystem::canonical(repoPath, ec);
    const RewindConfig config = loadConfig(ec ? repoPath : resolvedRepo);

    SandboxRunOptions options;
    options.python = QString::fromStdString(config.python);
    const auto maxSteps = parsePositiveInt(args, QStringLiteral("--max-steps"), config.maxSteps);
    const auto timeoutSeconds = parsePositiveInt(args, QStringLiteral("--timeout"), 0);
    if (!maxSteps || !timeoutSeconds) {
        std::cerr << "--max-steps and --timeout take a positive integer." << std::endl;
        return kExitUsage;
    }
    options.maxSteps = *maxSteps;
    options.timeout = std::chrono::seconds(*timeoutSeconds);
    options.disableSaving = hasFlag(args, QStringLiteral("--disable-saving"));

    const SandboxPreparer preparer(config);
    const IsolatedRun run = preparer.prepare(
        repoPath,
        toPath(script),
        runsRoot.isEmpty() ? std::nullopt : std::optional<std::filesystem::path>(toPath(runsRoot)));

    std::cout << "Isolated repo:   " << run.isolatedRepo.string() << "\n";
    std::cout << "Isolated script: " << run.isolatedScript.string() << "\n";
    if (sub == QStringLiteral("prepare")) {
        return kExitOk;
    }

    const SandboxRunResult result = runSandboxed(run, options);
    std::cout << "Exit code: " << result.exitCode
              << (result.timedOut ? " (timed out)" : "") << "\n";
    std::cout << "Log: " << result.logFile.string() << "\n";
    return (result.exitCode == 0 && !result.timedOut) ? kExitOk : kExitFailed;
}

int RewindCli::runMutate(const QStringList &args)
{
    const auto repo = repoArgument(args);
    const auto mode = parseModeString(getArgValue(args, QStringLiteral("--mode")).toStdString());
    const int sep = args.indexOf(QStringLiteral("--"));
    if (!repo || !mode || sep < 0 || sep + 1 >= args.size()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    const auto timeoutSeconds = parsePositiveInt(args, QStringLiteral("--timeout"), 0);
    if (!timeoutSeconds) {
        std::cerr << "--timeout takes a positive integer." << std::endl;
        return kExitUsage;
    }

    MutationRequest request;
    request.mode = *mode;
    request.confirmed = hasFlag(args, QStringLiteral("--yes"));
    request.program = args.at(sep + 1);
    request.arguments = args.mid(sep + 2);
    request.description = args.mid(sep + 1).join(QLatin1Char(' ')).toStdString();
    request.timeout = std::chrono::seconds(*timeoutSeconds);

    try {
        checkApplyGuard(request);
    } catch (const ApplyNotConfirmedError &e) {
        std::cerr << e.what() << std::endl;
        return kExitFailed;
    }

    HistoryStore store(toPath(*repo));
    MutationSession session(store);
    const MutationReport report = session.run(request);
    renderMutationReport(report, store.repo());
    return (report.exitCode == 0 && !report.timedOut) ? kExitOk : kExitFailed;
}

} // namespace rewind
