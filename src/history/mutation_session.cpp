#include "history/mutation_session.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace rewind {

bool checkApplyGuard(const MutationRequest &request)
{
    if (request.mode != MutationMode::Apply) {
        return false;
    }
    if (!request.confirmed) {
        throw ApplyNotConfirmedError(
            "Apply mode modifies the repository; confirm it explicitly (--yes).");
    }
    return true;
}

MutationSession::MutationSession(HistoryStore &store)
    : m_store(store)
{
}

MutationReport MutationSession::run(const MutationRequest &request)
{
    MutationReport report;
    report.mode = request.mode;

    if (!checkApplyGuard(request)) {
        RLOG_INFO(QStringLiteral("MutationSession"),
                  QStringLiteral("run"),
                  QStringLiteral("mutation_skipped"),
                  QStringLiteral("read_only_mode"),
                  QStringLiteral("no_history_entry"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"mode", toModeString(request.mode)}}));
        return report;
    }

    const HistoryEntry entry = m_store.createEntry(request.description);
    rewind::logging::CorrelationScope corr(QString::fromStdString(entry.runId));
    report.runId = entry.runId;

    ProcessOptions options;
    options.program = request.program;
    options.arguments = request.arguments;
    options.workingDirectory = QString::fromStdString(m_store.repo().string());
    options.timeout = request.timeout;
    options.outputFile = QString::fromStdString((entry.root / "mutator.log").string());

    const ProcessOutcome outcome = runProcess(options);
    report.exitCode = outcome.exitCode;
    report.timedOut = outcome.timedOut;

    // Finalize regardless of how the mutator ended; a partial edit still
    // needs an exact change set to be undoable.
    report.changes = m_store.finalizeEntry(entry);

    RLOG_INFO(QStringLiteral("MutationSession"),
              QStringLiteral("run"),
              QStringLiteral("mutation_finished"),
              QStringLiteral("apply_mode"),
              QStringLiteral("child_process"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runId", entry.runId},
                              {"started", outcome.started},
                              {"exitCode", outcome.exitCode},
                              {"timedOut", outcome.timedOut},
                              {"durationMs", outcome.duration.count()}}));
    return report;
}

} // namespace rewind
