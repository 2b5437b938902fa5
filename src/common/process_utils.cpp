#include "common/process_utils.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QStandardPaths>

#include <algorithm>
#include <limits>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace rewind {

int waitMilliseconds(std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0) {
        return -1;
    }
    constexpr auto kMaxWait = static_cast<std::chrono::milliseconds::rep>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(timeout.count(), kMaxWait));
}

ProcessOutcome runProcess(const ProcessOptions &options)
{
    ProcessOutcome outcome;

    QProcess process;
    process.setProcessEnvironment(options.environment);
    if (!options.workingDirectory.isEmpty()) {
        process.setWorkingDirectory(options.workingDirectory);
    }
    process.setProcessChannelMode(QProcess::MergedChannels);
    if (!options.outputFile.isEmpty()) {
        process.setStandardOutputFile(options.outputFile, QIODevice::Truncate);
    }

    QElapsedTimer timer;
    timer.start();

    process.start(options.program, options.arguments);
    if (!process.waitForStarted()) {
        RLOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runProcess"),
                  QStringLiteral("process_start_failed"),
                  QStringLiteral("child_process"),
                  QStringLiteral("qprocess"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", options.program.toStdString()},
                                  {"error", process.errorString().toStdString()}}));
        return outcome;
    }
    outcome.started = true;

    process.closeWriteChannel();

    const int waitMs = waitMilliseconds(options.timeout);
    if (!process.waitForFinished(waitMs)) {
        if (process.state() != QProcess::NotRunning) {
            outcome.timedOut = true;
            process.kill();
            process.waitForFinished();
            RLOG_WARN(QStringLiteral("ProcessUtils"),
                      QStringLiteral("runProcess"),
                      QStringLiteral("process_deadline_expired"),
                      QStringLiteral("timeout"),
                      QStringLiteral("kill"),
                      rewind::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"program", options.program.toStdString()},
                                      {"timeoutMs", options.timeout.count()}}));
        }
    }

    outcome.duration = std::chrono::milliseconds(timer.elapsed());
    outcome.crashed = !outcome.timedOut && process.exitStatus() != QProcess::NormalExit;
    outcome.exitCode = (outcome.timedOut || outcome.crashed) ? -1 : process.exitCode();
    if (options.outputFile.isEmpty()) {
        outcome.output = process.readAll();
    }
    return outcome;
}

QString findExecutable(const QString &name)
{
    return QStandardPaths::findExecutable(name);
}

} // namespace rewind
