#include "sandbox/sandbox_runner.hpp"

#include <QDir>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace rewind {

QProcessEnvironment sandboxEnvironment(const IsolatedRun &run,
                                       const SandboxRunOptions &options,
                                       QProcessEnvironment base)
{
    const QString isolatedRoot = QString::fromStdString(run.isolatedRepo.string());
    const QString existing = base.value(QStringLiteral("PYTHONPATH"));
    base.insert(QStringLiteral("PYTHONPATH"),
                existing.isEmpty()
                    ? isolatedRoot
                    : isolatedRoot + QDir::listSeparator() + existing);
    base.insert(QStringLiteral("PYTHONDONTWRITEBYTECODE"), QStringLiteral("1"));
    base.insert(QStringLiteral("REWIND_SAFE_PROFILE"), QStringLiteral("1"));
    base.insert(QStringLiteral("REWIND_MAX_STEPS"), QString::number(options.maxSteps));
    if (options.disableSaving) {
        base.insert(QStringLiteral("REWIND_DISABLE_SAVING"), QStringLiteral("1"));
    } else {
        base.remove(QStringLiteral("REWIND_DISABLE_SAVING"));
    }
    return base;
}

SandboxRunResult runSandboxed(const IsolatedRun &run, const SandboxRunOptions &options)
{
    SandboxRunResult result;
    result.logFile = run.runDir / "profile.log";

    ProcessOptions process;
    process.program = options.python;
    process.arguments = QStringList{QString::fromStdString(run.isolatedScript.string())}
                        + options.scriptArguments;
    process.workingDirectory = QString::fromStdString(run.isolatedRepo.string());
    process.environment = sandboxEnvironment(run, options);
    process.timeout = options.timeout;
    process.outputFile = QString::fromStdString(result.logFile.string());

    const ProcessOutcome outcome = runProcess(process);
    if (!outcome.started) {
        throw SandboxError("could not start interpreter: " + options.python.toStdString());
    }

    result.exitCode = outcome.exitCode;
    result.timedOut = outcome.timedOut;
    result.duration = outcome.duration;

    RLOG_INFO(QStringLiteral("SandboxRunner"),
              QStringLiteral("runSandboxed"),
              QStringLiteral("sandbox_run_finished"),
              QStringLiteral("isolated_run"),
              QStringLiteral("guarded_python"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runDir", run.runDir.string()},
                              {"maxSteps", options.maxSteps},
                              {"result", result}}));
    return result;
}

} // namespace rewind
