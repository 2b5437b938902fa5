#pragma once

#include <chrono>

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace rewind {

struct SandboxRunOptions {
    QString python = QStringLiteral("python3");
    int maxSteps = 100;
    bool disableSaving = false;
    QStringList scriptArguments;
    std::chrono::milliseconds timeout{0};
};

// Environment that activates the runtime guard inside the isolated copy.
QProcessEnvironment sandboxEnvironment(const IsolatedRun &run,
                                       const SandboxRunOptions &options,
                                       QProcessEnvironment base = QProcessEnvironment::systemEnvironment());

// Runs the isolated script with the guard active. Output goes to
// <runDir>/profile.log. Throws SandboxError when the interpreter cannot start.
SandboxRunResult runSandboxed(const IsolatedRun &run, const SandboxRunOptions &options);

} // namespace rewind
