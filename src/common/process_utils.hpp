#pragma once

#include <chrono>

#include <QByteArray>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace rewind {

struct ProcessOptions {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    // Zero or negative means wait without a deadline.
    std::chrono::milliseconds timeout{0};
    // When set, stdout and stderr are merged into this file instead of
    // being captured in memory.
    QString outputFile;
};

struct ProcessOutcome {
    bool started = false;
    bool timedOut = false;
    bool crashed = false;
    int exitCode = -1;
    std::chrono::milliseconds duration{0};
    QByteArray output;
};

// Wait budget for QProcess: -1 for no deadline, otherwise the timeout
// clamped to what an int can hold.
int waitMilliseconds(std::chrono::milliseconds timeout);

// Blocking child process run with an optional deadline. On expiry the child
// is killed and reaped before returning.
ProcessOutcome runProcess(const ProcessOptions &options);

QString findExecutable(const QString &name);

} // namespace rewind
