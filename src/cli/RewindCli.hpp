#pragma once

#include <optional>

#include <QString>
#include <QStringList>

namespace rewind {

class RewindCli
{
public:
    // CLI dispatcher for history, undo, sandbox and mutation commands.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runHistory(const QStringList &args);
    int runUndo(const QStringList &args);
    int runSandbox(const QStringList &args);
    int runMutate(const QStringList &args);

    std::optional<QString> repoArgument(const QStringList &args) const;
};

} // namespace rewind
