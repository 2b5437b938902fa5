#include "sandbox/sandbox_preparer.hpp"

#include <QDateTime>
#include <QFile>
#include <QSaveFile>
#include <QString>

#include <system_error>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

// Q_INIT_RESOURCE must be expanded outside of any namespace.
static void initGuardResource()
{
    Q_INIT_RESOURCE(guard);
}

namespace rewind {

namespace {

QString toQString(const std::filesystem::path &path)
{
    return QString::fromStdString(path.string());
}

std::filesystem::path resolveExisting(const std::filesystem::path &path, const char *what)
{
    std::error_code ec;
    const std::filesystem::path resolved = std::filesystem::canonical(path, ec);
    if (ec) {
        throw SandboxError(std::string(what) + " not found: " + path.string());
    }
    return resolved;
}

bool isWithin(const std::filesystem::path &path, const std::filesystem::path &base)
{
    const std::filesystem::path rel = path.lexically_relative(base);
    return !rel.empty() && *rel.begin() != "..";
}

struct CopyState {
    const std::set<std::string> &excluded;
    std::filesystem::path runsRoot;
    std::set<std::filesystem::path> visited;
    std::size_t files = 0;
};

void copyDirectory(CopyState &state,
                   const std::filesystem::path &source,
                   const std::filesystem::path &destination)
{
    std::error_code ec;
    const std::filesystem::path canonicalSource = std::filesystem::canonical(source, ec);
    if (ec) {
        throw SandboxError("cannot resolve " + source.string() + ": " + ec.message());
    }
    if (canonicalSource == state.runsRoot || !state.visited.insert(canonicalSource).second) {
        return;
    }

    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw SandboxError("cannot create " + destination.string() + ": " + ec.message());
    }

    std::filesystem::directory_iterator it(source, ec);
    if (ec) {
        throw SandboxError("cannot list " + source.string() + ": " + ec.message());
    }

    const std::filesystem::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        const std::filesystem::path path = it->path();
        const std::string name = path.filename().string();
        const std::filesystem::path target = destination / path.filename();

        // Symlinks are followed so the copy never points back into the
        // original tree.
        const auto status = std::filesystem::status(path, ec);
        if (ec) {
            RLOG_WARN(QStringLiteral("SandboxPreparer"),
                      QStringLiteral("copyDirectory"),
                      QStringLiteral("sandbox_skip_entry"),
                      QStringLiteral("dangling_or_unreadable"),
                      QStringLiteral("skip"),
                      rewind::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", path.string()}, {"error", ec.message()}}));
            ec.clear();
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (state.excluded.count(name) > 0) {
                continue;
            }
            copyDirectory(state, path, target);
        } else if (std::filesystem::is_regular_file(status)) {
            if (!QFile::copy(toQString(path), toQString(target))) {
                throw SandboxError("failed to copy " + path.string() + " into sandbox");
            }
            ++state.files;
        }
    }
    if (ec) {
        throw SandboxError("cannot list " + source.string() + ": " + ec.message());
    }
}

} // namespace

SandboxPreparer::SandboxPreparer(RewindConfig config)
    : m_config(std::move(config))
{
}

IsolatedRun SandboxPreparer::prepare(const std::filesystem::path &repo,
                                     const std::filesystem::path &script,
                                     const std::optional<std::filesystem::path> &runsRoot) const
{
    IsolatedRun run;
    run.originalRepo = resolveExisting(repo, "repository");

    const std::filesystem::path scriptPath = script.is_absolute()
        ? script
        : run.originalRepo / script;
    const std::filesystem::path resolvedScript = resolveExisting(scriptPath, "training script");
    if (!isWithin(resolvedScript, run.originalRepo)) {
        throw SandboxError("training script is outside the repository: "
                           + resolvedScript.string());
    }
    const std::filesystem::path relScript = resolvedScript.lexically_relative(run.originalRepo);

    std::filesystem::path root = runsRoot.value_or(defaultRunsRoot(run.originalRepo));
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw SandboxError("cannot create runs root " + root.string() + ": " + ec.message());
    }
    root = std::filesystem::canonical(root);

    const std::string timestamp = QDateTime::currentDateTimeUtc()
                                      .toString(QStringLiteral("yyyyMMdd-HHmmss"))
                                      .toStdString();
    std::string error;
    const auto runName = claimUniqueDirectory(root, timestamp, &error);
    if (!runName) {
        throw SandboxError("cannot allocate run directory: " + error);
    }
    run.runDir = root / *runName;
    run.isolatedRepo = run.runDir / "repo";

    copyTree(run.originalRepo, run.isolatedRepo, root);

    run.isolatedScript = run.isolatedRepo / relScript;
    if (!std::filesystem::is_regular_file(run.isolatedScript, ec)) {
        throw SandboxError("Script not found in isolated copy: " + run.isolatedScript.string());
    }

    run.guardModulePath = writeGuardModule(run.isolatedRepo);

    RLOG_INFO(QStringLiteral("SandboxPreparer"),
              QStringLiteral("prepare"),
              QStringLiteral("sandbox_prepared"),
              QStringLiteral("isolated_run"),
              QStringLiteral("full_copy"),
              rewind::logging::defaultWho(),
              QString(),
              nlohmann::json(run));
    return run;
}

void SandboxPreparer::copyTree(const std::filesystem::path &source,
                               const std::filesystem::path &destination,
                               const std::filesystem::path &runsRoot) const
{
    CopyState state{m_config.sandboxExcludes, runsRoot, {}, 0};
    copyDirectory(state, source, destination);

    RLOG_DEBUG(QStringLiteral("SandboxPreparer"),
               QStringLiteral("copyTree"),
               QStringLiteral("sandbox_copy_done"),
               QStringLiteral("isolated_run"),
               QStringLiteral("recursive_copy"),
               rewind::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", source.string()},
                               {"destination", destination.string()},
                               {"files", state.files}}));
}

std::filesystem::path SandboxPreparer::writeGuardModule(const std::filesystem::path &isolatedRepo) const
{
    const std::filesystem::path target = isolatedRepo / kGuardModuleName;
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        RLOG_WARN(QStringLiteral("SandboxPreparer"),
                  QStringLiteral("writeGuardModule"),
                  QStringLiteral("guard_replaces_existing"),
                  QStringLiteral("name_clash"),
                  QStringLiteral("overwrite_copy"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", target.string()}}));
    }

    const std::string source = guardModuleSource();
    QSaveFile file(toQString(target));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw SandboxError("cannot write guard module: " + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(source);
    if (file.write(data) != data.size() || !file.commit()) {
        throw SandboxError("cannot write guard module: " + file.errorString().toStdString());
    }
    return target;
}

IsolatedRun prepareSandbox(const std::filesystem::path &repo,
                           const std::filesystem::path &script,
                           const std::optional<std::filesystem::path> &runsRoot)
{
    std::error_code ec;
    const std::filesystem::path resolved = std::filesystem::canonical(repo, ec);
    const SandboxPreparer preparer(loadConfig(ec ? repo : resolved));
    return preparer.prepare(repo, script, runsRoot);
}

std::string guardModuleSource()
{
    initGuardResource();
    QFile resource(QStringLiteral(":/rewind/sitecustomize.py"));
    if (!resource.open(QIODevice::ReadOnly)) {
        throw SandboxError("runtime guard resource missing from build");
    }
    return resource.readAll().toStdString();
}

} // namespace rewind
