#include "common/config.hpp"

#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace rewind {

namespace {

constexpr std::uintmax_t kDefaultMaxBackupBytes = 5 * 1024 * 1024;
constexpr int kDefaultMaxSteps = 100;

nlohmann::json readConfigFile(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.exists()) {
        return nlohmann::json();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        RLOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("readConfigFile"),
                  QStringLiteral("config_unreadable"),
                  QStringLiteral("open_failed"),
                  QStringLiteral("defaults"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.string()}}));
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &error) {
        RLOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("readConfigFile"),
                  QStringLiteral("config_malformed"),
                  QStringLiteral("parse_error"),
                  QStringLiteral("defaults"),
                  rewind::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.string()}, {"error", error.what()}}));
        return nlohmann::json();
    }
}

void applyStringSet(const nlohmann::json &root, const char *key, std::set<std::string> &target)
{
    if (!root.contains(key) || !root.at(key).is_array()) {
        return;
    }
    std::set<std::string> values;
    for (const auto &item : root.at(key)) {
        if (item.is_string()) {
            values.insert(item.get<std::string>());
        }
    }
    target = std::move(values);
}

void applyFile(const nlohmann::json &root, RewindConfig &config)
{
    if (!root.is_object()) {
        return;
    }
    applyStringSet(root, "backup_extensions", config.backupExtensions);
    applyStringSet(root, "manifest_excludes", config.manifestExcludes);
    applyStringSet(root, "sandbox_excludes", config.sandboxExcludes);
    if (root.contains("max_backup_bytes") && root.at("max_backup_bytes").is_number_unsigned()) {
        config.maxBackupBytes = root.at("max_backup_bytes").get<std::uintmax_t>();
    }
    if (root.contains("max_steps") && root.at("max_steps").is_number_integer()) {
        config.maxSteps = root.at("max_steps").get<int>();
    }
    if (root.contains("python") && root.at("python").is_string()) {
        config.python = root.at("python").get<std::string>();
    }

    // The state directory is never part of a snapshot or a sandbox copy.
    config.manifestExcludes.insert(kStateDirName);
    config.sandboxExcludes.insert(kStateDirName);
}

void applyEnvironment(RewindConfig &config)
{
    bool ok = false;
    const qulonglong maxBytes = qEnvironmentVariable("REWIND_MAX_BACKUP_BYTES").toULongLong(&ok);
    if (ok) {
        config.maxBackupBytes = maxBytes;
    }

    const int maxSteps = qEnvironmentVariableIntValue("REWIND_MAX_STEPS", &ok);
    if (ok && maxSteps > 0) {
        config.maxSteps = maxSteps;
    }

    const QString python = qEnvironmentVariable("REWIND_PYTHON");
    if (!python.isEmpty()) {
        config.python = python.toStdString();
    }
}

} // namespace

RewindConfig defaultConfig()
{
    RewindConfig config;
    config.backupExtensions = {
        ".py", ".pyw", ".sh", ".md", ".txt", ".toml",
        ".yaml", ".yml", ".json", ".cfg", ".ini",
    };
    config.maxBackupBytes = kDefaultMaxBackupBytes;
    config.manifestExcludes = {
        ".git", ".venv", "venv", "build", "dist", "__pycache__", kStateDirName,
    };
    config.sandboxExcludes = {
        ".git", ".venv", "venv", "__pycache__", "build", "dist",
        ".pytest_cache", ".ruff_cache", kStateDirName,
    };
    config.maxSteps = kDefaultMaxSteps;
    config.python = "python3";
    return config;
}

RewindConfig loadConfig(const std::filesystem::path &repo)
{
    RewindConfig config = defaultConfig();
    applyFile(readConfigFile(stateRoot(repo) / "config.json"), config);
    applyEnvironment(config);
    return config;
}

std::filesystem::path stateRoot(const std::filesystem::path &repo)
{
    return repo / kStateDirName;
}

std::filesystem::path historyRoot(const std::filesystem::path &repo)
{
    return stateRoot(repo) / "history";
}

std::filesystem::path defaultRunsRoot(const std::filesystem::path &repo)
{
    return stateRoot(repo) / "runs";
}

} // namespace rewind
