#include "history/backup_store.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "common/file_utils.hpp"
#include "common/logging.hpp"

namespace rewind {

namespace {

constexpr qint64 kBinarySniffBytes = 4096;

enum class Sniff {
    Text,
    Binary,
    Unreadable
};

Sniff sniffContent(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return Sniff::Unreadable;
    }
    const QByteArray head = file.read(kBinarySniffBytes);
    if (head.isEmpty() && file.error() != QFileDevice::NoError) {
        return Sniff::Unreadable;
    }
    return head.contains('\0') ? Sniff::Binary : Sniff::Text;
}

std::string lowerExtension(const std::string &relPath)
{
    std::string ext = std::filesystem::path(relPath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

BackupStore::BackupStore(std::filesystem::path repo,
                         std::filesystem::path backupRoot,
                         const RewindConfig &config)
    : m_repo(std::move(repo))
    , m_backupRoot(std::move(backupRoot))
    , m_extensions(config.backupExtensions)
    , m_maxBytes(config.maxBackupBytes)
{
}

BackupResult BackupStore::backup(const Manifest &manifest) const
{
    BackupResult result;

    for (const auto &[rel, entry] : manifest) {
        if (!isCandidate(rel)) {
            continue;
        }

        if (entry.size > m_maxBytes) {
            result.skipped.push_back({rel, SkipReason::TooLarge});
            continue;
        }

        const std::filesystem::path source = m_repo / rel;
        const Sniff sniff = sniffContent(source);
        if (sniff == Sniff::Binary) {
            result.skipped.push_back({rel, SkipReason::Binary});
            continue;
        }
        if (sniff == Sniff::Unreadable) {
            result.skipped.push_back({rel, SkipReason::Unreadable});
            continue;
        }

        std::string error;
        if (!copyFileBytes(source, backupPath(rel), &error)) {
            RLOG_WARN(QStringLiteral("BackupStore"),
                      QStringLiteral("backup"),
                      QStringLiteral("backup_copy_failed"),
                      QStringLiteral("io_error"),
                      QStringLiteral("skip_file"),
                      rewind::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", rel}, {"error", error}}));
            result.skipped.push_back({rel, SkipReason::Unreadable});
            continue;
        }
        result.backedUp.push_back(rel);
    }

    RLOG_INFO(QStringLiteral("BackupStore"),
              QStringLiteral("backup"),
              QStringLiteral("backup_complete"),
              QStringLiteral("history_entry"),
              QStringLiteral("copy_eligible"),
              rewind::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"backedUp", result.backedUp.size()},
                              {"skipped", result.skipped.size()}}));
    return result;
}

bool BackupStore::isCandidate(const std::string &relPath) const
{
    return m_extensions.count(lowerExtension(relPath)) > 0;
}

bool BackupStore::hasBackup(const std::string &relPath) const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(backupPath(relPath), ec);
}

std::filesystem::path BackupStore::backupPath(const std::string &relPath) const
{
    return m_backupRoot / std::filesystem::path(relPath);
}

} // namespace rewind
