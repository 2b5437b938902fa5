#include "common/file_utils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QString>

#include <stdexcept>

namespace rewind {

namespace {

constexpr qint64 kCopyChunkBytes = 1024 * 1024;
constexpr int kMaxUniqueSuffix = 100;

QString toQString(const std::filesystem::path &path)
{
    return QString::fromStdString(path.string());
}

} // namespace

void writeJsonFile(const std::filesystem::path &path, const nlohmann::json &payload)
{
    const QString target = toQString(path);
    if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
        throw std::runtime_error("failed to create directory for " + path.string());
    }

    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw std::runtime_error("failed to open " + path.string() + " for writing");
    }
    const QByteArray data = QByteArray::fromStdString(payload.dump(2) + "\n");
    if (file.write(data) != data.size() || !file.commit()) {
        throw std::runtime_error("failed to write " + path.string());
    }
}

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path &path)
{
    QFile file(toQString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return std::nullopt;
    }
}

bool copyFileBytes(const std::filesystem::path &src,
                   const std::filesystem::path &dst,
                   std::string *error)
{
    const QString target = toQString(dst);
    if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
        if (error) {
            *error = "mkpath failed";
        }
        return false;
    }

    QFile in(toQString(src));
    if (!in.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = in.errorString().toStdString();
        }
        return false;
    }

    QSaveFile out(target);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) {
            *error = out.errorString().toStdString();
        }
        return false;
    }

    while (!in.atEnd()) {
        const QByteArray chunk = in.read(kCopyChunkBytes);
        if (chunk.isEmpty() && in.error() != QFileDevice::NoError) {
            if (error) {
                *error = in.errorString().toStdString();
            }
            out.cancelWriting();
            return false;
        }
        if (out.write(chunk) != chunk.size()) {
            if (error) {
                *error = out.errorString().toStdString();
            }
            out.cancelWriting();
            return false;
        }
    }

    if (!out.commit()) {
        if (error) {
            *error = out.errorString().toStdString();
        }
        return false;
    }
    QFile::setPermissions(target, in.permissions());
    return true;
}

std::optional<std::string> claimUniqueDirectory(const std::filesystem::path &parent,
                                                const std::string &base,
                                                std::string *error)
{
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        if (error) {
            *error = ec.message();
        }
        return std::nullopt;
    }

    for (int suffix = 0; suffix < kMaxUniqueSuffix; ++suffix) {
        const std::string name = base + (suffix < 10 ? "-0" : "-") + std::to_string(suffix);
        if (std::filesystem::create_directory(parent / name, ec)) {
            return name;
        }
        if (ec) {
            if (error) {
                *error = ec.message();
            }
            return std::nullopt;
        }
    }
    if (error) {
        *error = "no free name for " + base;
    }
    return std::nullopt;
}

std::string toPosixRelative(const std::filesystem::path &relative)
{
    return relative.generic_string();
}

} // namespace rewind
