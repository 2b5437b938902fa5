#include "history/manifest_builder.hpp"

#include <QCryptographicHash>
#include <QFile>
#include <QString>

#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/file_utils.hpp"
#include "common/logging.hpp"

namespace rewind {

namespace {

constexpr qint64 kHashChunkBytes = 1024 * 1024;

struct WalkState {
    std::filesystem::path root;
    const std::set<std::string> &excluded;
    ManifestScan scan;
};

bool isExcluded(const std::filesystem::path &relative, const std::set<std::string> &excluded)
{
    if (relative.empty()) {
        return false;
    }
    return excluded.count(relative.begin()->string()) > 0;
}

void addFile(WalkState &state, const std::filesystem::path &path)
{
    const std::filesystem::path relative = path.lexically_relative(state.root);
    const std::string rel = toPosixRelative(relative);

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        state.scan.failures.push_back({rel, ec.message()});
        return;
    }

    std::string error;
    const auto digest = hashFile(path, &error);
    if (!digest) {
        state.scan.failures.push_back({rel, error});
        return;
    }

    state.scan.entries[rel] = ManifestEntry{rel, size, *digest};
}

void visit(WalkState &state,
           const std::filesystem::directory_entry &entry,
           std::vector<std::filesystem::path> &subdirs)
{
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec) {
        state.scan.failures.push_back(
            {toPosixRelative(entry.path().lexically_relative(state.root)), ec.message()});
        return;
    }

    if (std::filesystem::is_directory(status)) {
        subdirs.push_back(entry.path());
    } else if (std::filesystem::is_regular_file(status)) {
        addFile(state, entry.path());
    }
}

void walk(WalkState &state, const std::filesystem::path &dir)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        state.scan.failures.push_back(
            {toPosixRelative(dir.lexically_relative(state.root)), ec.message()});
        return;
    }

    std::vector<std::filesystem::path> subdirs;
    const std::filesystem::directory_iterator end;
    while (it != end) {
        if (!isExcluded(it->path().lexically_relative(state.root), state.excluded)) {
            visit(state, *it, subdirs);
        }

        it.increment(ec);
        if (ec) {
            state.scan.failures.push_back(
                {toPosixRelative(dir.lexically_relative(state.root)), ec.message()});
            break;
        }
    }

    for (const auto &subdir : subdirs) {
        walk(state, subdir);
    }
}

} // namespace

ManifestScan buildManifest(const std::filesystem::path &root,
                           const std::set<std::string> &excludedTopLevel)
{
    std::error_code ec;
    std::filesystem::path base = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        base = root.lexically_normal();
    }

    WalkState state{base, excludedTopLevel, {}};
    walk(state, base);

    RLOG_DEBUG(QStringLiteral("ManifestBuilder"),
               QStringLiteral("buildManifest"),
               QStringLiteral("manifest_built"),
               QStringLiteral("snapshot"),
               QStringLiteral("sha256_walk"),
               rewind::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", root.string()},
                               {"files", state.scan.entries.size()},
                               {"failures", state.scan.failures.size()}}));
    return std::move(state.scan);
}

std::optional<std::string> hashFile(const std::filesystem::path &path, std::string *error)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = file.errorString().toStdString();
        }
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    while (!file.atEnd()) {
        const QByteArray chunk = file.read(kHashChunkBytes);
        if (chunk.isEmpty() && file.error() != QFileDevice::NoError) {
            if (error) {
                *error = file.errorString().toStdString();
            }
            return std::nullopt;
        }
        hash.addData(chunk);
    }
    return hash.result().toHex().toStdString();
}

} // namespace rewind
