#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "common/config.hpp"
#include "history/manifest_builder.hpp"

class ManifestTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDeterministic();
    void testTopLevelExclusions();
    void testNestedNamesNotExcluded();
    void testSymlinksSkipped();
    void testUnreadableRecordedAsFailure();
    void testHashKnownValue();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::filesystem::path m_repo;

    void writeFile(const std::string &rel, const std::string &content);
};

void ManifestTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ManifestTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ManifestTests::init()
{
    m_repo = std::filesystem::path(m_tempDir.path().toStdString()) / "repo";
    std::error_code error;
    std::filesystem::remove_all(m_repo, error);
    std::filesystem::create_directories(m_repo);
}

void ManifestTests::writeFile(const std::string &rel, const std::string &content)
{
    const std::filesystem::path path = m_repo / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

void ManifestTests::testDeterministic()
{
    writeFile("train.py", "a=1\n");
    writeFile("pkg/utils.py", "def f():\n    return 1\n");
    writeFile("data/notes.md", "# notes\n");

    const auto excludes = rewind::defaultConfig().manifestExcludes;
    const auto first = rewind::buildManifest(m_repo, excludes);
    const auto second = rewind::buildManifest(m_repo, excludes);

    QCOMPARE(first.entries.size(), static_cast<std::size_t>(3));
    QVERIFY(first.failures.empty());
    QVERIFY(first.entries.count("pkg/utils.py") == 1);
    for (const auto &[rel, entry] : first.entries) {
        const auto it = second.entries.find(rel);
        QVERIFY(it != second.entries.end());
        QCOMPARE(QString::fromStdString(it->second.sha256),
                 QString::fromStdString(entry.sha256));
        QCOMPARE(it->second.size, entry.size);
        QCOMPARE(QString::fromStdString(entry.relPath), QString::fromStdString(rel));
    }
    QCOMPARE(first.entries.at("train.py").size, static_cast<std::uintmax_t>(4));
}

void ManifestTests::testTopLevelExclusions()
{
    writeFile("train.py", "a=1\n");
    writeFile(".git/HEAD", "ref: refs/heads/main\n");
    writeFile(".rewind/history/x/meta.json", "{}");
    writeFile("__pycache__/train.cpython-311.pyc", "bytes");
    writeFile("build/out.txt", "artifact");

    const auto scan = rewind::buildManifest(m_repo, rewind::defaultConfig().manifestExcludes);
    QCOMPARE(scan.entries.size(), static_cast<std::size_t>(1));
    QVERIFY(scan.entries.count("train.py") == 1);
}

void ManifestTests::testNestedNamesNotExcluded()
{
    writeFile("src/build/gen.py", "x=1\n");

    const auto scan = rewind::buildManifest(m_repo, rewind::defaultConfig().manifestExcludes);
    QVERIFY(scan.entries.count("src/build/gen.py") == 1);
}

void ManifestTests::testSymlinksSkipped()
{
    writeFile("real.py", "x=1\n");
    std::error_code error;
    std::filesystem::create_symlink(m_repo / "real.py", m_repo / "link.py", error);
    if (error) {
        QSKIP("symlinks not supported here");
    }

    const auto scan = rewind::buildManifest(m_repo, {});
    QVERIFY(scan.entries.count("real.py") == 1);
    QVERIFY(scan.entries.count("link.py") == 0);
}

void ManifestTests::testUnreadableRecordedAsFailure()
{
    if (geteuid() == 0) {
        QSKIP("permission bits are not enforced for root");
    }
    writeFile("ok.py", "x=1\n");
    writeFile("secret.py", "x=2\n");
    std::filesystem::permissions(m_repo / "secret.py", std::filesystem::perms::none);

    const auto scan = rewind::buildManifest(m_repo, {});
    std::filesystem::permissions(m_repo / "secret.py", std::filesystem::perms::owner_all);

    QVERIFY(scan.entries.count("ok.py") == 1);
    QVERIFY(scan.entries.count("secret.py") == 0);
    QCOMPARE(scan.failures.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(scan.failures.front().relPath), QStringLiteral("secret.py"));
}

void ManifestTests::testHashKnownValue()
{
    writeFile("abc.txt", "abc");
    const auto digest = rewind::hashFile(m_repo / "abc.txt");
    QVERIFY(digest.has_value());
    QCOMPARE(QString::fromStdString(*digest),
             QStringLiteral("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    std::string error;
    QVERIFY(!rewind::hashFile(m_repo / "missing.txt", &error).has_value());
    QVERIFY(!error.empty());
}

QTEST_MAIN(ManifestTests)
#include "test_manifest.moc"
