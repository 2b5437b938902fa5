#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "history/history_store.hpp"
#include "history/undo_engine.hpp"

class UndoTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testRestoresModifiedFile();
    void testDivergenceBlocks();
    void testForceOverridesDivergence();
    void testRemovesAddedFiles();
    void testRestoresDeletedFile();
    void testReappearedDeletedFileRestored();
    void testUnreadableLiveFileNotDivergent();
    void testRemoveFailureReportedAsGap();
    void testBackupGapsCounted();
    void testUndoLatest();
    void testMissingHistory();
    void testUnfinalizedEntryIsIncomplete();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::filesystem::path m_repo;

    void writeFile(const std::string &rel, const std::string &content);
    std::string readFile(const std::string &rel) const;
    rewind::HistoryEntry mutate(rewind::HistoryStore &store,
                                const std::string &rel,
                                const std::string &content);
};

void UndoTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("REWIND_MAX_BACKUP_BYTES");
}

void UndoTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void UndoTests::init()
{
    m_repo = std::filesystem::path(m_tempDir.path().toStdString()) / "repo";
    std::error_code error;
    std::filesystem::remove_all(m_repo, error);
    std::filesystem::create_directories(m_repo);
    writeFile("train.py", "a=1\n");
    writeFile("utils.py", "def helper():\n    return 42\n");
}

void UndoTests::writeFile(const std::string &rel, const std::string &content)
{
    const std::filesystem::path path = m_repo / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string UndoTests::readFile(const std::string &rel) const
{
    std::ifstream in(m_repo / rel, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

rewind::HistoryEntry UndoTests::mutate(rewind::HistoryStore &store,
                                       const std::string &rel,
                                       const std::string &content)
{
    const auto entry = store.createEntry("edit " + rel);
    writeFile(rel, content);
    store.finalizeEntry(entry);
    return entry;
}

void UndoTests::testRestoresModifiedFile()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = mutate(store, "train.py", "a=2\n");

    const auto summary = rewind::undo(m_repo, entry.runId, false);
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=1\n"));
    QVERIFY(summary.outcome == rewind::UndoOutcome::Restored);
    QCOMPARE(summary.restored, std::vector<std::string>{"train.py"});
    QVERIFY(summary.removed.empty());
    QVERIFY(summary.skippedNoBackup.empty());

    QVERIFY(std::filesystem::is_regular_file(entry.root / "undo.json"));
    QVERIFY(!std::filesystem::exists(entry.root / "staging"));
}

void UndoTests::testDivergenceBlocks()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = mutate(store, "train.py", "a=2\n");
    writeFile("train.py", "a=3\n");

    rewind::UndoEngine engine(store);
    bool thrown = false;
    try {
        engine.undo(entry.runId, false);
    } catch (const rewind::DivergenceError &error) {
        thrown = true;
        QCOMPARE(error.divergedPaths(), std::vector<std::string>{"train.py"});
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("train.py")));
        QVERIFY(error.outcome() == rewind::UndoOutcome::DivergenceBlocked);
    }
    QVERIFY(thrown);
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=3\n"));
    QVERIFY(!std::filesystem::exists(entry.root / "undo.json"));
}

void UndoTests::testForceOverridesDivergence()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = mutate(store, "train.py", "a=2\n");
    writeFile("train.py", "a=3\n");

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, true);
    QVERIFY(summary.outcome == rewind::UndoOutcome::Restored);
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=1\n"));
}

void UndoTests::testRemovesAddedFiles()
{
    const std::string utilsBefore = readFile("utils.py");

    rewind::HistoryStore store(m_repo);
    const auto entry = store.createEntry("add files");
    writeFile("generated.py", "x=1\n");
    writeFile("pkg/extra.txt", "extra\n");
    writeFile("train.py", "a=2\n");
    store.finalizeEntry(entry);

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    QVERIFY(!std::filesystem::exists(m_repo / "generated.py"));
    QVERIFY(!std::filesystem::exists(m_repo / "pkg/extra.txt"));
    QCOMPARE(summary.removed.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=1\n"));
    QCOMPARE(readFile("utils.py"), utilsBefore);
}

void UndoTests::testRestoresDeletedFile()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = store.createEntry("delete utils");
    std::filesystem::remove(m_repo / "utils.py");
    store.finalizeEntry(entry);

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    QCOMPARE(summary.restored, std::vector<std::string>{"utils.py"});
    QCOMPARE(QString::fromStdString(readFile("utils.py")),
             QStringLiteral("def helper():\n    return 42\n"));
}

void UndoTests::testReappearedDeletedFileRestored()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = store.createEntry("delete utils");
    std::filesystem::remove(m_repo / "utils.py");
    store.finalizeEntry(entry);
    writeFile("utils.py", "rewritten by hand\n");

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    QVERIFY(summary.outcome == rewind::UndoOutcome::Restored);
    QCOMPARE(summary.restored, std::vector<std::string>{"utils.py"});
    QCOMPARE(QString::fromStdString(readFile("utils.py")),
             QStringLiteral("def helper():\n    return 42\n"));
}

void UndoTests::testUnreadableLiveFileNotDivergent()
{
    if (geteuid() == 0) {
        QSKIP("permission bits are not enforced for root");
    }
    rewind::HistoryStore store(m_repo);
    const auto entry = mutate(store, "train.py", "a=2\n");
    writeFile("train.py", "a=3\n");
    std::filesystem::permissions(m_repo / "train.py", std::filesystem::perms::owner_write);

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    std::filesystem::permissions(m_repo / "train.py",
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    QCOMPARE(summary.restored, std::vector<std::string>{"train.py"});
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=1\n"));
}

void UndoTests::testRemoveFailureReportedAsGap()
{
    if (geteuid() == 0) {
        QSKIP("permission bits are not enforced for root");
    }
    rewind::HistoryStore store(m_repo);
    const auto entry = store.createEntry("add locked file");
    writeFile("locked/new.py", "x=1\n");
    writeFile("train.py", "a=2\n");
    store.finalizeEntry(entry);

    const std::filesystem::path locked = m_repo / "locked";
    std::filesystem::permissions(locked,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    QVERIFY(summary.outcome == rewind::UndoOutcome::RestoredWithGaps);
    QCOMPARE(summary.removeFailed, std::vector<std::string>{"locked/new.py"});
    QVERIFY(summary.removed.empty());
    QVERIFY(std::filesystem::exists(m_repo / "locked/new.py"));
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=1\n"));

    const auto record = rewind::readJsonFile(entry.root / "undo.json");
    QVERIFY(record.has_value());
    QCOMPARE(record->at("remove_failed").size(), static_cast<std::size_t>(1));
}

void UndoTests::testBackupGapsCounted()
{
    writeFile("big.txt", std::string(64, 'a'));
    writeFile("blob.json", std::string("{\0}", 3));
    writeFile("huge.md", std::string(128, 'c'));
    writeFile("cache.cfg", std::string("k\0v", 3));

    rewind::RewindConfig config = rewind::defaultConfig();
    config.maxBackupBytes = 32;
    rewind::HistoryStore store(m_repo, config);
    const auto entry = store.createEntry("edit all");
    writeFile("train.py", "a=2\n");
    writeFile("big.txt", std::string(64, 'b'));
    writeFile("blob.json", std::string("[\0]", 3));
    std::filesystem::remove(m_repo / "huge.md");
    std::filesystem::remove(m_repo / "cache.cfg");
    const auto changes = store.finalizeEntry(entry);
    QCOMPARE(changes.deleted, (std::vector<std::string>{"cache.cfg", "huge.md"}));

    rewind::UndoEngine engine(store);
    const auto summary = engine.undo(entry.runId, false);
    QVERIFY(summary.outcome == rewind::UndoOutcome::RestoredWithGaps);
    QCOMPARE(summary.restored, std::vector<std::string>{"train.py"});
    QCOMPARE(summary.skippedNoBackup,
             (std::vector<std::string>{"big.txt", "blob.json", "cache.cfg", "huge.md"}));
    QVERIFY(!std::filesystem::exists(m_repo / "huge.md"));
    QVERIFY(!std::filesystem::exists(m_repo / "cache.cfg"));
    QCOMPARE(QString::fromStdString(readFile("big.txt")), QString(64, QLatin1Char('b')));

    const auto record = rewind::readJsonFile(entry.root / "undo.json");
    QVERIFY(record.has_value());
    QCOMPARE(QString::fromStdString(record->value("outcome", "")),
             QStringLiteral("restored_with_gaps"));
}

void UndoTests::testUndoLatest()
{
    rewind::HistoryStore store(m_repo);
    mutate(store, "train.py", "a=2\n");
    mutate(store, "utils.py", "changed\n");

    const auto summary = rewind::undoLatest(m_repo, false);
    QCOMPARE(summary.restored, std::vector<std::string>{"utils.py"});
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=2\n"));
}

void UndoTests::testMissingHistory()
{
    rewind::HistoryStore store(m_repo);
    rewind::UndoEngine engine(store);
    QVERIFY_THROWS_EXCEPTION(rewind::MissingHistoryError, engine.undoLatest(false));
    QVERIFY_THROWS_EXCEPTION(rewind::MissingHistoryError, engine.undo("19990101-000000-000-00", false));
    QVERIFY_THROWS_EXCEPTION(rewind::MissingHistoryError, engine.undo("../outside", false));
}

void UndoTests::testUnfinalizedEntryIsIncomplete()
{
    rewind::HistoryStore store(m_repo);
    const auto entry = store.createEntry("crashed before finalize");
    writeFile("train.py", "a=2\n");

    rewind::UndoEngine engine(store);
    QVERIFY_THROWS_EXCEPTION(rewind::MissingHistoryError, engine.undo(entry.runId, false));
    QCOMPARE(QString::fromStdString(readFile("train.py")), QStringLiteral("a=2\n"));
}

QTEST_MAIN(UndoTests)
#include "test_undo.moc"
