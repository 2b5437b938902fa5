#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/process_utils.hpp"
#include "history/manifest_builder.hpp"
#include "sandbox/sandbox_preparer.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace {

const char *kLoopScript =
    "from sitecustomize import active_guard\n"
    "\n"
    "guard = active_guard()\n"
    "\n"
    "def step():\n"
    "    pass\n"
    "\n"
    "step = guard.wrap_step(step)\n"
    "for _ in range(1000):\n"
    "    step()\n"
    "print('loop finished')\n";

const char *kSaveScript =
    "import os\n"
    "from sitecustomize import active_guard\n"
    "\n"
    "def save(path):\n"
    "    with open(path, 'w') as handle:\n"
    "        handle.write('weights')\n"
    "\n"
    "save = active_guard().wrap_save(save, 'save')\n"
    "save('model_a.pt')\n"
    "save('model_b.pt')\n"
    "print('saved' if os.path.exists('model_a.pt') else 'not saved')\n";

int countGuardLines(const std::string &text)
{
    int count = 0;
    std::size_t pos = 0;
    while ((pos = text.find("[rewind-guard]", pos)) != std::string::npos) {
        ++count;
        pos += 1;
    }
    return count;
}

} // namespace

class SandboxTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testPrepareCopiesRepository();
    void testOriginalUntouched();
    void testRunsAreNeverReused();
    void testSymlinkedFilesMaterialized();
    void testMissingScript();
    void testScriptOutsideRepository();
    void testGuardModuleSource();
    void testSandboxEnvironment();
    void testGuardStopsAtMaxSteps();
    void testGuardDisablesSaving();
    void testGuardInertOutsideSandbox();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::filesystem::path m_repo;

    void writeFile(const std::string &rel, const std::string &content);
    static std::string readFile(const std::filesystem::path &path);
    QString python() const;
};

void SandboxTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SandboxTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SandboxTests::init()
{
    m_repo = std::filesystem::path(m_tempDir.path().toStdString()) / "repo";
    std::error_code error;
    std::filesystem::remove_all(m_repo, error);
    std::filesystem::create_directories(m_repo);
    writeFile("train.py", kLoopScript);
    writeFile("pkg/model.py", "class Model:\n    pass\n");
}

void SandboxTests::writeFile(const std::string &rel, const std::string &content)
{
    const std::filesystem::path path = m_repo / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string SandboxTests::readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

QString SandboxTests::python() const
{
    return rewind::findExecutable(QStringLiteral("python3"));
}

void SandboxTests::testPrepareCopiesRepository()
{
    writeFile(".git/HEAD", "ref\n");
    writeFile("pkg/__pycache__/model.cpython-311.pyc", "bytes");
    writeFile(".rewind/history/old/meta.json", "{}");

    const auto run = rewind::prepareSandbox(m_repo, "train.py");

    QVERIFY(std::filesystem::is_regular_file(run.isolatedScript));
    QVERIFY(run.isolatedScript == run.isolatedRepo / "train.py");
    QVERIFY(std::filesystem::is_regular_file(run.isolatedRepo / "pkg/model.py"));
    QVERIFY(!std::filesystem::exists(run.isolatedRepo / ".git"));
    QVERIFY(!std::filesystem::exists(run.isolatedRepo / "pkg/__pycache__"));
    QVERIFY(!std::filesystem::exists(run.isolatedRepo / ".rewind"));

    QVERIFY(run.guardModulePath == run.isolatedRepo / rewind::kGuardModuleName);
    QCOMPARE(readFile(run.guardModulePath), rewind::guardModuleSource());

    const std::filesystem::path runsRoot = rewind::defaultRunsRoot(run.originalRepo);
    QVERIFY(run.runDir.parent_path() == std::filesystem::canonical(runsRoot));
}

void SandboxTests::testOriginalUntouched()
{
    const auto excludes = rewind::defaultConfig().manifestExcludes;
    const auto before = rewind::buildManifest(m_repo, excludes);

    const auto run = rewind::prepareSandbox(m_repo, m_repo / "train.py");
    std::ofstream(run.isolatedRepo / "train.py", std::ios::trunc) << "changed\n";

    const auto after = rewind::buildManifest(m_repo, excludes);
    QCOMPARE(after.entries.size(), before.entries.size());
    for (const auto &[rel, entry] : before.entries) {
        QCOMPARE(QString::fromStdString(after.entries.at(rel).sha256),
                 QString::fromStdString(entry.sha256));
    }
    QVERIFY(!std::filesystem::exists(m_repo / rewind::kGuardModuleName));
}

void SandboxTests::testRunsAreNeverReused()
{
    const std::filesystem::path runsRoot =
        std::filesystem::path(m_tempDir.path().toStdString()) / "runs";
    const auto first = rewind::prepareSandbox(m_repo, "train.py", runsRoot);
    const auto second = rewind::prepareSandbox(m_repo, "train.py", runsRoot);
    QVERIFY(first.runDir != second.runDir);
    QVERIFY(std::filesystem::is_directory(first.isolatedRepo));
    QVERIFY(std::filesystem::is_directory(second.isolatedRepo));
}

void SandboxTests::testSymlinkedFilesMaterialized()
{
    std::error_code error;
    std::filesystem::create_symlink(m_repo / "pkg/model.py", m_repo / "alias.py", error);
    if (error) {
        QSKIP("symlinks not supported here");
    }

    const auto run = rewind::prepareSandbox(m_repo, "train.py");
    const std::filesystem::path copied = run.isolatedRepo / "alias.py";
    QVERIFY(std::filesystem::is_regular_file(std::filesystem::symlink_status(copied)));
    QCOMPARE(readFile(copied), readFile(m_repo / "pkg/model.py"));
}

void SandboxTests::testMissingScript()
{
    QVERIFY_THROWS_EXCEPTION(rewind::SandboxError,
                             rewind::prepareSandbox(m_repo, "missing.py"));
    QVERIFY_THROWS_EXCEPTION(rewind::SandboxError,
                             rewind::prepareSandbox(m_repo / "nope", "train.py"));
}

void SandboxTests::testScriptOutsideRepository()
{
    const std::filesystem::path outside =
        std::filesystem::path(m_tempDir.path().toStdString()) / "outside.py";
    std::ofstream(outside) << "print('hi')\n";
    QVERIFY_THROWS_EXCEPTION(rewind::SandboxError, rewind::prepareSandbox(m_repo, outside));
}

void SandboxTests::testGuardModuleSource()
{
    const std::string source = rewind::guardModuleSource();
    QVERIFY(source.find("class RuntimeGuard") != std::string::npos);
    QVERIFY(source.find("REWIND_SAFE_PROFILE") != std::string::npos);
    QVERIFY(source.find("[rewind-guard]") != std::string::npos);
}

void SandboxTests::testSandboxEnvironment()
{
    rewind::IsolatedRun run;
    run.isolatedRepo = "/tmp/runs/x/repo";

    QProcessEnvironment base;
    base.insert(QStringLiteral("PYTHONPATH"), QStringLiteral("/opt/lib"));
    base.insert(QStringLiteral("REWIND_DISABLE_SAVING"), QStringLiteral("1"));

    rewind::SandboxRunOptions options;
    options.maxSteps = 7;
    const auto env = rewind::sandboxEnvironment(run, options, base);

    QCOMPARE(env.value(QStringLiteral("PYTHONPATH")), QStringLiteral("/tmp/runs/x/repo:/opt/lib"));
    QCOMPARE(env.value(QStringLiteral("REWIND_SAFE_PROFILE")), QStringLiteral("1"));
    QCOMPARE(env.value(QStringLiteral("REWIND_MAX_STEPS")), QStringLiteral("7"));
    QVERIFY(!env.contains(QStringLiteral("REWIND_DISABLE_SAVING")));

    options.disableSaving = true;
    const auto saving = rewind::sandboxEnvironment(run, options, QProcessEnvironment());
    QCOMPARE(saving.value(QStringLiteral("PYTHONPATH")), QStringLiteral("/tmp/runs/x/repo"));
    QCOMPARE(saving.value(QStringLiteral("REWIND_DISABLE_SAVING")), QStringLiteral("1"));
}

void SandboxTests::testGuardStopsAtMaxSteps()
{
    if (python().isEmpty()) {
        QSKIP("python3 not available");
    }

    const auto run = rewind::prepareSandbox(m_repo, "train.py");
    rewind::SandboxRunOptions options;
    options.python = python();
    options.maxSteps = 5;
    options.timeout = std::chrono::seconds(60);

    const auto result = rewind::runSandboxed(run, options);
    QVERIFY(!result.timedOut);
    QCOMPARE(result.exitCode, 0);

    const std::string log = readFile(result.logFile);
    QCOMPARE(countGuardLines(log), 1);
    QVERIFY(log.find("REWIND_MAX_STEPS=5") != std::string::npos);
    QVERIFY(log.find("loop finished") == std::string::npos);
}

void SandboxTests::testGuardDisablesSaving()
{
    if (python().isEmpty()) {
        QSKIP("python3 not available");
    }
    writeFile("save_model.py", kSaveScript);

    const auto run = rewind::prepareSandbox(m_repo, "save_model.py");
    rewind::SandboxRunOptions options;
    options.python = python();
    options.disableSaving = true;
    options.timeout = std::chrono::seconds(60);

    const auto result = rewind::runSandboxed(run, options);
    QCOMPARE(result.exitCode, 0);

    const std::string log = readFile(result.logFile);
    QCOMPARE(countGuardLines(log), 1);
    QVERIFY(log.find("not saved") != std::string::npos);
    QVERIFY(!std::filesystem::exists(run.isolatedRepo / "model_a.pt"));
}

void SandboxTests::testGuardInertOutsideSandbox()
{
    if (python().isEmpty()) {
        QSKIP("python3 not available");
    }
    const auto run = rewind::prepareSandbox(m_repo, "train.py");

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.remove(QStringLiteral("REWIND_SAFE_PROFILE"));
    env.insert(QStringLiteral("PYTHONPATH"), QString::fromStdString(run.isolatedRepo.string()));

    rewind::ProcessOptions options;
    options.program = python();
    options.arguments = QStringList{QString::fromStdString(run.isolatedScript.string())};
    options.workingDirectory = QString::fromStdString(run.isolatedRepo.string());
    options.environment = env;
    options.timeout = std::chrono::seconds(60);

    const auto outcome = rewind::runProcess(options);
    QVERIFY(outcome.started);
    QCOMPARE(outcome.exitCode, 0);
    QVERIFY(outcome.output.contains("loop finished"));
    QVERIFY(!outcome.output.contains("[rewind-guard]"));
}

QTEST_MAIN(SandboxTests)
#include "test_sandbox.moc"
