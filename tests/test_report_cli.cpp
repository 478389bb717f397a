#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <sstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "journal/run_context.hpp"
#include "journal/run_index.hpp"
#include "report/ReportCli.hpp"

class ReportCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testJournalJson();
    void testJournalLatestMarkdown();
    void testRunsJson();
    void testVerify();
    void testUsageErrors();

private:
    QTemporaryDir m_tempDir;
    QString m_contextFile;

    int runCli(const QStringList &args, std::string &out);
};

void ReportCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());

    auto context = tunelog::RunContext::create("20260301-101500", m_tempDir.path());
    context.journal().record("registry", "HKLM\\SYSTEM\\Power\\HibernateEnabled",
                             tunelog::SnapshotValue::fromInt(1),
                             tunelog::SnapshotValue::fromInt(0), "Disable hibernation");
    context.journal().record("powercfg", "activeScheme",
                             tunelog::SnapshotValue::fromString("balanced"),
                             tunelog::SnapshotValue::fromString("high"), "first");
    context.journal().record("powercfg", "activeScheme",
                             tunelog::SnapshotValue::fromString("high"),
                             tunelog::SnapshotValue::fromString("ultimate"), "second");
    context.persist();
    m_contextFile = context.contextFile();
}

int ReportCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    tunelog::logging::Logger logger(QStringLiteral("tunelog-report"), QString());
    tunelog::ReportCli cli(logger);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ReportCliTests::testJournalJson()
{
    std::string output;
    const int code = runCli({"tunelog-report", "journal",
                             "--context", m_contextFile,
                             "--category", "powercfg",
                             "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(parsed.value("runId", "")), QStringLiteral("20260301-101500"));
    QVERIFY(parsed.value("integrityVerified", false));
    QCOMPARE(parsed.at("changes").size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(parsed.at("changes")[0].value("note", "")),
             QStringLiteral("first"));
}

void ReportCliTests::testJournalLatestMarkdown()
{
    std::string output;
    const int code = runCli({"tunelog-report", "journal",
                             "--context", m_contextFile,
                             "--latest"}, output);
    QCOMPARE(code, 0);

    const QString text = QString::fromStdString(output);
    QVERIFY(text.contains(QStringLiteral("# tunelog Change Journal")));
    QVERIFY(text.contains(QStringLiteral("Keys: 2")));
    QVERIFY(text.contains(QStringLiteral("high -> ultimate")));
    QVERIFY(!text.contains(QStringLiteral("balanced -> high")));
}

void ReportCliTests::testRunsJson()
{
    {
        tunelog::RunIndex index(tunelog::RunIndex::defaultPath(m_tempDir.path().toStdString()));
        tunelog::RunRecord record;
        record.runId = "20260301-101500";
        record.startedAt = std::chrono::system_clock::now();
        record.finishedAt = record.startedAt;
        record.status = "succeeded";
        record.contextFile = m_contextFile.toStdString();
        record.changeCount = 3;
        index.upsertRun(record);

        tunelog::PhaseResult phase;
        phase.name = "system-power";
        phase.state = tunelog::PhaseState::Succeeded;
        index.addPhaseResult(record.runId, 0, phase);
    }

    std::string output;
    const int code = runCli({"tunelog-report", "runs",
                             "--workspace", m_tempDir.path(),
                             "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.value("totalRuns", 0), 1);
    const auto &run = parsed.at("runs")[0];
    QCOMPARE(run.value("changeCount", 0), 3);
    QCOMPARE(run.at("phases").size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(run.at("phases")[0].value("state", "")),
             QStringLiteral("succeeded"));
}

void ReportCliTests::testVerify()
{
    std::string output;
    QCOMPARE(runCli({"tunelog-report", "verify", "--context", m_contextFile,
                     "--format", "json"}, output), 0);
    auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.value("usable", false));
    QVERIFY(parsed.value("integrityVerified", false));
    QCOMPARE(parsed.value("entries", 0), 3);

    const QString missing = QDir(m_tempDir.path()).filePath("Logs/context-missing.json");
    QCOMPARE(runCli({"tunelog-report", "verify", "--context", missing,
                     "--format", "json"}, output), 1);
    parsed = nlohmann::json::parse(output);
    QVERIFY(!parsed.value("usable", true));
    QCOMPARE(QString::fromStdString(parsed.value("reason", "")),
             QStringLiteral("context file not found"));
}

void ReportCliTests::testUsageErrors()
{
    std::string output;
    QCOMPARE(runCli({"tunelog-report"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage:")));

    QCOMPARE(runCli({"tunelog-report", "journal"}, output), 1);
    QCOMPARE(runCli({"tunelog-report", "journal", "--context", m_contextFile,
                     "--format", "xml"}, output), 1);
    QCOMPARE(runCli({"tunelog-report", "runs", "--workspace", m_tempDir.path(),
                     "--mode", "undo"}, output), 1);
}

QTEST_MAIN(ReportCliTests)
#include "test_report_cli.moc"
