#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <optional>

#include "common/models.hpp"
#include "journal/run_index.hpp"

class RunIndexTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testDefaultPath();
    void testUpsertAndGet();
    void testListRunsNewestFirst();
    void testPhaseResultsOrdered();

private:
    QTemporaryDir m_tempDir;

    void resetDb();
    std::string dbPath() const;
    static tunelog::RunRecord makeRun(const std::string &runId,
                                      tunelog::RunMode mode,
                                      std::chrono::system_clock::time_point startedAt);
};

void RunIndexTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

std::string RunIndexTests::dbPath() const
{
    return tunelog::RunIndex::defaultPath(m_tempDir.path().toStdString());
}

void RunIndexTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

tunelog::RunRecord RunIndexTests::makeRun(const std::string &runId,
                                          tunelog::RunMode mode,
                                          std::chrono::system_clock::time_point startedAt)
{
    tunelog::RunRecord record;
    record.runId = runId;
    record.mode = mode;
    record.startedAt = startedAt;
    record.finishedAt = startedAt + std::chrono::seconds(30);
    record.status = "succeeded";
    record.contextFile = "/ws/Logs/context-" + runId + ".json";
    record.logFile = "/ws/Logs/tunelog-" + runId + ".log";
    return record;
}

void RunIndexTests::testDefaultPath()
{
    const std::filesystem::path path(tunelog::RunIndex::defaultPath("/ws"));
    QCOMPARE(QString::fromStdString(path.filename().string()), QStringLiteral("runs.db"));
    QCOMPARE(QString::fromStdString(path.parent_path().filename().string()), QStringLiteral("Logs"));
}

void RunIndexTests::testUpsertAndGet()
{
    resetDb();
    const auto now = std::chrono::system_clock::now();

    {
        tunelog::RunIndex index(dbPath());
        auto record = makeRun("run-a", tunelog::RunMode::Apply, now);
        record.status = "running";
        index.upsertRun(record);

        record.status = "failed";
        record.changeCount = 7;
        index.upsertRun(record);
    }

    tunelog::RunIndex index(dbPath());
    const auto loaded = index.getRun("run-a");
    QVERIFY(loaded.has_value());
    QCOMPARE(QString::fromStdString(loaded->status), QStringLiteral("failed"));
    QCOMPARE(loaded->changeCount, 7);
    QCOMPARE(loaded->mode, tunelog::RunMode::Apply);
    QCOMPARE(QString::fromStdString(loaded->contextFile),
             QStringLiteral("/ws/Logs/context-run-a.json"));
    QVERIFY(loaded->rollbackTarget.empty());
    QCOMPARE(index.listRuns().size(), static_cast<size_t>(1));

    QVERIFY(!index.getRun("run-missing").has_value());
}

void RunIndexTests::testListRunsNewestFirst()
{
    resetDb();
    const auto base = std::chrono::system_clock::now() - std::chrono::hours(3);

    tunelog::RunIndex index(dbPath());
    index.upsertRun(makeRun("run-1", tunelog::RunMode::Apply, base));
    index.upsertRun(makeRun("run-2", tunelog::RunMode::Rollback, base + std::chrono::hours(1)));
    index.upsertRun(makeRun("run-3", tunelog::RunMode::Apply, base + std::chrono::hours(2)));

    const auto all = index.listRuns();
    QCOMPARE(all.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(all.front().runId), QStringLiteral("run-3"));
    QCOMPARE(QString::fromStdString(all.back().runId), QStringLiteral("run-1"));

    const auto applies = index.listRuns(tunelog::RunMode::Apply);
    QCOMPARE(applies.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(applies.front().runId), QStringLiteral("run-3"));

    const auto limited = index.listRuns(std::nullopt, 1);
    QCOMPARE(limited.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(limited.front().runId), QStringLiteral("run-3"));
}

void RunIndexTests::testPhaseResultsOrdered()
{
    resetDb();
    tunelog::RunIndex index(dbPath());
    index.upsertRun(makeRun("run-p", tunelog::RunMode::Apply, std::chrono::system_clock::now()));

    tunelog::PhaseResult backup;
    backup.name = "backup";
    backup.state = tunelog::PhaseState::Succeeded;
    backup.startedAt = std::chrono::system_clock::now();
    backup.duration = std::chrono::milliseconds(1200);

    tunelog::PhaseResult network;
    network.name = "network";
    network.state = tunelog::PhaseState::TimedOut;
    network.exitCode = 124;
    network.message = "timed out after 1000 ms";

    index.addPhaseResult("run-p", 1, network);
    index.addPhaseResult("run-p", 0, backup);

    const auto phases = index.phaseResults("run-p");
    QCOMPARE(phases.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(phases[0].name), QStringLiteral("backup"));
    QCOMPARE(static_cast<qint64>(phases[0].duration.count()), static_cast<qint64>(1200));
    QCOMPARE(phases[1].state, tunelog::PhaseState::TimedOut);
    QCOMPARE(phases[1].exitCode, 124);
    QCOMPARE(QString::fromStdString(phases[1].message), QStringLiteral("timed out after 1000 ms"));

    QVERIFY(index.phaseResults("run-other").empty());
}

QTEST_MAIN(RunIndexTests)
#include "test_run_index.moc"
