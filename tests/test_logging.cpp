#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testLogEventWrites();
    void testDebugNeedsTrace();
    void testTraceWrites();

private:
    QTemporaryDir m_tempDir;

    static QList<QByteArray> readLines(const QString &path);
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

QList<QByteArray> LoggingTests::readLines(const QString &path)
{
    QList<QByteArray> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    const QString logPath = m_tempDir.filePath(QStringLiteral("Logs/tunelog-test.log"));
    tunelog::logging::Logger logger(QStringLiteral("tunelog-test"), logPath);
    logger.setCorrelationId(QStringLiteral("run-1"));

    TLOG_INFO(logger,
              QStringLiteral("Test"),
              QStringLiteral("testLogEventWrites"),
              QStringLiteral("test_log"),
              QStringLiteral("unit_test"),
              QStringLiteral("direct_call"),
              (nlohmann::json{{"key", "value"}}));

    const auto lines = readLines(logPath);
    QCOMPARE(lines.size(), 1);

    const auto parsed = nlohmann::json::parse(lines.front().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("tunelog-test"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("run-1"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugNeedsTrace()
{
    const QString logPath = m_tempDir.filePath(QStringLiteral("Logs/quiet.log"));
    tunelog::logging::Logger logger(QStringLiteral("tunelog-test"), logPath, false);

    TLOG_DEBUG(logger,
               QStringLiteral("Test"),
               QStringLiteral("testDebugNeedsTrace"),
               QStringLiteral("debug_line"),
               QStringLiteral("unit_test"),
               QStringLiteral("direct_call"),
               nlohmann::json::object());
    TLOG_WARN(logger,
              QStringLiteral("Test"),
              QStringLiteral("testDebugNeedsTrace"),
              QStringLiteral("warn_line"),
              QStringLiteral("unit_test"),
              QStringLiteral("direct_call"),
              nlohmann::json::object());

    const auto lines = readLines(logPath);
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(nlohmann::json::parse(lines.front().toStdString()).value("what", "")),
             QStringLiteral("warn_line"));
    QVERIFY(!QFile::exists(logger.traceFilePath()));
}

void LoggingTests::testTraceWrites()
{
    const QString logPath = m_tempDir.filePath(QStringLiteral("Logs/traced.log"));
    tunelog::logging::Logger logger(QStringLiteral("tunelog-test"), logPath, true);
    QCOMPARE(logger.traceFilePath(), m_tempDir.filePath(QStringLiteral("Logs/traced-trace.log")));

    TLOG_DEBUG(logger,
               QStringLiteral("Test"),
               QStringLiteral("testTraceWrites"),
               QStringLiteral("test_trace"),
               QStringLiteral("unit_test"),
               QStringLiteral("direct_call"),
               nlohmann::json::object());

    QCOMPARE(readLines(logPath).size(), 1);
    QCOMPARE(readLines(logger.traceFilePath()).size(), 1);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
