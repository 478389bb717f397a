#include <QtTest/QtTest>

#include <stdexcept>

#include "journal/change_journal.hpp"

class ChangeJournalTests : public QObject
{
    Q_OBJECT
private slots:
    void testRecordAppendsInOrder();
    void testQueryByCategoryAndPrefix();
    void testQueryAnyOfFilters();
    void testLatestPerKey();
    void testPersistHookRunsOnEveryRecord();
    void testFailingHookKeepsEntry();
};

namespace {

tunelog::SnapshotValue num(std::int64_t value)
{
    return tunelog::SnapshotValue::fromInt(value);
}

} // namespace

void ChangeJournalTests::testRecordAppendsInOrder()
{
    tunelog::ChangeJournal journal;
    QVERIFY(journal.empty());

    const auto first = journal.record("registry", "HKLM\\A\\x", tunelog::SnapshotValue::absent(),
                                      num(1), "first");
    journal.record("registry", "HKLM\\A\\y", num(0), num(2), "second");
    journal.record("bcdedit", "useplatformtick", tunelog::SnapshotValue::absent(),
                   tunelog::SnapshotValue::fromString("yes"), "third");

    QCOMPARE(journal.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(first.note), QStringLiteral("first"));

    const auto all = journal.query();
    QCOMPARE(all.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(all[0].note), QStringLiteral("first"));
    QCOMPARE(QString::fromStdString(all[1].note), QStringLiteral("second"));
    QCOMPARE(QString::fromStdString(all[2].note), QStringLiteral("third"));
    QVERIFY(all[0].timestamp <= all[2].timestamp);
}

void ChangeJournalTests::testQueryByCategoryAndPrefix()
{
    tunelog::ChangeJournal journal;
    journal.record("registry", "HKLM\\SYSTEM\\Power\\a", num(0), num(1), "");
    journal.record("registry", "HKLM\\SOFTWARE\\Vendor\\b", num(0), num(1), "");
    journal.record("service", "SysMain", tunelog::SnapshotValue::absent(),
                   tunelog::SnapshotValue::absent(), "");

    QCOMPARE(journal.query(tunelog::RollbackFilter{"registry", ""}).size(), static_cast<size_t>(2));
    const auto system = journal.query(tunelog::RollbackFilter{"registry", "HKLM\\SYSTEM"});
    QCOMPARE(system.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(system.front().key), QStringLiteral("HKLM\\SYSTEM\\Power\\a"));
    QCOMPARE(journal.query(tunelog::RollbackFilter{"powercfg", ""}).size(), static_cast<size_t>(0));
}

void ChangeJournalTests::testQueryAnyOfFilters()
{
    tunelog::ChangeJournal journal;
    journal.record("registry", "HKLM\\A\\x", num(0), num(1), "1");
    journal.record("service", "DoSvc", tunelog::SnapshotValue::absent(),
                   tunelog::SnapshotValue::absent(), "2");
    journal.record("registry", "HKLM\\B\\y", num(0), num(1), "3");

    // An entry matching two filters is returned once.
    const std::vector<tunelog::RollbackFilter> filters = {
        {"registry", "HKLM\\A"}, {"registry", ""}, {"service", "DoSvc"}};
    const auto selected = journal.query(filters);
    QCOMPARE(selected.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(selected[1].note), QStringLiteral("2"));

    QCOMPARE(journal.query(std::vector<tunelog::RollbackFilter>{}).size(), static_cast<size_t>(3));
}

void ChangeJournalTests::testLatestPerKey()
{
    tunelog::ChangeJournal journal;
    journal.record("powercfg", "activeScheme", tunelog::SnapshotValue::fromString("balanced"),
                   tunelog::SnapshotValue::fromString("high"), "first");
    journal.record("registry", "HKLM\\A\\x", num(0), num(1), "other");
    journal.record("powercfg", "activeScheme", tunelog::SnapshotValue::fromString("high"),
                   tunelog::SnapshotValue::fromString("ultimate"), "second");

    const auto latest = journal.latestPerKey(tunelog::RollbackFilter{"powercfg", ""});
    QCOMPARE(latest.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(latest.front().note), QStringLiteral("second"));

    const auto everyKey = journal.latestPerKey();
    QCOMPARE(everyKey.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(everyKey.front().note), QStringLiteral("other"));
}

void ChangeJournalTests::testPersistHookRunsOnEveryRecord()
{
    tunelog::ChangeJournal journal;
    std::vector<size_t> seenSizes;
    journal.setPersistHook([&](const tunelog::ChangeJournal &current) {
        seenSizes.push_back(current.size());
    });

    journal.record("registry", "HKLM\\A\\x", num(0), num(1), "");
    journal.record("registry", "HKLM\\A\\y", num(0), num(1), "");

    QCOMPARE(seenSizes.size(), static_cast<size_t>(2));
    QCOMPARE(seenSizes[0], static_cast<size_t>(1));
    QCOMPARE(seenSizes[1], static_cast<size_t>(2));
}

void ChangeJournalTests::testFailingHookKeepsEntry()
{
    tunelog::ChangeJournal journal;
    journal.setPersistHook([](const tunelog::ChangeJournal &) {
        throw std::runtime_error("disk full");
    });

    QVERIFY_EXCEPTION_THROWN(journal.record("registry", "HKLM\\A\\x", num(0), num(1), "kept"),
                             std::runtime_error);
    QCOMPARE(journal.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(journal.entries().back().note), QStringLiteral("kept"));
}

QTEST_MAIN(ChangeJournalTests)
#include "test_change_journal.moc"
