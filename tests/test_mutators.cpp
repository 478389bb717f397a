#include <QtTest/QtTest>

#include <stdexcept>

#include "common/logging.hpp"
#include "fake_backends.hpp"
#include "journal/change_journal.hpp"
#include "mutators/key_value_mutators.hpp"

using tunelog::testing::FakeRegistry;
using tunelog::testing::FakeServices;
using tunelog::testing::FakeSettings;

class MutatorsTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testRegistryJournalsBeforeAndAfter();
    void testRegistryRejectsWrongValueType();
    void testRegistryRejectsBackslashInName();
    void testRegistryRecordsPreviousKind();
    void testRegistryEnsureKeyFailure();
    void testRegistryBeforeReadFailure();
    void testRegistryWriteFailureRecordsNothing();
    void testRegistryReadBackFailureIsJournaled();
    void testServiceSecondRequestIsNoop();
    void testServicePartialFailureIsJournaled();
    void testServiceUnknownName();
    void testPowerSchemeAndBootOption();
    void testJournalPersistFailure();

private:
    tunelog::logging::Logger m_logger{QStringLiteral("tunelog-test"), QString()};
    FakeRegistry m_registry;
    FakeServices m_services;
    FakeSettings m_powercfg;
    FakeSettings m_bcdedit;
    tunelog::ChangeJournal m_journal;

    tunelog::KeyValueMutators mutators();
};

namespace {

const std::string kPath = "HKLM\\SYSTEM\\CurrentControlSet\\Control\\PriorityControl";

} // namespace

void MutatorsTests::init()
{
    m_registry = FakeRegistry();
    m_services = FakeServices();
    m_powercfg = FakeSettings();
    m_bcdedit = FakeSettings();
    m_journal = tunelog::ChangeJournal();
}

tunelog::KeyValueMutators MutatorsTests::mutators()
{
    return tunelog::KeyValueMutators(m_journal, m_registry, m_services, m_powercfg, m_bcdedit,
                                     m_logger);
}

void MutatorsTests::testRegistryJournalsBeforeAndAfter()
{
    m_registry.values[kPath + "\\Win32PrioritySeparation"] = tunelog::SnapshotValue::fromInt(2);
    auto m = mutators();

    const auto first = m.setRegistryValue(kPath, "Win32PrioritySeparation",
                                          tunelog::SnapshotValue::fromInt(38),
                                          tunelog::RegistryValueKind::DWord, "foreground boost");
    QVERIFY(first.ok());
    QVERIFY(first.value().has_value());
    QVERIFY(first.value()->before == tunelog::SnapshotValue::fromInt(2));
    QVERIFY(first.value()->after == tunelog::SnapshotValue::fromInt(38));

    const auto created = m.setRegistryValue(kPath, "NewValue", tunelog::SnapshotValue::fromString("x"),
                                            tunelog::RegistryValueKind::String, "");
    QVERIFY(created.ok());
    QVERIFY(created.value()->before.isAbsent());

    QCOMPARE(m_journal.size(), static_cast<size_t>(2));
    const auto &entry = m_journal.entries().front();
    QCOMPARE(QString::fromStdString(entry.category), QStringLiteral("registry"));
    QCOMPARE(QString::fromStdString(entry.key),
             QString::fromStdString(kPath + "\\Win32PrioritySeparation"));
    QCOMPARE(QString::fromStdString(entry.note), QStringLiteral("foreground boost"));
}

void MutatorsTests::testRegistryRejectsWrongValueType()
{
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromString("abc"),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::MutatorFailure);
    QVERIFY(m_journal.empty());
    QVERIFY(m_registry.values.empty());
}

void MutatorsTests::testRegistryRejectsBackslashInName()
{
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Sub\\Value", tunelog::SnapshotValue::fromInt(1),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::MutatorFailure);
    QVERIFY(m_journal.empty());
    QVERIFY(m_registry.values.empty());
}

void MutatorsTests::testRegistryRecordsPreviousKind()
{
    m_registry.values[kPath + "\\Path"] = tunelog::SnapshotValue::fromString("%SystemRoot%");
    m_registry.kinds[kPath + "\\Path"] = tunelog::RegistryValueKind::ExpandString;
    auto m = mutators();

    QVERIFY(m.setRegistryValue(kPath, "Path", tunelog::SnapshotValue::fromString("C:\\Tools"),
                               tunelog::RegistryValueKind::String, "").ok());
    QVERIFY(m.setRegistryValue(kPath, "Fresh", tunelog::SnapshotValue::fromInt(1),
                               tunelog::RegistryValueKind::DWord, "").ok());

    const auto &entries = m_journal.entries();
    QCOMPARE(entries.size(), static_cast<size_t>(2));
    QVERIFY(entries[0].beforeKind == tunelog::RegistryValueKind::ExpandString);
    QVERIFY(!entries[1].beforeKind.has_value());
}

void MutatorsTests::testRegistryEnsureKeyFailure()
{
    m_registry.failEnsure = true;
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromInt(1),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateWriteFailure);
    QVERIFY(m_journal.empty());
}

void MutatorsTests::testRegistryBeforeReadFailure()
{
    m_registry.failReadsFrom = 1;
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromInt(1),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateReadFailure);
    QVERIFY(!result.error().recorded.has_value());
    // Never applied blind.
    QVERIFY(m_registry.values.empty());
    QVERIFY(m_journal.empty());
}

void MutatorsTests::testRegistryWriteFailureRecordsNothing()
{
    m_registry.deniedKeys.insert(kPath + "\\Value");
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromInt(1),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateWriteFailure);
    QVERIFY(QString::fromStdString(result.error().message).contains(QStringLiteral("access denied")));
    QVERIFY(m_journal.empty());
}

void MutatorsTests::testRegistryReadBackFailureIsJournaled()
{
    m_registry.failReadsFrom = 2;
    auto m = mutators();
    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromInt(7),
                                           tunelog::RegistryValueKind::DWord, "tweak");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateReadFailure);
    QVERIFY(result.error().recorded.has_value());

    QCOMPARE(m_journal.size(), static_cast<size_t>(1));
    const auto &entry = m_journal.entries().front();
    QVERIFY(entry.before.isAbsent());
    QVERIFY(entry.after == tunelog::SnapshotValue::fromInt(7));
    QCOMPARE(QString::fromStdString(entry.note), QStringLiteral("tweak (unverified)"));
}

void MutatorsTests::testServiceSecondRequestIsNoop()
{
    m_services.states["X"] = {"Running", "Automatic"};
    auto m = mutators();

    const auto first = m.setService("X", tunelog::StartupType::Disabled,
                                    tunelog::ServiceStatus::Stopped, "stop X");
    QVERIFY(first.ok());
    QVERIFY(first.value().has_value());
    QCOMPARE(QString::fromStdString(first.value()->before.asService().status),
             QStringLiteral("Running"));
    QCOMPARE(QString::fromStdString(first.value()->after.asService().startupType),
             QStringLiteral("Disabled"));

    const auto second = m.setService("X", tunelog::StartupType::Disabled,
                                     tunelog::ServiceStatus::Stopped, "stop X");
    QVERIFY(second.ok());
    QVERIFY(!second.value().has_value());

    QCOMPARE(m_journal.size(), static_cast<size_t>(1));
    QCOMPARE(m_services.startupChanges, 1);
    QCOMPARE(m_services.runStateChanges, 1);
}

void MutatorsTests::testServicePartialFailureIsJournaled()
{
    m_services.states["DoSvc"] = {"Running", "Automatic"};
    m_services.failRunStateChanges = true;
    auto m = mutators();

    const auto result = m.setService("DoSvc", tunelog::StartupType::Manual,
                                     tunelog::ServiceStatus::Stopped, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateWriteFailure);
    QVERIFY(result.error().recorded.has_value());

    // The startup type change went through and must stay reversible.
    QCOMPARE(m_journal.size(), static_cast<size_t>(1));
    const auto &after = m_journal.entries().front().after.asService();
    QCOMPARE(QString::fromStdString(after.startupType), QStringLiteral("Manual"));
    QCOMPARE(QString::fromStdString(after.status), QStringLiteral("Running"));
}

void MutatorsTests::testServiceUnknownName()
{
    auto m = mutators();
    const auto result = m.setService("Missing", tunelog::StartupType::Manual, std::nullopt, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::StateReadFailure);

    const auto badState = m.setService("Missing", std::nullopt, tunelog::ServiceStatus::Paused, "");
    QVERIFY(!badState.ok());
    QCOMPARE(badState.error().kind, tunelog::ErrorKind::MutatorFailure);
    QVERIFY(m_journal.empty());
}

void MutatorsTests::testPowerSchemeAndBootOption()
{
    m_powercfg.values["activeScheme"] = "381b4222-f694-41f0-9685-ff5bb260df2e";
    auto m = mutators();

    const auto scheme = m.setActivePowerScheme("8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c", "high");
    QVERIFY(scheme.ok());
    QCOMPARE(QString::fromStdString(scheme.value()->category), QStringLiteral("powercfg"));
    QCOMPARE(QString::fromStdString(scheme.value()->key), QStringLiteral("activeScheme"));
    QVERIFY(scheme.value()->before
            == tunelog::SnapshotValue::fromString("381b4222-f694-41f0-9685-ff5bb260df2e"));

    const auto boot = m.setBootOption("disabledynamictick", "yes", "");
    QVERIFY(boot.ok());
    QCOMPARE(QString::fromStdString(boot.value()->category), QStringLiteral("bcdedit"));
    QVERIFY(boot.value()->before.isAbsent());
    QVERIFY(boot.value()->after == tunelog::SnapshotValue::fromString("yes"));

    m_bcdedit.failWrites = true;
    const auto failed = m.setBootOption("useplatformtick", "yes", "");
    QVERIFY(!failed.ok());
    QCOMPARE(failed.error().kind, tunelog::ErrorKind::StateWriteFailure);
    QCOMPARE(m_journal.size(), static_cast<size_t>(2));
}

void MutatorsTests::testJournalPersistFailure()
{
    m_journal.setPersistHook([](const tunelog::ChangeJournal &) {
        throw std::runtime_error("disk full");
    });
    auto m = mutators();

    const auto result = m.setRegistryValue(kPath, "Value", tunelog::SnapshotValue::fromInt(1),
                                           tunelog::RegistryValueKind::DWord, "");
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, tunelog::ErrorKind::JournalWriteFailure);
    QVERIFY(result.error().recorded.has_value());
    QCOMPARE(m_journal.size(), static_cast<size_t>(1));
}

QTEST_MAIN(MutatorsTests)
#include "test_mutators.moc"
