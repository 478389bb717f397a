#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/json_utils.hpp"
#include "platform/simulated_backends.hpp"

class SimulatedBackendsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testRegistryValues();
    void testRegistryRemoveAbsentIsNoop();
    void testServiceDefaultsAndTransitions();
    void testSettingCategoriesAreSeparate();
    void testStateSurvivesReopen();

private:
    QTemporaryDir m_tempDir;

    QString statePath(const QString &name) const;
};

void SimulatedBackendsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

QString SimulatedBackendsTests::statePath(const QString &name) const
{
    return m_tempDir.filePath(name + QStringLiteral("/state.ini"));
}

void SimulatedBackendsTests::testRegistryValues()
{
    tunelog::IniRegistryStore registry(statePath("registry"));
    const std::string path = "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Multimedia\\SystemProfile";

    QVERIFY(registry.read(path, "SystemResponsiveness").isAbsent());

    registry.ensureKey(path);
    registry.write(path, "SystemResponsiveness", tunelog::SnapshotValue::fromInt(10),
                   tunelog::RegistryValueKind::DWord);
    registry.write(path, "NetworkThrottlingIndex", tunelog::SnapshotValue::fromInt(4294967295LL),
                   tunelog::RegistryValueKind::DWord);
    registry.write(path + "\\Tasks\\Games", "Scheduling Category",
                   tunelog::SnapshotValue::fromString("High"), tunelog::RegistryValueKind::String);

    QVERIFY(registry.read(path, "SystemResponsiveness") == tunelog::SnapshotValue::fromInt(10));
    QVERIFY(registry.read(path, "NetworkThrottlingIndex")
            == tunelog::SnapshotValue::fromInt(4294967295LL));
    QVERIFY(registry.read(path + "\\Tasks\\Games", "Scheduling Category")
            == tunelog::SnapshotValue::fromString("High"));

    registry.remove(path, "SystemResponsiveness");
    QVERIFY(registry.read(path, "SystemResponsiveness").isAbsent());
    QVERIFY(!registry.read(path, "NetworkThrottlingIndex").isAbsent());
}

void SimulatedBackendsTests::testRegistryRemoveAbsentIsNoop()
{
    tunelog::IniRegistryStore registry(statePath("remove"));
    registry.remove("HKLM\\SYSTEM\\Nothing", "Here");
    registry.remove("HKLM\\SYSTEM\\Nothing", "Here");
    QVERIFY(registry.read("HKLM\\SYSTEM\\Nothing", "Here").isAbsent());
}

void SimulatedBackendsTests::testServiceDefaultsAndTransitions()
{
    tunelog::IniServiceManager services(statePath("services"));

    auto state = services.query("SysMain");
    QCOMPARE(QString::fromStdString(state.status), QStringLiteral("Stopped"));
    QCOMPARE(QString::fromStdString(state.startupType), QStringLiteral("Manual"));

    services.setStartupType("SysMain", tunelog::StartupType::Automatic);
    services.start("SysMain");
    services.start("SysMain");
    state = services.query("SysMain");
    QCOMPARE(QString::fromStdString(state.status), QStringLiteral("Running"));
    QCOMPARE(QString::fromStdString(state.startupType), QStringLiteral("Automatic"));

    services.stop("SysMain");
    QCOMPARE(QString::fromStdString(services.query("SysMain").status), QStringLiteral("Stopped"));
}

void SimulatedBackendsTests::testSettingCategoriesAreSeparate()
{
    tunelog::IniSettingStore powercfg(statePath("settings"), tunelog::category::PowerCfg);
    tunelog::IniSettingStore bcdedit(statePath("settings"), tunelog::category::BcdEdit);

    powercfg.write("activeScheme", "8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c");
    bcdedit.write("useplatformtick", "yes");

    QVERIFY(powercfg.read("activeScheme")
            == tunelog::SnapshotValue::fromString("8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c"));
    QVERIFY(bcdedit.read("activeScheme").isAbsent());
    QVERIFY(powercfg.read("useplatformtick").isAbsent());

    bcdedit.remove("useplatformtick");
    bcdedit.remove("useplatformtick");
    QVERIFY(bcdedit.read("useplatformtick").isAbsent());
}

void SimulatedBackendsTests::testStateSurvivesReopen()
{
    {
        tunelog::IniRegistryStore registry(statePath("reopen"));
        registry.write("HKLM\\SYSTEM\\Power", "HibernateEnabled", tunelog::SnapshotValue::fromInt(0),
                       tunelog::RegistryValueKind::DWord);
    }
    tunelog::IniRegistryStore reopened(statePath("reopen"));
    QVERIFY(reopened.read("HKLM\\SYSTEM\\Power", "HibernateEnabled")
            == tunelog::SnapshotValue::fromInt(0));
}

QTEST_MAIN(SimulatedBackendsTests)
#include "test_simulated_backends.moc"
