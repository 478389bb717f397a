#include <QtTest/QtTest>

#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "unit/phase_profile.hpp"

class PhaseProfileTests : public QObject
{
    Q_OBJECT
private slots:
    void testParsesAllActionTypes();
    void testRejectsMalformedActions();
    void testRejectsMalformedActions_data();
    void testDerivedRollbackFilters();
    void testExplicitRollbackFilters();
    void testLoadReportsBadFiles();
    void testShippedProfilesParse();
};

void PhaseProfileTests::testParsesAllActionTypes()
{
    const auto json = nlohmann::json::parse(R"({
        "phase": "mixed",
        "description": "one of each",
        "actions": [
            {"type": "registry", "path": "HKLM\\SOFTWARE\\T", "name": "Size", "value": 20},
            {"type": "registry", "path": "HKLM\\SOFTWARE\\T", "name": "Cat", "kind": "string",
             "value": "High", "onError": "continue"},
            {"type": "service", "name": "SysMain", "startupType": "Disabled", "runState": "Stopped"},
            {"type": "powercfg", "scheme": "8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c"},
            {"type": "bcdedit", "element": "disabledynamictick", "value": "yes",
             "optIn": "EnableBcdTweaks"}
        ]
    })");

    const auto profile = tunelog::parsePhaseProfile(json);
    QCOMPARE(QString::fromStdString(profile.phase), QStringLiteral("mixed"));
    QCOMPARE(profile.actions.size(), static_cast<size_t>(5));

    const auto &dword = profile.actions[0];
    QCOMPARE(dword.kind, tunelog::RegistryValueKind::DWord);
    QVERIFY(dword.value == tunelog::SnapshotValue::fromInt(20));
    QVERIFY(!dword.continueOnError);
    QCOMPARE(QString::fromStdString(dword.journalKey()), QStringLiteral("HKLM\\SOFTWARE\\T\\Size"));

    QCOMPARE(profile.actions[1].kind, tunelog::RegistryValueKind::String);
    QVERIFY(profile.actions[1].continueOnError);

    const auto &service = profile.actions[2];
    QCOMPARE(service.startupType.value(), tunelog::StartupType::Disabled);
    QCOMPARE(service.runState.value(), tunelog::ServiceStatus::Stopped);
    QCOMPARE(QString::fromStdString(service.journalCategory()), QStringLiteral("service"));

    QCOMPARE(QString::fromStdString(profile.actions[3].journalKey()), QStringLiteral("activeScheme"));
    QCOMPARE(QString::fromStdString(profile.actions[4].optIn), QStringLiteral("EnableBcdTweaks"));
    QCOMPARE(QString::fromStdString(profile.actions[4].journalKey()),
             QStringLiteral("disabledynamictick"));
}

void PhaseProfileTests::testRejectsMalformedActions_data()
{
    QTest::addColumn<QString>("profile");

    QTest::newRow("not an object") << QStringLiteral("[]");
    QTest::newRow("no phase") << QStringLiteral(R"({"actions": []})");
    QTest::newRow("actions not array") << QStringLiteral(R"({"phase": "p", "actions": {}})");
    QTest::newRow("unknown type")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "firewall"}]})");
    QTest::newRow("registry without value")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "registry", "path": "HKLM\\X", "name": "N"}]})");
    QTest::newRow("dword with text")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "registry", "path": "HKLM\\X", "name": "N", "value": "x"}]})");
    QTest::newRow("backslash in value name")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "registry", "path": "HKLM\\X", "name": "A\\B", "value": 1}]})");
    QTest::newRow("boolean value")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "registry", "path": "HKLM\\X", "name": "N", "value": true}]})");
    QTest::newRow("service no change")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "service", "name": "S"}]})");
    QTest::newRow("service paused")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "service", "name": "S", "runState": "Paused"}]})");
    QTest::newRow("bad onError")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "powercfg", "scheme": "g", "onError": "retry"}]})");
    QTest::newRow("bcdedit without element")
        << QStringLiteral(R"({"phase": "p", "actions": [{"type": "bcdedit", "value": "yes"}]})");
}

void PhaseProfileTests::testRejectsMalformedActions()
{
    QFETCH(QString, profile);
    const auto json = nlohmann::json::parse(profile.toStdString());
    QVERIFY_EXCEPTION_THROWN(tunelog::parsePhaseProfile(json), std::exception);
}

void PhaseProfileTests::testDerivedRollbackFilters()
{
    const auto json = nlohmann::json::parse(R"({
        "phase": "p",
        "actions": [
            {"type": "bcdedit", "element": "useplatformtick", "value": "yes"},
            {"type": "bcdedit", "element": "useplatformtick", "value": "no"},
            {"type": "service", "name": "DoSvc", "startupType": "Manual"}
        ]
    })");
    const auto filters = tunelog::parsePhaseProfile(json).effectiveRollbackFilters();
    QCOMPARE(filters.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(filters[0].category), QStringLiteral("bcdedit"));
    QCOMPARE(QString::fromStdString(filters[0].keyPrefix), QStringLiteral("useplatformtick"));
    QCOMPARE(QString::fromStdString(filters[1].keyPrefix), QStringLiteral("DoSvc"));

    const auto readOnly = tunelog::parsePhaseProfile(nlohmann::json{{"phase", "diagnosis"}});
    QVERIFY(readOnly.effectiveRollbackFilters().empty());
}

void PhaseProfileTests::testExplicitRollbackFilters()
{
    const auto json = nlohmann::json::parse(R"({
        "phase": "p",
        "actions": [{"type": "bcdedit", "element": "useplatformtick", "value": "yes"}],
        "rollback": {"filters": [{"category": "registry", "keyPrefix": "HKLM\\SOFTWARE\\Vendor"}]}
    })");
    const auto profile = tunelog::parsePhaseProfile(json);
    QVERIFY(profile.explicitRollbackFilters);
    const auto filters = profile.effectiveRollbackFilters();
    QCOMPARE(filters.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(filters[0].category), QStringLiteral("registry"));
}

void PhaseProfileTests::testLoadReportsBadFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString missing = QDir(dir.path()).filePath(QStringLiteral("missing.json"));
    QVERIFY_EXCEPTION_THROWN(tunelog::loadPhaseProfile(missing), std::runtime_error);

    const QString broken = QDir(dir.path()).filePath(QStringLiteral("broken.json"));
    QFile file(broken);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"phase\": ");
    file.close();
    QVERIFY_EXCEPTION_THROWN(tunelog::loadPhaseProfile(broken), std::runtime_error);
}

void PhaseProfileTests::testShippedProfilesParse()
{
    const QDir profiles(QStringLiteral(TUNELOG_SOURCE_DIR "/Profiles"));
    const QStringList files = profiles.entryList({QStringLiteral("*.json")}, QDir::Files);
    QCOMPARE(files.size(), 10);
    for (const QString &name : files) {
        const auto profile = tunelog::loadPhaseProfile(profiles.filePath(name));
        QCOMPARE(QString::fromStdString(profile.phase) + QStringLiteral(".json"), name);
    }
}

QTEST_MAIN(PhaseProfileTests)
#include "test_phase_profile.moc"
