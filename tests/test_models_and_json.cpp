#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testSnapshotValueTags();
    void testChangeEntryRoundTrip();
    void testServiceSnapshotKeepsUnknownText();
    void testPhaseSpecDefaults();
    void testRollbackFilterMatching();
    void testEnumStrings();

private:
    static qint64 toSeconds(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testSnapshotValueTags()
{
    nlohmann::json absent = tunelog::SnapshotValue::absent();
    QVERIFY(absent.is_null());
    QVERIFY(absent.get<tunelog::SnapshotValue>().isAbsent());

    nlohmann::json number = tunelog::SnapshotValue::fromInt(4294967295LL);
    const auto parsedNumber = number.get<tunelog::SnapshotValue>();
    QVERIFY(parsedNumber.isInt());
    QCOMPARE(parsedNumber.asInt(), static_cast<std::int64_t>(4294967295LL));

    const auto text = nlohmann::json("High").get<tunelog::SnapshotValue>();
    QVERIFY(text.isString());
    QCOMPARE(QString::fromStdString(text.asString()), QStringLiteral("High"));

    const auto service = nlohmann::json{{"status", "Running"}, {"startupType", "Automatic"}}
                             .get<tunelog::SnapshotValue>();
    QVERIFY(service.isService());
    QCOMPARE(QString::fromStdString(service.display()), QStringLiteral("Running/Automatic"));
}

void ModelsJsonTests::testChangeEntryRoundTrip()
{
    tunelog::ChangeEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = tunelog::category::Registry;
    entry.key = "HKLM\\SYSTEM\\Test\\Value";
    entry.before = tunelog::SnapshotValue::absent();
    entry.after = tunelog::SnapshotValue::fromInt(1);
    entry.note = "enable test";

    nlohmann::json j = entry;
    const auto parsed = j.get<tunelog::ChangeEntry>();

    QCOMPARE(QString::fromStdString(parsed.category), QStringLiteral("registry"));
    QCOMPARE(QString::fromStdString(parsed.key), QStringLiteral("HKLM\\SYSTEM\\Test\\Value"));
    QVERIFY(parsed.before.isAbsent());
    QVERIFY(parsed.after == tunelog::SnapshotValue::fromInt(1));
    QCOMPARE(QString::fromStdString(parsed.note), QStringLiteral("enable test"));
    QCOMPARE(toSeconds(parsed.timestamp), toSeconds(entry.timestamp));
}

void ModelsJsonTests::testServiceSnapshotKeepsUnknownText()
{
    const tunelog::ServiceStateSnapshot snapshot{"Running", "TriggerStart"};
    nlohmann::json j = tunelog::SnapshotValue::fromService(snapshot);
    const auto parsed = j.get<tunelog::SnapshotValue>();

    QVERIFY(parsed.isService());
    QCOMPARE(QString::fromStdString(parsed.asService().startupType),
             QStringLiteral("TriggerStart"));
    QVERIFY(!tunelog::parseStartupTypeString("TriggerStart").has_value());
}

void ModelsJsonTests::testPhaseSpecDefaults()
{
    const auto phase = nlohmann::json{{"name", "network"}, {"program", "tunelog-unit"}}
                           .get<tunelog::PhaseSpec>();

    QCOMPARE(QString::fromStdString(phase.title), QStringLiteral("network"));
    QCOMPARE(phase.runner, tunelog::RunnerKind::Native);
    QCOMPARE(phase.timeoutMs, 0);
    QVERIFY(!phase.advisory);
    QVERIFY(phase.optIns.empty());

    nlohmann::json optIns = nlohmann::json::array();
    optIns.push_back({{"flag", "EnableX"}, {"prompt", "X?"}});
    const auto script = nlohmann::json{{"name", "gpu"},
                                       {"runner", "powershell"},
                                       {"program", "Scripts/gpu.ps1"},
                                       {"optIns", optIns}}
                            .get<tunelog::PhaseSpec>();
    QCOMPARE(script.runner, tunelog::RunnerKind::PowerShell);
    QCOMPARE(script.optIns.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(script.optIns.front().flag), QStringLiteral("EnableX"));
}

void ModelsJsonTests::testRollbackFilterMatching()
{
    tunelog::ChangeEntry entry;
    entry.category = tunelog::category::Registry;
    entry.key = "HKLM\\SOFTWARE\\Vendor\\Value";

    QVERIFY(tunelog::RollbackFilter{}.matches(entry));
    QVERIFY((tunelog::RollbackFilter{"registry", "HKLM\\SOFTWARE"}).matches(entry));
    QVERIFY(!(tunelog::RollbackFilter{"service", ""}).matches(entry));
    QVERIFY(!(tunelog::RollbackFilter{"registry", "HKLM\\SYSTEM"}).matches(entry));
}

void ModelsJsonTests::testEnumStrings()
{
    QCOMPARE(tunelog::parseModeString("rollback").value(), tunelog::RunMode::Rollback);
    QVERIFY(!tunelog::parseModeString("undo").has_value());
    QCOMPARE(tunelog::parsePhaseStateString(tunelog::toPhaseStateString(tunelog::PhaseState::TimedOut)),
             tunelog::PhaseState::TimedOut);
    QCOMPARE(tunelog::parseServiceStatusString("Paused"), tunelog::ServiceStatus::Paused);
    QCOMPARE(tunelog::parseRegistryKindString("sz").value(), tunelog::RegistryValueKind::String);
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
