#include "platform/setting_store.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "platform/platform_error.hpp"

namespace tunelog {

namespace {

CommandOutput runTool(logging::Logger &logger,
                      const QString &component,
                      const QString &program,
                      const QStringList &args)
{
    const CommandOutput output = runCommand(program, args);
    TLOG_DEBUG(logger,
               component,
               QStringLiteral("runTool"),
               QStringLiteral("command_finished"),
               QStringLiteral("setting_access"),
               program,
               (nlohmann::json{{"args", args.join(QLatin1Char(' ')).toStdString()},
                               {"exitCode", output.exitCode}}));
    if (!output.started) {
        throw PlatformError(PlatformErrorKind::NotFound,
                            program.toStdString() + " could not be started");
    }
    if (output.timedOut) {
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            program.toStdString() + " timed out");
    }
    if (output.exitCode != 0) {
        const QString text = output.standardOutput + output.standardError;
        if (text.contains(QStringLiteral("Access is denied"), Qt::CaseInsensitive)
            || text.contains(QStringLiteral("administrator"), Qt::CaseInsensitive)) {
            throw PlatformError(PlatformErrorKind::PermissionDenied,
                                program.toStdString() + ": access denied");
        }
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            program.toStdString() + " exit "
                                + std::to_string(output.exitCode) + ": "
                                + text.trimmed().toStdString());
    }
    return output;
}

void requireActiveSchemeKey(const std::string &key)
{
    if (key != kActiveSchemeKey) {
        throw PlatformError(PlatformErrorKind::Unsupported,
                            "powercfg has no setting named " + key);
    }
}

} // namespace

PowerCfgStore::PowerCfgStore(logging::Logger &logger)
    : m_logger(logger)
{
}

SnapshotValue PowerCfgStore::read(const std::string &key)
{
    requireActiveSchemeKey(key);
    const CommandOutput output = runTool(m_logger, QStringLiteral("PowerCfgStore"),
                                         QStringLiteral("powercfg.exe"),
                                         {QStringLiteral("/getactivescheme")});

    static const QRegularExpression guidRe(QStringLiteral(
        "([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})"));
    const auto match = guidRe.match(output.standardOutput);
    if (!match.hasMatch()) {
        throw PlatformError(PlatformErrorKind::CommandFailed,
                            "no scheme GUID in powercfg output");
    }
    return SnapshotValue::fromString(match.captured(1).toLower().toStdString());
}

void PowerCfgStore::write(const std::string &key, const std::string &value)
{
    requireActiveSchemeKey(key);
    runTool(m_logger, QStringLiteral("PowerCfgStore"), QStringLiteral("powercfg.exe"),
            {QStringLiteral("/setactive"), QString::fromStdString(value)});
}

void PowerCfgStore::remove(const std::string &key)
{
    requireActiveSchemeKey(key);
    throw PlatformError(PlatformErrorKind::Unsupported,
                        "the active power scheme cannot be removed");
}

BcdEditStore::BcdEditStore(logging::Logger &logger, const QString &entry)
    : m_logger(logger)
    , m_entry(entry)
{
}

SnapshotValue BcdEditStore::read(const std::string &key)
{
    const CommandOutput output = runTool(m_logger, QStringLiteral("BcdEditStore"),
                                         QStringLiteral("bcdedit.exe"),
                                         {QStringLiteral("/enum"), m_entry});

    // Element lines are "<name><spaces><value>"; headers and separators never
    // start with a known element name.
    const QString element = QString::fromStdString(key);
    const QStringList lines = output.standardOutput.split(QRegularExpression(QStringLiteral("[\\r\\n]+")),
                                                          Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const int split = line.indexOf(QRegularExpression(QStringLiteral("\\s")));
        if (split <= 0) {
            continue;
        }
        if (line.left(split).compare(element, Qt::CaseInsensitive) == 0) {
            return SnapshotValue::fromString(line.mid(split).trimmed().toStdString());
        }
    }
    return SnapshotValue::absent();
}

void BcdEditStore::write(const std::string &key, const std::string &value)
{
    runTool(m_logger, QStringLiteral("BcdEditStore"), QStringLiteral("bcdedit.exe"),
            {QStringLiteral("/set"), m_entry, QString::fromStdString(key),
             QString::fromStdString(value)});
}

void BcdEditStore::remove(const std::string &key)
{
    if (read(key).isAbsent()) {
        return;
    }
    runTool(m_logger, QStringLiteral("BcdEditStore"), QStringLiteral("bcdedit.exe"),
            {QStringLiteral("/deletevalue"), m_entry, QString::fromStdString(key)});
}

} // namespace tunelog
