#include "journal/run_context.hpp"

#include <stdexcept>

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/json_utils.hpp"

namespace tunelog {

namespace {

const QStringList kWorkspaceDirs = {
    QStringLiteral("Logs"),
    QStringLiteral("Backup"),
    QStringLiteral("Profiles"),
    QStringLiteral("Scripts"),
};

} // namespace

RunContext::RunContext(const RunContext &other)
    : m_runId(other.m_runId)
    , m_mode(other.m_mode)
    , m_createdAt(other.m_createdAt)
    , m_workspaceRoot(other.m_workspaceRoot)
    , m_logFile(other.m_logFile)
    , m_contextFile(other.m_contextFile)
    , m_rollbackTarget(other.m_rollbackTarget)
    , m_data(other.m_data)
    , m_integrityVerified(other.m_integrityVerified)
    , m_autoPersist(other.m_autoPersist)
    , m_journal(other.m_journal.entries())
{
    // The hook is bound to its owner; never copy it.
    if (m_autoPersist) {
        installPersistHook();
    }
}

RunContext &RunContext::operator=(const RunContext &other)
{
    if (this == &other) {
        return *this;
    }
    m_runId = other.m_runId;
    m_mode = other.m_mode;
    m_createdAt = other.m_createdAt;
    m_workspaceRoot = other.m_workspaceRoot;
    m_logFile = other.m_logFile;
    m_contextFile = other.m_contextFile;
    m_rollbackTarget = other.m_rollbackTarget;
    m_data = other.m_data;
    m_integrityVerified = other.m_integrityVerified;
    m_autoPersist = other.m_autoPersist;
    m_journal = ChangeJournal(other.m_journal.entries());
    if (m_autoPersist) {
        installPersistHook();
    }
    return *this;
}

RunContext RunContext::create(const std::string &runId,
                              const QString &workspaceRoot,
                              RunMode mode)
{
    RunContext context;
    context.m_runId = runId;
    context.m_mode = mode;
    context.m_createdAt = std::chrono::system_clock::now();
    context.m_workspaceRoot = QDir::cleanPath(QDir(workspaceRoot).absolutePath());

    for (const QString &dir : kWorkspaceDirs) {
        QDir().mkpath(context.absPath({dir}));
    }

    const QString id = QString::fromStdString(runId);
    context.m_logFile = context.absPath(
        {QStringLiteral("Logs"), QStringLiteral("tunelog-%1.log").arg(id)});
    context.m_contextFile = context.absPath(
        {QStringLiteral("Logs"), QStringLiteral("context-%1.json").arg(id)});
    return context;
}

std::string RunContext::generateRunId()
{
    return QDateTime::currentDateTimeUtc()
        .toString(QStringLiteral("yyyyMMdd-HHmmss"))
        .toStdString();
}

QString RunContext::absPath(const QStringList &parts) const
{
    QString path = m_workspaceRoot;
    for (const QString &part : parts) {
        path = QDir(path).filePath(part);
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

std::string RunContext::journalDigest(const nlohmann::json &changes)
{
    const QByteArray canonical = QByteArray::fromStdString(changes.dump());
    return QCryptographicHash::hash(canonical, QCryptographicHash::Sha256)
        .toHex()
        .toStdString();
}

nlohmann::json RunContext::toJson() const
{
    const nlohmann::json changes = m_journal.entries();
    return nlohmann::json{
        {"schemaVersion", kSchemaVersion},
        {"runId", m_runId},
        {"mode", toModeString(m_mode)},
        {"createdAt", toIso8601Utc(m_createdAt)},
        {"workspaceRoot", m_workspaceRoot.toStdString()},
        {"logFile", m_logFile.toStdString()},
        {"contextFile", m_contextFile.toStdString()},
        {"rollbackTarget", m_rollbackTarget.toStdString()},
        {"data", m_data},
        {"changes", changes},
        {"integrity", {
            {"algorithm", "sha256"},
            {"journalDigest", journalDigest(changes)}
        }}
    };
}

void RunContext::persist() const
{
    persist(m_contextFile);
}

void RunContext::persist(const QString &path) const
{
    if (path.isEmpty()) {
        throw std::runtime_error("run context has no file path");
    }

    QDir().mkpath(QFileInfo(path).absolutePath());

    const QByteArray data = QByteArray::fromStdString(toJson().dump(2));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw std::runtime_error("failed to open run context for writing: "
                                 + file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw std::runtime_error("failed to write run context: "
                                 + file.errorString().toStdString());
    }
    if (!file.commit()) {
        throw std::runtime_error("failed to commit run context: "
                                 + file.errorString().toStdString());
    }
}

void RunContext::enableAutoPersist()
{
    m_autoPersist = true;
    installPersistHook();
}

void RunContext::installPersistHook()
{
    m_journal.setPersistHook([this](const ChangeJournal &) { persist(); });
}

ContextLoadResult RunContext::load(const QString &path)
{
    ContextLoadResult result;

    QFile file(path);
    if (!file.exists()) {
        result.reason = "context file not found";
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result.reason = "context file unreadable: " + file.errorString().toStdString();
        return result;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &error) {
        result.reason = std::string("context file unparseable: ") + error.what();
        return result;
    }

    if (!doc.is_object() || !doc.contains("runId") || !doc.at("runId").is_string()
        || !doc.contains("changes") || !doc.at("changes").is_array()) {
        result.reason = "context file incomplete";
        return result;
    }

    int schema = kSchemaVersion;
    if (doc.contains("schemaVersion")) {
        if (!doc.at("schemaVersion").is_number_integer()) {
            result.reason = "context file malformed: schemaVersion is not an integer";
            return result;
        }
        schema = doc.at("schemaVersion").get<int>();
    }
    if (schema > kSchemaVersion) {
        result.reason = "unsupported schema version " + std::to_string(schema);
        return result;
    }

    const nlohmann::json &changes = doc.at("changes");
    bool verified = false;
    if (doc.contains("integrity") && doc.at("integrity").is_object()) {
        const nlohmann::json &integrity = doc.at("integrity");
        if (integrity.contains("journalDigest") && !integrity.at("journalDigest").is_string()) {
            result.reason = "context file malformed: journalDigest is not a string";
            return result;
        }
        const std::string expected = integrity.value("journalDigest", "");
        if (expected != journalDigest(changes)) {
            result.reason = "integrity mismatch";
            return result;
        }
        verified = true;
    }

    RunContext context;
    try {
        context.m_runId = doc.at("runId").get<std::string>();
        context.m_mode = parseModeString(doc.value("mode", "Apply")).value_or(RunMode::Apply);
        context.m_createdAt = fromIso8601Utc(doc.value("createdAt", ""));
        context.m_workspaceRoot = QString::fromStdString(doc.value("workspaceRoot", ""));
        context.m_logFile = QString::fromStdString(doc.value("logFile", ""));
        context.m_contextFile = QString::fromStdString(
            doc.value("contextFile", QFileInfo(path).absoluteFilePath().toStdString()));
        context.m_rollbackTarget = QString::fromStdString(doc.value("rollbackTarget", ""));
        if (doc.contains("data") && doc.at("data").is_object()) {
            context.m_data = doc.at("data");
        }
        context.m_journal = ChangeJournal(changes.get<std::vector<ChangeEntry>>());
    } catch (const nlohmann::json::exception &error) {
        result.reason = std::string("context file malformed: ") + error.what();
        return result;
    } catch (const std::invalid_argument &error) {
        result.reason = std::string("context file malformed: ") + error.what();
        return result;
    }
    context.m_integrityVerified = verified;

    result.context = context;
    return result;
}

} // namespace tunelog
