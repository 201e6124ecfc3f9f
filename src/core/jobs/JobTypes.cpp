#include "JobTypes.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

// ── JobPhase ────────────────────────────────────────────────────────
QString jobPhaseName(JobPhase phase)
{
    switch (phase) {
    case JobPhase::Importing:  return QStringLiteral("importing");
    case JobPhase::Enriching:  return QStringLiteral("enriching");
    case JobPhase::Organizing: return QStringLiteral("organizing");
    case JobPhase::Completed:  return QStringLiteral("completed");
    case JobPhase::Canceled:   return QStringLiteral("canceled");
    case JobPhase::Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

std::optional<JobPhase> jobPhaseFromName(const QString& name)
{
    static const JobPhase all[] = {
        JobPhase::Importing, JobPhase::Enriching, JobPhase::Organizing,
        JobPhase::Completed, JobPhase::Canceled, JobPhase::Failed
    };
    for (JobPhase p : all) {
        if (jobPhaseName(p) == name)
            return p;
    }
    return std::nullopt;
}

bool isTerminalPhase(JobPhase phase)
{
    return phase == JobPhase::Completed || phase == JobPhase::Canceled
        || phase == JobPhase::Failed;
}

bool canTransition(JobPhase from, JobPhase to)
{
    if (isTerminalPhase(from))
        return false;
    if (to == JobPhase::Canceled || to == JobPhase::Failed)
        return true;
    // Running phases only move forward
    return static_cast<int>(to) > static_cast<int>(from);
}

// ── ImportMode ──────────────────────────────────────────────────────
QString importModeName(ImportMode mode)
{
    switch (mode) {
    case ImportMode::Organized: return QStringLiteral("organized");
    case ImportMode::Import:    return QStringLiteral("import");
    case ImportMode::Organize:  return QStringLiteral("organize");
    }
    return QStringLiteral("import");
}

ImportMode importModeFromName(const QString& name)
{
    if (name == QStringLiteral("organized")) return ImportMode::Organized;
    if (name == QStringLiteral("organize"))  return ImportMode::Organize;
    return ImportMode::Import;
}

// ── JobParams JSON ──────────────────────────────────────────────────
QByteArray JobParams::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("library_xml_path")] = exportPath;
    obj[QStringLiteral("import_mode")] = importModeName(importMode);
    QJsonArray mappings;
    for (const auto& m : pathMappings) {
        QJsonObject mo;
        mo[QStringLiteral("from")] = m.from;
        mo[QStringLiteral("to")] = m.to;
        mappings.append(mo);
    }
    obj[QStringLiteral("path_mappings")] = mappings;
    obj[QStringLiteral("skip_duplicates")] = skipDuplicates;
    obj[QStringLiteral("enrich_metadata")] = enrichMetadata;
    obj[QStringLiteral("auto_organize")] = autoOrganize;
    obj[QStringLiteral("preserve_location")] = preserveLocation;
    obj[QStringLiteral("import_playlists")] = importPlaylists;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<JobParams> JobParams::fromJson(const QByteArray& data, SyncError* error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("invalid job params: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    QJsonObject obj = doc.object();
    JobParams p;
    p.exportPath = obj.value(QStringLiteral("library_xml_path")).toString();
    p.importMode = importModeFromName(obj.value(QStringLiteral("import_mode")).toString());
    for (const auto& v : obj.value(QStringLiteral("path_mappings")).toArray()) {
        QJsonObject mo = v.toObject();
        p.pathMappings.append({mo.value(QStringLiteral("from")).toString(),
                               mo.value(QStringLiteral("to")).toString()});
    }
    p.skipDuplicates   = obj.value(QStringLiteral("skip_duplicates")).toBool(true);
    p.enrichMetadata   = obj.value(QStringLiteral("enrich_metadata")).toBool();
    p.autoOrganize     = obj.value(QStringLiteral("auto_organize")).toBool();
    p.preserveLocation = obj.value(QStringLiteral("preserve_location")).toBool();
    p.importPlaylists  = obj.value(QStringLiteral("import_playlists")).toBool();

    if (p.exportPath.isEmpty()) {
        setError(error, SyncError::Kind::Parse, QStringLiteral("job params carry no export path"));
        return std::nullopt;
    }
    return p;
}

// ── Checkpoint JSON ─────────────────────────────────────────────────
QByteArray Checkpoint::toJson(const QString& jobId) const
{
    QJsonObject obj;
    obj[QStringLiteral("operation_id")] = jobId;
    obj[QStringLiteral("type")] = QStringLiteral("itunes_import");
    obj[QStringLiteral("phase")] = jobPhaseName(phase);
    obj[QStringLiteral("phase_index")] = index;
    obj[QStringLiteral("phase_total")] = total;
    obj[QStringLiteral("status")] = QStringLiteral("running");
    obj[QStringLiteral("updated_at")] = updatedAt.toUTC().toString(Qt::ISODateWithMs);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<Checkpoint> Checkpoint::fromJson(const QByteArray& data, SyncError* error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("invalid checkpoint: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    QJsonObject obj = doc.object();
    auto phase = jobPhaseFromName(obj.value(QStringLiteral("phase")).toString());
    if (!phase) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("checkpoint has unknown phase '%1'")
                     .arg(obj.value(QStringLiteral("phase")).toString()));
        return std::nullopt;
    }

    Checkpoint cp;
    cp.phase = *phase;
    cp.index = qMax(0, obj.value(QStringLiteral("phase_index")).toInt());
    cp.total = qMax(0, obj.value(QStringLiteral("phase_total")).toInt());
    cp.updatedAt = QDateTime::fromString(obj.value(QStringLiteral("updated_at")).toString(),
                                         Qt::ISODateWithMs);
    return cp;
}
