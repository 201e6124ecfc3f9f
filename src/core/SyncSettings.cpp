#include "SyncSettings.h"

#include <QDir>
#include <QStandardPaths>
#include <QDebug>

QString SyncSettings::defaultPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

SyncSettings::SyncSettings(const QString& path)
    : m_settings(path, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── iTunes export ───────────────────────────────────────────────────
QString SyncSettings::libraryXmlPath() const
{
    return m_settings.value(QStringLiteral("itunes/libraryXmlPath")).toString();
}

void SyncSettings::setLibraryXmlPath(const QString& path)
{
    m_settings.setValue(QStringLiteral("itunes/libraryXmlPath"), path);
}

QVector<PathMapping> SyncSettings::pathMappings() const
{
    QVector<PathMapping> mappings;
    // beginReadArray is not const
    auto& s = const_cast<QSettings&>(m_settings);
    int count = s.beginReadArray(QStringLiteral("itunes/pathMappings"));
    for (int i = 0; i < count; ++i) {
        s.setArrayIndex(i);
        PathMapping m;
        m.from = s.value(QStringLiteral("from")).toString();
        m.to = s.value(QStringLiteral("to")).toString();
        if (!m.from.isEmpty())
            mappings.append(m);
    }
    s.endArray();
    return mappings;
}

void SyncSettings::setPathMappings(const QVector<PathMapping>& mappings)
{
    m_settings.beginWriteArray(QStringLiteral("itunes/pathMappings"), mappings.size());
    for (int i = 0; i < mappings.size(); ++i) {
        m_settings.setArrayIndex(i);
        m_settings.setValue(QStringLiteral("from"), mappings[i].from);
        m_settings.setValue(QStringLiteral("to"), mappings[i].to);
    }
    m_settings.endArray();
}

bool SyncSettings::autoWriteBack() const
{
    return m_settings.value(QStringLiteral("itunes/autoWriteBack"), false).toBool();
}

void SyncSettings::setAutoWriteBack(bool enabled)
{
    m_settings.setValue(QStringLiteral("itunes/autoWriteBack"), enabled);
}

int SyncSettings::writeBackDelayMs() const
{
    return m_settings.value(QStringLiteral("itunes/writeBackDelayMs"), 5000).toInt();
}

void SyncSettings::setWriteBackDelayMs(int ms)
{
    m_settings.setValue(QStringLiteral("itunes/writeBackDelayMs"), ms);
}

// ── Pipeline ────────────────────────────────────────────────────────
PipelineOptions SyncSettings::pipelineOptions() const
{
    PipelineOptions o;
    o.progressBatch    = qMax(1, m_settings.value(QStringLiteral("import/progressBatch"), o.progressBatch).toInt());
    o.checkpointBatch  = qMax(1, m_settings.value(QStringLiteral("import/checkpointBatch"), o.checkpointBatch).toInt());
    o.errorLimit       = qMax(0, m_settings.value(QStringLiteral("import/errorLimit"), o.errorLimit).toInt());
    o.failureRunLimit  = qMax(1, m_settings.value(QStringLiteral("enrich/failureRunLimit"), o.failureRunLimit).toInt());
    o.failureBackoffMs = qMax(0, m_settings.value(QStringLiteral("enrich/failureBackoffMs"), o.failureBackoffMs).toInt());
    o.successBatch     = qMax(1, m_settings.value(QStringLiteral("enrich/successBatch"), o.successBatch).toInt());
    o.successPauseMs   = qMax(0, m_settings.value(QStringLiteral("enrich/successPauseMs"), o.successPauseMs).toInt());
    return o;
}

void SyncSettings::setPipelineOptions(const PipelineOptions& o)
{
    m_settings.setValue(QStringLiteral("import/progressBatch"), o.progressBatch);
    m_settings.setValue(QStringLiteral("import/checkpointBatch"), o.checkpointBatch);
    m_settings.setValue(QStringLiteral("import/errorLimit"), o.errorLimit);
    m_settings.setValue(QStringLiteral("enrich/failureRunLimit"), o.failureRunLimit);
    m_settings.setValue(QStringLiteral("enrich/failureBackoffMs"), o.failureBackoffMs);
    m_settings.setValue(QStringLiteral("enrich/successBatch"), o.successBatch);
    m_settings.setValue(QStringLiteral("enrich/successPauseMs"), o.successPauseMs);
}

// ── Organizer ───────────────────────────────────────────────────────
OrganizerOptions SyncSettings::organizerOptions() const
{
    OrganizerOptions o;
    o.rootDir = m_settings.value(QStringLiteral("organize/rootDir")).toString();
    o.pattern = m_settings.value(QStringLiteral("organize/pattern"), o.pattern).toString();
    return o;
}

void SyncSettings::setOrganizerOptions(const OrganizerOptions& o)
{
    m_settings.setValue(QStringLiteral("organize/rootDir"), o.rootDir);
    m_settings.setValue(QStringLiteral("organize/pattern"), o.pattern);
}

// ── Catalog ─────────────────────────────────────────────────────────
QString SyncSettings::databasePath() const
{
    QString path = m_settings.value(QStringLiteral("catalog/databasePath")).toString();
    if (path.isEmpty()) {
        QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
        path = dir.filePath(QStringLiteral("catalog.db"));
    }
    return path;
}

void SyncSettings::setDatabasePath(const QString& path)
{
    m_settings.setValue(QStringLiteral("catalog/databasePath"), path);
}
