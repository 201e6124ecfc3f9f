#pragma once

#include <QSettings>
#include <QString>
#include <QVector>

#include "export/ExportTypes.h"
#include "pipeline/PipelineOptions.h"

// INI-backed configuration. The file path is injected so tests and the CLI
// can point at their own settings; defaultPath() is the per-user location.
class SyncSettings {
public:
    explicit SyncSettings(const QString& path = defaultPath());

    static QString defaultPath();
    QString fileName() const { return m_settings.fileName(); }

    // ── iTunes export ────────────────────────────────────────────────
    QString libraryXmlPath() const;
    void setLibraryXmlPath(const QString& path);

    QVector<PathMapping> pathMappings() const;
    void setPathMappings(const QVector<PathMapping>& mappings);

    bool autoWriteBack() const;
    void setAutoWriteBack(bool enabled);

    int writeBackDelayMs() const;
    void setWriteBackDelayMs(int ms);

    // ── Pipeline ─────────────────────────────────────────────────────
    PipelineOptions pipelineOptions() const;
    void setPipelineOptions(const PipelineOptions& options);

    // ── Organizer ────────────────────────────────────────────────────
    OrganizerOptions organizerOptions() const;
    void setOrganizerOptions(const OrganizerOptions& options);

    // ── Catalog ──────────────────────────────────────────────────────
    QString databasePath() const;
    void setDatabasePath(const QString& path);

    void sync() { m_settings.sync(); }

private:
    QSettings m_settings;
};
