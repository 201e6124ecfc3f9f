#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "WriteBackTypes.h"

class QTimer;
class WriteBackEngine;

// Debounced automatic write-back. Book ids collect until the export has
// been quiet for the configured delay, then go out as one batch without
// a backup.
class WriteBackBatcher : public QObject {
    Q_OBJECT

public:
    WriteBackBatcher(WriteBackEngine* engine, QObject* parent = nullptr);

    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }
    void setExportPath(const QString& path) { m_exportPath = path; }
    void setPathMappings(const QVector<PathMapping>& mappings) { m_mappings = mappings; }
    void setDelay(int ms);

    void enqueue(const QString& bookId);
    int pendingCount() const { return m_pending.size(); }

    // Writes whatever is pending now.
    void flush();

signals:
    void batchWritten(bool success, int updatedCount, const QString& message);

private:
    WriteBackEngine* m_engine;
    QTimer* m_timer;
    QStringList m_pending;
    QString m_exportPath;
    QVector<PathMapping> m_mappings;
    bool m_enabled = false;
};
