#pragma once

#include <QDateTime>
#include <QFileSystemWatcher>
#include <QMutex>
#include <QObject>
#include <QString>

// Flags the export as changed when the media player rewrites it. Players
// replace the file atomically, so the path is re-added after every change.
class ExportWatcher : public QObject {
    Q_OBJECT

public:
    explicit ExportWatcher(QObject* parent = nullptr);

    bool watch(const QString& exportPath);
    void stop();
    QString exportPath() const { return m_path; }

    bool hasChanged() const;
    QDateTime changedAt() const;
    void clearChanged();

signals:
    void exportChanged(const QString& path);

private:
    void onFileChanged(const QString& path);

    QFileSystemWatcher m_watcher;
    QString m_path;
    mutable QMutex m_mutex;
    bool m_changed = false;
    QDateTime m_changedAt;
};
