#include "ExportWatcher.h"

#include <QFileInfo>
#include <QMutexLocker>
#include <QDebug>

ExportWatcher::ExportWatcher(QObject* parent)
    : QObject(parent)
{
    connect(&m_watcher, &QFileSystemWatcher::fileChanged, this, &ExportWatcher::onFileChanged);
}

bool ExportWatcher::watch(const QString& exportPath)
{
    stop();
    m_path = QFileInfo(exportPath).absoluteFilePath();
    if (!m_watcher.addPath(m_path)) {
        qWarning() << "[Export] Cannot watch" << m_path;
        return false;
    }
    qDebug() << "[Export] Watching" << m_path;
    return true;
}

void ExportWatcher::stop()
{
    if (!m_watcher.files().isEmpty())
        m_watcher.removePaths(m_watcher.files());
}

bool ExportWatcher::hasChanged() const
{
    QMutexLocker lock(&m_mutex);
    return m_changed;
}

QDateTime ExportWatcher::changedAt() const
{
    QMutexLocker lock(&m_mutex);
    return m_changedAt;
}

void ExportWatcher::clearChanged()
{
    QMutexLocker lock(&m_mutex);
    m_changed = false;
    m_changedAt = QDateTime();
}

void ExportWatcher::onFileChanged(const QString& path)
{
    {
        QMutexLocker lock(&m_mutex);
        m_changed = true;
        m_changedAt = QDateTime::currentDateTimeUtc();
    }

    // Atomic replace drops the inode we were watching
    if (QFileInfo::exists(path) && !m_watcher.files().contains(path))
        m_watcher.addPath(path);

    qInfo() << "[Export] Export changed:" << path;
    emit exportChanged(path);
}
