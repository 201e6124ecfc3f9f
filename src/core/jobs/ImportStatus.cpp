#include "ImportStatus.h"

#include <QMutexLocker>

int progressPercent(int current, int total)
{
    if (total <= 0)
        return 0;
    qint64 pct = static_cast<qint64>(current) * 100 / total;
    return static_cast<int>(qBound<qint64>(0, pct, 100));
}

QString ImportStatusSnapshot::summary() const
{
    return QStringLiteral("Processed %1/%2: %3 imported, %4 skipped, %5 failed")
        .arg(processed).arg(total).arg(imported).arg(skipped).arg(failed);
}

// ── ImportStatus ────────────────────────────────────────────────────
ImportStatus::ImportStatus(int errorLimit)
    : m_errorLimit(qMax(0, errorLimit))
{
}

void ImportStatus::setTotal(int total)
{
    QMutexLocker lock(&m_mutex);
    m_data.total = total;
}

void ImportStatus::setProcessed(int processed)
{
    QMutexLocker lock(&m_mutex);
    m_data.processed = processed;
}

void ImportStatus::incrementImported()
{
    QMutexLocker lock(&m_mutex);
    ++m_data.imported;
}

void ImportStatus::incrementSkipped()
{
    QMutexLocker lock(&m_mutex);
    ++m_data.skipped;
}

void ImportStatus::recordFailure(const QString& message)
{
    QMutexLocker lock(&m_mutex);
    ++m_data.failed;
    appendErrorLocked(message);
}

void ImportStatus::recordError(const QString& message)
{
    QMutexLocker lock(&m_mutex);
    appendErrorLocked(message);
}

void ImportStatus::appendErrorLocked(const QString& message)
{
    if (m_data.errors.size() < m_errorLimit)
        m_data.errors.append(message);
}

ImportStatusSnapshot ImportStatus::snapshot() const
{
    QMutexLocker lock(&m_mutex);
    return m_data;
}

// ── ImportStatusRegistry ────────────────────────────────────────────
std::shared_ptr<ImportStatus> ImportStatusRegistry::acquire(const QString& jobId, int errorLimit)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_statuses.find(jobId);
    if (it != m_statuses.end())
        return it.value();
    auto status = std::make_shared<ImportStatus>(errorLimit);
    m_statuses.insert(jobId, status);
    return status;
}

std::shared_ptr<ImportStatus> ImportStatusRegistry::find(const QString& jobId) const
{
    QMutexLocker lock(&m_mutex);
    return m_statuses.value(jobId);
}

std::optional<ImportStatusSnapshot> ImportStatusRegistry::snapshot(const QString& jobId,
                                                                   SyncError* error) const
{
    auto status = find(jobId);
    if (!status) {
        setError(error, SyncError::Kind::NotFound, QStringLiteral("unknown job %1").arg(jobId));
        return std::nullopt;
    }
    return status->snapshot();
}

void ImportStatusRegistry::remove(const QString& jobId)
{
    QMutexLocker lock(&m_mutex);
    m_statuses.remove(jobId);
}

QStringList ImportStatusRegistry::jobIds() const
{
    QMutexLocker lock(&m_mutex);
    return m_statuses.keys();
}
