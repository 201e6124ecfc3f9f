#include "CheckpointStore.h"
#include "../catalog/ICatalogStore.h"

#include <QDebug>

CheckpointStore::CheckpointStore(ICatalogStore* store)
    : m_store(store)
{
}

bool CheckpointStore::saveParams(const QString& jobId, const JobParams& params)
{
    if (!m_store->saveOperationParams(jobId, params.toJson())) {
        qWarning() << "[Jobs] Failed to save params for" << jobId;
        return false;
    }
    return true;
}

std::optional<JobParams> CheckpointStore::loadParams(const QString& jobId, SyncError* error) const
{
    QByteArray data = m_store->operationParams(jobId);
    if (data.isEmpty()) {
        setError(error, SyncError::Kind::NotFound, QStringLiteral("no saved params for job %1").arg(jobId));
        return std::nullopt;
    }
    return JobParams::fromJson(data, error);
}

bool CheckpointStore::saveCheckpoint(const QString& jobId, JobPhase phase, int index, int total)
{
    Checkpoint cp;
    cp.phase = phase;
    cp.index = index;
    cp.total = total;
    cp.updatedAt = QDateTime::currentDateTimeUtc();
    if (!m_store->saveOperationState(jobId, cp.toJson(jobId))) {
        qWarning() << "[Jobs] Failed to save checkpoint" << jobPhaseName(phase) << index << "/" << total
                   << "for" << jobId;
        return false;
    }
    return true;
}

std::optional<Checkpoint> CheckpointStore::loadCheckpoint(const QString& jobId, SyncError* error) const
{
    QByteArray data = m_store->operationState(jobId);
    if (data.isEmpty())
        return std::nullopt;
    return Checkpoint::fromJson(data, error);
}

bool CheckpointStore::clearState(const QString& jobId)
{
    return m_store->deleteOperationState(jobId);
}
