#pragma once

#include <QString>
#include <optional>

#include "JobTypes.h"
#include "../SyncError.h"

class ICatalogStore;

// Job params and checkpoints, serialized as JSON into the catalog's
// operation rows so they survive a restart.
class CheckpointStore {
public:
    explicit CheckpointStore(ICatalogStore* store);

    bool saveParams(const QString& jobId, const JobParams& params);
    std::optional<JobParams> loadParams(const QString& jobId, SyncError* error = nullptr) const;

    // Last write wins.
    bool saveCheckpoint(const QString& jobId, JobPhase phase, int index, int total);
    // nullopt without error when the job has no checkpoint.
    std::optional<Checkpoint> loadCheckpoint(const QString& jobId, SyncError* error = nullptr) const;

    // Drops params and checkpoint. Safe to call repeatedly.
    bool clearState(const QString& jobId);

private:
    ICatalogStore* m_store;
};
