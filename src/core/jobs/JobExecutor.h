#pragma once

#include <QString>

#include "JobTypes.h"
#include "JobContext.h"
#include "ImportStatus.h"
#include "../pipeline/PipelineOptions.h"

class ICatalogStore;
class CheckpointStore;
class ImportPipeline;

// Terminal result of one job run.
struct JobOutcome {
    QString jobId;
    JobPhase phase = JobPhase::Failed;   // Completed, Canceled or Failed
    QString summary;
    ImportStatusSnapshot status;
    SyncError error;

    bool succeeded() const { return phase == JobPhase::Completed; }
};

// Drives one import job through importing → enriching → organizing.
// Checkpoints survive cancellation so resume() continues where the job
// stopped; success and failure clear them.
class JobExecutor {
public:
    JobExecutor(ICatalogStore* store, CheckpointStore* checkpoints, ImportPipeline* pipeline,
                ImportStatusRegistry* registry, const PipelineOptions& options = PipelineOptions());

    // Saves params, then runs from the job's checkpoint (if any).
    JobOutcome run(const QString& jobId, const JobParams& params, IProgressReporter* reporter);
    // Reloads saved params; NotFound when the job left nothing behind.
    JobOutcome resume(const QString& jobId, IProgressReporter* reporter);

    ImportStatusRegistry* statusRegistry() const { return m_registry; }

private:
    JobOutcome execute(JobContext& ctx);
    JobPhase nextPhase(JobPhase from, const JobParams& params) const;
    bool advance(const JobContext& ctx, JobPhase& current, JobPhase to);
    JobOutcome finish(const JobContext& ctx, JobPhase phase, const QString& summary,
                      const SyncError& error = SyncError());

    ICatalogStore* m_store;
    CheckpointStore* m_checkpoints;
    ImportPipeline* m_pipeline;
    ImportStatusRegistry* m_registry;
    PipelineOptions m_options;
};
