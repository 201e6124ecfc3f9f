#include "JobExecutor.h"
#include "CheckpointStore.h"
#include "../catalog/ICatalogStore.h"
#include "../export/AlbumGrouper.h"
#include "../export/ExportParser.h"
#include "../export/LibraryFingerprint.h"
#include "../pipeline/ImportPipeline.h"

#include <QFileInfo>
#include <QDebug>

using LogLevel = IProgressReporter::LogLevel;

JobExecutor::JobExecutor(ICatalogStore* store, CheckpointStore* checkpoints, ImportPipeline* pipeline,
                         ImportStatusRegistry* registry, const PipelineOptions& options)
    : m_store(store)
    , m_checkpoints(checkpoints)
    , m_pipeline(pipeline)
    , m_registry(registry)
    , m_options(options)
{
}

JobOutcome JobExecutor::run(const QString& jobId, const JobParams& params, IProgressReporter* reporter)
{
    JobContext ctx;
    ctx.jobId = jobId;
    ctx.params = params;
    ctx.params.exportPath = QFileInfo(params.exportPath).absoluteFilePath();
    ctx.reporter = reporter;
    ctx.status = m_registry->acquire(jobId, m_options.errorLimit);

    // Params are write-once; a rerun of a known job keeps the originals
    if (auto saved = m_checkpoints->loadParams(jobId)) {
        ctx.params = *saved;
    } else if (!m_checkpoints->saveParams(jobId, ctx.params)) {
        qWarning() << "[Jobs] Job" << jobId << "will not be resumable";
    }
    return execute(ctx);
}

JobOutcome JobExecutor::resume(const QString& jobId, IProgressReporter* reporter)
{
    SyncError err;
    auto params = m_checkpoints->loadParams(jobId, &err);
    if (!params) {
        JobOutcome outcome;
        outcome.jobId = jobId;
        outcome.phase = JobPhase::Failed;
        outcome.error = err;
        outcome.summary = QStringLiteral("Cannot resume job %1: %2").arg(jobId, err.message);
        qWarning() << "[Jobs]" << outcome.summary;
        return outcome;
    }

    JobContext ctx;
    ctx.jobId = jobId;
    ctx.params = *params;
    ctx.reporter = reporter;
    ctx.status = m_registry->acquire(jobId, m_options.errorLimit);
    return execute(ctx);
}

// ═══════════════════════════════════════════════════════════════════════
//  execute
// ═══════════════════════════════════════════════════════════════════════

JobOutcome JobExecutor::execute(JobContext& ctx)
{
    JobPhase phase = JobPhase::Importing;
    int startIndex = 0;

    SyncError cpErr;
    auto checkpoint = m_checkpoints->loadCheckpoint(ctx.jobId, &cpErr);
    if (cpErr.isError())
        qWarning() << "[Jobs] Ignoring unreadable checkpoint for" << ctx.jobId << ":" << cpErr.message;
    if (checkpoint && !isTerminalPhase(checkpoint->phase)) {
        phase = checkpoint->phase;
        startIndex = checkpoint->index;
        qInfo() << "[Jobs] Job" << ctx.jobId << "resuming at" << jobPhaseName(phase)
                << startIndex << "/" << checkpoint->total;
    }

    ctx.log(LogLevel::Info, QStringLiteral("Starting iTunes import from %1").arg(ctx.params.exportPath));

    SyncError parseErr;
    auto library = ExportParser::parseFile(ctx.params.exportPath, &parseErr);
    if (!library) {
        QString msg = QStringLiteral("failed to parse library: %1").arg(parseErr.message);
        ctx.status->recordError(msg);
        ctx.log(LogLevel::Error, msg);
        return finish(ctx, JobPhase::Failed, msg, parseErr);
    }

    const QVector<AlbumGroup> groups = AlbumGrouper::group(library->tracks);
    ctx.status->setTotal(groups.size());

    if (groups.isEmpty()) {
        ctx.progress(0, 0, QStringLiteral("No audiobooks found"));
        ctx.log(LogLevel::Info, QStringLiteral("No audiobooks found"));
    }

    // ── importing ────────────────────────────────────────────────────
    if (phase == JobPhase::Importing) {
        if (!m_pipeline->runImportPhase(ctx, *library, groups, startIndex))
            return finish(ctx, JobPhase::Canceled, ctx.status->snapshot().summary());
        startIndex = 0;
        if (!advance(ctx, phase, nextPhase(phase, ctx.params)))
            return finish(ctx, JobPhase::Failed, QStringLiteral("invalid phase transition"));
    } else {
        // Import already committed in an earlier run
        ctx.status->setProcessed(groups.size());
    }

    // ── enriching ────────────────────────────────────────────────────
    if (phase == JobPhase::Enriching) {
        if (!m_pipeline->runEnrichPhase(ctx, startIndex))
            return finish(ctx, JobPhase::Canceled, ctx.status->snapshot().summary());
        startIndex = 0;
        if (!advance(ctx, phase, nextPhase(phase, ctx.params)))
            return finish(ctx, JobPhase::Failed, QStringLiteral("invalid phase transition"));
    }

    // ── organizing ───────────────────────────────────────────────────
    if (phase == JobPhase::Organizing) {
        if (!m_pipeline->runOrganizePhase(ctx, startIndex))
            return finish(ctx, JobPhase::Canceled, ctx.status->snapshot().summary());
        if (!advance(ctx, phase, JobPhase::Completed))
            return finish(ctx, JobPhase::Failed, QStringLiteral("invalid phase transition"));
    }

    // ── completed ────────────────────────────────────────────────────
    m_checkpoints->clearState(ctx.jobId);
    if (auto fp = FingerprintService::compute(ctx.params.exportPath))
        m_store->saveLibraryFingerprint(*fp);

    ImportStatusSnapshot snap = ctx.status->snapshot();
    ctx.progress(snap.total, snap.total, snap.summary());
    return finish(ctx, JobPhase::Completed, snap.summary());
}

JobPhase JobExecutor::nextPhase(JobPhase from, const JobParams& params) const
{
    if (from == JobPhase::Importing && params.enrichMetadata)
        return JobPhase::Enriching;
    if ((from == JobPhase::Importing || from == JobPhase::Enriching) && params.shouldOrganize())
        return JobPhase::Organizing;
    return JobPhase::Completed;
}

bool JobExecutor::advance(const JobContext& ctx, JobPhase& current, JobPhase to)
{
    if (!canTransition(current, to)) {
        qWarning() << "[Jobs] Job" << ctx.jobId << "rejected transition"
                   << jobPhaseName(current) << "->" << jobPhaseName(to);
        return false;
    }
    qDebug() << "[Jobs] Job" << ctx.jobId << jobPhaseName(current) << "->" << jobPhaseName(to);
    current = to;
    // Mark the phase boundary so a restart does not redo the previous phase
    if (!isTerminalPhase(to))
        m_checkpoints->saveCheckpoint(ctx.jobId, to, 0, 0);
    return true;
}

JobOutcome JobExecutor::finish(const JobContext& ctx, JobPhase phase, const QString& summary,
                               const SyncError& error)
{
    JobOutcome outcome;
    outcome.jobId = ctx.jobId;
    outcome.phase = phase;
    outcome.status = ctx.status->snapshot();
    outcome.error = error;

    switch (phase) {
    case JobPhase::Completed:
        outcome.summary = QStringLiteral("Import complete. %1").arg(summary);
        break;
    case JobPhase::Canceled:
        outcome.summary = QStringLiteral("Import canceled. %1").arg(summary);
        break;
    default:
        outcome.summary = QStringLiteral("Import failed: %1").arg(summary);
        // Unrecoverable: nothing left to resume
        m_checkpoints->clearState(ctx.jobId);
        break;
    }

    qInfo() << "[Jobs] Job" << ctx.jobId << jobPhaseName(phase) << "-" << outcome.summary;
    ctx.log(phase == JobPhase::Failed ? LogLevel::Error : LogLevel::Info, outcome.summary,
            {{QStringLiteral("phase"), jobPhaseName(phase)},
             {QStringLiteral("imported"), outcome.status.imported},
             {QStringLiteral("skipped"), outcome.status.skipped},
             {QStringLiteral("failed"), outcome.status.failed}});
    return outcome;
}
