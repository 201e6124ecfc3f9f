#include "JobQueue.h"

#include <QMutexLocker>
#include <QUuid>
#include <QtConcurrent>
#include <QDebug>

// ── QueuedJob ───────────────────────────────────────────────────────
QueuedJob::QueuedJob(const QString& jobId, JobQueue* queue)
    : m_queue(queue)
{
    m_info.jobId = jobId;
}

void QueuedJob::log(LogLevel level, const QString& message, const QVariantMap& detail)
{
    Q_UNUSED(detail);
    switch (level) {
    case LogLevel::Debug:   qDebug() << "[Jobs]" << m_info.jobId << message; break;
    case LogLevel::Info:    qInfo() << "[Jobs]" << m_info.jobId << message; break;
    case LogLevel::Warning:
    case LogLevel::Error:   qWarning() << "[Jobs]" << m_info.jobId << message; break;
    }
    emit m_queue->jobLog(m_info.jobId, levelName(level), message);
}

void QueuedJob::updateProgress(int current, int total, const QString& message)
{
    {
        QMutexLocker lock(&m_mutex);
        m_info.current = current;
        m_info.total = total;
        m_info.message = message;
    }
    emit m_queue->jobProgress(m_info.jobId, current, total, message);
}

void QueuedJob::markRunning()
{
    QMutexLocker lock(&m_mutex);
    m_info.running = true;
    m_info.outcome.reset();
}

void QueuedJob::setOutcome(const JobOutcome& outcome)
{
    QMutexLocker lock(&m_mutex);
    m_info.running = false;
    m_info.message = outcome.summary;
    m_info.outcome = outcome;
}

QueuedJobInfo QueuedJob::info() const
{
    QMutexLocker lock(&m_mutex);
    QueuedJobInfo copy = m_info;
    copy.cancelRequested = m_canceled.load();
    return copy;
}

// ── JobQueue ────────────────────────────────────────────────────────
JobQueue::JobQueue(JobExecutor* executor, int maxConcurrent, QObject* parent)
    : QObject(parent)
    , m_executor(executor)
{
    m_pool.setMaxThreadCount(qMax(1, maxConcurrent));
}

JobQueue::~JobQueue()
{
    {
        QMutexLocker lock(&m_mutex);
        for (auto& job : m_jobs)
            job->cancel();
    }
    m_pool.waitForDone();
}

std::shared_ptr<QueuedJob> JobQueue::createJob(const QString& jobId)
{
    QMutexLocker lock(&m_mutex);
    auto existing = m_jobs.value(jobId);
    if (existing && existing->info().running)
        return nullptr;
    auto job = std::make_shared<QueuedJob>(jobId, this);
    job->markRunning();
    m_jobs.insert(jobId, job);
    m_finished.removeAll(jobId);
    return job;
}

QString JobQueue::enqueueImport(const JobParams& params, const QString& jobId)
{
    const QString id = jobId.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : jobId;
    auto job = createJob(id);
    if (!job) {
        qWarning() << "[Jobs] Job" << id << "is already running";
        return QString();
    }

    JobExecutor* executor = m_executor;
    start(id, job, [executor, id, params](IProgressReporter* reporter) {
        return executor->run(id, params, reporter);
    });
    return id;
}

bool JobQueue::enqueueResume(const QString& jobId)
{
    auto job = createJob(jobId);
    if (!job) {
        qWarning() << "[Jobs] Job" << jobId << "is already running";
        return false;
    }

    JobExecutor* executor = m_executor;
    start(jobId, job, [executor, jobId](IProgressReporter* reporter) {
        return executor->resume(jobId, reporter);
    });
    return true;
}

void JobQueue::start(const QString& jobId, std::shared_ptr<QueuedJob> job,
                     std::function<JobOutcome(IProgressReporter*)> work)
{
    qInfo() << "[Jobs] Queued" << jobId;
    (void)QtConcurrent::run(&m_pool, [this, jobId, job, work]() {
        emit jobStarted(jobId);
        JobOutcome outcome = work(job.get());
        job->setOutcome(outcome);
        retireFinished(jobId);
        emit jobFinished(jobId, outcome.succeeded(), outcome.summary);
    });
}

void JobQueue::retireFinished(const QString& jobId)
{
    QMutexLocker lock(&m_mutex);
    m_finished.removeAll(jobId);
    m_finished.append(jobId);
    pruneFinishedLocked();
}

void JobQueue::pruneFinishedLocked()
{
    while (m_finished.size() > m_finishedLimit) {
        const QString id = m_finished.takeFirst();
        auto job = m_jobs.value(id);
        if (job && job->info().running)
            continue;
        m_jobs.remove(id);
        if (ImportStatusRegistry* registry = m_executor->statusRegistry())
            registry->remove(id);
        qDebug() << "[Jobs] Dropped finished job" << id;
    }
}

void JobQueue::setFinishedJobLimit(int limit)
{
    QMutexLocker lock(&m_mutex);
    m_finishedLimit = qMax(0, limit);
    pruneFinishedLocked();
}

int JobQueue::finishedJobLimit() const
{
    QMutexLocker lock(&m_mutex);
    return m_finishedLimit;
}

bool JobQueue::cancel(const QString& jobId)
{
    QMutexLocker lock(&m_mutex);
    auto job = m_jobs.value(jobId);
    if (!job)
        return false;
    job->cancel();
    qInfo() << "[Jobs] Cancel requested for" << jobId;
    return true;
}

std::optional<QueuedJobInfo> JobQueue::jobInfo(const QString& jobId) const
{
    QMutexLocker lock(&m_mutex);
    auto job = m_jobs.value(jobId);
    if (!job)
        return std::nullopt;
    return job->info();
}

QStringList JobQueue::jobIds() const
{
    QMutexLocker lock(&m_mutex);
    return m_jobs.keys();
}

bool JobQueue::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}
