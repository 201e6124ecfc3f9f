#pragma once

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "IProgressReporter.h"
#include "JobExecutor.h"

class JobQueue;

// Latest known state of a queued job.
struct QueuedJobInfo {
    QString jobId;
    int current = 0;
    int total = 0;
    QString message;
    bool running = false;
    bool cancelRequested = false;
    std::optional<JobOutcome> outcome;

    int percent() const { return progressPercent(current, total); }
};

// Reporter handed to the executor for one job. Records progress, forwards
// it to the queue's signals and carries the cancel flag.
class QueuedJob : public IProgressReporter {
public:
    QueuedJob(const QString& jobId, JobQueue* queue);

    void log(LogLevel level, const QString& message, const QVariantMap& detail = QVariantMap()) override;
    void updateProgress(int current, int total, const QString& message) override;
    bool isCanceled() const override { return m_canceled.load(); }

    void cancel() { m_canceled.store(true); }
    void markRunning();
    void setOutcome(const JobOutcome& outcome);
    QueuedJobInfo info() const;

private:
    JobQueue* m_queue;
    std::atomic<bool> m_canceled{false};
    mutable QMutex m_mutex;
    QueuedJobInfo m_info;
};

// Runs import jobs concurrently on a private thread pool. Jobs share the
// catalog store and rely on its locking.
class JobQueue : public QObject {
    Q_OBJECT

public:
    explicit JobQueue(JobExecutor* executor, int maxConcurrent = 2, QObject* parent = nullptr);
    ~JobQueue() override;

    // Returns the job id (generated when jobId is empty).
    QString enqueueImport(const JobParams& params, const QString& jobId = QString());
    // False when the job is already running.
    bool enqueueResume(const QString& jobId);

    // Cooperative: the job stops at its next unit boundary.
    bool cancel(const QString& jobId);

    std::optional<QueuedJobInfo> jobInfo(const QString& jobId) const;
    QStringList jobIds() const;
    bool waitForDone(int msecs = -1);

    // Finished jobs kept for jobInfo(); older ones are dropped together
    // with their import status.
    void setFinishedJobLimit(int limit);
    int finishedJobLimit() const;

signals:
    void jobStarted(const QString& jobId);
    void jobProgress(const QString& jobId, int current, int total, const QString& message);
    void jobLog(const QString& jobId, const QString& level, const QString& message);
    void jobFinished(const QString& jobId, bool succeeded, const QString& summary);

private:
    friend class QueuedJob;

    std::shared_ptr<QueuedJob> createJob(const QString& jobId);
    void start(const QString& jobId, std::shared_ptr<QueuedJob> job,
               std::function<JobOutcome(IProgressReporter*)> work);
    void retireFinished(const QString& jobId);
    void pruneFinishedLocked();

    JobExecutor* m_executor;
    QThreadPool m_pool;
    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<QueuedJob>> m_jobs;
    QStringList m_finished;     // oldest first
    int m_finishedLimit = 32;
};
