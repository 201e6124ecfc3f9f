#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

#include "../SyncError.h"

// current*100/total clamped to [0, 100]; 0 when total is not positive.
int progressPercent(int current, int total);

// Deep copy handed to status readers.
struct ImportStatusSnapshot {
    int total = 0;
    int processed = 0;
    int imported = 0;
    int skipped = 0;
    int failed = 0;
    QStringList errors;

    int percent() const { return progressPercent(processed, total); }
    QString summary() const;
};

// Counters for one running job. Writers and readers share m_mutex;
// readers only ever see a snapshot.
class ImportStatus {
public:
    explicit ImportStatus(int errorLimit = 50);

    void setTotal(int total);
    void setProcessed(int processed);
    void incrementImported();
    void incrementSkipped();

    // Counts a failure; the message is kept while fewer than errorLimit are stored.
    void recordFailure(const QString& message);
    // Keeps a message without touching the failure counter (job-level errors).
    void recordError(const QString& message);

    ImportStatusSnapshot snapshot() const;

private:
    void appendErrorLocked(const QString& message);

    mutable QMutex m_mutex;
    ImportStatusSnapshot m_data;
    int m_errorLimit;
};

// Status objects keyed by job id, owned by whoever runs the jobs and
// injected into the executor.
class ImportStatusRegistry {
public:
    // Returns the existing status for jobId, or creates one.
    std::shared_ptr<ImportStatus> acquire(const QString& jobId, int errorLimit = 50);
    std::shared_ptr<ImportStatus> find(const QString& jobId) const;
    std::optional<ImportStatusSnapshot> snapshot(const QString& jobId, SyncError* error = nullptr) const;
    void remove(const QString& jobId);
    QStringList jobIds() const;

private:
    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<ImportStatus>> m_statuses;
};
