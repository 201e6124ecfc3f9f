#pragma once

#include <QString>
#include <memory>

#include "JobTypes.h"
#include "ImportStatus.h"
#include "IProgressReporter.h"

// Everything one job run needs, passed explicitly down the call chain.
struct JobContext {
    QString jobId;
    JobParams params;
    std::shared_ptr<ImportStatus> status;
    IProgressReporter* reporter = nullptr;

    bool isCanceled() const { return reporter && reporter->isCanceled(); }

    void log(IProgressReporter::LogLevel level, const QString& message,
             const QVariantMap& detail = QVariantMap()) const
    {
        if (reporter)
            reporter->log(level, message, detail);
    }

    void progress(int current, int total, const QString& message) const
    {
        if (reporter)
            reporter->updateProgress(current, total, message);
    }
};
