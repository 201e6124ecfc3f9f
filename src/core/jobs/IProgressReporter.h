#pragma once

#include <QString>
#include <QVariantMap>

// Per-job sink for log lines, progress and cooperative cancellation.
class IProgressReporter {
public:
    enum class LogLevel { Debug, Info, Warning, Error };

    virtual ~IProgressReporter() = default;

    virtual void log(LogLevel level, const QString& message,
                     const QVariantMap& detail = QVariantMap()) = 0;
    virtual void updateProgress(int current, int total, const QString& message) = 0;
    virtual bool isCanceled() const = 0;

    static QString levelName(LogLevel level)
    {
        switch (level) {
        case LogLevel::Debug:   return QStringLiteral("debug");
        case LogLevel::Info:    return QStringLiteral("info");
        case LogLevel::Warning: return QStringLiteral("warn");
        case LogLevel::Error:   return QStringLiteral("error");
        }
        return QStringLiteral("info");
    }
};
