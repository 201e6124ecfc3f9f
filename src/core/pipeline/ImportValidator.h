#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "../SyncError.h"
#include "../export/ExportTypes.h"

// Dry run of an import: what would be found on disk.
struct ValidationReport {
    int totalTracks = 0;
    int audiobookTracks = 0;
    int filesFound = 0;
    int filesMissing = 0;
    QStringList missingPaths;   // decoded path, or the raw location when undecodable
    QStringList pathPrefixes;   // candidates for path mappings
    QString estimatedTime;
};

class ImportValidator {
public:
    static std::optional<ValidationReport> validate(const QString& exportPath,
                                                    const QVector<PathMapping>& mappings,
                                                    SyncError* error = nullptr);

    // Roughly one second per book: "42 seconds", "3 minutes", "2 hours 5 minutes".
    static QString formatEstimate(int seconds);
};
