#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "../SyncError.h"
#include "../export/ExportTypes.h"
#include "../export/LibraryFingerprint.h"

// New local path for the export entry carrying persistentId.
struct WriteBackUpdate {
    QString persistentId;
    QString newPath;
};

struct WriteBackOptions {
    QString exportPath;
    QVector<WriteBackUpdate> updates;
    QVector<PathMapping> pathMappings;   // applied in reverse before writing
    bool createBackup = true;
    bool forceOverwrite = false;         // skip the fingerprint check
    QString backupPath;                  // default <export>.backup.<yyyyMMdd-HHmmss>
};

struct WriteBackResult {
    bool success = false;
    int updatedCount = 0;
    QStringList unmatchedIds;   // persistent ids with no track dict in the export
    QString backupPath;
    std::optional<FingerprintConflict> conflict;   // set with error.kind == Conflict
    SyncError error;

    QString message() const;
};
