#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "../SyncError.h"

// Snapshot of the export file used to detect changes between a sync
// and a later write-back.
struct LibraryFingerprint {
    QString   path;
    qint64    size = 0;
    QDateTime modTime;
    QString   checksum;   // hex MD5 of the file contents

    // size + mtime; the checksum is compared only when strong is set.
    bool matches(const LibraryFingerprint& other, bool strong = false) const;
    QString describe() const;
};

// Stored vs. current fingerprint when a write-back finds the export
// changed behind its back.
struct FingerprintConflict {
    LibraryFingerprint stored;
    LibraryFingerprint current;

    QString message() const;
};

class FingerprintService {
public:
    static std::optional<LibraryFingerprint> compute(const QString& path, SyncError* error = nullptr);
};
