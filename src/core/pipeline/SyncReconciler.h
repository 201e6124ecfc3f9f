#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "../SyncError.h"
#include "../export/ExportTypes.h"
#include "../jobs/IProgressReporter.h"

class ICatalogStore;
class ImportPipeline;
struct CatalogBook;
struct ExportTrack;

struct SyncOptions {
    QString exportPath;
    QVector<PathMapping> pathMappings;
    bool force = false;   // ignore an unchanged fingerprint
};

struct SyncResult {
    bool exportUnchanged = false;   // short-circuited on the stored fingerprint
    bool canceled = false;
    int total = 0;
    int updated = 0;
    int created = 0;
    int unchanged = 0;
    int skipped = 0;
    int failed = 0;
    QStringList errors;

    QString summary() const;
};

// Re-reads the export and mirrors play state onto books that already
// carry the entry's persistent id; unknown ids are imported as new books.
class SyncReconciler {
public:
    SyncReconciler(ICatalogStore* store, ImportPipeline* pipeline);

    // nullopt only for a fatal error (unreadable or malformed export).
    std::optional<SyncResult> sync(const SyncOptions& options, IProgressReporter* reporter = nullptr,
                                   SyncError* error = nullptr);

    // Copies play count, rating, bookmark and last-played from track onto
    // book. Returns false when nothing differed.
    static bool applyPlayState(CatalogBook& book, const ExportTrack& track);

private:
    ICatalogStore* m_store;
    ImportPipeline* m_pipeline;
};
