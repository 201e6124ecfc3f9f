#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>
#include <optional>

#include "Collaborators.h"
#include "PipelineOptions.h"
#include "../SyncError.h"
#include "../export/AlbumGrouper.h"
#include "../export/ExportTypes.h"
#include "../jobs/JobContext.h"

class ICatalogStore;
class CheckpointStore;

// A book assembled from one album group, before it is stored.
struct BookCandidate {
    CatalogBook book;
    QString firstFilePath;        // resolved file of the authoritative track
    QVector<QString> trackPaths;  // parallel to group.tracks, empty when unresolvable
    QVector<qint64> trackDurationsMs;
    QVector<qint64> trackSizes;
};

// Turns album groups into catalog books and runs the optional enrich and
// organize passes. Each phase iterates sequentially so checkpoint indices
// stay meaningful.
class ImportPipeline {
public:
    enum class GroupResult { Imported, Skipped, Failed };

    ImportPipeline(ICatalogStore* store, CheckpointStore* checkpoints, IContentHasher* hasher,
                   IMetadataEnricher* enricher, IOrganizer* organizer,
                   const PipelineOptions& options = PipelineOptions());

    // ── Phases (return false when canceled) ──────────────────────────
    bool runImportPhase(const JobContext& ctx, const ExportLibrary& library,
                        const QVector<AlbumGroup>& groups, int startIndex);
    bool runEnrichPhase(const JobContext& ctx, int startIndex);
    bool runOrganizePhase(const JobContext& ctx, int startIndex);

    GroupResult importGroup(const JobContext& ctx, const ExportLibrary& library, const AlbumGroup& group);

    // ── Building blocks shared with SyncReconciler ───────────────────
    std::optional<BookCandidate> buildBookFromGroup(const AlbumGroup& group,
                                                    const QVector<PathMapping>& mappings,
                                                    const QString& importSource,
                                                    SyncError* error = nullptr) const;
    void linkAuthorAndSeries(CatalogBook& book, const ExportTrack& track);
    // Creates the book, its segments (multi-track only) and the author link.
    std::optional<CatalogBook> storeCandidate(const BookCandidate& candidate, const AlbumGroup& group,
                                              SyncError* error = nullptr);

    static QString extractSeriesName(const QString& album);
    static QString commonParentDirectory(const QStringList& filePaths);
    // True when every file under dir (hidden files aside) is one of filePaths.
    static bool directoryHoldsOnly(const QString& dir, const QStringList& filePaths);
    // path relocated from oldBase to newBase, keeping its relative part.
    static QString rebasePath(const QString& path, const QString& oldBase, const QString& newBase);

    const PipelineOptions& options() const { return m_options; }
    void setSleepFunction(std::function<void(int)> sleep) { m_sleep = std::move(sleep); }

private:
    QString relocateSegments(const JobContext& ctx, const CatalogBook& book, const QString& newDir);
    void reportProgress(const JobContext& ctx, int current, int total, const QString& message) const;

    ICatalogStore* m_store;
    CheckpointStore* m_checkpoints;
    IContentHasher* m_hasher;
    IMetadataEnricher* m_enricher;
    IOrganizer* m_organizer;
    PipelineOptions m_options;
    std::function<void(int)> m_sleep;
};
