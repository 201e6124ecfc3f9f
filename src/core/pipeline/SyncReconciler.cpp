#include "SyncReconciler.h"
#include "ImportPipeline.h"
#include "../catalog/ICatalogStore.h"
#include "../export/AlbumGrouper.h"
#include "../export/ExportParser.h"
#include "../export/LibraryFingerprint.h"

#include <QFileInfo>
#include <QDebug>

using LogLevel = IProgressReporter::LogLevel;

QString SyncResult::summary() const
{
    if (exportUnchanged)
        return QStringLiteral("Export unchanged since last sync");
    QString s = QStringLiteral("Sync %1: %2 updated, %3 new, %4 unchanged")
                    .arg(canceled ? QStringLiteral("canceled") : QStringLiteral("complete"))
                    .arg(updated).arg(created).arg(unchanged);
    if (skipped > 0)
        s += QStringLiteral(", %1 skipped").arg(skipped);
    if (failed > 0)
        s += QStringLiteral(", %1 failed").arg(failed);
    return s;
}

SyncReconciler::SyncReconciler(ICatalogStore* store, ImportPipeline* pipeline)
    : m_store(store)
    , m_pipeline(pipeline)
{
}

bool SyncReconciler::applyPlayState(CatalogBook& book, const ExportTrack& track)
{
    QDateTime lastPlayed;
    if (track.playDateUtc.isValid())
        lastPlayed = track.playDateUtc;
    else if (track.playDate > 0)
        lastPlayed = QDateTime::fromSecsSinceEpoch(track.playDate, Qt::UTC);

    bool changed = false;
    if (book.playCount != track.playCount) {
        book.playCount = track.playCount;
        changed = true;
    }
    if (book.rating != track.rating) {
        book.rating = track.rating;
        changed = true;
    }
    if (book.bookmark != track.bookmark) {
        book.bookmark = track.bookmark;
        changed = true;
    }
    // Compared at second precision, the export's resolution
    const qint64 stored = book.lastPlayed.isValid() ? book.lastPlayed.toSecsSinceEpoch() : 0;
    const qint64 current = lastPlayed.isValid() ? lastPlayed.toSecsSinceEpoch() : 0;
    if (stored != current) {
        book.lastPlayed = lastPlayed;
        changed = true;
    }
    return changed;
}

std::optional<SyncResult> SyncReconciler::sync(const SyncOptions& options, IProgressReporter* reporter,
                                               SyncError* error)
{
    auto log = [reporter](LogLevel level, const QString& msg) {
        if (reporter)
            reporter->log(level, msg);
    };

    const QString exportPath = QFileInfo(options.exportPath).absoluteFilePath();
    auto current = FingerprintService::compute(exportPath, error);
    if (!current)
        return std::nullopt;

    SyncResult result;
    if (!options.force) {
        auto stored = m_store->libraryFingerprint(exportPath);
        if (stored && stored->matches(*current)) {
            qInfo() << "[Sync] Export unchanged:" << current->describe();
            result.exportUnchanged = true;
            log(LogLevel::Info, result.summary());
            return result;
        }
    }

    auto library = ExportParser::parseFile(exportPath, error);
    if (!library) {
        qWarning() << "[Sync] Failed to parse" << exportPath;
        return std::nullopt;
    }

    const QVector<AlbumGroup> groups = AlbumGrouper::group(library->tracks);
    result.total = groups.size();
    const PipelineOptions& opts = m_pipeline->options();
    log(LogLevel::Info, QStringLiteral("Syncing %1 audiobooks from %2").arg(groups.size()).arg(exportPath));

    for (int i = 0; i < groups.size(); ++i) {
        if (reporter && reporter->isCanceled()) {
            result.canceled = true;
            log(LogLevel::Info, QStringLiteral("Sync canceled at %1 of %2").arg(i).arg(groups.size()));
            break;
        }

        const AlbumGroup& group = groups[i];
        if (group.tracks.isEmpty() || group.first().persistentId.isEmpty()) {
            ++result.skipped;
        } else if (auto existing = m_store->bookByPersistentId(group.first().persistentId)) {
            CatalogBook book = *existing;
            if (applyPlayState(book, group.first())) {
                SyncError storeErr;
                if (m_store->updateBook(book, &storeErr)) {
                    ++result.updated;
                } else {
                    ++result.failed;
                    QString msg = QStringLiteral("Failed to update '%1': %2").arg(book.title, storeErr.message);
                    qWarning() << "[Sync]" << msg;
                    if (result.errors.size() < opts.errorLimit)
                        result.errors.append(msg);
                    log(LogLevel::Warning, msg);
                }
            } else {
                ++result.unchanged;
            }
        } else {
            SyncError err;
            auto candidate = m_pipeline->buildBookFromGroup(group, options.pathMappings, exportPath, &err);
            std::optional<CatalogBook> created;
            if (candidate)
                created = m_pipeline->storeCandidate(*candidate, group, &err);
            if (created) {
                ++result.created;
                log(LogLevel::Info, QStringLiteral("Imported new audiobook '%1'").arg(created->title));
            } else {
                ++result.failed;
                QString msg = QStringLiteral("%1: %2").arg(group.key, err.message);
                qWarning() << "[Sync]" << msg;
                if (result.errors.size() < opts.errorLimit)
                    result.errors.append(msg);
                log(LogLevel::Warning, msg);
            }
        }

        const int processed = i + 1;
        if (reporter && (processed % opts.progressBatch == 0 || processed == groups.size()))
            reporter->updateProgress(processed, groups.size(),
                                     QStringLiteral("Synced %1/%2 audiobooks").arg(processed).arg(groups.size()));
    }

    if (!result.canceled) {
        // Recompute: the export may have been touched while we were reading it
        if (auto fresh = FingerprintService::compute(exportPath))
            m_store->saveLibraryFingerprint(*fresh);
    }

    qInfo() << "[Sync]" << result.summary();
    log(LogLevel::Info, result.summary());
    return result;
}
