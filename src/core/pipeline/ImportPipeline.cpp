#include "ImportPipeline.h"
#include "MediaProbe.h"
#include "../catalog/ICatalogStore.h"
#include "../export/ExportParser.h"
#include "../export/LocationCodec.h"
#include "../jobs/CheckpointStore.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QThread>
#include <QDebug>

using LogLevel = IProgressReporter::LogLevel;

ImportPipeline::ImportPipeline(ICatalogStore* store, CheckpointStore* checkpoints, IContentHasher* hasher,
                               IMetadataEnricher* enricher, IOrganizer* organizer,
                               const PipelineOptions& options)
    : m_store(store)
    , m_checkpoints(checkpoints)
    , m_hasher(hasher)
    , m_enricher(enricher)
    , m_organizer(organizer)
    , m_options(options)
    , m_sleep([](int ms) { QThread::msleep(static_cast<unsigned long>(ms)); })
{
    m_options.progressBatch = qMax(1, m_options.progressBatch);
    m_options.checkpointBatch = qMax(1, m_options.checkpointBatch);
    m_options.failureRunLimit = qMax(1, m_options.failureRunLimit);
    m_options.successBatch = qMax(1, m_options.successBatch);
}

void ImportPipeline::reportProgress(const JobContext& ctx, int current, int total, const QString& message) const
{
    // Batched; the last unit of a phase always reports
    if (current % m_options.progressBatch == 0 || current == total)
        ctx.progress(current, total, message);
}

// ═══════════════════════════════════════════════════════════════════════
//  Import phase
// ═══════════════════════════════════════════════════════════════════════

bool ImportPipeline::runImportPhase(const JobContext& ctx, const ExportLibrary& library,
                                    const QVector<AlbumGroup>& groups, int startIndex)
{
    const int total = groups.size();
    const int start = qBound(0, startIndex, total);
    if (startIndex > total)
        qWarning() << "[Import] Checkpoint index" << startIndex << "beyond" << total << "groups, clamping";

    ctx.status->setTotal(total);
    ctx.status->setProcessed(start);

    if (start > 0) {
        qInfo() << "[Import] Resuming job" << ctx.jobId << "at group" << start << "of" << total;
        ctx.log(LogLevel::Info, QStringLiteral("Resuming import at group %1 of %2").arg(start).arg(total));
    } else {
        ctx.log(LogLevel::Info, QStringLiteral("Found %1 audiobooks to import").arg(total));
    }

    for (int i = start; i < total; ++i) {
        if (ctx.isCanceled()) {
            qInfo() << "[Import] Job" << ctx.jobId << "canceled at group" << i << "of" << total;
            ctx.log(LogLevel::Info, QStringLiteral("Import canceled at group %1 of %2").arg(i).arg(total));
            return false;
        }

        importGroup(ctx, library, groups[i]);

        const int processed = i + 1;
        ctx.status->setProcessed(processed);
        if (processed % m_options.checkpointBatch == 0)
            m_checkpoints->saveCheckpoint(ctx.jobId, JobPhase::Importing, processed, total);
        reportProgress(ctx, processed, total,
                       QStringLiteral("Processed %1/%2 audiobooks").arg(processed).arg(total));
    }
    return true;
}

ImportPipeline::GroupResult ImportPipeline::importGroup(const JobContext& ctx, const ExportLibrary& library,
                                                        const AlbumGroup& group)
{
    SyncError err;
    auto candidate = buildBookFromGroup(group, ctx.params.pathMappings, ctx.params.exportPath, &err);
    if (!candidate) {
        QString msg = QStringLiteral("%1: %2").arg(group.key, err.message);
        qWarning() << "[Import]" << msg;
        ctx.status->recordFailure(msg);
        ctx.log(LogLevel::Error, msg, {{QStringLiteral("group"), group.key},
                                       {QStringLiteral("kind"), err.kindName()}});
        return GroupResult::Failed;
    }

    CatalogBook& book = candidate->book;

    // Hash the first member file, not the book directory
    SyncError hashErr;
    auto hash = m_hasher->computeFileHash(candidate->firstFilePath, &hashErr);
    if (!hash) {
        ctx.log(LogLevel::Warning, QStringLiteral("Failed to hash %1: %2")
                                       .arg(candidate->firstFilePath, hashErr.message));
    } else {
        book.fileHash = *hash;
        book.originalFileHash = *hash;
        if (ctx.params.importMode == ImportMode::Organized)
            book.organizedFileHash = *hash;

        if (m_store->isHashBlocked(*hash)) {
            ctx.status->incrementSkipped();
            ctx.log(LogLevel::Warning, QStringLiteral("Skipping blocked hash for %1").arg(book.title));
            return GroupResult::Skipped;
        }
    }

    if (ctx.params.skipDuplicates) {
        if (m_store->bookByFilePath(book.filePath)) {
            ctx.status->incrementSkipped();
            ctx.log(LogLevel::Info, QStringLiteral("Skipping duplicate file path: %1").arg(book.filePath));
            return GroupResult::Skipped;
        }
        if (hash && m_store->bookByFileHash(*hash)) {
            ctx.status->incrementSkipped();
            ctx.log(LogLevel::Info, QStringLiteral("Skipping duplicate hash: %1").arg(book.title));
            return GroupResult::Skipped;
        }
    }

    book.libraryState = ctx.params.importMode == ImportMode::Organized
        ? LibraryState::Organized : LibraryState::Imported;

    auto created = storeCandidate(*candidate, group, &err);
    if (!created) {
        QString msg = QStringLiteral("Failed to save '%1': %2").arg(book.title, err.message);
        qWarning() << "[Import]" << msg;
        ctx.status->recordFailure(msg);
        ctx.log(LogLevel::Error, msg);
        return GroupResult::Failed;
    }

    ctx.status->incrementImported();
    qDebug() << "[Import] Created" << created->title << "(" << group.tracks.size() << "tracks )";

    if (ctx.params.importPlaylists) {
        QStringList tags;
        for (const auto& track : group.tracks) {
            for (const QString& tag : ExportParser::playlistTags(track.trackId, library.playlists)) {
                if (!tags.contains(tag))
                    tags.append(tag);
            }
        }
        if (!tags.isEmpty()) {
            ctx.log(LogLevel::Info,
                    QStringLiteral("Playlist tags for '%1': %2").arg(created->title, tags.join(QStringLiteral(", "))),
                    {{QStringLiteral("bookId"), created->id}, {QStringLiteral("tags"), tags}});
        }
    }
    return GroupResult::Imported;
}

// ═══════════════════════════════════════════════════════════════════════
//  Book construction
// ═══════════════════════════════════════════════════════════════════════

std::optional<BookCandidate> ImportPipeline::buildBookFromGroup(const AlbumGroup& group,
                                                                const QVector<PathMapping>& mappings,
                                                                const QString& importSource,
                                                                SyncError* error) const
{
    if (group.tracks.isEmpty()) {
        setError(error, SyncError::Kind::Validation, QStringLiteral("group has no tracks"));
        return std::nullopt;
    }

    const ExportTrack& first = group.first();
    SyncError decodeErr;
    auto firstPath = LocationCodec::resolve(first.location, mappings, &decodeErr);
    if (!firstPath) {
        setError(error, SyncError::Kind::Decode,
                 QStringLiteral("failed to decode location: %1").arg(decodeErr.message));
        return std::nullopt;
    }

    QFileInfo info(*firstPath);
    if (!info.isFile()) {
        setError(error, SyncError::Kind::IO, QStringLiteral("file does not exist: %1").arg(*firstPath));
        return std::nullopt;
    }

    BookCandidate c;
    c.firstFilePath = *firstPath;

    qint64 totalMs = 0;
    qint64 totalSize = 0;
    QStringList resolved;
    for (int i = 0; i < group.tracks.size(); ++i) {
        const ExportTrack& track = group.tracks[i];
        QString path = i == 0 ? *firstPath
                              : LocationCodec::resolve(track.location, mappings).value_or(QString());
        if (!path.isEmpty())
            resolved.append(path);

        qint64 ms = track.totalTime;
        if (ms <= 0 && !path.isEmpty())
            ms = MediaProbe::durationMs(path).value_or(0);

        qint64 size = track.size;
        if (size <= 0 && !path.isEmpty())
            size = QFileInfo(path).size();

        c.trackPaths.append(path);
        c.trackDurationsMs.append(ms);
        c.trackSizes.append(size);
        totalMs += ms;
        totalSize += size;
    }

    CatalogBook& b = c.book;
    // A multi-track book owns its folder only when nothing else lives there;
    // in a shared folder it is addressed by its first track.
    b.filePath = *firstPath;
    if (group.isMultiTrack()) {
        const QString dir = commonParentDirectory(resolved);
        if (directoryHoldsOnly(dir, resolved))
            b.filePath = dir;
    }
    b.originalFilename = info.fileName();
    b.format = info.suffix().toLower();

    QString title = group.isMultiTrack() ? first.album.trimmed() : first.name.trimmed();
    if (title.isEmpty())
        title = first.name.trimmed();
    if (title.isEmpty())
        title = info.completeBaseName();
    b.title = title;

    b.duration = static_cast<int>(totalMs / 1000);
    b.fileSize = totalSize;
    b.releaseYear = first.year > 0 ? first.year : 0;
    b.persistentId = first.persistentId;
    b.playCount = first.playCount;
    b.rating = first.rating;
    b.bookmark = first.bookmark;
    b.dateAdded = first.dateAdded;
    if (first.playDateUtc.isValid())
        b.lastPlayed = first.playDateUtc;
    else if (first.playDate > 0)
        b.lastPlayed = QDateTime::fromSecsSinceEpoch(first.playDate, Qt::UTC);
    if (!first.albumArtist.isEmpty() && first.albumArtist != first.artist)
        b.narrator = first.albumArtist;
    if (!first.comments.isEmpty())
        b.edition = first.comments;
    b.importSource = importSource;
    return c;
}

void ImportPipeline::linkAuthorAndSeries(CatalogBook& book, const ExportTrack& track)
{
    QString artist = track.artist.trimmed();
    if (!artist.isEmpty()) {
        SyncError err;
        if (auto author = m_store->getOrCreateAuthorByName(artist, &err))
            book.authorId = author->id;
        else
            qWarning() << "[Import] Author" << artist << "not linked:" << err.message;
    }

    QString seriesName = extractSeriesName(track.album);
    if (!seriesName.isEmpty()) {
        SyncError err;
        if (auto series = m_store->getOrCreateSeriesByName(seriesName, book.authorId, &err))
            book.seriesId = series->id;
        else
            qWarning() << "[Import] Series" << seriesName << "not linked:" << err.message;
    }
}

std::optional<CatalogBook> ImportPipeline::storeCandidate(const BookCandidate& candidate, const AlbumGroup& group,
                                                          SyncError* error)
{
    CatalogBook book = candidate.book;
    linkAuthorAndSeries(book, group.first());

    auto created = m_store->createBook(book, error);
    if (!created)
        return std::nullopt;

    if (!created->authorId.isEmpty() && !m_store->setBookAuthors(created->id, {created->authorId}))
        qWarning() << "[Import] Failed to link author for" << created->title;

    if (group.isMultiTrack()) {
        const int totalTracks = group.tracks.size();
        for (int i = 0; i < totalTracks; ++i) {
            const QString& path = candidate.trackPaths.value(i);
            if (path.isEmpty()) {
                qWarning() << "[Import] No segment for unresolvable track" << group.tracks[i].name;
                continue;
            }
            BookSegment seg;
            seg.bookId = created->id;
            seg.filePath = path;
            seg.persistentId = group.tracks[i].persistentId;
            seg.format = QFileInfo(path).suffix().toLower();
            seg.fileSize = candidate.trackSizes.value(i);
            seg.duration = static_cast<int>(candidate.trackDurationsMs.value(i) / 1000);
            seg.trackNumber = group.tracks[i].trackNumber > 0 ? group.tracks[i].trackNumber : i + 1;
            seg.totalTracks = totalTracks;

            SyncError segErr;
            if (!m_store->createSegment(seg, &segErr))
                qWarning() << "[Import] Segment" << path << "not stored:" << segErr.message;
        }
    }
    return created;
}

// "Series, Book 1" / "Series - Book 1" / "Series: Book 1" → "Series";
// anything else is taken whole.
QString ImportPipeline::extractSeriesName(const QString& album)
{
    if (album.isEmpty())
        return QString();

    for (QChar sep : {QChar(','), QChar('-'), QChar(':')}) {
        const QStringList parts = album.split(sep);
        if (parts.size() == 2)
            return parts.first().trimmed();
    }
    return album.trimmed();
}

QString ImportPipeline::commonParentDirectory(const QStringList& filePaths)
{
    if (filePaths.isEmpty())
        return QString();

    QStringList common = QFileInfo(filePaths.first()).absolutePath().split('/');
    for (int i = 1; i < filePaths.size(); ++i) {
        const QStringList parts = QFileInfo(filePaths[i]).absolutePath().split('/');
        int n = 0;
        while (n < common.size() && n < parts.size() && common[n] == parts[n])
            ++n;
        common = common.mid(0, n);
    }

    QString dir = common.join('/');
    return dir.isEmpty() ? QStringLiteral("/") : dir;
}

bool ImportPipeline::directoryHoldsOnly(const QString& dir, const QStringList& filePaths)
{
    if (!QFileInfo(dir).isDir())
        return false;

    QSet<QString> members;
    for (const QString& path : filePaths)
        members.insert(QFileInfo(path).absoluteFilePath());

    QDirIterator it(dir, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (!members.contains(QFileInfo(it.next()).absoluteFilePath()))
            return false;
    }
    return true;
}

QString ImportPipeline::rebasePath(const QString& path, const QString& oldBase, const QString& newBase)
{
    return QDir(newBase).filePath(QDir(oldBase).relativeFilePath(path));
}

// ═══════════════════════════════════════════════════════════════════════
//  Enrichment phase
// ═══════════════════════════════════════════════════════════════════════

bool ImportPipeline::runEnrichPhase(const JobContext& ctx, int startIndex)
{
    if (!m_enricher) {
        ctx.log(LogLevel::Warning, QStringLiteral("No metadata enricher configured, skipping enrichment"));
        return true;
    }

    const QVector<CatalogBook> candidates =
        m_store->booksByImportSource(ctx.params.exportPath, LibraryState::Imported);
    const int total = candidates.size();
    const int start = qBound(0, startIndex, total);
    ctx.log(LogLevel::Info, QStringLiteral("Enriching metadata for %1 books").arg(total - start));

    int failureRun = 0;
    int enriched = 0;
    int failures = 0;
    for (int i = start; i < total; ++i) {
        if (ctx.isCanceled()) {
            ctx.log(LogLevel::Info, QStringLiteral("Enrichment canceled at %1 of %2").arg(i).arg(total));
            return false;
        }

        const CatalogBook& book = candidates[i];
        SyncError err;
        auto updated = m_enricher->fetchMetadataForRecord(book.id, &err);
        if (updated) {
            if (updated->id.isEmpty())
                updated->id = book.id;
            SyncError storeErr;
            if (!m_store->updateBook(*updated, &storeErr))
                ctx.log(LogLevel::Warning, QStringLiteral("Failed to store metadata for '%1': %2")
                                               .arg(book.title, storeErr.message));
            failureRun = 0;
            ++enriched;
            if (enriched % m_options.successBatch == 0 && m_options.successPauseMs > 0) {
                qDebug() << "[Import] Pausing" << m_options.successPauseMs << "ms after" << enriched << "lookups";
                m_sleep(m_options.successPauseMs);
            }
        } else {
            ++failures;
            ++failureRun;
            ctx.log(LogLevel::Warning, QStringLiteral("Metadata lookup failed for '%1': %2")
                                           .arg(book.title, err.message));
            if (failureRun >= m_options.failureRunLimit) {
                ctx.log(LogLevel::Warning, QStringLiteral("%1 consecutive lookup failures, backing off %2 ms")
                                               .arg(failureRun).arg(m_options.failureBackoffMs));
                if (m_options.failureBackoffMs > 0)
                    m_sleep(m_options.failureBackoffMs);
                failureRun = 0;
            }
        }

        const int processed = i + 1;
        if (processed % m_options.checkpointBatch == 0)
            m_checkpoints->saveCheckpoint(ctx.jobId, JobPhase::Enriching, processed, total);
        reportProgress(ctx, processed, total,
                       QStringLiteral("Enriched %1/%2 books").arg(processed).arg(total));
    }

    ctx.log(LogLevel::Info, QStringLiteral("Enrichment finished: %1 enriched, %2 failed").arg(enriched).arg(failures));
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  Organize phase
// ═══════════════════════════════════════════════════════════════════════

bool ImportPipeline::runOrganizePhase(const JobContext& ctx, int startIndex)
{
    if (!m_organizer) {
        ctx.log(LogLevel::Warning, QStringLiteral("No organizer configured, skipping organize"));
        return true;
    }

    // Organized books leave the candidate set, so startIndex only offsets progress
    const QVector<CatalogBook> candidates =
        m_store->booksByImportSource(ctx.params.exportPath, LibraryState::Imported);
    const int offset = qMax(0, startIndex);
    const int total = offset + candidates.size();
    ctx.log(LogLevel::Info, QStringLiteral("Organizing %1 books").arg(candidates.size()));

    for (int i = 0; i < candidates.size(); ++i) {
        if (ctx.isCanceled()) {
            ctx.log(LogLevel::Info, QStringLiteral("Organize canceled at %1 of %2").arg(offset + i).arg(total));
            return false;
        }

        CatalogBook book = candidates[i];
        SyncError err;
        auto newPath = m_organizer->organizeBook(book, &err);
        if (!newPath) {
            QString msg = QStringLiteral("Failed to organize '%1': %2").arg(book.title, err.message);
            ctx.status->recordFailure(msg);
            ctx.log(LogLevel::Warning, msg);
        } else {
            if (*newPath != book.filePath) {
                const QString firstFile = relocateSegments(ctx, book, *newPath);
                book.filePath = *newPath;
                const QString hashTarget = firstFile.isEmpty() ? *newPath : firstFile;
                if (QFileInfo(hashTarget).isFile()) {
                    if (auto hash = m_hasher->computeFileHash(hashTarget))
                        book.organizedFileHash = *hash;
                }
                ctx.log(LogLevel::Info, QStringLiteral("Organized '%1' to %2").arg(book.title, *newPath));
            }
            book.libraryState = LibraryState::Organized;
            SyncError storeErr;
            if (!m_store->updateBook(book, &storeErr))
                ctx.log(LogLevel::Warning, QStringLiteral("Failed to update organized path for '%1': %2")
                                               .arg(book.title, storeErr.message));
        }

        const int processed = offset + i + 1;
        if (processed % m_options.checkpointBatch == 0)
            m_checkpoints->saveCheckpoint(ctx.jobId, JobPhase::Organizing, processed, total);
        reportProgress(ctx, processed, total,
                       QStringLiteral("Organized %1/%2 books").arg(processed).arg(total));
    }
    return true;
}

// Multi-track books move into newDir with their files' layout relative to
// the common parent kept. Returns the first segment's new path, or an
// empty string for single-file books.
QString ImportPipeline::relocateSegments(const JobContext& ctx, const CatalogBook& book, const QString& newDir)
{
    QVector<BookSegment> segments = m_store->segmentsForBook(book.id);
    if (segments.isEmpty())
        return QString();

    QStringList paths;
    for (const auto& seg : segments)
        paths.append(seg.filePath);
    const QString base = commonParentDirectory(paths);

    for (auto& seg : segments) {
        seg.filePath = rebasePath(seg.filePath, base, newDir);
        SyncError err;
        if (!m_store->updateSegment(seg, &err))
            ctx.log(LogLevel::Warning, QStringLiteral("Failed to update segment path for '%1': %2")
                                           .arg(book.title, err.message));
    }
    return segments.first().filePath;
}
