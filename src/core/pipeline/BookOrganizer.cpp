#include "BookOrganizer.h"
#include "ImportPipeline.h"
#include "../catalog/ICatalogStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QDebug>

BookOrganizer::BookOrganizer(const OrganizerOptions& options, ICatalogStore* store)
    : m_options(options)
    , m_store(store)
{
}

// ═══════════════════════════════════════════════════════════════════════
//  organizeBook
// ═══════════════════════════════════════════════════════════════════════

std::optional<QString> BookOrganizer::organizeBook(const CatalogBook& book, SyncError* error)
{
    if (m_options.rootDir.isEmpty()) {
        setError(error, SyncError::Kind::Validation, QStringLiteral("organize root directory is not configured"));
        return std::nullopt;
    }

    QFileInfo src(book.filePath);
    if (!src.exists()) {
        setError(error, SyncError::Kind::IO, QStringLiteral("file does not exist: %1").arg(book.filePath));
        return std::nullopt;
    }

    const QStringList tracks = segmentPaths(book);
    QString dest = destinationFor(book);
    if (QFileInfo(dest).absoluteFilePath() == src.absoluteFilePath())
        return book.filePath; // Already in the right place

    if (QFileInfo::exists(dest)) {
        setError(error, SyncError::Kind::Conflict, QStringLiteral("destination already exists: %1").arg(dest));
        return std::nullopt;
    }

    QDir destDir = QFileInfo(dest).absoluteDir();
    if (!destDir.exists() && !destDir.mkpath(QStringLiteral("."))) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to create directory %1").arg(destDir.absolutePath()));
        return std::nullopt;
    }

    // The folder moves whole only when the book was imported as its owner
    // and nothing else has appeared in it since
    if (!tracks.isEmpty()
        && (!src.isDir() || !ImportPipeline::directoryHoldsOnly(src.absoluteFilePath(), tracks)))
        return moveTrackFiles(book, tracks, dest, error);

    bool moved = src.isDir() ? QDir().rename(src.absoluteFilePath(), dest)
                             : QFile::rename(src.absoluteFilePath(), dest);
    if (!moved) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to move %1 to %2").arg(book.filePath, dest));
        return std::nullopt;
    }

    qDebug() << "[Organize] Moved" << book.filePath << "->" << dest;
    return dest;
}

std::optional<QString> BookOrganizer::moveTrackFiles(const CatalogBook& book, const QStringList& files,
                                                     const QString& dest, SyncError* error)
{
    const QString base = ImportPipeline::commonParentDirectory(files);
    QVector<QPair<QString, QString>> done;

    for (const QString& file : files) {
        const QString target = ImportPipeline::rebasePath(file, base, dest);
        QDir targetDir = QFileInfo(target).absoluteDir();
        bool ok = targetDir.exists() || targetDir.mkpath(QStringLiteral("."));
        ok = ok && QFile::rename(file, target);
        if (!ok) {
            // Undo the moves made so far
            for (auto it = done.crbegin(); it != done.crend(); ++it) {
                if (!QFile::rename(it->second, it->first))
                    qWarning() << "[Organize] Could not move" << it->second << "back to" << it->first;
            }
            setError(error, SyncError::Kind::IO,
                     QStringLiteral("failed to move %1 to %2").arg(file, target));
            return std::nullopt;
        }
        done.append({file, target});
    }

    qDebug() << "[Organize] Moved" << files.size() << "tracks of" << book.title << "->" << dest;
    return dest;
}

QStringList BookOrganizer::segmentPaths(const CatalogBook& book) const
{
    QStringList paths;
    if (!m_store || book.id.isEmpty())
        return paths;
    for (const auto& seg : m_store->segmentsForBook(book.id))
        paths.append(seg.filePath);
    return paths;
}

QString BookOrganizer::destinationFor(const CatalogBook& book) const
{
    QString dest = QDir(m_options.rootDir).filePath(applyPattern(book));
    QFileInfo src(book.filePath);
    if (!src.isDir() && !src.suffix().isEmpty() && segmentPaths(book).isEmpty())
        dest += QStringLiteral(".") + src.suffix();
    return dest;
}

// ═══════════════════════════════════════════════════════════════════════
//  applyPattern
// ═══════════════════════════════════════════════════════════════════════

QString BookOrganizer::applyPattern(const CatalogBook& book) const
{
    QString author;
    QString series;
    if (m_store) {
        if (!book.authorId.isEmpty()) {
            if (auto a = m_store->authorById(book.authorId))
                author = a->name;
        }
        if (!book.seriesId.isEmpty()) {
            if (auto s = m_store->seriesById(book.seriesId))
                series = s->name;
        }
    }

    QString title = book.title.isEmpty() ? QFileInfo(book.filePath).completeBaseName() : book.title;

    QString result = m_options.pattern;
    result.replace(QStringLiteral("%author%"),
                   sanitizeFilename(author.isEmpty() ? QStringLiteral("Unknown Author") : author));
    result.replace(QStringLiteral("%title%"), sanitizeFilename(title));
    result.replace(QStringLiteral("%series%"),
                   sanitizeFilename(series.isEmpty() ? QStringLiteral("Standalone") : series));
    result.replace(QStringLiteral("%narrator%"),
                   sanitizeFilename(book.narrator.isEmpty() ? QStringLiteral("Unknown Narrator") : book.narrator));
    result.replace(QStringLiteral("%year%"),
                   book.releaseYear > 0 ? QString::number(book.releaseYear) : QStringLiteral("0000"));
    return result;
}

// ═══════════════════════════════════════════════════════════════════════
//  sanitizeFilename
// ═══════════════════════════════════════════════════════════════════════

QString BookOrganizer::sanitizeFilename(const QString& name)
{
    QString result = name;
    static const QRegularExpression invalidChars(QStringLiteral("[<>:\"/\\\\|?*]"));
    result.replace(invalidChars, QStringLiteral("_"));
    result = result.trimmed();
    while (result.endsWith('.'))
        result.chop(1);
    return result.isEmpty() ? QStringLiteral("_") : result;
}
