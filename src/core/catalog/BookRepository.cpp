#include "BookRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QMutexLocker>

// Column order shared by INSERT and UPDATE (id is bound separately).
static const char* kBookColumns =
    "title, file_path, original_filename, format, duration, file_size, release_year,"
    " narrator, edition, description, author_id, series_id,"
    " file_hash, original_file_hash, organized_file_hash, library_state,"
    " persistent_id, play_count, rating, bookmark, last_played, date_added,"
    " import_source, updated_at";

BookRepository::BookRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

void BookRepository::bindBook(QSqlQuery& q, const CatalogBook& book) const
{
    q.addBindValue(book.title);
    q.addBindValue(book.filePath);
    q.addBindValue(book.originalFilename);
    q.addBindValue(book.format);
    q.addBindValue(book.duration);
    q.addBindValue(book.fileSize);
    q.addBindValue(book.releaseYear);
    q.addBindValue(book.narrator);
    q.addBindValue(book.edition);
    q.addBindValue(book.description);
    q.addBindValue(book.authorId);
    q.addBindValue(book.seriesId);
    q.addBindValue(book.fileHash);
    q.addBindValue(book.originalFileHash);
    q.addBindValue(book.organizedFileHash);
    q.addBindValue(libraryStateToString(book.libraryState));
    q.addBindValue(book.persistentId);
    q.addBindValue(book.playCount);
    q.addBindValue(book.rating);
    q.addBindValue(book.bookmark);
    q.addBindValue(m_ctx->timestampToString(book.lastPlayed));
    q.addBindValue(m_ctx->timestampToString(book.dateAdded));
    q.addBindValue(book.importSource);
    q.addBindValue(m_ctx->timestampToString(QDateTime::currentDateTimeUtc()));
}

// ── Books ───────────────────────────────────────────────────────────
std::optional<CatalogBook> BookRepository::insertBook(const CatalogBook& book, SyncError* error)
{
    QMutexLocker lock(m_ctx->writeMutex);

    CatalogBook stored = book;
    if (stored.id.isEmpty())
        stored.id = m_ctx->generateId();
    stored.createdAt = QDateTime::currentDateTimeUtc();

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("INSERT INTO books (id, created_at, %1) VALUES (?, ?%2)")
                  .arg(QLatin1String(kBookColumns), QStringLiteral(", ?").repeated(24)));
    q.addBindValue(stored.id);
    q.addBindValue(m_ctx->timestampToString(stored.createdAt));
    bindBook(q, stored);

    if (!q.exec()) {
        qWarning() << "BookRepository::insertBook failed:" << q.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to save '%1': %2").arg(book.title, q.lastError().text()));
        return std::nullopt;
    }
    stored.updatedAt = stored.createdAt;
    return stored;
}

bool BookRepository::updateBook(const CatalogBook& book, SyncError* error)
{
    QMutexLocker lock(m_ctx->writeMutex);

    QStringList assignments;
    for (const QString& col : QString::fromLatin1(kBookColumns).split(QLatin1Char(',')))
        assignments.append(col.trimmed() + QStringLiteral(" = ?"));

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("UPDATE books SET %1 WHERE id = ?").arg(assignments.join(QStringLiteral(", "))));
    bindBook(q, book);
    q.addBindValue(book.id);

    if (!q.exec()) {
        qWarning() << "BookRepository::updateBook failed:" << q.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to update '%1': %2").arg(book.title, q.lastError().text()));
        return false;
    }
    if (q.numRowsAffected() == 0) {
        setError(error, SyncError::Kind::NotFound,
                 QStringLiteral("book %1 does not exist").arg(book.id));
        return false;
    }
    return true;
}

std::optional<CatalogBook> BookRepository::bookByColumn(const QString& column, const QString& value) const
{
    if (value.isEmpty())
        return std::nullopt;

    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT * FROM books WHERE %1 = ? ORDER BY rowid LIMIT 1").arg(column));
    q.addBindValue(value);
    if (q.exec() && q.next())
        return m_ctx->bookFromQuery(q);
    if (q.lastError().isValid())
        qWarning() << "BookRepository::bookByColumn" << column << "error:" << q.lastError().text();
    return std::nullopt;
}

std::optional<CatalogBook> BookRepository::bookById(const QString& id) const
{
    return bookByColumn(QStringLiteral("id"), id);
}

std::optional<CatalogBook> BookRepository::bookByFilePath(const QString& filePath) const
{
    return bookByColumn(QStringLiteral("file_path"), filePath);
}

std::optional<CatalogBook> BookRepository::bookByFileHash(const QString& hash) const
{
    return bookByColumn(QStringLiteral("file_hash"), hash);
}

std::optional<CatalogBook> BookRepository::bookByPersistentId(const QString& persistentId) const
{
    return bookByColumn(QStringLiteral("persistent_id"), persistentId);
}

QVector<CatalogBook> BookRepository::booksByImportSource(const QString& importSource,
                                                        LibraryState state) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QVector<CatalogBook> result;
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral(
        "SELECT * FROM books WHERE import_source = ? AND library_state = ? ORDER BY rowid"));
    q.addBindValue(importSource);
    q.addBindValue(libraryStateToString(state));
    if (!q.exec()) {
        qWarning() << "BookRepository::booksByImportSource error:" << q.lastError().text();
        return result;
    }
    while (q.next())
        result.append(m_ctx->bookFromQuery(q));
    return result;
}

int BookRepository::bookCount() const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    if (q.exec(QStringLiteral("SELECT COUNT(*) FROM books")) && q.next())
        return q.value(0).toInt();
    return 0;
}

// ── Segments ────────────────────────────────────────────────────────
bool BookRepository::insertSegment(const BookSegment& segment, SyncError* error)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT INTO book_segments (id, book_id, file_path, format, file_size, duration,"
        " persistent_id, track_number, total_tracks) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    q.addBindValue(segment.id.isEmpty() ? m_ctx->generateId() : segment.id);
    q.addBindValue(segment.bookId);
    q.addBindValue(segment.filePath);
    q.addBindValue(segment.format);
    q.addBindValue(segment.fileSize);
    q.addBindValue(segment.duration);
    q.addBindValue(segment.persistentId);
    q.addBindValue(segment.trackNumber);
    q.addBindValue(segment.totalTracks);

    if (!q.exec()) {
        qWarning() << "BookRepository::insertSegment failed:" << q.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to save segment %1: %2").arg(segment.filePath, q.lastError().text()));
        return false;
    }
    return true;
}

bool BookRepository::updateSegment(const BookSegment& segment, SyncError* error)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "UPDATE book_segments SET file_path = ?, format = ?, file_size = ?, duration = ?,"
        " persistent_id = ?, track_number = ?, total_tracks = ? WHERE id = ?"));
    q.addBindValue(segment.filePath);
    q.addBindValue(segment.format);
    q.addBindValue(segment.fileSize);
    q.addBindValue(segment.duration);
    q.addBindValue(segment.persistentId);
    q.addBindValue(segment.trackNumber);
    q.addBindValue(segment.totalTracks);
    q.addBindValue(segment.id);

    if (!q.exec()) {
        qWarning() << "BookRepository::updateSegment failed:" << q.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to update segment %1: %2").arg(segment.filePath, q.lastError().text()));
        return false;
    }
    if (q.numRowsAffected() == 0) {
        setError(error, SyncError::Kind::NotFound, QStringLiteral("segment not found: %1").arg(segment.id));
        return false;
    }
    return true;
}

BookSegment BookRepository::segmentFromQuery(const QSqlQuery& q)
{
    BookSegment s;
    s.id           = q.value(QStringLiteral("id")).toString();
    s.bookId       = q.value(QStringLiteral("book_id")).toString();
    s.filePath     = q.value(QStringLiteral("file_path")).toString();
    s.format       = q.value(QStringLiteral("format")).toString();
    s.fileSize     = q.value(QStringLiteral("file_size")).toLongLong();
    s.duration     = q.value(QStringLiteral("duration")).toInt();
    s.persistentId = q.value(QStringLiteral("persistent_id")).toString();
    s.trackNumber  = q.value(QStringLiteral("track_number")).toInt();
    s.totalTracks  = q.value(QStringLiteral("total_tracks")).toInt();
    return s;
}

QVector<BookSegment> BookRepository::segmentsForBook(const QString& bookId) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QVector<BookSegment> result;
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT * FROM book_segments WHERE book_id = ? ORDER BY track_number, rowid"));
    q.addBindValue(bookId);
    if (q.exec()) {
        while (q.next())
            result.append(segmentFromQuery(q));
    }
    return result;
}

std::optional<BookSegment> BookRepository::segmentByPersistentId(const QString& persistentId) const
{
    if (persistentId.isEmpty())
        return std::nullopt;

    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT * FROM book_segments WHERE persistent_id = ? LIMIT 1"));
    q.addBindValue(persistentId);
    if (q.exec() && q.next())
        return segmentFromQuery(q);
    return std::nullopt;
}
