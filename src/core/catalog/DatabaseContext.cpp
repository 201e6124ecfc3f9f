#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QUuid>

QString DatabaseContext::generateId() const
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString DatabaseContext::timestampToString(const QDateTime& dt) const
{
    if (!dt.isValid())
        return QString();
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime DatabaseContext::timestampFromString(const QString& str) const
{
    if (str.isEmpty())
        return QDateTime();
    return QDateTime::fromString(str, Qt::ISODateWithMs);
}

CatalogBook DatabaseContext::bookFromQuery(const QSqlQuery& query) const
{
    CatalogBook b;
    b.id                = query.value(QStringLiteral("id")).toString();
    b.title             = query.value(QStringLiteral("title")).toString();
    b.filePath          = query.value(QStringLiteral("file_path")).toString();
    b.originalFilename  = query.value(QStringLiteral("original_filename")).toString();
    b.format            = query.value(QStringLiteral("format")).toString();
    b.duration          = query.value(QStringLiteral("duration")).toInt();
    b.fileSize          = query.value(QStringLiteral("file_size")).toLongLong();
    b.releaseYear       = query.value(QStringLiteral("release_year")).toInt();
    b.narrator          = query.value(QStringLiteral("narrator")).toString();
    b.edition           = query.value(QStringLiteral("edition")).toString();
    b.description       = query.value(QStringLiteral("description")).toString();
    b.authorId          = query.value(QStringLiteral("author_id")).toString();
    b.seriesId          = query.value(QStringLiteral("series_id")).toString();
    b.fileHash          = query.value(QStringLiteral("file_hash")).toString();
    b.originalFileHash  = query.value(QStringLiteral("original_file_hash")).toString();
    b.organizedFileHash = query.value(QStringLiteral("organized_file_hash")).toString();
    b.libraryState      = libraryStateFromString(query.value(QStringLiteral("library_state")).toString())
                              .value_or(LibraryState::Imported);
    b.persistentId      = query.value(QStringLiteral("persistent_id")).toString();
    b.playCount         = query.value(QStringLiteral("play_count")).toInt();
    b.rating            = query.value(QStringLiteral("rating")).toInt();
    b.bookmark          = query.value(QStringLiteral("bookmark")).toLongLong();
    b.lastPlayed        = timestampFromString(query.value(QStringLiteral("last_played")).toString());
    b.dateAdded         = timestampFromString(query.value(QStringLiteral("date_added")).toString());
    b.importSource      = query.value(QStringLiteral("import_source")).toString();
    b.createdAt         = timestampFromString(query.value(QStringLiteral("created_at")).toString());
    b.updatedAt         = timestampFromString(query.value(QStringLiteral("updated_at")).toString());
    return b;
}

// ── LibraryState ────────────────────────────────────────────────────
QString libraryStateToString(LibraryState state)
{
    switch (state) {
    case LibraryState::Imported:  return QStringLiteral("imported");
    case LibraryState::Organized: return QStringLiteral("organized");
    case LibraryState::Deleted:   return QStringLiteral("deleted");
    }
    return QStringLiteral("imported");
}

std::optional<LibraryState> libraryStateFromString(const QString& str)
{
    if (str == QStringLiteral("imported"))  return LibraryState::Imported;
    if (str == QStringLiteral("organized")) return LibraryState::Organized;
    if (str == QStringLiteral("deleted"))   return LibraryState::Deleted;
    return std::nullopt;
}
