#pragma once

#include <QVector>
#include <QString>
#include <optional>
#include "CatalogTypes.h"
#include "../SyncError.h"

struct DatabaseContext;
class QSqlQuery;

class BookRepository {
public:
    explicit BookRepository(DatabaseContext* ctx);

    std::optional<CatalogBook> insertBook(const CatalogBook& book, SyncError* error);
    bool updateBook(const CatalogBook& book, SyncError* error);
    std::optional<CatalogBook> bookById(const QString& id) const;
    std::optional<CatalogBook> bookByFilePath(const QString& filePath) const;
    std::optional<CatalogBook> bookByFileHash(const QString& hash) const;
    std::optional<CatalogBook> bookByPersistentId(const QString& persistentId) const;
    QVector<CatalogBook> booksByImportSource(const QString& importSource, LibraryState state) const;
    int bookCount() const;

    bool insertSegment(const BookSegment& segment, SyncError* error);
    bool updateSegment(const BookSegment& segment, SyncError* error);
    QVector<BookSegment> segmentsForBook(const QString& bookId) const;
    std::optional<BookSegment> segmentByPersistentId(const QString& persistentId) const;

private:
    std::optional<CatalogBook> bookByColumn(const QString& column, const QString& value) const;
    void bindBook(QSqlQuery& q, const CatalogBook& book) const;
    static BookSegment segmentFromQuery(const QSqlQuery& q);

    DatabaseContext* m_ctx;
};
