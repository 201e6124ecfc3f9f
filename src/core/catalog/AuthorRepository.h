#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include "CatalogTypes.h"
#include "../SyncError.h"

struct DatabaseContext;

// Authors, series and the book ↔ author link table.
class AuthorRepository {
public:
    explicit AuthorRepository(DatabaseContext* ctx);

    std::optional<Author> getOrCreateAuthor(const QString& name, SyncError* error);
    std::optional<Series> getOrCreateSeries(const QString& name, const QString& authorId, SyncError* error);
    std::optional<Author> authorById(const QString& id) const;
    std::optional<Series> seriesById(const QString& id) const;
    bool setBookAuthors(const QString& bookId, const QStringList& authorIds);
    QStringList bookAuthors(const QString& bookId) const;

private:
    DatabaseContext* m_ctx;
};
