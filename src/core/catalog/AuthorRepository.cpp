#include "AuthorRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QMutexLocker>

AuthorRepository::AuthorRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

// ── Authors ─────────────────────────────────────────────────────────
// Name match is exact (BINARY collation), so "tolkien" and "Tolkien"
// are different authors.
std::optional<Author> AuthorRepository::getOrCreateAuthor(const QString& name, SyncError* error)
{
    if (name.isEmpty()) {
        setError(error, SyncError::Kind::Validation, QStringLiteral("author name is empty"));
        return std::nullopt;
    }

    QMutexLocker lock(m_ctx->writeMutex);

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("SELECT id, name FROM authors WHERE name = ?"));
    q.addBindValue(name);
    if (q.exec() && q.next())
        return Author{q.value(0).toString(), q.value(1).toString()};

    Author author{m_ctx->generateId(), name};
    QSqlQuery ins(*m_ctx->writeDb);
    ins.prepare(QStringLiteral("INSERT INTO authors (id, name) VALUES (?, ?)"));
    ins.addBindValue(author.id);
    ins.addBindValue(author.name);
    if (!ins.exec()) {
        qWarning() << "[CatalogDB] getOrCreateAuthor INSERT failed:" << ins.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to create author '%1': %2").arg(name, ins.lastError().text()));
        return std::nullopt;
    }
    return author;
}

// ── Series ──────────────────────────────────────────────────────────
std::optional<Series> AuthorRepository::getOrCreateSeries(const QString& name, const QString& authorId,
                                                          SyncError* error)
{
    if (name.isEmpty()) {
        setError(error, SyncError::Kind::Validation, QStringLiteral("series name is empty"));
        return std::nullopt;
    }

    QMutexLocker lock(m_ctx->writeMutex);

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("SELECT id, name, author_id FROM series WHERE name = ? AND author_id = ?"));
    q.addBindValue(name);
    q.addBindValue(authorId);
    if (q.exec() && q.next())
        return Series{q.value(0).toString(), q.value(1).toString(), q.value(2).toString()};

    Series series{m_ctx->generateId(), name, authorId};
    QSqlQuery ins(*m_ctx->writeDb);
    ins.prepare(QStringLiteral("INSERT INTO series (id, name, author_id) VALUES (?, ?, ?)"));
    ins.addBindValue(series.id);
    ins.addBindValue(series.name);
    ins.addBindValue(series.authorId);
    if (!ins.exec()) {
        qWarning() << "[CatalogDB] getOrCreateSeries INSERT failed:" << ins.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("failed to create series '%1': %2").arg(name, ins.lastError().text()));
        return std::nullopt;
    }
    return series;
}

std::optional<Author> AuthorRepository::authorById(const QString& id) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT id, name FROM authors WHERE id = ?"));
    q.addBindValue(id);
    if (q.exec() && q.next())
        return Author{q.value(0).toString(), q.value(1).toString()};
    return std::nullopt;
}

std::optional<Series> AuthorRepository::seriesById(const QString& id) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT id, name, author_id FROM series WHERE id = ?"));
    q.addBindValue(id);
    if (q.exec() && q.next())
        return Series{q.value(0).toString(), q.value(1).toString(), q.value(2).toString()};
    return std::nullopt;
}

// ── Book ↔ author links ─────────────────────────────────────────────
bool AuthorRepository::setBookAuthors(const QString& bookId, const QStringList& authorIds)
{
    QMutexLocker lock(m_ctx->writeMutex);
    m_ctx->writeDb->transaction();

    QSqlQuery del(*m_ctx->writeDb);
    del.prepare(QStringLiteral("DELETE FROM book_authors WHERE book_id = ?"));
    del.addBindValue(bookId);
    if (!del.exec()) {
        qWarning() << "[CatalogDB] setBookAuthors DELETE failed:" << del.lastError().text();
        m_ctx->writeDb->rollback();
        return false;
    }

    int position = 0;
    for (const QString& authorId : authorIds) {
        QSqlQuery ins(*m_ctx->writeDb);
        ins.prepare(QStringLiteral(
            "INSERT OR IGNORE INTO book_authors (book_id, author_id, position) VALUES (?, ?, ?)"));
        ins.addBindValue(bookId);
        ins.addBindValue(authorId);
        ins.addBindValue(position++);
        if (!ins.exec()) {
            qWarning() << "[CatalogDB] setBookAuthors INSERT failed:" << ins.lastError().text();
            m_ctx->writeDb->rollback();
            return false;
        }
    }
    return m_ctx->writeDb->commit();
}

QStringList AuthorRepository::bookAuthors(const QString& bookId) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QStringList ids;
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT author_id FROM book_authors WHERE book_id = ? ORDER BY position"));
    q.addBindValue(bookId);
    if (q.exec()) {
        while (q.next())
            ids.append(q.value(0).toString());
    }
    return ids;
}
