#include "OperationStateRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QMutexLocker>

OperationStateRepository::OperationStateRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

// ── Operation params / state ────────────────────────────────────────
bool OperationStateRepository::upsertBlob(const QString& table, const QString& operationId,
                                          const QByteArray& data)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO %1 (operation_id, data, updated_at) VALUES (?, ?, ?)").arg(table));
    q.addBindValue(operationId);
    q.addBindValue(data);
    q.addBindValue(m_ctx->timestampToString(QDateTime::currentDateTimeUtc()));
    if (!q.exec()) {
        qWarning() << "[CatalogDB]" << table << "upsert failed:" << q.lastError().text();
        return false;
    }
    return true;
}

QByteArray OperationStateRepository::blob(const QString& table, const QString& operationId) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT data FROM %1 WHERE operation_id = ?").arg(table));
    q.addBindValue(operationId);
    if (q.exec() && q.next())
        return q.value(0).toByteArray();
    return QByteArray();
}

bool OperationStateRepository::saveParams(const QString& operationId, const QByteArray& data)
{
    return upsertBlob(QStringLiteral("operation_params"), operationId, data);
}

QByteArray OperationStateRepository::params(const QString& operationId) const
{
    return blob(QStringLiteral("operation_params"), operationId);
}

bool OperationStateRepository::saveState(const QString& operationId, const QByteArray& data)
{
    return upsertBlob(QStringLiteral("operation_state"), operationId, data);
}

QByteArray OperationStateRepository::state(const QString& operationId) const
{
    return blob(QStringLiteral("operation_state"), operationId);
}

bool OperationStateRepository::deleteState(const QString& operationId)
{
    QMutexLocker lock(m_ctx->writeMutex);
    bool ok = true;
    for (const QString& table : {QStringLiteral("operation_state"), QStringLiteral("operation_params")}) {
        QSqlQuery q(*m_ctx->writeDb);
        q.prepare(QStringLiteral("DELETE FROM %1 WHERE operation_id = ?").arg(table));
        q.addBindValue(operationId);
        if (!q.exec()) {
            qWarning() << "[CatalogDB] delete from" << table << "failed:" << q.lastError().text();
            ok = false;
        }
    }
    return ok;
}

// ── Fingerprints ────────────────────────────────────────────────────
bool OperationStateRepository::saveFingerprint(const LibraryFingerprint& fp)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO library_fingerprints (path, size, mod_time, checksum, updated_at)"
        " VALUES (?, ?, ?, ?, ?)"));
    q.addBindValue(fp.path);
    q.addBindValue(fp.size);
    q.addBindValue(fp.modTime.toMSecsSinceEpoch());
    q.addBindValue(fp.checksum);
    q.addBindValue(m_ctx->timestampToString(QDateTime::currentDateTimeUtc()));
    if (!q.exec()) {
        qWarning() << "[CatalogDB] saveFingerprint failed:" << q.lastError().text();
        return false;
    }
    return true;
}

std::optional<LibraryFingerprint> OperationStateRepository::fingerprint(const QString& path) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral(
        "SELECT path, size, mod_time, checksum FROM library_fingerprints WHERE path = ?"));
    q.addBindValue(path);
    if (q.exec() && q.next()) {
        LibraryFingerprint fp;
        fp.path     = q.value(0).toString();
        fp.size     = q.value(1).toLongLong();
        fp.modTime  = QDateTime::fromMSecsSinceEpoch(q.value(2).toLongLong(), Qt::UTC);
        fp.checksum = q.value(3).toString();
        return fp;
    }
    return std::nullopt;
}

// ── Do-not-import list ──────────────────────────────────────────────
bool OperationStateRepository::isHashBlocked(const QString& hash) const
{
    if (hash.isEmpty())
        return false;
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT COUNT(*) FROM do_not_import WHERE hash = ?"));
    q.addBindValue(hash);
    if (q.exec() && q.next())
        return q.value(0).toInt() > 0;
    return false;
}

bool OperationStateRepository::blockHash(const QString& hash, const QString& reason)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO do_not_import (hash, reason, created_at) VALUES (?, ?, ?)"));
    q.addBindValue(hash);
    q.addBindValue(reason);
    q.addBindValue(m_ctx->timestampToString(QDateTime::currentDateTimeUtc()));
    if (!q.exec()) {
        qWarning() << "[CatalogDB] blockHash failed:" << q.lastError().text();
        return false;
    }
    return true;
}
