#pragma once

#include <QSqlDatabase>
#include <QRecursiveMutex>
#include <QDateTime>
#include "CatalogTypes.h"

class QSqlQuery;

// Shared database infrastructure passed to all repository classes.
// Holds references to the read/write connections and mutexes
// owned by CatalogDatabase, plus shared helper methods.
struct DatabaseContext {
    QSqlDatabase* writeDb = nullptr;
    QSqlDatabase* readDb = nullptr;
    QRecursiveMutex* writeMutex = nullptr;
    QRecursiveMutex* readMutex = nullptr;

    // Shared helpers
    QString generateId() const;
    CatalogBook bookFromQuery(const QSqlQuery& query) const;
    QString timestampToString(const QDateTime& dt) const;
    QDateTime timestampFromString(const QString& str) const;
};
