#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "CatalogTypes.h"
#include "../SyncError.h"
#include "../export/LibraryFingerprint.h"

// Persistent catalog the pipeline reads and writes. CatalogDatabase is
// the SQLite implementation; tests may substitute their own.
//
// Implementations do their own locking; the pipeline never holds a lock
// across calls.
class ICatalogStore {
public:
    virtual ~ICatalogStore() = default;

    // ── Books ────────────────────────────────────────────────────
    // Returns the stored book with its id assigned.
    virtual std::optional<CatalogBook> createBook(const CatalogBook& book, SyncError* error = nullptr) = 0;
    virtual bool updateBook(const CatalogBook& book, SyncError* error = nullptr) = 0;
    virtual std::optional<CatalogBook> bookById(const QString& id) const = 0;
    virtual std::optional<CatalogBook> bookByFilePath(const QString& filePath) const = 0;
    virtual std::optional<CatalogBook> bookByFileHash(const QString& hash) const = 0;
    virtual std::optional<CatalogBook> bookByPersistentId(const QString& persistentId) const = 0;
    virtual QVector<CatalogBook> booksByImportSource(const QString& importSource,
                                                     LibraryState state) const = 0;
    virtual int bookCount() const = 0;

    // ── Segments ─────────────────────────────────────────────────
    virtual bool createSegment(const BookSegment& segment, SyncError* error = nullptr) = 0;
    virtual bool updateSegment(const BookSegment& segment, SyncError* error = nullptr) = 0;
    virtual QVector<BookSegment> segmentsForBook(const QString& bookId) const = 0;
    virtual std::optional<BookSegment> segmentByPersistentId(const QString& persistentId) const = 0;

    // ── Authors / series (exact, case-sensitive name match) ──────
    virtual std::optional<Author> getOrCreateAuthorByName(const QString& name, SyncError* error = nullptr) = 0;
    virtual std::optional<Series> getOrCreateSeriesByName(const QString& name, const QString& authorId,
                                                          SyncError* error = nullptr) = 0;
    virtual std::optional<Author> authorById(const QString& id) const = 0;
    virtual std::optional<Series> seriesById(const QString& id) const = 0;
    virtual bool setBookAuthors(const QString& bookId, const QStringList& authorIds) = 0;
    virtual QStringList bookAuthors(const QString& bookId) const = 0;

    // ── Do-not-import list ───────────────────────────────────────
    virtual bool isHashBlocked(const QString& hash) const = 0;
    virtual bool blockHash(const QString& hash, const QString& reason) = 0;

    // ── Export fingerprints (keyed by absolute export path) ──────
    virtual bool saveLibraryFingerprint(const LibraryFingerprint& fingerprint) = 0;
    virtual std::optional<LibraryFingerprint> libraryFingerprint(const QString& path) const = 0;

    // ── Operation params / checkpoint rows (opaque JSON) ─────────
    virtual bool saveOperationParams(const QString& operationId, const QByteArray& data) = 0;
    virtual QByteArray operationParams(const QString& operationId) const = 0;
    virtual bool saveOperationState(const QString& operationId, const QByteArray& data) = 0;
    virtual QByteArray operationState(const QString& operationId) const = 0;
    virtual bool deleteOperationState(const QString& operationId) = 0;
};
