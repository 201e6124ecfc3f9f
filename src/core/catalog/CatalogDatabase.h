#pragma once

#include <QObject>
#include <QSqlDatabase>
#include <QRecursiveMutex>
#include <QString>

#include "ICatalogStore.h"
#include "DatabaseContext.h"
#include "BookRepository.h"
#include "AuthorRepository.h"
#include "OperationStateRepository.h"

// SQLite-backed catalog. One write connection and one read-only connection
// in WAL mode, each guarded by its own mutex; every repository shares them
// through DatabaseContext.
class CatalogDatabase : public QObject, public ICatalogStore {
    Q_OBJECT

public:
    explicit CatalogDatabase(const QString& dbPath, QObject* parent = nullptr);
    ~CatalogDatabase() override;

    bool open(SyncError* error = nullptr);
    void close();
    bool isOpen() const;
    QString path() const { return m_dbPath; }

    // ── Books ────────────────────────────────────────────────────────
    std::optional<CatalogBook> createBook(const CatalogBook& book, SyncError* error = nullptr) override;
    bool updateBook(const CatalogBook& book, SyncError* error = nullptr) override;
    std::optional<CatalogBook> bookById(const QString& id) const override;
    std::optional<CatalogBook> bookByFilePath(const QString& filePath) const override;
    std::optional<CatalogBook> bookByFileHash(const QString& hash) const override;
    std::optional<CatalogBook> bookByPersistentId(const QString& persistentId) const override;
    QVector<CatalogBook> booksByImportSource(const QString& importSource,
                                             LibraryState state) const override;
    int bookCount() const override;

    // ── Segments ─────────────────────────────────────────────────────
    bool createSegment(const BookSegment& segment, SyncError* error = nullptr) override;
    bool updateSegment(const BookSegment& segment, SyncError* error = nullptr) override;
    QVector<BookSegment> segmentsForBook(const QString& bookId) const override;
    std::optional<BookSegment> segmentByPersistentId(const QString& persistentId) const override;

    // ── Authors / series ─────────────────────────────────────────────
    std::optional<Author> getOrCreateAuthorByName(const QString& name, SyncError* error = nullptr) override;
    std::optional<Series> getOrCreateSeriesByName(const QString& name, const QString& authorId,
                                                  SyncError* error = nullptr) override;
    std::optional<Author> authorById(const QString& id) const override;
    std::optional<Series> seriesById(const QString& id) const override;
    bool setBookAuthors(const QString& bookId, const QStringList& authorIds) override;
    QStringList bookAuthors(const QString& bookId) const override;

    // ── Do-not-import list ───────────────────────────────────────────
    bool isHashBlocked(const QString& hash) const override;
    bool blockHash(const QString& hash, const QString& reason) override;

    // ── Export fingerprints ──────────────────────────────────────────
    bool saveLibraryFingerprint(const LibraryFingerprint& fingerprint) override;
    std::optional<LibraryFingerprint> libraryFingerprint(const QString& path) const override;

    // ── Operation rows ───────────────────────────────────────────────
    bool saveOperationParams(const QString& operationId, const QByteArray& data) override;
    QByteArray operationParams(const QString& operationId) const override;
    bool saveOperationState(const QString& operationId, const QByteArray& data) override;
    QByteArray operationState(const QString& operationId) const override;
    bool deleteOperationState(const QString& operationId) override;

signals:
    void databaseChanged();

private:
    bool createTables();
    void migrateSchema();
    void createIndexes();

    QSqlDatabase m_db;        // write connection
    QSqlDatabase m_readDb;    // read connection
    QString m_dbPath;
    QString m_writeName;
    QString m_readName;
    mutable QRecursiveMutex m_writeMutex;
    mutable QRecursiveMutex m_readMutex;

    DatabaseContext m_ctx;
    BookRepository* m_bookRepo = nullptr;
    AuthorRepository* m_authorRepo = nullptr;
    OperationStateRepository* m_stateRepo = nullptr;
};
