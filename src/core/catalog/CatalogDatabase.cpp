#include "CatalogDatabase.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDir>
#include <QFileInfo>
#include <QUuid>
#include <QDebug>
#include <QMutexLocker>

CatalogDatabase::CatalogDatabase(const QString& dbPath, QObject* parent)
    : QObject(parent)
    , m_dbPath(dbPath)
{
    // Connection names are per instance so several catalogs can be open at once
    const QString suffix = QUuid::createUuid().toString(QUuid::Id128);
    m_writeName = QStringLiteral("catalog_write_") + suffix;
    m_readName  = QStringLiteral("catalog_read_") + suffix;

    m_ctx.writeDb = &m_db;
    m_ctx.readDb = &m_readDb;
    m_ctx.writeMutex = &m_writeMutex;
    m_ctx.readMutex = &m_readMutex;

    m_bookRepo = new BookRepository(&m_ctx);
    m_authorRepo = new AuthorRepository(&m_ctx);
    m_stateRepo = new OperationStateRepository(&m_ctx);
}

CatalogDatabase::~CatalogDatabase()
{
    close();
    delete m_bookRepo;
    delete m_authorRepo;
    delete m_stateRepo;
}

// ── open / close ────────────────────────────────────────────────────
bool CatalogDatabase::open(SyncError* error)
{
    QMutexLocker lock(&m_writeMutex);
    if (m_db.isOpen()) return true;

    QDir().mkpath(QFileInfo(m_dbPath).absolutePath());

    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_writeName);
    m_db.setDatabaseName(m_dbPath);
    if (!m_db.open()) {
        qWarning() << "[CatalogDB] Failed to open write connection:" << m_db.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("cannot open catalog %1: %2").arg(m_dbPath, m_db.lastError().text()));
        return false;
    }

    QSqlQuery pragma(m_db);
    if (pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")) && pragma.next()) {
        QString mode = pragma.value(0).toString().toLower();
        if (mode != QStringLiteral("wal"))
            qWarning() << "[CatalogDB] WAL mode not activated, got:" << mode;
    }
    pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));
    pragma.exec(QStringLiteral("PRAGMA foreign_keys=ON"));
    pragma.exec(QStringLiteral("PRAGMA temp_store=MEMORY"));

    if (!createTables()) {
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("cannot create catalog schema in %1").arg(m_dbPath));
        m_db.close();
        return false;
    }
    migrateSchema();
    createIndexes();

    // Read connection opened after the schema exists so query_only is safe
    QMutexLocker readLock(&m_readMutex);
    m_readDb = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_readName);
    m_readDb.setDatabaseName(m_dbPath);
    if (!m_readDb.open()) {
        qWarning() << "[CatalogDB] Failed to open read connection:" << m_readDb.lastError().text();
        setError(error, SyncError::Kind::Store,
                 QStringLiteral("cannot open catalog %1: %2").arg(m_dbPath, m_readDb.lastError().text()));
        m_db.close();
        return false;
    }
    QSqlQuery readPragma(m_readDb);
    readPragma.exec(QStringLiteral("PRAGMA journal_mode=WAL"));
    readPragma.exec(QStringLiteral("PRAGMA temp_store=MEMORY"));
    readPragma.exec(QStringLiteral("PRAGMA query_only=ON"));

    qDebug() << "[CatalogDB] Opened at" << m_dbPath;
    return true;
}

void CatalogDatabase::close()
{
    bool readWasOpen = false, writeWasOpen = false;
    {
        QMutexLocker lock(&m_readMutex);
        if (m_readDb.isOpen()) {
            m_readDb.close();
            readWasOpen = true;
        }
        m_readDb = QSqlDatabase();
    }
    {
        QMutexLocker lock(&m_writeMutex);
        if (m_db.isOpen()) {
            m_db.close();
            writeWasOpen = true;
        }
        m_db = QSqlDatabase();
    }
    if (readWasOpen)
        QSqlDatabase::removeDatabase(m_readName);
    if (writeWasOpen)
        QSqlDatabase::removeDatabase(m_writeName);
}

bool CatalogDatabase::isOpen() const
{
    QMutexLocker lock(&m_writeMutex);
    return m_db.isOpen();
}

// ── createTables ────────────────────────────────────────────────────
bool CatalogDatabase::createTables()
{
    const QStringList statements = {
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS books ("
            "  id TEXT PRIMARY KEY,"
            "  title TEXT NOT NULL,"
            "  file_path TEXT,"
            "  original_filename TEXT,"
            "  format TEXT,"
            "  duration INTEGER DEFAULT 0,"
            "  file_size INTEGER DEFAULT 0,"
            "  release_year INTEGER DEFAULT 0,"
            "  narrator TEXT,"
            "  edition TEXT,"
            "  description TEXT,"
            "  author_id TEXT,"
            "  series_id TEXT,"
            "  file_hash TEXT,"
            "  original_file_hash TEXT,"
            "  organized_file_hash TEXT,"
            "  library_state TEXT DEFAULT 'imported',"
            "  persistent_id TEXT,"
            "  play_count INTEGER DEFAULT 0,"
            "  rating INTEGER DEFAULT 0,"
            "  bookmark INTEGER DEFAULT 0,"
            "  last_played TEXT,"
            "  date_added TEXT,"
            "  import_source TEXT,"
            "  created_at TEXT,"
            "  updated_at TEXT"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS book_segments ("
            "  id TEXT PRIMARY KEY,"
            "  book_id TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,"
            "  file_path TEXT,"
            "  format TEXT,"
            "  file_size INTEGER DEFAULT 0,"
            "  duration INTEGER DEFAULT 0,"
            "  persistent_id TEXT,"
            "  track_number INTEGER DEFAULT 0,"
            "  total_tracks INTEGER DEFAULT 0"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS authors ("
            "  id TEXT PRIMARY KEY,"
            "  name TEXT NOT NULL UNIQUE"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS series ("
            "  id TEXT PRIMARY KEY,"
            "  name TEXT NOT NULL,"
            "  author_id TEXT NOT NULL DEFAULT '',"
            "  UNIQUE(name, author_id)"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS book_authors ("
            "  book_id TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,"
            "  author_id TEXT NOT NULL REFERENCES authors(id) ON DELETE CASCADE,"
            "  position INTEGER DEFAULT 0,"
            "  PRIMARY KEY (book_id, author_id)"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS do_not_import ("
            "  hash TEXT PRIMARY KEY,"
            "  reason TEXT,"
            "  created_at TEXT"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS library_fingerprints ("
            "  path TEXT PRIMARY KEY,"
            "  size INTEGER DEFAULT 0,"
            "  mod_time INTEGER DEFAULT 0,"
            "  checksum TEXT,"
            "  updated_at TEXT"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS operation_params ("
            "  operation_id TEXT PRIMARY KEY,"
            "  data BLOB,"
            "  updated_at TEXT"
            ")"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS operation_state ("
            "  operation_id TEXT PRIMARY KEY,"
            "  data BLOB,"
            "  updated_at TEXT"
            ")"),
    };

    QSqlQuery q(m_db);
    for (const QString& sql : statements) {
        if (!q.exec(sql)) {
            qWarning() << "[CatalogDB] createTables failed:" << q.lastError().text();
            return false;
        }
    }
    return true;
}

// Columns added after the first release; catalogs created before them
// get them here.
void CatalogDatabase::migrateSchema()
{
    QSqlQuery pragma(m_db);
    pragma.exec(QStringLiteral("PRAGMA table_info(book_segments)"));
    QStringList segmentColumns;
    while (pragma.next())
        segmentColumns.append(pragma.value(1).toString());

    if (!segmentColumns.contains(QStringLiteral("persistent_id"))) {
        QSqlQuery alter(m_db);
        if (alter.exec(QStringLiteral("ALTER TABLE book_segments ADD COLUMN persistent_id TEXT")))
            qDebug() << "[CatalogDB] Migration: added book_segments.persistent_id";
        else
            qWarning() << "[CatalogDB] Migration of book_segments failed:" << alter.lastError().text();
    }
}

void CatalogDatabase::createIndexes()
{
    QSqlQuery q(m_db);
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_books_file_path ON books(file_path)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_books_file_hash ON books(file_hash)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_books_persistent_id ON books(persistent_id)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_books_import_source ON books(import_source, library_state)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_segments_book ON book_segments(book_id)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_segments_persistent_id ON book_segments(persistent_id)"));
}

// ── Books (delegated to BookRepository) ─────────────────────────────
std::optional<CatalogBook> CatalogDatabase::createBook(const CatalogBook& book, SyncError* error)
{
    auto stored = m_bookRepo->insertBook(book, error);
    if (stored)
        emit databaseChanged();
    return stored;
}

bool CatalogDatabase::updateBook(const CatalogBook& book, SyncError* error)
{
    bool ok = m_bookRepo->updateBook(book, error);
    if (ok)
        emit databaseChanged();
    return ok;
}

std::optional<CatalogBook> CatalogDatabase::bookById(const QString& id) const
{
    return m_bookRepo->bookById(id);
}

std::optional<CatalogBook> CatalogDatabase::bookByFilePath(const QString& filePath) const
{
    return m_bookRepo->bookByFilePath(filePath);
}

std::optional<CatalogBook> CatalogDatabase::bookByFileHash(const QString& hash) const
{
    return m_bookRepo->bookByFileHash(hash);
}

std::optional<CatalogBook> CatalogDatabase::bookByPersistentId(const QString& persistentId) const
{
    return m_bookRepo->bookByPersistentId(persistentId);
}

QVector<CatalogBook> CatalogDatabase::booksByImportSource(const QString& importSource,
                                                          LibraryState state) const
{
    return m_bookRepo->booksByImportSource(importSource, state);
}

int CatalogDatabase::bookCount() const
{
    return m_bookRepo->bookCount();
}

bool CatalogDatabase::createSegment(const BookSegment& segment, SyncError* error)
{
    return m_bookRepo->insertSegment(segment, error);
}

bool CatalogDatabase::updateSegment(const BookSegment& segment, SyncError* error)
{
    bool ok = m_bookRepo->updateSegment(segment, error);
    if (ok)
        emit databaseChanged();
    return ok;
}

QVector<BookSegment> CatalogDatabase::segmentsForBook(const QString& bookId) const
{
    return m_bookRepo->segmentsForBook(bookId);
}

std::optional<BookSegment> CatalogDatabase::segmentByPersistentId(const QString& persistentId) const
{
    return m_bookRepo->segmentByPersistentId(persistentId);
}

// ── Authors / series (delegated to AuthorRepository) ────────────────
std::optional<Author> CatalogDatabase::getOrCreateAuthorByName(const QString& name, SyncError* error)
{
    return m_authorRepo->getOrCreateAuthor(name, error);
}

std::optional<Series> CatalogDatabase::getOrCreateSeriesByName(const QString& name,
                                                               const QString& authorId,
                                                               SyncError* error)
{
    return m_authorRepo->getOrCreateSeries(name, authorId, error);
}

std::optional<Author> CatalogDatabase::authorById(const QString& id) const
{
    return m_authorRepo->authorById(id);
}

std::optional<Series> CatalogDatabase::seriesById(const QString& id) const
{
    return m_authorRepo->seriesById(id);
}

bool CatalogDatabase::setBookAuthors(const QString& bookId, const QStringList& authorIds)
{
    return m_authorRepo->setBookAuthors(bookId, authorIds);
}

QStringList CatalogDatabase::bookAuthors(const QString& bookId) const
{
    return m_authorRepo->bookAuthors(bookId);
}

// ── State tables (delegated to OperationStateRepository) ────────────
bool CatalogDatabase::isHashBlocked(const QString& hash) const
{
    return m_stateRepo->isHashBlocked(hash);
}

bool CatalogDatabase::blockHash(const QString& hash, const QString& reason)
{
    return m_stateRepo->blockHash(hash, reason);
}

bool CatalogDatabase::saveLibraryFingerprint(const LibraryFingerprint& fingerprint)
{
    return m_stateRepo->saveFingerprint(fingerprint);
}

std::optional<LibraryFingerprint> CatalogDatabase::libraryFingerprint(const QString& path) const
{
    return m_stateRepo->fingerprint(path);
}

bool CatalogDatabase::saveOperationParams(const QString& operationId, const QByteArray& data)
{
    return m_stateRepo->saveParams(operationId, data);
}

QByteArray CatalogDatabase::operationParams(const QString& operationId) const
{
    return m_stateRepo->params(operationId);
}

bool CatalogDatabase::saveOperationState(const QString& operationId, const QByteArray& data)
{
    return m_stateRepo->saveState(operationId, data);
}

QByteArray CatalogDatabase::operationState(const QString& operationId) const
{
    return m_stateRepo->state(operationId);
}

bool CatalogDatabase::deleteOperationState(const QString& operationId)
{
    return m_stateRepo->deleteState(operationId);
}
