#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "WriteBackTypes.h"

class ICatalogStore;

// Rewrites Location values in the export for entries whose persistent id
// has a new path. Everything else in the file stays byte-identical; a
// result that does not re-parse is rolled back from memory.
//
// Callers serialize write-backs per export path.
class WriteBackEngine {
public:
    // Returns false (and fills error) when the rewritten export is unusable.
    using Validator = std::function<bool(const QString& exportPath, SyncError* error)>;

    explicit WriteBackEngine(ICatalogStore* store);

    WriteBackResult writeBack(const WriteBackOptions& options);

    // Dry run: persistent ids absent from the export or the catalog, and
    // target paths that are missing on disk or are directories.
    QStringList validateWriteBack(const WriteBackOptions& options) const;

    // Builds updates from catalog books: one per segment for multi-track
    // books, one per book otherwise. Entries without a persistent id are dropped.
    QVector<WriteBackUpdate> updatesForBooks(const QStringList& bookIds) const;

    void setValidator(Validator validator) { m_validator = std::move(validator); }

    // Replaces the Location string of each track dict whose Persistent ID
    // is a key of locations. replaced receives the number of edits and
    // matched the persistent ids that were rewritten.
    static QByteArray rewriteLocations(const QByteArray& xml, const QHash<QString, QString>& locations,
                                       int* replaced = nullptr, QSet<QString>* matched = nullptr);

    static QString defaultBackupPath(const QString& exportPath);

private:
    // Local path an update writes: its newPath, else the catalog path of
    // the segment or book carrying the persistent id. nullopt when the id
    // is unknown to the catalog.
    std::optional<QString> pathForUpdate(const WriteBackUpdate& update) const;
    static bool writeBytes(const QString& path, const QByteArray& data, SyncError* error);
    static void restoreOriginal(const QString& path, const QByteArray& data, const QDateTime& modified);

    ICatalogStore* m_store;
    Validator m_validator;
};
