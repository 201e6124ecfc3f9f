#pragma once

#include <QString>
#include <optional>

#include "../SyncError.h"
#include "../catalog/CatalogTypes.h"

// Services the import pipeline calls out to. Implementations must be
// safe to call from the job's worker thread.

class IContentHasher {
public:
    virtual ~IContentHasher() = default;
    // Hex digest of the file's contents; IO error when unreadable.
    virtual std::optional<QString> computeFileHash(const QString& path, SyncError* error = nullptr) = 0;
};

class IMetadataEnricher {
public:
    virtual ~IMetadataEnricher() = default;
    // Looks the book up in an external source and returns the updated
    // record. The pipeline persists what comes back.
    virtual std::optional<CatalogBook> fetchMetadataForRecord(const QString& bookId,
                                                              SyncError* error = nullptr) = 0;
};

class IOrganizer {
public:
    virtual ~IOrganizer() = default;
    // Moves/renames the book's files and returns the new path. The
    // pipeline only records the result.
    virtual std::optional<QString> organizeBook(const CatalogBook& book, SyncError* error = nullptr) = 0;
};
