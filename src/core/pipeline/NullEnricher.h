#pragma once

#include "Collaborators.h"

// Enricher used when no metadata source is configured. Every lookup fails.
class NullEnricher : public IMetadataEnricher {
public:
    std::optional<CatalogBook> fetchMetadataForRecord(const QString& bookId,
                                                      SyncError* error = nullptr) override
    {
        setError(error, SyncError::Kind::NotFound,
                 QStringLiteral("no metadata source configured (book %1)").arg(bookId));
        return std::nullopt;
    }
};
