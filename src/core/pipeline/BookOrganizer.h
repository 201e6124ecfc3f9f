#pragma once

#include <QString>

#include "Collaborators.h"
#include "PipelineOptions.h"

class ICatalogStore;

// Moves a book into the organized tree.
// Pattern tokens: %author%, %title%, %series%, %narrator%, %year%
// Default: "%author%/%title%"
//
// Single-file books become <root>/<pattern>.<ext>; multi-track books go
// to the directory <root>/<pattern>. A book that owns its folder moves it
// as a whole; one that shares a folder with other books moves only its
// own files, keeping their paths relative to their common parent.
class BookOrganizer : public IOrganizer {
public:
    BookOrganizer(const OrganizerOptions& options, ICatalogStore* store);

    std::optional<QString> organizeBook(const CatalogBook& book, SyncError* error = nullptr) override;

    // Target path for book without touching the file system.
    QString destinationFor(const CatalogBook& book) const;

private:
    QStringList segmentPaths(const CatalogBook& book) const;
    std::optional<QString> moveTrackFiles(const CatalogBook& book, const QStringList& files,
                                          const QString& dest, SyncError* error);
    QString applyPattern(const CatalogBook& book) const;
    static QString sanitizeFilename(const QString& name);

    OrganizerOptions m_options;
    ICatalogStore* m_store;
};
