#pragma once

#include "Collaborators.h"

// SHA-256 over the whole file, read in chunks.
class ContentHasher : public IContentHasher {
public:
    std::optional<QString> computeFileHash(const QString& path, SyncError* error = nullptr) override;
};
