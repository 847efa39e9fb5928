// Integrity markers for phase outputs: the size and SHA-256 of an archive are
// recorded when its download completes and checked before the archive is
// reused by a retry.
#pragma once
#include "Job.hpp"
#include "vrpkg/TransferTypes.hpp"

namespace vrpkg {

enum class ArtifactCheck {
    Valid,
    NotComplete, // the phase that writes it never finished
    Missing,
    SizeMismatch,
    HashMismatch,
    Unreadable,
    Cancelled
};

const char *artifactCheckName(ArtifactCheck c);

// Hex SHA-256 of a file, read in chunks; polls shouldCancel between chunks.
bool sha256OfFile(const QString &path, QString &hexOut, QString &err,
                  const CancelCB &shouldCancel = {});

// Fills marker (path, size, sha256, complete=true) from the file on disk.
bool recordArtifact(const QString &path, ArtifactMarker &marker, QString &err,
                    const CancelCB &shouldCancel = {});

// Size-only check is cheap enough for startup; the hash check reads the file.
ArtifactCheck verifyArtifact(const ArtifactMarker &marker, bool checkHash,
                             const CancelCB &shouldCancel = {});

} // namespace vrpkg
