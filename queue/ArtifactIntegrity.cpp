#include "ArtifactIntegrity.hpp"

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>

namespace vrpkg {

static constexpr qint64 kHashChunk = 1024 * 1024;

const char *artifactCheckName(ArtifactCheck c) {
    switch (c) {
    case ArtifactCheck::Valid:
        return "Valid";
    case ArtifactCheck::NotComplete:
        return "NotComplete";
    case ArtifactCheck::Missing:
        return "Missing";
    case ArtifactCheck::SizeMismatch:
        return "SizeMismatch";
    case ArtifactCheck::HashMismatch:
        return "HashMismatch";
    case ArtifactCheck::Unreadable:
        return "Unreadable";
    case ArtifactCheck::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool sha256OfFile(const QString &path, QString &hexOut, QString &err,
                  const CancelCB &shouldCancel) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot open %1: %2").arg(path, f.errorString());
        return false;
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    while (!f.atEnd()) {
        if (shouldCancel && shouldCancel()) {
            err = QStringLiteral("Cancelled");
            return false;
        }
        const QByteArray chunk = f.read(kHashChunk);
        if (chunk.isEmpty() && f.error() != QFileDevice::NoError) {
            err = QStringLiteral("Cannot read %1: %2").arg(path, f.errorString());
            return false;
        }
        hash.addData(chunk);
    }
    hexOut = QString::fromLatin1(hash.result().toHex());
    return true;
}

bool recordArtifact(const QString &path, ArtifactMarker &marker, QString &err,
                    const CancelCB &shouldCancel) {
    const QFileInfo fi(path);
    if (!fi.isFile()) {
        err = QStringLiteral("Artifact missing: %1").arg(path);
        return false;
    }
    QString hex;
    if (!sha256OfFile(path, hex, err, shouldCancel))
        return false;
    marker.path = path;
    marker.size = quint64(fi.size());
    marker.sha256 = hex;
    marker.complete = true;
    return true;
}

ArtifactCheck verifyArtifact(const ArtifactMarker &marker, bool checkHash,
                             const CancelCB &shouldCancel) {
    if (!marker.complete || marker.path.isEmpty())
        return ArtifactCheck::NotComplete;
    const QFileInfo fi(marker.path);
    if (!fi.isFile())
        return ArtifactCheck::Missing;
    if (quint64(fi.size()) != marker.size)
        return ArtifactCheck::SizeMismatch;
    if (!checkHash || marker.sha256.isEmpty())
        return ArtifactCheck::Valid;
    QString hex;
    QString err;
    if (!sha256OfFile(marker.path, hex, err, shouldCancel)) {
        return (shouldCancel && shouldCancel()) ? ArtifactCheck::Cancelled
                                                : ArtifactCheck::Unreadable;
    }
    return hex.compare(marker.sha256, Qt::CaseInsensitive) == 0
               ? ArtifactCheck::Valid
               : ArtifactCheck::HashMismatch;
}

} // namespace vrpkg
