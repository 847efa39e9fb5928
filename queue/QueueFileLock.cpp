#include "QueueFileLock.hpp"

#include <QDir>
#include <QFileInfo>

namespace vrpkg {

QueueFileLock::QueueFileLock(const QString &queueFile)
    : fileName_(queueFile + QStringLiteral(".lock")), lock_(fileName_) {
    // A live holder keeps its claim however long it runs.
    lock_.setStaleLockTime(0);
}

bool QueueFileLock::acquire(QString &err, int timeoutMs) {
    if (lock_.isLocked())
        return true;
    if (!QDir().mkpath(QFileInfo(fileName_).absolutePath())) {
        err = QStringLiteral("Cannot create the directory of %1").arg(fileName_);
        return false;
    }
    if (lock_.tryLock(timeoutMs))
        return true;
    switch (lock_.error()) {
    case QLockFile::LockFailedError: {
        qint64 pid = 0;
        QString host;
        QString app;
        if (lock_.getLockInfo(&pid, &host, &app))
            err = QStringLiteral("Queue is in use by %1 (pid %2 on %3)")
                      .arg(app.isEmpty() ? QStringLiteral("another process") : app)
                      .arg(pid)
                      .arg(host.isEmpty() ? QStringLiteral("this host") : host);
        else
            err = QStringLiteral("Queue is in use by another process");
        break;
    }
    case QLockFile::PermissionError:
        err = QStringLiteral("No permission to create %1").arg(fileName_);
        break;
    default:
        err = QStringLiteral("Cannot lock %1").arg(fileName_);
        break;
    }
    return false;
}

} // namespace vrpkg
