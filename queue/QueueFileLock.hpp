// Exclusive claim on a persisted queue file, held by the process that
// restores and runs that queue. Restoring a queue another process is running
// would reconcile its live jobs and delete their partial downloads.
#pragma once
#include <QLockFile>
#include <QString>

namespace vrpkg {

class QueueFileLock {
public:
    // Lock file is "<queueFile>.lock".
    explicit QueueFileLock(const QString &queueFile);

    // Waits up to timeoutMs (0 = try once). A lock left by a process that
    // died is taken over. err names the holder when the lock is busy.
    bool acquire(QString &err, int timeoutMs = 0);
    bool isHeld() const { return lock_.isLocked(); }
    QString fileName() const { return fileName_; }

private:
    QString fileName_;
    QLockFile lock_;
};

} // namespace vrpkg
