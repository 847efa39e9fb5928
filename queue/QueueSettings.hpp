// Queue configuration read from QSettings and applied through QueueManager
// setters (the manager never polls settings).
#pragma once
#include <QString>

class QSettings;

namespace vrpkg {

struct QueueSettings {
    QString downloadPath;
    QString queueFile;   // persisted queue (INI)
    QString mirrorRoot;  // base for relative catalog locators
    QString devicesRoot; // mounted device storage; empty pushes over adb
    int maxConcurrent = 1;
    int downloadLimitKBps = 0; // 0 = unlimited
    int uploadLimitKBps = 0;
    int stallTimeoutSec = 60;
    QString sevenZipPath = QStringLiteral("7z");
    QString adbPath = QStringLiteral("adb");

    // Defaults live under the application data directory.
    static QueueSettings defaults();
    // Missing keys fall back to defaults(); out-of-range values are clamped.
    static QueueSettings load(QSettings &s);
    void save(QSettings &s) const;

    quint64 downloadLimitBytesPerSec() const {
        return quint64(downloadLimitKBps) * 1024u;
    }
    quint64 uploadLimitBytesPerSec() const {
        return quint64(uploadLimitKBps) * 1024u;
    }
};

} // namespace vrpkg
