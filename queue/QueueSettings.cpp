#include "QueueSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace vrpkg {

static constexpr int kMaxConcurrentCap = 16;
static constexpr int kMaxStallSec = 24 * 3600;

QueueSettings QueueSettings::defaults() {
    QueueSettings d;
    QString base =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.vrpkg");
    d.downloadPath = base + QStringLiteral("/downloads");
    d.queueFile = base + QStringLiteral("/download-queue.ini");
    // devicesRoot stays empty: OBB data goes to the device over adb.
    return d;
}

QueueSettings QueueSettings::load(QSettings &s) {
    const QueueSettings d = defaults();
    QueueSettings out = d;
    out.downloadPath =
        s.value("Transfers/downloadPath", d.downloadPath).toString().trimmed();
    if (out.downloadPath.isEmpty())
        out.downloadPath = d.downloadPath;
    out.queueFile = s.value("Transfers/queueFile", d.queueFile).toString();
    if (out.queueFile.trimmed().isEmpty())
        out.queueFile = d.queueFile;
    out.mirrorRoot = s.value("Transfers/mirrorRoot").toString();
    out.devicesRoot = s.value("Transfers/devicesRoot", d.devicesRoot).toString();
    out.maxConcurrent = qBound(
        1, s.value("Transfers/maxConcurrent", d.maxConcurrent).toInt(),
        kMaxConcurrentCap);
    out.downloadLimitKBps =
        qMax(0, s.value("Transfers/downloadLimitKBps", 0).toInt());
    out.uploadLimitKBps =
        qMax(0, s.value("Transfers/uploadLimitKBps", 0).toInt());
    out.stallTimeoutSec = qBound(
        0, s.value("Transfers/stallTimeoutSec", d.stallTimeoutSec).toInt(),
        kMaxStallSec);
    const QString sevenZip = s.value("Tools/sevenZip").toString().trimmed();
    if (!sevenZip.isEmpty())
        out.sevenZipPath = sevenZip;
    const QString adb = s.value("Tools/adb").toString().trimmed();
    if (!adb.isEmpty())
        out.adbPath = adb;
    return out;
}

void QueueSettings::save(QSettings &s) const {
    s.setValue("Transfers/downloadPath", downloadPath);
    s.setValue("Transfers/queueFile", queueFile);
    s.setValue("Transfers/mirrorRoot", mirrorRoot);
    s.setValue("Transfers/devicesRoot", devicesRoot);
    s.setValue("Transfers/maxConcurrent", maxConcurrent);
    s.setValue("Transfers/downloadLimitKBps", downloadLimitKBps);
    s.setValue("Transfers/uploadLimitKBps", uploadLimitKBps);
    s.setValue("Transfers/stallTimeoutSec", stallTimeoutSec);
    s.setValue("Tools/sevenZip", sevenZipPath);
    s.setValue("Tools/adb", adbPath);
}

} // namespace vrpkg
