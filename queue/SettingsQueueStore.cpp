// Persists the queue with QSettings (INI array "jobs").
#include "SettingsQueueStore.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <utility>
Q_LOGGING_CATEGORY(vrpkgStore, "vrpkg.store")

namespace vrpkg {

static constexpr int kStoreVersion = 1;

SettingsQueueStore::SettingsQueueStore(QString filePath)
    : filePath_(std::move(filePath)) {}

bool SettingsQueueStore::save(const QVector<Job> &jobs, QString &err) {
    const QFileInfo fi(filePath_);
    if (!QDir().mkpath(fi.absolutePath())) {
        err = QStringLiteral("Cannot create %1").arg(fi.absolutePath());
        return false;
    }
    QSettings s(filePath_, QSettings::IniFormat);
    s.clear();
    s.setValue("version", kStoreVersion);
    s.beginWriteArray("jobs", jobs.size());
    for (int i = 0; i < jobs.size(); ++i) {
        s.setArrayIndex(i);
        const Job &j = jobs[i];
        s.setValue("key", j.key);
        s.setValue("kind", j.kind == JobKind::Upload ? "Upload" : "Download");
        s.setValue("status", jobStatusName(j.status));
        s.setValue("nextPhase", jobPhaseName(j.nextPhase));
        s.setValue("progress", j.progress);
        s.setValue("error", j.error);
        s.setValue("retryCount", j.retryCount);
        s.setValue("createdAtMs", QString::number(j.createdAtMs));
        s.setValue("updatedAtMs", QString::number(j.updatedAtMs));
        s.setValue("locator", j.payload.locator);
        s.setValue("device", j.payload.device);
        s.setValue("packageName", j.payload.packageName);
        s.setValue("expectedSize", QString::number(j.payload.expectedSize));
        s.setValue("expectedSha256", j.payload.expectedSha256);
        s.setValue("workDir", j.workDir);
        s.setValue("archivePath", j.archive.path);
        s.setValue("archiveSize", QString::number(j.archive.size));
        s.setValue("archiveSha256", j.archive.sha256);
        s.setValue("archiveComplete", j.archive.complete);
        s.setValue("contentDir", j.contentDir);
        s.setValue("contentReady", j.contentReady);
    }
    s.endArray();
    s.sync();
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Cannot write queue file %1").arg(filePath_);
        return false;
    }
    return true;
}

bool SettingsQueueStore::load(QVector<Job> &out, QString &err) {
    out.clear();
    if (!QFileInfo::exists(filePath_)) {
        qCInfo(vrpkgStore) << "No queue file yet" << "path=" << filePath_;
        return true;
    }
    QSettings s(filePath_, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Cannot read queue file %1").arg(filePath_);
        return false;
    }
    const int version = s.value("version", 0).toInt();
    if (version > kStoreVersion) {
        err = QStringLiteral("Queue file version %1 is newer than supported")
                  .arg(version);
        return false;
    }
    const int n = s.beginReadArray("jobs");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        Job j;
        j.key = s.value("key").toString();
        const auto status = jobStatusFromName(s.value("status").toString());
        const auto phase = jobPhaseFromName(s.value("nextPhase").toString());
        if (j.key.isEmpty() || !status || !phase) {
            qCWarning(vrpkgStore) << "Skipping malformed queue entry"
                                  << "index=" << i << "key=" << j.key;
            continue;
        }
        j.kind = s.value("kind").toString() == QLatin1String("Upload")
                     ? JobKind::Upload
                     : JobKind::Download;
        j.status = *status;
        j.nextPhase = *phase;
        j.progress = qBound(0, s.value("progress", 0).toInt(), 100);
        j.error = s.value("error").toString();
        j.retryCount = qMax(0, s.value("retryCount", 0).toInt());
        j.createdAtMs = s.value("createdAtMs").toString().toLongLong();
        j.updatedAtMs = s.value("updatedAtMs").toString().toLongLong();
        j.payload.locator = s.value("locator").toString();
        j.payload.device = s.value("device").toString();
        j.payload.packageName = s.value("packageName").toString();
        j.payload.expectedSize =
            s.value("expectedSize").toString().toULongLong();
        j.payload.expectedSha256 = s.value("expectedSha256").toString();
        j.workDir = s.value("workDir").toString();
        j.archive.path = s.value("archivePath").toString();
        j.archive.size = s.value("archiveSize").toString().toULongLong();
        j.archive.sha256 = s.value("archiveSha256").toString();
        j.archive.complete = s.value("archiveComplete", false).toBool();
        j.contentDir = s.value("contentDir").toString();
        j.contentReady = s.value("contentReady", false).toBool();
        out.push_back(j);
    }
    s.endArray();
    return true;
}

} // namespace vrpkg
